#include "http/http_client.hpp"
#include "pipeline/tile_error.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace http {

std::string HttpResponse::header(const std::string& name) const {
  std::string key = name;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = headers.find(key);
  return it == headers.end() ? std::string() : it->second;
}

HttpResponse HttpClient::get(const std::string& url) {
  HttpRequest request;
  request.method = "GET";
  request.url = url;

  HttpResponse response = perform(request);
  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: GET " << url << " returned status " << response.status;
    throw pipeline::NetworkError("GET " + url + " returned status " + std::to_string(response.status),
                                 response.status);
  }
  return response;
}

} // namespace http
} // namespace deepzoom
