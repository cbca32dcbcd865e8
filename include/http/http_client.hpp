#ifndef DEEPZOOM_HTTP_CLIENT_HPP
#define DEEPZOOM_HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace deepzoom {
namespace http {

// Header names are stored lowercase
using Headers = std::map<std::string, std::string>;

struct HttpOptions {
  std::chrono::milliseconds timeout{30000};
  std::size_t max_body_size{10 * 1024 * 1024};
  int max_redirects{5};
  bool verify_tls{true};
  std::string user_agent{"deepzoom/1.0"};
};

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  Headers headers;
  std::string body;
};

struct HttpResponse {
  unsigned status{0};
  Headers headers;
  std::vector<uint8_t> body;

  bool ok() const { return status >= 200 && status < 300; }
  std::string text() const { return std::string(body.begin(), body.end()); }
  // Empty string when the header is absent
  std::string header(const std::string& name) const;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  // Performs one request, following redirects for GET/HEAD.
  // Transport failures, timeouts and oversized bodies throw
  // pipeline::NetworkError; any status is returned to the caller.
  virtual HttpResponse perform(const HttpRequest& request) = 0;

  // GET that also treats a non-2xx status as pipeline::NetworkError
  HttpResponse get(const std::string& url);
};

} // namespace http
} // namespace deepzoom

#endif // DEEPZOOM_HTTP_CLIENT_HPP
