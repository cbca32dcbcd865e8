#ifndef DEEPZOOM_BEAST_HTTP_CLIENT_HPP
#define DEEPZOOM_BEAST_HTTP_CLIENT_HPP

#include <memory>
#include <boost/asio/ssl/context.hpp>
#include "http/http_client.hpp"
#include "http/url.hpp"

namespace deepzoom {
namespace http {

// HttpClient over Boost.Beast. Each request runs on its own io_context,
// so one client can be shared by every worker thread.
class BeastHttpClient : public HttpClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BeastHttpClient(HttpOptions options = HttpOptions());
  ~BeastHttpClient() override;

  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;


  // ---- REQUESTS ----
  HttpResponse perform(const HttpRequest& request) override;


  // ---- GETTERS ----
  const HttpOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  HttpOptions options_;
  std::unique_ptr<boost::asio::ssl::context> ssl_context_;


  // ---- REQUESTS ----
  // Single round trip without redirect handling
  HttpResponse exchange(const Url& url, const HttpRequest& request);
  HttpResponse exchange_plain(const Url& url, const HttpRequest& request);
  HttpResponse exchange_tls(const Url& url, const HttpRequest& request);
};

} // namespace http
} // namespace deepzoom

#endif // DEEPZOOM_BEAST_HTTP_CLIENT_HPP
