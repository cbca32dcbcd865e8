#ifndef DEEPZOOM_HTTP_URL_HPP
#define DEEPZOOM_HTTP_URL_HPP

#include <string>

namespace deepzoom {
namespace http {

struct Url {
  std::string scheme;   // "http" or "https", lowercase
  std::string host;
  std::string port;     // defaults to 80/443 by scheme
  std::string target;   // path plus query, at least "/"

  bool is_tls() const { return scheme == "https"; }
  // host, or host:port when the port is not the scheme default
  std::string authority() const;
  // target without query string or fragment
  std::string path() const;
  std::string to_string() const;
};

// Throws pipeline::NetworkError for anything that is not an absolute http(s) URL
Url parse_url(const std::string& url);

// Resolves a reference against base: absolute, protocol-relative ("//"),
// parent ("../"), root-relative ("/") and directory-relative forms
std::string resolve_relative(const std::string& path, const std::string& base);

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& text, bool encode_slash = true);

} // namespace http
} // namespace deepzoom

#endif // DEEPZOOM_HTTP_URL_HPP
