#include "http/beast_http_client.hpp"
#include "pipeline/tile_error.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <type_traits>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/ssl.h>

namespace deepzoom {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

using ResponseParser = bhttp::response_parser<bhttp::vector_body<uint8_t>>;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

bool is_redirect(unsigned status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bhttp::request<bhttp::string_body> build_request(const Url& url, const HttpRequest& request,
                                                 const HttpOptions& options) {
  const bhttp::verb verb = bhttp::string_to_verb(request.method);
  if (verb == bhttp::verb::unknown) {
    throw pipeline::NetworkError("Unsupported HTTP method: " + request.method);
  }

  bhttp::request<bhttp::string_body> req{verb, url.target, 11};
  req.set(bhttp::field::host, url.authority());
  req.set(bhttp::field::user_agent, options.user_agent);
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  req.body() = request.body;
  req.prepare_payload();
  return req;
}

HttpResponse to_response(ResponseParser& parser) {
  auto res = parser.release();

  HttpResponse response;
  response.status = res.result_int();
  for (const auto& field : res) {
    const auto raw_name = field.name_string();
    std::string name(raw_name.data(), raw_name.size());
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto value = field.value();
    response.headers[name] = std::string(value.data(), value.size());
  }
  response.body = std::move(res.body());
  return response;
}

[[noreturn]] void throw_failure(const char* stage, const Url& url, const beast::error_code& ec,
                                const HttpOptions& options) {
  if (ec == beast::error::timeout) {
    throw pipeline::NetworkError(url.to_string() + " timed out after " +
                                 std::to_string(options.timeout.count()) + " ms during " + stage);
  }
  if (ec == bhttp::error::body_limit) {
    throw pipeline::NetworkError("Response from " + url.to_string() + " exceeds " +
                                 std::to_string(options.max_body_size) + " bytes");
  }
  throw pipeline::NetworkError(std::string(stage) + " failed for " + url.to_string() + ": " + ec.message());
}

// Drives resolve, connect, optional TLS handshake, write and read on ioc
// under one deadline shared by every step.
template <class Stream>
void run_exchange(net::io_context& ioc, Stream& stream, beast::tcp_stream& tcp_layer,
                  const Url& url, bhttp::request<bhttp::string_body>& req,
                  ResponseParser& parser, const HttpOptions& options) {
  tcp::resolver resolver(ioc);
  beast::flat_buffer buffer;
  beast::error_code error;
  const char* stage = "resolve";
  bool done = false;
  std::function<void()> read_body;

  auto fail = [&](const char* at, const beast::error_code& ec) {
    stage = at;
    error = ec;
    done = true;
  };

  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  tcp_layer.expires_at(deadline);

  resolver.async_resolve(url.host, url.port,
    [&](const beast::error_code& ec, const tcp::resolver::results_type& results) {
      if (ec) {
        fail("resolve", ec);
        return;
      }
      tcp_layer.async_connect(results, [&](const beast::error_code& ec, const tcp::endpoint&) {
        if (ec) {
          fail("connect", ec);
          return;
        }
        // Chunked and close-delimited bodies are capped as they arrive
        read_body = [&]() {
          bhttp::async_read_some(stream, buffer, parser, [&](const beast::error_code& ec, std::size_t) {
            if (ec) {
              fail("read", ec);
              return;
            }
            if (parser.get().body().size() > options.max_body_size) {
              fail("read", bhttp::error::body_limit);
              return;
            }
            if (parser.is_done()) {
              done = true;
              return;
            }
            read_body();
          });
        };
        auto send = [&]() {
          bhttp::async_write(stream, req, [&](const beast::error_code& ec, std::size_t) {
            if (ec) {
              fail("write", ec);
              return;
            }
            bhttp::async_read_header(stream, buffer, parser, [&](const beast::error_code& ec, std::size_t) {
              if (ec) {
                fail("read", ec);
                return;
              }
              if (parser.is_done()) {
                done = true;
                return;
              }
              const auto content_length = parser.content_length();
              if (content_length && *content_length > options.max_body_size) {
                fail("read", bhttp::error::body_limit);
                return;
              }
              read_body();
            });
          });
        };
        if constexpr (std::is_same_v<Stream, TlsStream>) {
          stream.async_handshake(ssl::stream_base::client, [&, send](const beast::error_code& ec) {
            if (ec) {
              fail("handshake", ec);
              return;
            }
            send();
          });
        } else {
          send();
        }
      });
    });

  ioc.run_until(deadline);

  if (!done) {
    throw pipeline::NetworkError(url.to_string() + " timed out after " +
                                 std::to_string(options.timeout.count()) + " ms");
  }
  if (error) {
    throw_failure(stage, url, error, options);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastHttpClient::BeastHttpClient(HttpOptions options)
  : options_(std::move(options))
  , ssl_context_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
  if (options_.verify_tls) {
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(ssl::verify_peer);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: TLS peer verification disabled";
    ssl_context_->set_verify_mode(ssl::verify_none);
  }
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Initialized with timeout " << options_.timeout.count()
                           << " ms and body limit " << options_.max_body_size << " bytes";
}

BeastHttpClient::~BeastHttpClient() = default;

//==============================================
// REQUESTS
//==============================================

HttpResponse BeastHttpClient::perform(const HttpRequest& request) {
  HttpRequest current = request;

  for (int redirects = 0;; ++redirects) {
    const Url url = parse_url(current.url);
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << current.method << " " << current.url;

    HttpResponse response = exchange(url, current);
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << current.method << " " << current.url
                             << " -> " << response.status << " (" << response.body.size() << " bytes)";

    if (!is_redirect(response.status) || (current.method != "GET" && current.method != "HEAD")) {
      return response;
    }

    const std::string location = response.header("location");
    if (location.empty()) {
      return response;
    }
    if (redirects >= options_.max_redirects) {
      throw pipeline::NetworkError("Too many redirects for " + request.url);
    }
    current.url = resolve_relative(location, current.url);
  }
}

HttpResponse BeastHttpClient::exchange(const Url& url, const HttpRequest& request) {
  return url.is_tls() ? exchange_tls(url, request) : exchange_plain(url, request);
}

HttpResponse BeastHttpClient::exchange_plain(const Url& url, const HttpRequest& request) {
  net::io_context ioc;
  beast::tcp_stream stream(ioc);

  auto req = build_request(url, request, options_);
  ResponseParser parser;
  parser.body_limit(options_.max_body_size);
  if (request.method == "HEAD") {
    parser.skip(true);
  }

  run_exchange(ioc, stream, stream, url, req, parser, options_);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(trace) << "HTTP client: Socket shutdown reported: " << ec.message();
  }
  return to_response(parser);
}

HttpResponse BeastHttpClient::exchange_tls(const Url& url, const HttpRequest& request) {
  net::io_context ioc;
  TlsStream stream(ioc, *ssl_context_);

  // Servers behind shared front ends need SNI to pick the certificate
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    throw pipeline::NetworkError("Failed to set TLS server name for " + url.host);
  }
  if (options_.verify_tls) {
    stream.set_verify_callback(ssl::host_name_verification(url.host));
  }

  auto req = build_request(url, request, options_);
  ResponseParser parser;
  parser.body_limit(options_.max_body_size);
  if (request.method == "HEAD") {
    parser.skip(true);
  }

  run_exchange(ioc, stream, beast::get_lowest_layer(stream), url, req, parser, options_);

  // The body is complete; a TLS close_notify exchange is not awaited
  beast::error_code ec;
  beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(trace) << "HTTP client: Socket shutdown reported: " << ec.message();
  }
  return to_response(parser);
}

} // namespace http
} // namespace deepzoom
