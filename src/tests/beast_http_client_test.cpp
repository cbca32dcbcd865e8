#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "http/beast_http_client.hpp"
#include "pipeline/tile_error.hpp"
#include "test_utils.hpp"

using namespace deepzoom;
using namespace deepzoom::http;

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using ServerRequest = bhttp::request<bhttp::string_body>;
using ServerResponse = bhttp::response<bhttp::string_body>;

// Blocking HTTP/1.1 server on 127.0.0.1 serving one request per connection
class LocalHttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    explicit LocalHttpServer(Handler handler, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , handler_(std::move(handler))
        , delay_(delay) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~LocalHttpServer() {
        stop_ = true;
        // Wake the blocking accept
        net::io_context wake_ioc;
        tcp::socket wake(wake_ioc);
        beast::error_code ec;
        wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
        thread_.join();
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    std::vector<ServerRequest> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (true) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stop_) {
                break;
            }

            beast::flat_buffer buffer;
            ServerRequest request;
            bhttp::read(socket, buffer, request, ec);
            if (ec) {
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }

            if (delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }
            ServerResponse response = handler_(request);
            if (!response.chunked()) {
                response.prepare_payload();
            }
            bhttp::write(socket, response, ec);
            socket.shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    Handler handler_;
    std::chrono::milliseconds delay_;
    unsigned short port_ = 0;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::vector<ServerRequest> requests_;
    std::thread thread_;
};

ServerResponse make_server_response(bhttp::status status, const std::string& body) {
    ServerResponse response{status, 11};
    response.set(bhttp::field::content_type, "text/plain");
    response.body() = body;
    return response;
}

class BeastHttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_logging();
    }
};

TEST_F(BeastHttpClientTest, GetReturnsBodyAndHeaders) {
    LocalHttpServer server([](const ServerRequest&) {
        auto response = make_server_response(bhttp::status::ok, "tile-bytes");
        response.set("X-Tile-Version", "3");
        return response;
    });

    BeastHttpClient client;
    const HttpResponse response = client.get(server.url("/tile?x=1"));

    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.text(), "tile-bytes");
    EXPECT_EQ(response.header("X-Tile-Version"), "3");
    EXPECT_EQ(response.headers.at("x-tile-version"), "3");

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].target(), "/tile?x=1");
    EXPECT_EQ(requests[0][bhttp::field::user_agent], "deepzoom/1.0");
}

TEST_F(BeastHttpClientTest, StatusIsReturnedByPerformAndThrownByGet) {
    LocalHttpServer server([](const ServerRequest&) {
        return make_server_response(bhttp::status::not_found, "missing");
    });

    BeastHttpClient client;
    HttpRequest request;
    request.url = server.url("/missing");
    EXPECT_EQ(client.perform(request).status, 404u);

    try {
        client.get(server.url("/missing"));
        FAIL() << "Expected NetworkError";
    } catch (const pipeline::NetworkError& e) {
        ASSERT_TRUE(e.status().has_value());
        EXPECT_EQ(*e.status(), 404u);
    }
}

TEST_F(BeastHttpClientTest, PutSendsBodyAndHeaders) {
    LocalHttpServer server([](const ServerRequest&) {
        return make_server_response(bhttp::status::ok, "");
    });

    BeastHttpClient client;
    HttpRequest request;
    request.method = "PUT";
    request.url = server.url("/bucket/key.jpg");
    request.headers["content-type"] = "image/jpeg";
    request.headers["x-amz-acl"] = "public-read";
    request.body = "jpeg-data";
    EXPECT_TRUE(client.perform(request).ok());

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method(), bhttp::verb::put);
    EXPECT_EQ(requests[0].body(), "jpeg-data");
    EXPECT_EQ(requests[0]["x-amz-acl"], "public-read");
    EXPECT_EQ(requests[0][bhttp::field::content_type], "image/jpeg");
}

TEST_F(BeastHttpClientTest, FollowsRedirects) {
    LocalHttpServer server([](const ServerRequest& request) {
        if (request.target() == "/old") {
            auto response = make_server_response(bhttp::status::found, "");
            response.set(bhttp::field::location, "/new");
            return response;
        }
        return make_server_response(bhttp::status::ok, "moved here");
    });

    BeastHttpClient client;
    EXPECT_EQ(client.get(server.url("/old")).text(), "moved here");
    EXPECT_EQ(server.requests().size(), 2u);
}

TEST_F(BeastHttpClientTest, RedirectLoopIsBounded) {
    LocalHttpServer server([](const ServerRequest&) {
        auto response = make_server_response(bhttp::status::moved_permanently, "");
        response.set(bhttp::field::location, "/again");
        return response;
    });

    HttpOptions options;
    options.max_redirects = 2;
    BeastHttpClient client(options);
    EXPECT_THROW(client.get(server.url("/again")), pipeline::NetworkError);
    EXPECT_EQ(server.requests().size(), 3u);
}

TEST_F(BeastHttpClientTest, OversizedBodyIsRejected) {
    LocalHttpServer server([](const ServerRequest&) {
        return make_server_response(bhttp::status::ok, std::string(4096, 'x'));
    });

    HttpOptions options;
    options.max_body_size = 1024;
    BeastHttpClient client(options);
    EXPECT_THROW(client.get(server.url("/big")), pipeline::NetworkError);
}

TEST_F(BeastHttpClientTest, DefaultLimitRejectsBodiesOverTenMegabytes) {
    LocalHttpServer server([](const ServerRequest&) {
        return make_server_response(bhttp::status::ok, std::string(11 * 1024 * 1024, 't'));
    });

    BeastHttpClient client;
    try {
        client.get(server.url("/huge-tile"));
        FAIL() << "Expected NetworkError";
    } catch (const pipeline::NetworkError& e) {
        EXPECT_NE(std::string(e.what()).find("exceeds"), std::string::npos);
    }
}

TEST_F(BeastHttpClientTest, ChunkedBodyOverLimitIsRejected) {
    LocalHttpServer server([](const ServerRequest&) {
        auto response = make_server_response(bhttp::status::ok, std::string(4096, 'c'));
        response.chunked(true);
        return response;
    });

    HttpOptions options;
    options.max_body_size = 1024;
    BeastHttpClient client(options);
    EXPECT_THROW(client.get(server.url("/chunked")), pipeline::NetworkError);
}

TEST_F(BeastHttpClientTest, BodyAtLimitIsAccepted) {
    LocalHttpServer server([](const ServerRequest&) {
        return make_server_response(bhttp::status::ok, std::string(1024, 'x'));
    });

    HttpOptions options;
    options.max_body_size = 1024;
    BeastHttpClient client(options);
    EXPECT_EQ(client.get(server.url("/exact")).body.size(), 1024u);
}

TEST_F(BeastHttpClientTest, SlowServerTimesOut) {
    LocalHttpServer server([](const ServerRequest&) {
        return make_server_response(bhttp::status::ok, "late");
    }, std::chrono::milliseconds(600));

    HttpOptions options;
    options.timeout = std::chrono::milliseconds(100);
    BeastHttpClient client(options);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.get(server.url("/slow")), pipeline::NetworkError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));
}

TEST_F(BeastHttpClientTest, RefusedConnectionIsNetworkError) {
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    BeastHttpClient client;
    EXPECT_THROW(client.get("http://127.0.0.1:" + std::to_string(port) + "/"), pipeline::NetworkError);
}

TEST_F(BeastHttpClientTest, UnsupportedMethodIsNetworkError) {
    BeastHttpClient client;
    HttpRequest request;
    request.method = "FETCH";
    request.url = "http://127.0.0.1:1/";
    EXPECT_THROW(client.perform(request), pipeline::NetworkError);
}
