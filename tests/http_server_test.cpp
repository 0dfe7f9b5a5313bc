/*
 * Tests for the HTTP server
 *
 * - request line, header and body parsing
 * - response serialization
 * - a real round trip over loopback, including handler exceptions,
 *   oversized bodies and clients that hang up mid-request
 */

#include <gtest/gtest.h>
#include <atomic>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <stdexcept>
#include <string>

#include "http/http_server.h"

namespace websink {
namespace test {

// Send one raw request to 127.0.0.1:port and read until the server closes.
// With half_close the write side is shut down after sending.
static std::string round_trip(int port, const std::string& request, bool half_close = false) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return "";
    }

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }
    if (half_close) {
        shutdown(fd, SHUT_WR);
    }

    std::string response;
    char buffer[4096];
    ssize_t n;
    while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        response.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

TEST(ParseRequestTest, RequestLineHeadersAndBody) {
    http::Request req;
    ASSERT_TRUE(http::parse_request(
        "POST /api/session?debug=1 HTTP/1.1\r\n"
        "Host: localhost:8091\r\n"
        "Content-Type:  application/json \r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "{}", req));

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/api/session");
    EXPECT_EQ(req.header("content-type"), "application/json");
    EXPECT_EQ(req.header("Content-Length"), "2");
    EXPECT_EQ(req.header("x-missing"), "");
    EXPECT_EQ(req.body, "{}");
}

TEST(ParseRequestTest, RejectsMalformedRequestLine) {
    http::Request req;
    EXPECT_FALSE(http::parse_request("", req));
    EXPECT_FALSE(http::parse_request("GET\r\n\r\n", req));
    EXPECT_FALSE(http::parse_request("GET /\r\n\r\n", req));
    EXPECT_FALSE(http::parse_request("no line ending", req));
}

TEST(ResponseTest, BuildsStatusHeadersAndBody) {
    http::Response resp = http::Response::json("{\"ok\":true}", 503);
    resp.add_header("Retry-After", "1");

    std::string raw = resp.build();
    EXPECT_EQ(raw.rfind("HTTP/1.1 503 Service Unavailable\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Retry-After: 1\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 11), "{\"ok\":true}");
}

TEST(ResponseTest, NotFound) {
    http::Response resp = http::Response::not_found();
    EXPECT_EQ(resp.status(), 404);
    EXPECT_EQ(resp.build().rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
}

class HttpServerTest : public ::testing::Test {
protected:
    void TearDown() override {
        server_.stop();
    }

    http::Server server_;
};

TEST_F(HttpServerTest, PortZeroBindsAnyFreePort) {
    ASSERT_TRUE(server_.start(0, [](const http::Request&) { return http::Response::text("ok"); }));
    EXPECT_TRUE(server_.is_running());
    EXPECT_GT(server_.port(), 0);

    server_.stop();
    EXPECT_FALSE(server_.is_running());
}

TEST_F(HttpServerTest, StartTwiceFails) {
    auto handler = [](const http::Request&) { return http::Response::text("ok"); };
    ASSERT_TRUE(server_.start(0, handler));
    EXPECT_FALSE(server_.start(0, handler));
}

TEST_F(HttpServerTest, RoundTripDeliversBodyToHandler) {
    ASSERT_TRUE(server_.start(0, [](const http::Request& req) {
        return http::Response::text(req.method + " " + req.path + " " + req.body);
    }));

    std::string body = "{\"offer\":{}}";
    std::string response = round_trip(server_.port(),
        "POST /api/session HTTP/1.1\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body);

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response.find("\r\n\r\nPOST /api/session " + body), std::string::npos);
}

TEST_F(HttpServerTest, HandlerExceptionBecomesServerError) {
    ASSERT_TRUE(server_.start(0, [](const http::Request&) -> http::Response {
        throw std::runtime_error("handler blew up");
    }));

    std::string response = round_trip(server_.port(), "GET / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u);

    // The server keeps serving after a failed request
    response = round_trip(server_.port(), "GET / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 500", 0), 0u);
}

TEST_F(HttpServerTest, GarbageRequestIsBadRequest) {
    ASSERT_TRUE(server_.start(0, [](const http::Request&) { return http::Response::text("ok"); }));

    std::string response = round_trip(server_.port(), "garbage\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
}

TEST_F(HttpServerTest, OversizedBodyIsRejected) {
    std::atomic<bool> called{false};
    ASSERT_TRUE(server_.start(0, [&called](const http::Request&) {
        called = true;
        return http::Response::text("ok");
    }));

    std::string response = round_trip(server_.port(),
        "POST /api/session HTTP/1.1\r\n"
        "Content-Length: " + std::to_string(http::MAX_BODY_SIZE + 1) + "\r\n"
        "\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u);
    EXPECT_FALSE(called);
}

TEST_F(HttpServerTest, IncompleteHeadersBeforeHangupAreBadRequest) {
    std::atomic<bool> called{false};
    ASSERT_TRUE(server_.start(0, [&called](const http::Request&) {
        called = true;
        return http::Response::text("ok");
    }));

    // No blank line ends the header block before the client stops sending
    std::string response = round_trip(server_.port(), "GET / HTTP/1.1\r\nHost: x", true);
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_FALSE(called);
}

TEST_F(HttpServerTest, TruncatedBodyBeforeHangupIsBadRequest) {
    std::atomic<bool> called{false};
    ASSERT_TRUE(server_.start(0, [&called](const http::Request&) {
        called = true;
        return http::Response::text("ok");
    }));

    std::string response = round_trip(server_.port(),
        "POST /api/session HTTP/1.1\r\n"
        "Content-Length: 100\r\n"
        "\r\n"
        "{\"offer\"", true);
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_FALSE(called);
}

} // namespace test
} // namespace websink
