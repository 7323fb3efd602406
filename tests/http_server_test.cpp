#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "include/file_descriptor.hpp"
#include "include/http_server.hpp"

using namespace speedwatch;
using namespace std::chrono_literals;

TEST(ParseRequestTest, CompleteRequestWithBody) {
    const std::string raw =
        "POST /api/v1/report?debug=1 HTTP/1.1\r\n"
        "Host: master\r\n"
        "Content-Type: application/json\r\n"
        "X-Api-Token:  abc  \r\n"
        "Content-Length: 7\r\n"
        "\r\n"
        "{\"a\":1}";

    HttpRequest req;
    auto state = parse_request(raw, req);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, ParseState::Complete);
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/api/v1/report");
    EXPECT_EQ(req.body, "{\"a\":1}");
    ASSERT_TRUE(req.header("X-API-TOKEN").has_value());
    EXPECT_EQ(*req.header("x-api-token"), "abc");
    EXPECT_FALSE(req.header("authorization").has_value());
}

TEST(ParseRequestTest, IncompleteUntilBodyArrives) {
    HttpRequest req;
    auto headers_only = parse_request("GET /health HTTP/1.1\r\nHost: x\r\n", req);
    ASSERT_TRUE(headers_only.has_value());
    EXPECT_EQ(*headers_only, ParseState::Incomplete);

    auto partial_body =
        parse_request("POST /r HTTP/1.1\r\nContent-Length: 10\r\n\r\n12345", req);
    ASSERT_TRUE(partial_body.has_value());
    EXPECT_EQ(*partial_body, ParseState::Incomplete);
}

TEST(ParseRequestTest, Errors) {
    HttpRequest req;

    auto bad_line = parse_request("GARBAGE\r\n\r\n", req);
    ASSERT_FALSE(bad_line.has_value());
    EXPECT_EQ(bad_line.error().status, 400);

    auto bad_version = parse_request("GET / SPDY/3\r\n\r\n", req);
    ASSERT_FALSE(bad_version.has_value());
    EXPECT_EQ(bad_version.error().status, 400);

    auto bad_header = parse_request("GET / HTTP/1.1\r\nno colon here\r\n\r\n", req);
    ASSERT_FALSE(bad_header.has_value());
    EXPECT_EQ(bad_header.error().status, 400);

    auto bad_length = parse_request("POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n", req);
    ASSERT_FALSE(bad_length.has_value());
    EXPECT_EQ(bad_length.error().status, 400);

    auto chunked =
        parse_request("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n", req);
    ASSERT_FALSE(chunked.has_value());
    EXPECT_EQ(chunked.error().status, 411);

    auto too_big = parse_request("POST / HTTP/1.1\r\nContent-Length: 5000\r\n\r\n", req, 1024);
    ASSERT_FALSE(too_big.has_value());
    EXPECT_EQ(too_big.error().status, 413);

    auto endless_headers = parse_request(std::string(2048, 'a'), req, 1024);
    ASSERT_FALSE(endless_headers.has_value());
    EXPECT_EQ(endless_headers.error().status, 413);
}

TEST(SerializeReplyTest, WritesStatusLineAndLength) {
    const std::string wire = serialize_reply(HttpReply{404, "application/json", "{}"});
    EXPECT_TRUE(wire.starts_with("HTTP/1.1 404 Not Found\r\n"));
    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_TRUE(wire.ends_with("\r\n\r\n{}"));
}

TEST(HttpServerDispatchTest, RoutesByMethodAndPath) {
    HttpServer server("127.0.0.1", 0, 1);
    server.route("GET", "/health", [](const HttpRequest&) {
        return HttpReply{200, "application/json", "{\"status\":\"alive\"}"};
    });
    server.route("POST", "/boom", [](const HttpRequest&) -> HttpReply {
        throw std::runtime_error("handler exploded");
    });

    HttpRequest req;
    req.method = "GET";
    req.path = "/health";
    EXPECT_EQ(server.dispatch(req).status, 200);

    req.method = "DELETE";
    EXPECT_EQ(server.dispatch(req).status, 405);

    req.method = "GET";
    req.path = "/missing";
    EXPECT_EQ(server.dispatch(req).status, 404);

    req.method = "POST";
    req.path = "/boom";
    EXPECT_EQ(server.dispatch(req).status, 500);
}

namespace {

std::string round_trip(std::uint16_t port, const std::string& request) {
    FileDescriptor fd(::socket(AF_INET, SOCK_STREAM, 0));
    if (!fd) return {};

    timeval tv{};
    tv.tv_sec = 5;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) return {};

    if (!fd.write_all(request)) return {};

    std::string response;
    std::array<char, 1024> buf{};
    while (true) {
        auto n = fd.read_some(buf);
        if (!n || *n == 0) break;
        response.append(buf.data(), *n);
    }
    return response;
}

FileDescriptor connect_to(std::uint16_t port) {
    FileDescriptor fd(::socket(AF_INET, SOCK_STREAM, 0));
    if (!fd) return fd;

    timeval tv{};
    tv.tv_sec = 5;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        return FileDescriptor();
    }
    return fd;
}

std::string read_reply(const FileDescriptor& fd) {
    std::string response;
    std::array<char, 1024> buf{};
    while (true) {
        auto n = fd.read_some(buf);
        if (!n || *n == 0) break;
        response.append(buf.data(), *n);
    }
    return response;
}

}  // namespace

TEST(HttpServerTest, ServesOverLoopback) {
    HttpServer server("127.0.0.1", 0, 2);
    server.route("GET", "/health", [](const HttpRequest&) {
        return HttpReply{200, "application/json", "{\"status\":\"alive\"}"};
    });
    server.route("POST", "/echo", [](const HttpRequest& req) {
        return HttpReply{200, "text/plain", req.body};
    });
    server.start();
    ASSERT_NE(server.port(), 0);

    auto health = round_trip(server.port(), "GET /health HTTP/1.1\r\nHost: t\r\n\r\n");
    EXPECT_TRUE(health.starts_with("HTTP/1.1 200 OK"));
    EXPECT_TRUE(health.ends_with("{\"status\":\"alive\"}"));

    auto echo = round_trip(server.port(),
                           "POST /echo HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello");
    EXPECT_TRUE(echo.ends_with("\r\n\r\nhello"));

    auto missing = round_trip(server.port(), "GET /nope HTTP/1.1\r\n\r\n");
    EXPECT_TRUE(missing.starts_with("HTTP/1.1 404"));

    auto wrong_method = round_trip(server.port(), "POST /health HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    EXPECT_TRUE(wrong_method.starts_with("HTTP/1.1 405"));

    auto oversized = round_trip(
        server.port(), "POST /echo HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n");
    EXPECT_TRUE(oversized.starts_with("HTTP/1.1 413"));

    server.stop();
}

TEST(HttpServerTest, BindFailureThrows) {
    HttpServer server("not-an-address", 0, 1);
    EXPECT_THROW(server.start(), std::system_error);
}

TEST(HttpServerTest, TricklingClientHitsRequestDeadline) {
    HttpServer server("127.0.0.1", 0, 1, HttpServerLimits{.max_pending = 8, .request_deadline = 400ms});
    server.route("POST", "/echo", [](const HttpRequest& req) {
        return HttpReply{200, "text/plain", req.body};
    });
    server.start();

    const auto started = std::chrono::steady_clock::now();
    FileDescriptor client = connect_to(server.port());
    ASSERT_TRUE(client);

    // Each byte arrives well inside the per-read socket timeout.
    const std::string head = "POST /echo HTTP/1.1\r\n";
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(::send(client.get(), head.data() + i, 1, MSG_NOSIGNAL), 1);
        std::this_thread::sleep_for(100ms);
    }

    auto reply = read_reply(client);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(reply.starts_with("HTTP/1.1 408")) << reply;
    EXPECT_LT(elapsed, 2s);

    // The worker is free again for the next client.
    auto echo = round_trip(server.port(), "POST /echo HTTP/1.1\r\nContent-Length: 2\r\n\r\nok");
    EXPECT_TRUE(echo.ends_with("\r\n\r\nok"));
    server.stop();
}

TEST(HttpServerTest, FullQueueIsAnsweredWithServiceUnavailable) {
    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool entered = false;
    bool released = false;

    HttpServer server("127.0.0.1", 0, 1, HttpServerLimits{.max_pending = 1, .request_deadline = 5s});
    server.route("GET", "/block", [&](const HttpRequest&) {
        std::unique_lock lock(gate_mutex);
        entered = true;
        gate_cv.notify_all();
        gate_cv.wait(lock, [&] { return released; });
        return HttpReply{200, "text/plain", "done"};
    });
    server.start();

    // First connection occupies the only worker.
    FileDescriptor busy = connect_to(server.port());
    ASSERT_TRUE(busy);
    ASSERT_TRUE(busy.write_all("GET /block HTTP/1.1\r\n\r\n").has_value());
    {
        std::unique_lock lock(gate_mutex);
        ASSERT_TRUE(gate_cv.wait_for(lock, 5s, [&] { return entered; }));
    }

    // Second one fills the queue.
    FileDescriptor queued = connect_to(server.port());
    ASSERT_TRUE(queued);
    std::this_thread::sleep_for(200ms);

    FileDescriptor rejected = connect_to(server.port());
    ASSERT_TRUE(rejected);
    EXPECT_TRUE(read_reply(rejected).starts_with("HTTP/1.1 503"));

    {
        std::lock_guard lock(gate_mutex);
        released = true;
    }
    gate_cv.notify_all();
    EXPECT_TRUE(read_reply(busy).ends_with("done"));

    ASSERT_TRUE(queued.write_all("GET /block HTTP/1.1\r\n\r\n").has_value());
    EXPECT_TRUE(read_reply(queued).ends_with("done"));
    server.stop();
}
