/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "include/config.hpp"
#include "include/file_descriptor.hpp"

namespace speedwatch {

struct HttpRequest {
    std::string method;
    std::string path;
    // Header names are lower-cased.
    std::map<std::string, std::string, std::less<>> headers;
    std::string body;
    std::string remote;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpReply {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

enum class ParseState { Complete, Incomplete };

struct RequestParseError {
    int status = 400;
    std::string message;
};

// Parses a raw HTTP/1.x request. Returns Incomplete while the headers or the
// Content-Length body have not fully arrived.
[[nodiscard]] std::expected<ParseState, RequestParseError> parse_request(
    std::string_view raw, HttpRequest& out, std::size_t max_bytes = Config::MAX_REQUEST_BYTES);

[[nodiscard]] std::string serialize_reply(const HttpReply& reply);
[[nodiscard]] std::string_view status_text(int status) noexcept;

using HttpHandler = std::function<HttpReply(const HttpRequest&)>;

struct HttpServerLimits {
    // Accepted connections waiting for a worker; beyond this new ones get 503.
    std::size_t max_pending = Config::MAX_PENDING_CONNECTIONS;
    // Time allowed for the whole request, from the moment a worker picks it up.
    std::chrono::milliseconds request_deadline = Config::REQUEST_DEADLINE;
};

// Minimal HTTP/1.1 server: one accept thread hands connections to a fixed
// pool of workers. One request per connection.
class HttpServer {
   public:
    HttpServer(std::string host, std::uint16_t port,
               std::size_t workers = Config::DEFAULT_HTTP_WORKERS, HttpServerLimits limits = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(std::string method, std::string path, HttpHandler handler);

    // Binds and starts serving; throws std::system_error when the socket
    // cannot be bound.
    void start();
    void stop();

    // Actual bound port (useful when constructed with port 0).
    [[nodiscard]] std::uint16_t port() const { return bound_port_; }

    [[nodiscard]] HttpReply dispatch(const HttpRequest& request) const;

   private:
    void accept_loop(std::stop_token stop);
    void worker_loop(std::stop_token stop);
    void serve_connection(FileDescriptor client, std::string remote);
    void reject_busy(FileDescriptor client, const std::string& remote);

    std::string host_;
    std::uint16_t port_;
    std::uint16_t bound_port_ = 0;
    std::size_t worker_count_;
    HttpServerLimits limits_;

    std::map<std::pair<std::string, std::string>, HttpHandler> routes_;

    FileDescriptor listen_fd_;
    std::atomic<bool> running_{false};

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<std::pair<FileDescriptor, std::string>> pending_;

    std::jthread acceptor_;
    std::vector<std::jthread> workers_;
};

}  // namespace speedwatch
