/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/http_server.hpp"

#include <array>
#include <chrono>
#include <cerrno>
#include <exception>
#include <format>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "include/log.hpp"
#include "include/utils.hpp"

namespace speedwatch {

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return std::string_view(it->second);
}

std::expected<ParseState, RequestParseError> parse_request(std::string_view raw, HttpRequest& out,
                                                           std::size_t max_bytes) {
    const auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) {
        if (raw.size() > max_bytes) {
            return std::unexpected(RequestParseError{413, "request headers too large"});
        }
        return ParseState::Incomplete;
    }

    std::string_view head = raw.substr(0, header_end);
    auto line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);
    head.remove_prefix(line_end == std::string_view::npos ? head.size() : line_end + 2);

    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
        return std::unexpected(RequestParseError{400, "malformed request line"});
    }

    std::string_view version = request_line.substr(sp2 + 1);
    if (!version.starts_with("HTTP/1.")) {
        return std::unexpected(RequestParseError{400, "unsupported protocol version"});
    }

    out.method = std::string(request_line.substr(0, sp1));
    std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    out.path = std::string(target.substr(0, target.find('?')));
    out.headers.clear();

    while (!head.empty()) {
        auto eol = head.find("\r\n");
        std::string_view line = head.substr(0, eol);
        head.remove_prefix(eol == std::string_view::npos ? head.size() : eol + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::unexpected(RequestParseError{400, "malformed header line"});
        }
        out.headers.insert_or_assign(to_lower(trim_sv(line.substr(0, colon))),
                                     trim(line.substr(colon + 1)));
    }

    if (auto te = out.header("transfer-encoding"); te && to_lower(*te) != "identity") {
        return std::unexpected(RequestParseError{411, "chunked bodies are not supported"});
    }

    std::size_t content_length = 0;
    if (auto cl = out.header("content-length")) {
        auto parsed = parse_number<std::size_t>(*cl);
        if (!parsed) {
            return std::unexpected(RequestParseError{400, "invalid Content-Length"});
        }
        content_length = *parsed;
    }

    const std::size_t body_start = header_end + 4;
    if (content_length > max_bytes) {
        return std::unexpected(RequestParseError{413, "request body too large"});
    }
    if (raw.size() - body_start < content_length) {
        return ParseState::Incomplete;
    }

    out.body = std::string(raw.substr(body_start, content_length));
    return ParseState::Complete;
}

std::string_view status_text(int status) noexcept {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 411:
            return "Length Required";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

std::string serialize_reply(const HttpReply& reply) {
    return std::format(
        "HTTP/1.1 {} {}\r\n"
        "Content-Type: {}\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n"
        "\r\n"
        "{}",
        reply.status, status_text(reply.status), reply.content_type, reply.body.size(), reply.body);
}

namespace {

HttpReply json_error(int status, std::string_view message) {
    return HttpReply{status, "application/json", nlohmann::json{{"error", message}}.dump()};
}

void set_socket_timeouts(int fd) {
    timeval tv{};
    tv.tv_sec = Config::SOCKET_TIMEOUT_SEC;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

}  // namespace

HttpServer::HttpServer(std::string host, std::uint16_t port, std::size_t workers,
                       HttpServerLimits limits)
    : host_(std::move(host)),
      port_(port),
      worker_count_(workers == 0 ? 1 : workers),
      limits_(limits) {
    if (limits_.max_pending == 0) limits_.max_pending = 1;
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(std::string method, std::string path, HttpHandler handler) {
    routes_.insert_or_assign({std::move(method), std::move(path)}, std::move(handler));
}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    FileDescriptor fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) {
        running_ = false;
        throw std::system_error(errno, std::generic_category(), "Failed to create listen socket");
    }

    int opt = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        running_ = false;
        throw std::system_error(EINVAL, std::generic_category(),
                                std::format("Invalid listen address '{}'", host_));
    }

    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        running_ = false;
        throw std::system_error(errno, std::generic_category(),
                                std::format("Failed to bind {}:{}", host_, port_));
    }
    if (::listen(fd.get(), Config::LISTEN_BACKLOG) < 0) {
        running_ = false;
        throw std::system_error(errno, std::generic_category(), "Failed to listen");
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port_;
    }

    listen_fd_ = std::move(fd);

    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
    acceptor_ = std::jthread([this](std::stop_token stop) { accept_loop(stop); });

    log::info("HTTP server listening on {}:{} ({} workers)", host_, bound_port_, worker_count_);
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_.joinable()) {
        acceptor_.request_stop();
        acceptor_.join();
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();

    {
        std::lock_guard lock(queue_mutex_);
        pending_.clear();
    }
    listen_fd_.reset();
    log::info("HTTP server stopped");
}

void HttpServer::accept_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = listen_fd_.get();
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 200);
        if (ready <= 0) {
            if (ready < 0 && errno != EINTR) {
                log::error("poll on listen socket failed: {}", std::system_category().message(errno));
            }
            continue;
        }

        sockaddr_in client{};
        socklen_t len = sizeof(client);
        int client_fd = ::accept4(listen_fd_.get(), reinterpret_cast<sockaddr*>(&client), &len,
                                  SOCK_CLOEXEC);
        if (client_fd < 0) {
            continue;
        }

        std::array<char, INET_ADDRSTRLEN> ip{};
        ::inet_ntop(AF_INET, &client.sin_addr, ip.data(), ip.size());
        std::string remote = std::format("{}:{}", ip.data(), ntohs(client.sin_port));

        FileDescriptor connection(client_fd);
        bool queued = false;
        {
            std::lock_guard lock(queue_mutex_);
            if (pending_.size() < limits_.max_pending) {
                pending_.emplace_back(std::move(connection), remote);
                queued = true;
            }
        }
        if (!queued) {
            reject_busy(std::move(connection), remote);
            continue;
        }
        queue_cv_.notify_one();
    }
}

void HttpServer::worker_loop(std::stop_token stop) {
    while (true) {
        std::pair<FileDescriptor, std::string> job;
        {
            std::unique_lock lock(queue_mutex_);
            if (!queue_cv_.wait(lock, stop, [this] { return !pending_.empty(); })) {
                return;
            }
            job = std::move(pending_.front());
            pending_.pop_front();
        }

        try {
            serve_connection(std::move(job.first), std::move(job.second));
        } catch (const std::exception& e) {
            log::error("Connection handling failed: {}", e.what());
        }
    }
}

void HttpServer::reject_busy(FileDescriptor client, const std::string& remote) {
    log::warn("Rejecting connection from {}: {} connections already waiting", remote,
              limits_.max_pending);
    set_socket_timeouts(client.get());
    if (auto written = client.write_all(serialize_reply(json_error(503, "server busy")));
        !written) {
        log::debug("Write to {} failed: {}", remote, written.error());
    }
    ::shutdown(client.get(), SHUT_RDWR);
}

void HttpServer::serve_connection(FileDescriptor client, std::string remote) {
    set_socket_timeouts(client.get());
    const auto deadline = std::chrono::steady_clock::now() + limits_.request_deadline;

    std::string raw;
    std::array<char, 4096> buffer{};
    HttpRequest request;
    request.remote = remote;

    HttpReply reply;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        pollfd pfd{};
        pfd.fd = client.get();
        pfd.events = POLLIN;
        if (remaining.count() <= 0 || ::poll(&pfd, 1, static_cast<int>(remaining.count())) == 0) {
            log::debug("Request from {} exceeded {} ms", remote, limits_.request_deadline.count());
            reply = json_error(408, "request timeout");
            break;
        }

        auto n = client.read_some(buffer);
        if (!n) {
            log::debug("Read from {} failed: {}", remote, n.error());
            reply = json_error(408, "request timeout");
            break;
        }
        if (*n == 0) {
            return;
        }
        raw.append(buffer.data(), *n);

        auto state = parse_request(raw, request);
        if (!state) {
            reply = json_error(state.error().status, state.error().message);
            break;
        }
        if (*state == ParseState::Complete) {
            reply = dispatch(request);
            break;
        }
    }

    if (auto written = client.write_all(serialize_reply(reply)); !written) {
        log::debug("Write to {} failed: {}", remote, written.error());
    }
    ::shutdown(client.get(), SHUT_RDWR);
}

HttpReply HttpServer::dispatch(const HttpRequest& request) const {
    auto it = routes_.find({request.method, request.path});
    if (it == routes_.end()) {
        for (const auto& [key, handler] : routes_) {
            if (key.second == request.path) {
                return json_error(405, "method not allowed");
            }
        }
        return json_error(404, "not found");
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        log::error("Handler for {} {} failed: {}", request.method, request.path, e.what());
        return json_error(500, "internal error");
    }
}

}  // namespace speedwatch
