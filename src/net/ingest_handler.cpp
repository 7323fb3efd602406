/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/ingest_handler.hpp"

#include <array>
#include <cmath>
#include <format>
#include <utility>

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include "include/config.hpp"
#include "include/log.hpp"
#include "include/utils.hpp"

using json = nlohmann::json;

namespace speedwatch {

bool tokens_equal(std::string_view presented, std::string_view expected) noexcept {
    // Hashing first gives equal-length inputs, so the length of the secret
    // does not leak either.
    std::array<unsigned char, SHA256_DIGEST_LENGTH> a{};
    std::array<unsigned char, SHA256_DIGEST_LENGTH> b{};
    SHA256(reinterpret_cast<const unsigned char*>(presented.data()), presented.size(), a.data());
    SHA256(reinterpret_cast<const unsigned char*>(expected.data()), expected.size(), b.data());
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<std::string> extract_token(const HttpRequest& request, const json* body) {
    if (auto auth = request.header("authorization")) {
        constexpr std::string_view prefix = "bearer ";
        if (auth->size() > prefix.size() && to_lower(auth->substr(0, prefix.size())) == prefix) {
            return trim(auth->substr(prefix.size()));
        }
    }
    if (auto token = request.header("x-api-token"); token && !token->empty()) {
        return std::string(*token);
    }
    if (body && body->is_object()) {
        auto it = body->find("token");
        if (it != body->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

namespace {

std::expected<double, std::string> read_measure(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::unexpected(std::format("missing field '{}'", key));
    }
    if (!it->is_number()) {
        return std::unexpected(std::format("field '{}' must be a number", key));
    }
    double value = it->get<double>();
    if (!std::isfinite(value) || value < 0.0) {
        return std::unexpected(std::format("field '{}' must be a non-negative finite number", key));
    }
    return value;
}

std::expected<std::optional<std::string>, std::string> read_text(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(std::format("field '{}' must be a string", key));
    }
    auto value = trim(it->get<std::string>());
    if (value.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::move(value)};
}

HttpReply json_reply(int status, const json& body) {
    return HttpReply{status, "application/json", body.dump()};
}

}  // namespace

std::expected<Report, std::string> parse_report(const json& body) {
    if (!body.is_object()) {
        return std::unexpected("payload must be a JSON object");
    }

    Report report;
    auto node = body.find("node_id");
    if (node == body.end() || !node->is_string() || trim_sv(node->get_ref<const std::string&>()).empty()) {
        return std::unexpected("node_id must be a non-empty string");
    }
    report.node_id = trim(node->get_ref<const std::string&>());

    auto download = read_measure(body, "download_mbps");
    if (!download) return std::unexpected(download.error());
    auto upload = read_measure(body, "upload_mbps");
    if (!upload) return std::unexpected(upload.error());
    auto ping = read_measure(body, "ping_ms");
    if (!ping) return std::unexpected(ping.error());

    report.download_mbps = *download;
    report.upload_mbps = *upload;
    report.ping_ms = *ping;

    struct TextField {
        const char* key;
        std::optional<std::string> Report::*member;
    };
    constexpr std::array<TextField, 4> text_fields{{
        {"isp", &Report::isp},
        {"location", &Report::location},
        {"os_info", &Report::os_info},
        {"test_server", &Report::test_server},
    }};
    for (const auto& field : text_fields) {
        auto value = read_text(body, field.key);
        if (!value) return std::unexpected(value.error());
        report.*field.member = std::move(*value);
    }
    return report;
}

IngestHandler::IngestHandler(NodeStateStore& store, std::string api_token,
                             std::set<std::string, std::less<>> known_nodes,
                             AcceptedFn on_accepted, ClockFn clock)
    : store_(store),
      api_token_(std::move(api_token)),
      known_nodes_(std::move(known_nodes)),
      on_accepted_(std::move(on_accepted)),
      clock_(std::move(clock)) {}

HttpReply IngestHandler::handle(const HttpRequest& request) {
    json body = json::parse(request.body, nullptr, false);
    const json* body_ptr = body.is_discarded() ? nullptr : &body;

    auto token = extract_token(request, body_ptr);
    if (!token || api_token_.empty() || !tokens_equal(*token, api_token_)) {
        log::warn("Rejected report from {}: invalid or missing API token", request.remote);
        return json_reply(401, {{"error", "unauthorized"}});
    }

    if (!body_ptr) {
        log::warn("Rejected report from {}: body is not valid JSON", request.remote);
        return json_reply(400, {{"error", "invalid JSON body"}});
    }

    auto report = parse_report(body);
    if (!report) {
        log::warn("Rejected report from {}: {}", request.remote, report.error());
        return json_reply(400, {{"error", report.error()}});
    }

    report->captured_at = clock_();
    const std::string node_id = report->node_id;
    log::info("Report from {}: down {}, up {}, ping {}", node_id, format_speed(report->download_mbps),
              format_speed(report->upload_mbps), format_ping(report->ping_ms));

    store_.put(std::move(*report));

    if (!known_nodes_.contains(node_id)) {
        warn_unknown_node(node_id);
    }

    if (on_accepted_) {
        on_accepted_(node_id);
    }
    return json_reply(200, {{"status", "ok"}});
}

void IngestHandler::warn_unknown_node(const std::string& node_id) {
    std::lock_guard lock(warned_mutex_);
    if (!warned_nodes_.insert(node_id).second) {
        return;
    }
    log::warn(
        "Report from unknown node_id \"{}\". Add it to master.nodes_meta, for example:\n"
        "  \"{}\": {{\"flag\": \"🏳️\", \"display_name\": \"Node {}\"}}",
        node_id, node_id, node_id);
}

HttpReply health_reply(std::string_view mode) {
    return json_reply(200, {{"status", "alive"},
                            {"mode", std::string(mode)},
                            {"version", std::string(Config::APP_VERSION)}});
}

}  // namespace speedwatch
