/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "include/http_server.hpp"
#include "include/node_state_store.hpp"
#include "include/report.hpp"

namespace speedwatch {

// Compares two secrets in time independent of where they differ.
[[nodiscard]] bool tokens_equal(std::string_view presented, std::string_view expected) noexcept;

// Token from "Authorization: Bearer", then "X-Api-Token", then the body's "token" field.
[[nodiscard]] std::optional<std::string> extract_token(const HttpRequest& request,
                                                       const nlohmann::json* body);

// Validates a report payload. captured_at is left for the caller to stamp.
[[nodiscard]] std::expected<Report, std::string> parse_report(const nlohmann::json& body);

class IngestHandler {
   public:
    using AcceptedFn = std::function<void(const std::string& node_id)>;

    IngestHandler(NodeStateStore& store, std::string api_token,
                  std::set<std::string, std::less<>> known_nodes, AcceptedFn on_accepted = {},
                  ClockFn clock = system_now);

    HttpReply handle(const HttpRequest& request);

   private:
    void warn_unknown_node(const std::string& node_id);

    NodeStateStore& store_;
    std::string api_token_;
    std::set<std::string, std::less<>> known_nodes_;
    AcceptedFn on_accepted_;
    ClockFn clock_;

    std::mutex warned_mutex_;
    std::set<std::string, std::less<>> warned_nodes_;
};

[[nodiscard]] HttpReply health_reply(std::string_view mode);

}  // namespace speedwatch
