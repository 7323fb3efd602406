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
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "include/http_client.hpp"
#include "include/report.hpp"
#include "include/settings.hpp"

namespace speedwatch {

// A bare "http://host:port" gets the default report path appended.
[[nodiscard]] std::string report_url(const std::string& master_url);

[[nodiscard]] nlohmann::json build_report_payload(const NodeSettings& node, const Measurement& m,
                                                  const std::string& os_info, TimePoint now);

using AuthPostFn = std::function<std::expected<HttpResponse, std::string>(
    const std::string& url, const std::string& body, const std::vector<std::string>& headers)>;

// Uploads one report to the master.
class NodeClient {
    NodeSettings settings_;
    AuthPostFn post_;

   public:
    explicit NodeClient(NodeSettings settings, AuthPostFn post = {});

    std::expected<void, std::string> submit(const nlohmann::json& payload);
};

}  // namespace speedwatch
