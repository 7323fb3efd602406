/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/node_client.hpp"

#include <chrono>
#include <format>
#include <utility>

#include "include/config.hpp"
#include "include/log.hpp"

using json = nlohmann::json;

namespace speedwatch {

std::string report_url(const std::string& master_url) {
    auto scheme = master_url.find("://");
    auto host_start = scheme == std::string::npos ? 0 : scheme + 3;
    auto path = master_url.find('/', host_start);

    if (path == std::string::npos) {
        return master_url + std::string(Config::REPORT_PATH);
    }
    if (path == master_url.size() - 1) {
        return master_url.substr(0, path) + std::string(Config::REPORT_PATH);
    }
    return master_url;
}

json build_report_payload(const NodeSettings& node, const Measurement& m,
                          const std::string& os_info, TimePoint now) {
    json payload = {
        {"node_id", node.node_id},
        {"download_mbps", m.download_mbps},
        {"upload_mbps", m.upload_mbps},
        {"ping_ms", m.ping_ms},
        {"timestamp", std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(now))},
    };

    if (!m.isp.empty()) payload["isp"] = m.isp;
    if (!node.location.empty()) payload["location"] = node.location;
    if (!os_info.empty()) payload["os_info"] = os_info;
    if (!m.server_name.empty()) {
        payload["test_server"] = m.server_location.empty()
                                     ? m.server_name
                                     : std::format("{} ({})", m.server_name, m.server_location);
    }
    return payload;
}

NodeClient::NodeClient(NodeSettings settings, AuthPostFn post)
    : settings_(std::move(settings)), post_(std::move(post)) {
    if (!post_) {
        post_ = [](const std::string& url, const std::string& body,
                   const std::vector<std::string>& headers) {
            HttpClient client;
            return client.post_json(url, body, headers);
        };
    }
}

std::expected<void, std::string> NodeClient::submit(const json& payload) {
    const std::string url = report_url(settings_.master_url);
    const std::vector<std::string> headers{std::format("Authorization: Bearer {}", settings_.api_token)};

    auto response = post_(url, payload.dump(), headers);
    if (!response) {
        return std::unexpected(std::format("Error sending report to {}: {}", url, response.error()));
    }
    if (response->status != 200) {
        return std::unexpected(
            std::format("Master rejected report (HTTP {}): {}", response->status, response->body));
    }

    log::info("Report delivered to {}", url);
    return {};
}

}  // namespace speedwatch
