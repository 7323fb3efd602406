// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace speedwatch {

using TimePoint = std::chrono::system_clock::time_point;
using ClockFn = std::function<TimePoint()>;

inline TimePoint system_now() {
    return std::chrono::system_clock::now();
}

// One node's latest measurement. captured_at is the master's clock at arrival.
struct Report {
    std::string node_id;
    double download_mbps = 0.0;
    double upload_mbps = 0.0;
    double ping_ms = 0.0;
    std::optional<std::string> isp;
    std::optional<std::string> location;
    std::optional<std::string> os_info;
    std::optional<std::string> test_server;
    TimePoint captured_at{};

    bool operator==(const Report&) const = default;
};

struct NodeMeta {
    std::string node_id;
    std::string flag;
    std::string display_name;
    int order_rank = 0;
};

// Output of one speedtest CLI run on the measuring host.
struct Measurement {
    double download_mbps = 0.0;
    double upload_mbps = 0.0;
    double ping_ms = 0.0;
    std::string server_name;
    std::string server_location;
    std::string isp;
    bool success = false;
    bool rate_limited = false;
    std::string error;
};

}  // namespace speedwatch
