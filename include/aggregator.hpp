/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include "include/node_state_store.hpp"
#include "include/report.hpp"
#include "include/status.hpp"

namespace speedwatch {

enum class Freshness { Fresh, Stale, NoData };

enum class NodeStatus { Ok, Degraded, Offline };

struct NodeView {
    NodeMeta meta;
    // Kept for stale nodes too, so the detailed view can show when it was last seen.
    std::optional<Report> last_report;
    Freshness freshness = Freshness::NoData;
    Tier tier = Tier::VeryLow;
    NodeStatus status = NodeStatus::Offline;
    std::chrono::minutes age{0};
    bool configured = true;

    [[nodiscard]] bool fresh() const noexcept { return freshness == Freshness::Fresh; }
};

struct StatusSummary {
    int ok = 0;
    int degraded = 0;
    int offline = 0;
};

struct AggregatedView {
    TimePoint generated_at{};
    std::vector<NodeView> nodes;
    ClusterStatus cluster = ClusterStatus::Ok;
    StatusSummary summary;
};

struct AggregationPolicy {
    std::vector<NodeMeta> nodes;
    Thresholds thresholds;
    std::chrono::minutes staleness_window{120};
};

// Configured nodes come first in order_rank order, then nodes that reported
// without being configured, alphabetically.
[[nodiscard]] AggregatedView build_view(const NodeSnapshot& snapshot,
                                        const AggregationPolicy& policy,
                                        TimePoint now);

[[nodiscard]] std::string_view node_status_name(NodeStatus status) noexcept;

}  // namespace speedwatch
