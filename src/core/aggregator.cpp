/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/aggregator.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace speedwatch {

namespace {

NodeView make_node_view(NodeMeta meta, const NodeSnapshot& snapshot,
                        const AggregationPolicy& policy, TimePoint now) {
    NodeView view;
    view.meta = std::move(meta);

    auto it = snapshot.find(view.meta.node_id);
    if (it == snapshot.end()) {
        return view;
    }

    const Report& report = it->second;
    view.last_report = report;

    // A clock step backwards must not produce a negative age.
    auto age = std::chrono::duration_cast<std::chrono::minutes>(now - report.captured_at);
    view.age = std::max(age, std::chrono::minutes{0});

    if (now - report.captured_at > policy.staleness_window) {
        view.freshness = Freshness::Stale;
        return view;
    }

    view.freshness = Freshness::Fresh;
    view.tier = classify(report.download_mbps, report.upload_mbps, report.ping_ms,
                         policy.thresholds);
    view.status = view.tier < Tier::Low ? NodeStatus::Degraded : NodeStatus::Ok;
    return view;
}

}  // namespace

AggregatedView build_view(const NodeSnapshot& snapshot, const AggregationPolicy& policy,
                          TimePoint now) {
    AggregatedView result;
    result.generated_at = now;

    std::vector<NodeMeta> configured = policy.nodes;
    std::ranges::stable_sort(configured, {}, &NodeMeta::order_rank);

    std::set<std::string> seen;
    for (auto& meta : configured) {
        if (!seen.insert(meta.node_id).second) continue;
        result.nodes.push_back(make_node_view(std::move(meta), snapshot, policy, now));
    }

    // std::map iterates in key order, which gives the alphabetical tail.
    for (const auto& [node_id, report] : snapshot) {
        if (seen.contains(node_id)) continue;
        NodeMeta meta{.node_id = node_id, .flag = "", .display_name = node_id, .order_rank = 0};
        auto view = make_node_view(std::move(meta), snapshot, policy, now);
        view.configured = false;
        result.nodes.push_back(std::move(view));
    }

    std::vector<NodeHealth> health;
    health.reserve(result.nodes.size());
    for (const auto& node : result.nodes) {
        health.push_back({node.tier, !node.fresh()});
        switch (node.status) {
            case NodeStatus::Ok:
                ++result.summary.ok;
                break;
            case NodeStatus::Degraded:
                ++result.summary.degraded;
                break;
            case NodeStatus::Offline:
                ++result.summary.offline;
                break;
        }
    }
    result.cluster = cluster_status(health);
    return result;
}

std::string_view node_status_name(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Ok:
            return "ok";
        case NodeStatus::Degraded:
            return "degraded";
        case NodeStatus::Offline:
            return "offline";
    }
    return "offline";
}

}  // namespace speedwatch
