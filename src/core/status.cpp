/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/status.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace speedwatch {

Tier classify(double download_mbps, double, double, const Thresholds& thresholds) noexcept {
    if (!std::isfinite(download_mbps)) {
        return Tier::VeryLow;
    }

    const auto bounds = thresholds.bounds();
    Tier tier = Tier::VeryLow;
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        if (download_mbps >= bounds[i]) {
            tier = std::max(tier, static_cast<Tier>(i));
        }
    }
    return tier;
}

ClusterStatus cluster_status(std::span<const NodeHealth> nodes) noexcept {
    const bool degraded = std::ranges::any_of(nodes, [](const NodeHealth& node) {
        return node.stale || node.tier < Tier::Low;
    });
    return degraded ? ClusterStatus::Degraded : ClusterStatus::Ok;
}

std::string_view tier_name(Tier tier) noexcept {
    switch (tier) {
        case Tier::VeryLow:
            return "very_low";
        case Tier::Low:
            return "low";
        case Tier::Medium:
            return "medium";
        case Tier::Good:
            return "good";
        case Tier::Excellent:
            return "excellent";
    }
    return "very_low";
}

std::string_view tier_glyph(Tier tier) noexcept {
    switch (tier) {
        case Tier::VeryLow:
            return "🚨❌";
        case Tier::Low:
            return "⚠️🐌";
        case Tier::Medium:
            return "✅🚗";
        case Tier::Good:
            return "👍🛜";
        case Tier::Excellent:
            return "🚀⚡";
    }
    return "❓";
}

}  // namespace speedwatch
