/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <array>
#include <span>
#include <string_view>

namespace speedwatch {

enum class Tier { VeryLow, Low, Medium, Good, Excellent };

enum class ClusterStatus { Ok, Degraded };

// Lower bound (Mbps of download) of each tier.
struct Thresholds {
    double very_low = 50.0;
    double low = 200.0;
    double medium = 500.0;
    double good = 1000.0;
    double excellent = 2000.0;

    [[nodiscard]] std::array<double, 5> bounds() const {
        return {very_low, low, medium, good, excellent};
    }
};

struct NodeHealth {
    Tier tier = Tier::VeryLow;
    bool stale = false;
};

[[nodiscard]] Tier classify(double download_mbps, double upload_mbps, double ping_ms,
                            const Thresholds& thresholds) noexcept;

[[nodiscard]] ClusterStatus cluster_status(std::span<const NodeHealth> nodes) noexcept;

[[nodiscard]] std::string_view tier_name(Tier tier) noexcept;
[[nodiscard]] std::string_view tier_glyph(Tier tier) noexcept;

}  // namespace speedwatch
