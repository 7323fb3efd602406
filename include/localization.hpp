/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string_view>

#include "include/aggregator.hpp"
#include "include/preferences.hpp"
#include "include/status.hpp"

namespace speedwatch {

struct Labels {
    std::string_view report_title;
    std::string_view single_title;
    std::string_view summary;
    std::string_view download;
    std::string_view upload;
    std::string_view ping;
    std::string_view status;
    std::string_view test_server;
    std::string_view isp;
    std::string_view location;
    std::string_view os;
    std::string_view server;
    std::string_view description;
    std::string_view time;
    std::string_view error;
    std::string_view no_data;
    std::string_view stale;
    // Format strings taking the age in minutes.
    std::string_view last_seen;
    std::string_view stale_since;
    std::string_view cluster_ok;
    std::string_view cluster_degraded;
    std::string_view tier_very_low;
    std::string_view tier_low;
    std::string_view tier_medium;
    std::string_view tier_good;
    std::string_view tier_excellent;
    std::string_view node_ok;
    std::string_view node_degraded;
    std::string_view node_offline;
    std::string_view settings_title;
    std::string_view settings_language;
    std::string_view settings_view;
    std::string_view view_compact;
    std::string_view view_detailed;
    std::string_view saved;
    std::string_view save_failed;
};

[[nodiscard]] const Labels& labels_for(Language language) noexcept;
[[nodiscard]] std::string_view tier_label(const Labels& labels, Tier tier) noexcept;
[[nodiscard]] std::string_view node_status_label(const Labels& labels, NodeStatus status) noexcept;

}  // namespace speedwatch
