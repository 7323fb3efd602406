/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>

#include "include/aggregator.hpp"
#include "include/preferences.hpp"
#include "include/report.hpp"
#include "include/status.hpp"

namespace speedwatch {

// Everything a one-host report shows; used by single mode.
struct SingleReport {
    std::string server_name;
    std::string server_location;
    std::string description;
    std::string identifier;
    std::string os_info;
    Measurement measurement;
    TimePoint generated_at{};
};

// Pure functions: the output depends on the arguments only, so equal inputs
// render byte-identical text. Output uses Telegram HTML markup.
namespace Renderer {
std::string render_digest(const AggregatedView& view, Language language, ViewMode mode);
std::string render_compact(const AggregatedView& view, Language language);
std::string render_detailed(const AggregatedView& view, Language language);

std::string render_single(const SingleReport& report, const Thresholds& thresholds,
                          Language language);
}  // namespace Renderer

}  // namespace speedwatch
