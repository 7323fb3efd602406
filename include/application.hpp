/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include "include/log.hpp"
#include "include/report.hpp"
#include "include/settings.hpp"
#include "include/status.hpp"

namespace speedwatch {

struct CliOptions {
    bool help = false;
    bool version = false;
    std::optional<std::filesystem::path> config;
    std::optional<log::Level> log_level;
};

[[nodiscard]] std::expected<CliOptions, std::string> parse_cli(std::span<char* const> args);

// Single mode notifies on every run with send_always, otherwise only when
// the test failed or the download is below the "low" tier.
[[nodiscard]] bool should_notify(const Measurement& m, const Thresholds& thresholds,
                                 bool send_always) noexcept;

namespace ExitCode {
constexpr int Ok = 0;
constexpr int Fatal = 1;
constexpr int MeasurementFailed = 2;
}  // namespace ExitCode

class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;

    int run_master(const Settings& settings);
    int run_node(const Settings& settings);
    int run_single(const Settings& settings);
};

}  // namespace speedwatch
