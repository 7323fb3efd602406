/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "include/aggregator.hpp"
#include "include/config.hpp"
#include "include/log.hpp"
#include "include/preferences.hpp"
#include "include/status.hpp"

namespace speedwatch {

class SettingsError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

enum class RunMode { Single, Node, Master };

[[nodiscard]] std::optional<RunMode> parse_run_mode(std::string_view name) noexcept;
[[nodiscard]] std::string_view run_mode_name(RunMode mode) noexcept;

struct LoggingSettings {
    log::Level level = log::Level::Info;
    std::optional<std::filesystem::path> file;
    std::size_t max_bytes = Config::LOG_MAX_BYTES;
    int backup_count = Config::LOG_BACKUP_COUNT;
};

struct TelegramSettings {
    std::string bot_token;
    std::vector<std::string> chat_ids;
    bool send_always = false;
    std::string api_base = std::string(Config::TELEGRAM_API_BASE);
};

struct SpeedtestSettings {
    std::string command;  // empty: search PATH
    std::chrono::seconds timeout = Config::SPEEDTEST_DEFAULT_TIMEOUT;
    int retry_count = 3;
    std::chrono::seconds retry_delay{5};
    std::optional<int> server_id;
};

// Single-mode identity; "auto" means derive from the host.
struct ServerSettings {
    std::string name = "auto";
    std::string location = "auto";
    std::string identifier = "auto";
    std::string description;
};

struct RecipientSettings {
    std::string chat_id;
    PrefDefaults defaults;
};

struct NodeMetaSettings {
    std::string flag;
    std::string display_name;
};

struct ScheduleSettings {
    std::chrono::minutes interval{60};
    bool send_immediately = false;
};

struct MasterSettings {
    std::string listen_host = "0.0.0.0";
    std::uint16_t listen_port = 8080;
    std::string api_token;
    std::chrono::minutes node_timeout{120};
    std::vector<std::string> nodes_order;
    std::map<std::string, NodeMetaSettings, std::less<>> nodes_meta;
    std::vector<RecipientSettings> recipients;
    ScheduleSettings schedule;
    std::filesystem::path preferences_path = "chat_prefs.json";
    std::size_t workers = Config::DEFAULT_HTTP_WORKERS;

    // Listed nodes first in nodes_order order, then the rest of nodes_meta.
    [[nodiscard]] std::vector<NodeMeta> node_metas() const;
    [[nodiscard]] AggregationPolicy to_policy(const Thresholds& thresholds) const;
    [[nodiscard]] PreferenceDefaults preference_defaults() const;
    [[nodiscard]] std::vector<std::string> recipient_ids() const;
};

struct NodeSettings {
    std::string node_id;
    std::string master_url;
    std::string api_token;
    std::string location;
    std::string description;
};

struct Settings {
    RunMode mode = RunMode::Single;
    LoggingSettings logging;
    Thresholds thresholds;
    TelegramSettings telegram;
    SpeedtestSettings speedtest;
    ServerSettings server;
    std::optional<MasterSettings> master;
    std::optional<NodeSettings> node;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

[[nodiscard]] std::optional<std::string> process_env(std::string_view name);

// Builds and validates settings from a parsed document; throws SettingsError.
[[nodiscard]] Settings parse_settings(const nlohmann::json& doc, const EnvLookup& env = process_env);

[[nodiscard]] Settings load_settings(const std::filesystem::path& path,
                                     const EnvLookup& env = process_env);

// --config, then $SPEEDWATCH_CONFIG, then ./config.json, then next to the executable.
[[nodiscard]] std::optional<std::filesystem::path> find_config_file(
    const std::optional<std::filesystem::path>& explicit_path, const EnvLookup& env = process_env);

}  // namespace speedwatch
