/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/settings.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <set>
#include <utility>

#include "include/utils.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace speedwatch {

std::optional<RunMode> parse_run_mode(std::string_view name) noexcept {
    if (name == "single") return RunMode::Single;
    if (name == "node") return RunMode::Node;
    if (name == "master") return RunMode::Master;
    return std::nullopt;
}

std::string_view run_mode_name(RunMode mode) noexcept {
    switch (mode) {
        case RunMode::Single:
            return "single";
        case RunMode::Node:
            return "node";
        case RunMode::Master:
            return "master";
    }
    return "single";
}

std::vector<NodeMeta> MasterSettings::node_metas() const {
    std::vector<NodeMeta> metas;
    std::set<std::string, std::less<>> listed;

    auto make = [this](const std::string& id, int rank) {
        NodeMeta meta{.node_id = id, .flag = "", .display_name = id, .order_rank = rank};
        if (auto it = nodes_meta.find(id); it != nodes_meta.end()) {
            meta.flag = it->second.flag;
            if (!it->second.display_name.empty()) meta.display_name = it->second.display_name;
        }
        return meta;
    };

    int rank = 0;
    for (const auto& id : nodes_order) {
        if (!listed.insert(id).second) continue;
        metas.push_back(make(id, rank++));
    }
    for (const auto& [id, meta] : nodes_meta) {
        if (listed.contains(id)) continue;
        metas.push_back(make(id, rank++));
    }
    return metas;
}

AggregationPolicy MasterSettings::to_policy(const Thresholds& thresholds) const {
    return AggregationPolicy{
        .nodes = node_metas(), .thresholds = thresholds, .staleness_window = node_timeout};
}

PreferenceDefaults MasterSettings::preference_defaults() const {
    PreferenceDefaults defaults;
    for (const auto& recipient : recipients) {
        defaults.per_recipient.insert_or_assign(recipient.chat_id, recipient.defaults);
    }
    return defaults;
}

std::vector<std::string> MasterSettings::recipient_ids() const {
    std::vector<std::string> ids;
    ids.reserve(recipients.size());
    for (const auto& recipient : recipients) {
        ids.push_back(recipient.chat_id);
    }
    return ids;
}

std::optional<std::string> process_env(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

namespace {

const json& section(const json& doc, const char* key) {
    static const json empty = json::object();
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return empty;
    if (!it->is_object()) {
        throw SettingsError(std::format("'{}' must be an object", key));
    }
    return *it;
}

template <typename T>
T value_or(const json& obj, std::string_view where, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        throw SettingsError(std::format("'{}.{}' has the wrong type", where, key));
    }
}

// Telegram chat ids appear both as numbers and as strings.
std::string chat_id_string(const json& value, std::string_view where) {
    if (value.is_string()) return trim(value.get<std::string>());
    if (value.is_number_integer()) return std::to_string(value.get<std::int64_t>());
    throw SettingsError(std::format("'{}' must be a chat id (string or integer)", where));
}

int positive_int(const json& obj, std::string_view where, const char* key, int fallback) {
    int value = value_or<int>(obj, where, key, fallback);
    if (value <= 0) {
        throw SettingsError(std::format("'{}.{}' must be positive", where, key));
    }
    return value;
}

LoggingSettings parse_logging(const json& doc) {
    const json& s = section(doc, "logging");
    LoggingSettings out;

    auto level_text = value_or<std::string>(s, "logging", "level", "INFO");
    auto level = log::parse_level(level_text);
    if (!level) {
        throw SettingsError(std::format("'logging.level': unknown level '{}'", level_text));
    }
    out.level = *level;

    auto file = value_or<std::string>(s, "logging", "file", "");
    if (!file.empty()) out.file = fs::path(file);

    out.max_bytes = value_or<std::size_t>(s, "logging", "max_bytes", out.max_bytes);
    out.backup_count = value_or<int>(s, "logging", "backup_count", out.backup_count);
    if (out.backup_count < 0) {
        throw SettingsError("'logging.backup_count' must not be negative");
    }
    return out;
}

Thresholds parse_thresholds(const json& doc) {
    const json& s = section(doc, "thresholds");
    Thresholds t;
    t.very_low = value_or<double>(s, "thresholds", "very_low", t.very_low);
    t.low = value_or<double>(s, "thresholds", "low", t.low);
    t.medium = value_or<double>(s, "thresholds", "medium", t.medium);
    t.good = value_or<double>(s, "thresholds", "good", t.good);
    t.excellent = value_or<double>(s, "thresholds", "excellent",
                                   t.good < t.excellent ? t.excellent : t.good * 2.0);

    const auto bounds = t.bounds();
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        if (!(bounds[i] > 0.0)) {
            throw SettingsError("'thresholds' values must be positive");
        }
        if (i > 0 && !(bounds[i] > bounds[i - 1])) {
            throw SettingsError(
                "'thresholds' must be strictly increasing: very_low < low < medium < good < excellent");
        }
    }
    return t;
}

TelegramSettings parse_telegram(const json& doc, const EnvLookup& env) {
    const json& s = section(doc, "telegram");
    TelegramSettings out;

    out.bot_token = value_or<std::string>(s, "telegram", "bot_token", "");
    if (auto token = env(Config::BOT_TOKEN_ENV)) {
        out.bot_token = *token;
    }
    out.send_always = value_or<bool>(s, "telegram", "send_always", false);
    out.api_base = value_or<std::string>(s, "telegram", "api_base", out.api_base);

    if (auto it = s.find("chat_ids"); it != s.end() && !it->is_null()) {
        if (!it->is_array()) throw SettingsError("'telegram.chat_ids' must be an array");
        for (const auto& id : *it) {
            out.chat_ids.push_back(chat_id_string(id, "telegram.chat_ids[]"));
        }
    }
    return out;
}

SpeedtestSettings parse_speedtest(const json& doc) {
    const json& s = section(doc, "speedtest");
    SpeedtestSettings out;
    out.command = value_or<std::string>(s, "speedtest", "command", "");
    out.timeout = std::chrono::seconds(
        positive_int(s, "speedtest", "timeout_sec", static_cast<int>(out.timeout.count())));
    out.retry_count = positive_int(s, "speedtest", "retry_count", out.retry_count);
    out.retry_delay = std::chrono::seconds(
        value_or<int>(s, "speedtest", "retry_delay_sec", static_cast<int>(out.retry_delay.count())));
    if (out.retry_delay.count() < 0) {
        throw SettingsError("'speedtest.retry_delay_sec' must not be negative");
    }
    if (auto it = s.find("server_id"); it != s.end() && !it->is_null()) {
        out.server_id = value_or<int>(s, "speedtest", "server_id", 0);
    }
    return out;
}

ServerSettings parse_server(const json& doc) {
    const json& s = section(doc, "server");
    ServerSettings out;
    out.name = value_or<std::string>(s, "server", "name", out.name);
    out.location = value_or<std::string>(s, "server", "location", out.location);
    out.identifier = value_or<std::string>(s, "server", "identifier", out.identifier);
    out.description = value_or<std::string>(s, "server", "description", "");
    return out;
}

RecipientSettings parse_recipient(const json& entry, std::string_view where) {
    if (!entry.is_object()) {
        throw SettingsError(std::format("'{}' entries must be objects", where));
    }
    auto id = entry.find("chat_id");
    if (id == entry.end()) {
        throw SettingsError(std::format("'{}' entry is missing chat_id", where));
    }

    RecipientSettings out;
    out.chat_id = chat_id_string(*id, where);

    auto language = value_or<std::string>(entry, where, "default_language", "en");
    auto parsed_language = parse_language(language);
    if (!parsed_language) {
        throw SettingsError(std::format("'{}': unknown language '{}'", where, language));
    }
    auto mode = value_or<std::string>(entry, where, "default_view_mode", "compact");
    auto parsed_mode = parse_view_mode(mode);
    if (!parsed_mode) {
        throw SettingsError(std::format("'{}': unknown view mode '{}'", where, mode));
    }
    out.defaults = PrefDefaults{*parsed_language, *parsed_mode};
    return out;
}

MasterSettings parse_master(const json& s, const TelegramSettings& telegram) {
    MasterSettings out;
    out.listen_host = value_or<std::string>(s, "master", "listen_host", out.listen_host);

    int port = value_or<int>(s, "master", "listen_port", out.listen_port);
    if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        throw SettingsError("'master.listen_port' must be between 0 and 65535");
    }
    out.listen_port = static_cast<std::uint16_t>(port);

    out.api_token = value_or<std::string>(s, "master", "api_token", "");
    out.node_timeout = std::chrono::minutes(positive_int(s, "master", "node_timeout_minutes", 120));
    out.nodes_order = value_or<std::vector<std::string>>(s, "master", "nodes_order", {});
    out.workers = static_cast<std::size_t>(
        positive_int(s, "master", "workers", static_cast<int>(out.workers)));

    auto prefs_path = value_or<std::string>(s, "master", "preferences_path", "");
    if (!prefs_path.empty()) out.preferences_path = prefs_path;

    if (auto it = s.find("nodes_meta"); it != s.end() && !it->is_null()) {
        if (!it->is_object()) throw SettingsError("'master.nodes_meta' must be an object");
        for (const auto& [id, meta] : it->items()) {
            if (!meta.is_object()) {
                throw SettingsError(std::format("'master.nodes_meta.{}' must be an object", id));
            }
            const std::string where = std::format("master.nodes_meta.{}", id);
            out.nodes_meta.insert_or_assign(
                id, NodeMetaSettings{value_or<std::string>(meta, where, "flag", ""),
                                     value_or<std::string>(meta, where, "display_name", "")});
        }
    }

    // "telegram_targets" is the older name of the recipient list.
    const char* recipients_key = s.contains("recipients") ? "recipients" : "telegram_targets";
    if (auto it = s.find(recipients_key); it != s.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw SettingsError(std::format("'master.{}' must be an array", recipients_key));
        }
        const std::string where = std::format("master.{}", recipients_key);
        for (const auto& entry : *it) {
            out.recipients.push_back(parse_recipient(entry, where));
        }
    }
    if (out.recipients.empty()) {
        for (const auto& id : telegram.chat_ids) {
            out.recipients.push_back(RecipientSettings{id, {}});
        }
    }

    if (auto it = s.find("schedule"); it != s.end() && !it->is_null()) {
        if (!it->is_object()) throw SettingsError("'master.schedule' must be an object");
        out.schedule.interval =
            std::chrono::minutes(positive_int(*it, "master.schedule", "interval_minutes", 60));
        out.schedule.send_immediately =
            value_or<bool>(*it, "master.schedule", "send_immediately", false);
    } else {
        out.schedule.interval = std::chrono::minutes(
            positive_int(s, "master", "aggregation_interval_minutes", 60));
        out.schedule.send_immediately = true;
    }

    if (out.api_token.empty()) {
        throw SettingsError("'master.api_token' is required in master mode");
    }
    if (out.recipients.empty()) {
        throw SettingsError("master mode needs at least one recipient (master.recipients or telegram.chat_ids)");
    }
    return out;
}

NodeSettings parse_node(const json& s) {
    NodeSettings out;
    out.node_id = trim(value_or<std::string>(s, "node", "node_id", ""));
    out.master_url = trim(value_or<std::string>(s, "node", "master_url", ""));
    out.api_token = value_or<std::string>(s, "node", "api_token", "");
    out.location = value_or<std::string>(s, "node", "location", "");
    out.description = value_or<std::string>(s, "node", "description", "");

    if (out.node_id.empty()) throw SettingsError("'node.node_id' is required in node mode");
    if (out.master_url.empty()) throw SettingsError("'node.master_url' is required in node mode");
    if (out.api_token.empty()) throw SettingsError("'node.api_token' is required in node mode");
    return out;
}

}  // namespace

Settings parse_settings(const json& doc, const EnvLookup& env) {
    if (!doc.is_object()) {
        throw SettingsError("configuration must be a JSON object");
    }

    Settings out;
    auto mode_text = value_or<std::string>(doc, "config", "mode", "single");
    auto mode = parse_run_mode(mode_text);
    if (!mode) {
        throw SettingsError(std::format("'mode': unknown mode '{}' (single, node, master)", mode_text));
    }
    out.mode = *mode;

    out.logging = parse_logging(doc);
    out.thresholds = parse_thresholds(doc);
    out.telegram = parse_telegram(doc, env);
    out.speedtest = parse_speedtest(doc);
    out.server = parse_server(doc);

    if (out.mode == RunMode::Master) {
        out.master = parse_master(section(doc, "master"), out.telegram);
    }
    if (out.mode == RunMode::Node) {
        out.node = parse_node(section(doc, "node"));
    }

    if (out.mode != RunMode::Node && out.telegram.bot_token.empty()) {
        throw SettingsError(std::format("'telegram.bot_token' (or ${}) is required in {} mode",
                                        Config::BOT_TOKEN_ENV, run_mode_name(out.mode)));
    }
    if (out.mode == RunMode::Single && out.telegram.chat_ids.empty()) {
        throw SettingsError("'telegram.chat_ids' needs at least one chat in single mode");
    }
    return out;
}

Settings load_settings(const fs::path& path, const EnvLookup& env) {
    std::ifstream in(path);
    if (!in) {
        throw SettingsError(std::format("Cannot open configuration file '{}'", path.string()));
    }

    json doc;
    try {
        doc = json::parse(in, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw SettingsError(std::format("Invalid JSON in '{}': {}", path.string(), e.what()));
    }
    return parse_settings(doc, env);
}

std::optional<fs::path> find_config_file(const std::optional<fs::path>& explicit_path,
                                         const EnvLookup& env) {
    if (explicit_path) {
        return *explicit_path;
    }
    if (auto from_env = env(Config::CONFIG_ENV)) {
        return fs::path(*from_env);
    }

    std::error_code ec;
    fs::path local = fs::path(Config::DEFAULT_CONFIG_FILE);
    if (fs::exists(local, ec)) {
        return local;
    }
    fs::path beside_exe = get_exe_dir() / Config::DEFAULT_CONFIG_FILE;
    if (fs::exists(beside_exe, ec)) {
        return beside_exe;
    }
    return std::nullopt;
}

}  // namespace speedwatch
