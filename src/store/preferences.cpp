/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/preferences.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "include/file_descriptor.hpp"
#include "include/log.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace speedwatch {

std::optional<Language> parse_language(std::string_view code) noexcept {
    if (code == "en") return Language::En;
    if (code == "ru") return Language::Ru;
    return std::nullopt;
}

std::string_view language_code(Language language) noexcept {
    switch (language) {
        case Language::En:
            return "en";
        case Language::Ru:
            return "ru";
    }
    return "en";
}

std::optional<ViewMode> parse_view_mode(std::string_view name) noexcept {
    if (name == "compact") return ViewMode::Compact;
    if (name == "detailed") return ViewMode::Detailed;
    return std::nullopt;
}

std::string_view view_mode_name(ViewMode mode) noexcept {
    switch (mode) {
        case ViewMode::Compact:
            return "compact";
        case ViewMode::Detailed:
            return "detailed";
    }
    return "compact";
}

PrefDefaults PreferenceDefaults::for_recipient(std::string_view recipient_id) const {
    auto it = per_recipient.find(recipient_id);
    return it != per_recipient.end() ? it->second : fallback;
}

PreferenceStore::PreferenceStore(PreferenceDefaults defaults, ClockFn clock)
    : defaults_(std::move(defaults)), clock_(std::move(clock)) {}

void PreferenceStore::load_initial(PreferenceMap prefs) {
    std::lock_guard lock(mutex_);
    prefs_ = std::move(prefs);
}

RecipientPref PreferenceStore::make_default(const std::string& recipient_id) const {
    const auto d = defaults_.for_recipient(recipient_id);
    const auto now = clock_();
    return RecipientPref{recipient_id, d.language, d.view_mode, now, now};
}

RecipientPref PreferenceStore::get_or_default(const std::string& recipient_id) {
    std::lock_guard lock(mutex_);
    if (auto it = prefs_.find(recipient_id); it != prefs_.end()) {
        return it->second;
    }

    RecipientPref pref = make_default(recipient_id);
    PreferenceMap next = prefs_;
    next.insert_or_assign(recipient_id, pref);

    if (auto saved = persist(next); !saved) {
        log::warn("Could not persist default preferences for chat {}: {}", recipient_id,
                  saved.error());
        return pref;
    }
    prefs_ = std::move(next);
    return pref;
}

template <typename Mutator>
std::expected<RecipientPref, std::string> PreferenceStore::update(const std::string& recipient_id,
                                                                  Mutator&& mutate) {
    std::lock_guard lock(mutex_);

    RecipientPref pref;
    if (auto it = prefs_.find(recipient_id); it != prefs_.end()) {
        pref = it->second;
    } else {
        pref = make_default(recipient_id);
    }

    mutate(pref);
    pref.updated_at = clock_();

    PreferenceMap next = prefs_;
    next.insert_or_assign(recipient_id, pref);

    if (auto saved = persist(next); !saved) {
        return std::unexpected(saved.error());
    }
    prefs_ = std::move(next);
    return pref;
}

std::expected<RecipientPref, std::string> PreferenceStore::set_language(
    const std::string& recipient_id, Language language) {
    return update(recipient_id, [language](RecipientPref& p) { p.language = language; });
}

std::expected<RecipientPref, std::string> PreferenceStore::set_view_mode(
    const std::string& recipient_id, ViewMode mode) {
    return update(recipient_id, [mode](RecipientPref& p) { p.view_mode = mode; });
}

std::optional<RecipientPref> PreferenceStore::find(const std::string& recipient_id) const {
    std::lock_guard lock(mutex_);
    auto it = prefs_.find(recipient_id);
    if (it == prefs_.end()) return std::nullopt;
    return it->second;
}

namespace {

std::int64_t to_epoch(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch(std::int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

std::string string_field(const json& entry, const char* key) {
    auto it = entry.find(key);
    return it != entry.end() && it->is_string() ? it->get<std::string>() : std::string();
}

TimePoint time_field(const json& entry, const char* key) {
    auto it = entry.find(key);
    return it != entry.end() && it->is_number_integer() ? from_epoch(it->get<std::int64_t>())
                                                        : TimePoint{};
}

json to_json(const PreferenceMap& prefs) {
    json recipients = json::object();
    for (const auto& [id, pref] : prefs) {
        recipients[id] = {
            {"language", std::string(language_code(pref.language))},
            {"view_mode", std::string(view_mode_name(pref.view_mode))},
            {"created_at", to_epoch(pref.created_at)},
            {"updated_at", to_epoch(pref.updated_at)},
        };
    }
    return json{{"version", 1}, {"recipients", std::move(recipients)}};
}

PreferenceMap read_file(const fs::path& path) {
    PreferenceMap prefs;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return prefs;
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::format("Cannot open preferences file '{}'", path.string()));
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(
            std::format("Corrupt preferences file '{}': {}", path.string(), e.what()));
    }

    if (!doc.contains("recipients") || !doc["recipients"].is_object()) {
        return prefs;
    }

    for (const auto& [id, entry] : doc["recipients"].items()) {
        if (!entry.is_object()) {
            log::warn("Skipping invalid preferences entry for chat {}", id);
            continue;
        }
        auto language = parse_language(string_field(entry, "language"));
        auto mode = parse_view_mode(string_field(entry, "view_mode"));
        if (!language || !mode) {
            log::warn("Skipping invalid preferences entry for chat {}", id);
            continue;
        }
        prefs.insert_or_assign(id, RecipientPref{
                                       .recipient_id = id,
                                       .language = *language,
                                       .view_mode = *mode,
                                       .created_at = time_field(entry, "created_at"),
                                       .updated_at = time_field(entry, "updated_at"),
                                   });
    }
    return prefs;
}

}  // namespace

JsonPreferenceStore::JsonPreferenceStore(fs::path path, PreferenceDefaults defaults, ClockFn clock)
    : PreferenceStore(std::move(defaults), std::move(clock)), path_(std::move(path)) {
    load_initial(read_file(path_));
}

std::expected<void, std::string> JsonPreferenceStore::persist(const PreferenceMap& prefs) {
    const std::string payload = to_json(prefs).dump(2) + "\n";
    const fs::path tmp = path_.string() + ".tmp";

    {
        FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
        if (!fd) {
            return std::unexpected(std::format("Cannot write '{}': {}", tmp.string(),
                                               std::system_category().message(errno)));
        }
        if (auto written = fd.write_all(payload); !written) {
            return std::unexpected(std::format("Write to '{}' failed: {}", tmp.string(),
                                               written.error()));
        }
        if (::fsync(fd.get()) != 0) {
            return std::unexpected(std::format("fsync '{}' failed: {}", tmp.string(),
                                               std::system_category().message(errno)));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(std::format("Cannot replace '{}': {}", path_.string(), ec.message()));
    }
    return {};
}

}  // namespace speedwatch
