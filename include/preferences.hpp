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
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "include/report.hpp"

namespace speedwatch {

enum class Language { En, Ru };
enum class ViewMode { Compact, Detailed };

constexpr Language DEFAULT_LANGUAGE = Language::En;

[[nodiscard]] std::optional<Language> parse_language(std::string_view code) noexcept;
[[nodiscard]] std::string_view language_code(Language language) noexcept;
[[nodiscard]] std::optional<ViewMode> parse_view_mode(std::string_view name) noexcept;
[[nodiscard]] std::string_view view_mode_name(ViewMode mode) noexcept;

struct RecipientPref {
    std::string recipient_id;
    Language language = DEFAULT_LANGUAGE;
    ViewMode view_mode = ViewMode::Compact;
    TimePoint created_at{};
    TimePoint updated_at{};
};

struct PrefDefaults {
    Language language = DEFAULT_LANGUAGE;
    ViewMode view_mode = ViewMode::Compact;
};

// Defaults used when a recipient is seen for the first time. Per-recipient
// entries come from the configured recipient list.
struct PreferenceDefaults {
    PrefDefaults fallback;
    std::map<std::string, PrefDefaults, std::less<>> per_recipient;

    [[nodiscard]] PrefDefaults for_recipient(std::string_view recipient_id) const;
};

using PreferenceMap = std::map<std::string, RecipientPref, std::less<>>;

// Holds the recipient preferences in memory and writes every change through
// persist() before it becomes visible. A failed write leaves the previous
// preference in place.
class PreferenceStore {
   public:
    explicit PreferenceStore(PreferenceDefaults defaults, ClockFn clock = system_now);
    virtual ~PreferenceStore() = default;

    PreferenceStore(const PreferenceStore&) = delete;
    PreferenceStore& operator=(const PreferenceStore&) = delete;

    // Never fails: when the default cannot be persisted it is still returned.
    [[nodiscard]] RecipientPref get_or_default(const std::string& recipient_id);

    std::expected<RecipientPref, std::string> set_language(const std::string& recipient_id,
                                                           Language language);
    std::expected<RecipientPref, std::string> set_view_mode(const std::string& recipient_id,
                                                            ViewMode mode);

    [[nodiscard]] std::optional<RecipientPref> find(const std::string& recipient_id) const;

   protected:
    virtual std::expected<void, std::string> persist(const PreferenceMap& prefs) = 0;

    // For subclasses restoring state on construction.
    void load_initial(PreferenceMap prefs);

   private:
    template <typename Mutator>
    std::expected<RecipientPref, std::string> update(const std::string& recipient_id,
                                                     Mutator&& mutate);

    RecipientPref make_default(const std::string& recipient_id) const;

    PreferenceDefaults defaults_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    PreferenceMap prefs_;
};

// JSON document on disk, replaced atomically (write temp file, fsync, rename).
class JsonPreferenceStore final : public PreferenceStore {
   public:
    JsonPreferenceStore(std::filesystem::path path, PreferenceDefaults defaults,
                        ClockFn clock = system_now);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

   protected:
    std::expected<void, std::string> persist(const PreferenceMap& prefs) override;

   private:
    std::filesystem::path path_;
};

}  // namespace speedwatch
