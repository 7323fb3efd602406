/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>

#include "include/messenger.hpp"
#include "include/preferences.hpp"

namespace speedwatch {

// A preference change requested from a chat. Exactly one field is set.
struct PreferenceAction {
    std::optional<Language> language;
    std::optional<ViewMode> view_mode;
};

// Callback data is "lang:<code>" or "view:<mode>".
[[nodiscard]] std::optional<PreferenceAction> parse_preference_action(std::string_view data);
[[nodiscard]] std::string encode_action(const PreferenceAction& action);

[[nodiscard]] InlineKeyboard settings_keyboard(const RecipientPref& pref);
[[nodiscard]] std::string settings_text(const RecipientPref& pref);

class PreferenceController {
   public:
    PreferenceController(PreferenceStore& store, std::set<std::string, std::less<>> recipients);

    [[nodiscard]] bool allowed(std::string_view recipient_id) const;

    std::expected<RecipientPref, std::string> apply(const std::string& recipient_id,
                                                    const PreferenceAction& action);

    // Handles one inbound update; replies go through `api`.
    void handle(const ChatUpdate& update, ChatApi& api);

   private:
    PreferenceStore& store_;
    std::set<std::string, std::less<>> recipients_;
};

// Long-polls getUpdates on a background thread and feeds the controller.
class UpdatePoller {
   public:
    UpdatePoller(ChatApi& api, PreferenceController& controller,
                 long poll_timeout_sec = Config::TELEGRAM_POLL_TIMEOUT_SEC,
                 std::chrono::milliseconds retry_delay = std::chrono::seconds(5));
    ~UpdatePoller();

    UpdatePoller(const UpdatePoller&) = delete;
    UpdatePoller& operator=(const UpdatePoller&) = delete;

    void start();
    void stop();

   private:
    void run(std::stop_token stop);
    void poll_once();

    ChatApi& api_;
    PreferenceController& controller_;
    long poll_timeout_sec_;
    std::chrono::milliseconds retry_delay_;
    std::int64_t offset_ = 0;
    std::jthread worker_;
};

}  // namespace speedwatch
