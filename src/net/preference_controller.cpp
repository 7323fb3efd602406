/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/preference_controller.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>

#include "include/interrupts.hpp"
#include "include/localization.hpp"
#include "include/log.hpp"
#include "include/utils.hpp"

namespace speedwatch {

std::optional<PreferenceAction> parse_preference_action(std::string_view data) {
    auto colon = data.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    auto key = data.substr(0, colon);
    auto value = data.substr(colon + 1);

    if (key == "lang") {
        if (auto language = parse_language(value)) return PreferenceAction{.language = *language};
    } else if (key == "view") {
        if (auto mode = parse_view_mode(value)) return PreferenceAction{.view_mode = *mode};
    }
    return std::nullopt;
}

std::string encode_action(const PreferenceAction& action) {
    if (action.language) return std::format("lang:{}", language_code(*action.language));
    if (action.view_mode) return std::format("view:{}", view_mode_name(*action.view_mode));
    return {};
}

InlineKeyboard settings_keyboard(const RecipientPref& pref) {
    const Labels& l = labels_for(pref.language);
    auto mark = [](bool selected, std::string_view text) {
        return selected ? std::format("• {}", text) : std::string(text);
    };

    return {
        {
            {mark(pref.language == Language::En, "English"), encode_action({.language = Language::En})},
            {mark(pref.language == Language::Ru, "Русский"), encode_action({.language = Language::Ru})},
        },
        {
            {mark(pref.view_mode == ViewMode::Compact, l.view_compact),
             encode_action({.view_mode = ViewMode::Compact})},
            {mark(pref.view_mode == ViewMode::Detailed, l.view_detailed),
             encode_action({.view_mode = ViewMode::Detailed})},
        },
    };
}

std::string settings_text(const RecipientPref& pref) {
    const Labels& l = labels_for(pref.language);
    const std::string_view view = pref.view_mode == ViewMode::Detailed ? l.view_detailed
                                                                       : l.view_compact;
    return std::format("<b>{}</b>\n{}: {}\n{}: {}", l.settings_title, l.settings_language,
                       language_code(pref.language), l.settings_view, view);
}

PreferenceController::PreferenceController(PreferenceStore& store,
                                           std::set<std::string, std::less<>> recipients)
    : store_(store), recipients_(std::move(recipients)) {}

bool PreferenceController::allowed(std::string_view recipient_id) const {
    return recipients_.contains(recipient_id);
}

std::expected<RecipientPref, std::string> PreferenceController::apply(
    const std::string& recipient_id, const PreferenceAction& action) {
    if (!allowed(recipient_id)) {
        return std::unexpected(std::format("chat {} is not a configured recipient", recipient_id));
    }
    if (action.language) {
        return store_.set_language(recipient_id, *action.language);
    }
    if (action.view_mode) {
        return store_.set_view_mode(recipient_id, *action.view_mode);
    }
    return std::unexpected("empty preference action");
}

void PreferenceController::handle(const ChatUpdate& update, ChatApi& api) {
    if (update.chat_id.empty()) return;

    if (!allowed(update.chat_id)) {
        log::warn("Ignoring update from unknown chat {}", update.chat_id);
        return;
    }

    if (update.kind == UpdateKind::Command) {
        auto command = trim_sv(update.text);
        command = command.substr(0, command.find_first_of(" @"));
        if (command != "/settings" && command != "/start") return;

        auto pref = store_.get_or_default(update.chat_id);
        if (auto sent = api.send_message(update.chat_id, settings_text(pref), settings_keyboard(pref));
            !sent) {
            log::error("Failed to send settings to chat {}: {}", update.chat_id, sent.error());
        }
        return;
    }

    auto action = parse_preference_action(update.text);
    if (!action) {
        log::warn("Unknown callback data '{}' from chat {}", update.text, update.chat_id);
        return;
    }

    auto result = apply(update.chat_id, *action);
    std::string reply;
    if (result) {
        log::info("Chat {} set {}", update.chat_id, encode_action(*action));
        reply = std::string(labels_for(result->language).saved);
    } else {
        log::error("Preference change for chat {} failed: {}", update.chat_id, result.error());
        reply = std::string(labels_for(store_.get_or_default(update.chat_id).language).save_failed);
    }

    if (auto answered = api.answer_callback(update.callback_id, reply); !answered) {
        log::warn("answerCallbackQuery failed: {}", answered.error());
    }

    if (result) {
        // Refresh the keyboard so the selection marker moves.
        if (auto sent = api.send_message(update.chat_id, settings_text(*result),
                                         settings_keyboard(*result));
            !sent) {
            log::warn("Failed to refresh settings for chat {}: {}", update.chat_id, sent.error());
        }
    }
}

UpdatePoller::UpdatePoller(ChatApi& api, PreferenceController& controller, long poll_timeout_sec,
                           std::chrono::milliseconds retry_delay)
    : api_(api),
      controller_(controller),
      poll_timeout_sec_(poll_timeout_sec),
      retry_delay_(retry_delay) {}

UpdatePoller::~UpdatePoller() {
    stop();
}

void UpdatePoller::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void UpdatePoller::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
}

namespace {

// Backoff between failed polls; returns early on stop or interrupt.
void backoff(std::stop_token stop, std::chrono::milliseconds delay) {
    constexpr auto step = std::chrono::milliseconds(50);
    while (delay.count() > 0 && !stop.stop_requested() && !g_interrupted) {
        auto chunk = std::min(delay, std::chrono::milliseconds(step));
        std::this_thread::sleep_for(chunk);
        delay -= chunk;
    }
}

}  // namespace

void UpdatePoller::poll_once() {
    auto updates = api_.poll_updates(offset_, poll_timeout_sec_);
    if (!updates) {
        throw std::runtime_error(updates.error());
    }

    for (const auto& update : *updates) {
        offset_ = std::max(offset_, update.update_id + 1);
        try {
            controller_.handle(update, api_);
        } catch (const std::exception& e) {
            log::error("Failed to handle update {}: {}", update.update_id, e.what());
        }
    }
}

void UpdatePoller::run(std::stop_token stop) {
    log::info("Telegram update polling started");
    while (!stop.stop_requested() && !g_interrupted) {
        try {
            poll_once();
        } catch (const std::exception& e) {
            log::warn("getUpdates failed: {}", e.what());
            backoff(stop, retry_delay_);
        }
    }
    log::info("Telegram update polling stopped");
}

}  // namespace speedwatch
