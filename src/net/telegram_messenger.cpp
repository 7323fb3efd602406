/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/messenger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include "include/interrupts.hpp"
#include "include/log.hpp"
#include "include/utils.hpp"

using json = nlohmann::json;

namespace speedwatch {

namespace {

enum class Outcome { Done, Retry, Fail };

// Bot API fields read leniently: a wrong type reads as absent.
std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool bool_field(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

struct Attempt {
    Outcome outcome = Outcome::Fail;
    json result;
    std::string error;
    std::chrono::milliseconds wait{0};
};

Attempt classify_response(const std::expected<HttpResponse, std::string>& response) {
    Attempt attempt;
    if (!response) {
        attempt.outcome = Outcome::Retry;
        attempt.error = response.error();
        return attempt;
    }

    json body = json::parse(response->body, nullptr, false);
    const bool has_body = !body.is_discarded() && body.is_object();

    if (response->status == 200 && has_body && bool_field(body, "ok")) {
        attempt.outcome = Outcome::Done;
        attempt.result = body.contains("result") ? body["result"] : json();
        return attempt;
    }

    std::string description = has_body ? string_field(body, "description") : "";
    attempt.error = std::format("HTTP {}{}{}", response->status, description.empty() ? "" : ": ",
                                description);

    if (response->status == 429) {
        attempt.outcome = Outcome::Retry;
        if (has_body && body.contains("parameters") && body["parameters"].is_object()) {
            const auto& parameters = body["parameters"];
            if (auto it = parameters.find("retry_after");
                it != parameters.end() && it->is_number_integer()) {
                attempt.wait = std::chrono::seconds(
                    std::clamp(it->get<std::int64_t>(), std::int64_t{0}, std::int64_t{60}));
            }
        }
    } else if (response->status >= 500 || response->status == 0) {
        attempt.outcome = Outcome::Retry;
    }
    return attempt;
}

}  // namespace

TelegramMessenger::TelegramMessenger(std::string bot_token, std::string api_base,
                                     RetryPolicy policy, HttpPostFn post)
    : bot_token_(std::move(bot_token)),
      api_base_(std::move(api_base)),
      policy_(policy),
      post_(std::move(post)) {
    if (!post_) {
        post_ = [](const std::string& url, const std::string& body, long timeout_sec) {
            HttpClient client;
            return client.post_json(url, body, {}, timeout_sec);
        };
    }
}

std::expected<json, std::string> TelegramMessenger::call(std::string_view method,
                                                         const json& payload, long timeout_sec) {
    const std::string url = std::format("{}/bot{}/{}", api_base_, bot_token_, method);
    const std::string body = payload.dump();
    const int attempts = std::max(policy_.attempts, 1);

    auto delay = policy_.initial_delay;
    std::string last_error;

    for (int i = 1; i <= attempts; ++i) {
        Attempt attempt = classify_response(post_(url, body, timeout_sec));
        if (attempt.outcome == Outcome::Done) {
            return attempt.result;
        }

        last_error = attempt.error;
        if (attempt.outcome == Outcome::Fail || i == attempts) {
            break;
        }

        auto wait = std::max(attempt.wait, delay);
        log::warn("Telegram {} failed (attempt {}/{}): {}; retrying in {} ms", method, i, attempts,
                  last_error, wait.count());
        if (!interruptible_sleep(wait)) {
            break;
        }
        delay = std::min(delay * 2, policy_.max_delay);
    }
    return std::unexpected(std::format("Telegram {} failed: {}", method, last_error));
}

std::expected<void, std::string> TelegramMessenger::send_message(const std::string& recipient_id,
                                                                 const std::string& text,
                                                                 const InlineKeyboard& keyboard) {
    auto chunks = split_message(text, Config::TELEGRAM_MAX_MESSAGE_LENGTH);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        json payload = {
            {"chat_id", recipient_id},
            {"text", chunks[i]},
            {"parse_mode", "HTML"},
            {"disable_web_page_preview", true},
        };
        // The keyboard goes with the last chunk so it stays under the message.
        if (!keyboard.empty() && i + 1 == chunks.size()) {
            payload["reply_markup"] = {{"inline_keyboard", keyboard_to_json(keyboard)}};
        }

        auto sent = call("sendMessage", payload);
        if (!sent) {
            return std::unexpected(sent.error());
        }
    }
    return {};
}

std::expected<std::vector<ChatUpdate>, std::string> TelegramMessenger::poll_updates(
    std::int64_t offset, long timeout_sec) {
    json payload = {
        {"offset", offset},
        {"timeout", timeout_sec},
        {"allowed_updates", json::array({"message", "callback_query"})},
    };
    auto result = call("getUpdates", payload, timeout_sec + Config::HTTP_CONNECT_TIMEOUT_SEC);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_updates(*result);
}

std::expected<void, std::string> TelegramMessenger::answer_callback(const std::string& callback_id,
                                                                    const std::string& text) {
    auto result = call("answerCallbackQuery", {{"callback_query_id", callback_id}, {"text", text}});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

json keyboard_to_json(const InlineKeyboard& keyboard) {
    json rows = json::array();
    for (const auto& row : keyboard) {
        json buttons = json::array();
        for (const auto& button : row) {
            buttons.push_back({{"text", button.text}, {"callback_data", button.callback_data}});
        }
        rows.push_back(std::move(buttons));
    }
    return rows;
}

namespace {

// Integer or string id, rendered as a string.
std::string id_string(const json& object) {
    if (!object.is_object() || !object.contains("id")) return {};
    const auto& id = object["id"];
    if (id.is_number_integer()) return std::to_string(id.get<std::int64_t>());
    if (id.is_string()) return id.get<std::string>();
    return {};
}

}  // namespace

std::vector<ChatUpdate> parse_updates(const json& result) {
    std::vector<ChatUpdate> updates;
    if (!result.is_array()) return updates;

    for (const auto& item : result) {
        if (!item.is_object() || !item.contains("update_id") ||
            !item["update_id"].is_number_integer()) {
            continue;
        }

        ChatUpdate update;
        update.update_id = item["update_id"].get<std::int64_t>();

        if (item.contains("callback_query") && item["callback_query"].is_object()) {
            const auto& query = item["callback_query"];
            update.kind = UpdateKind::Callback;
            update.callback_id = id_string(query);
            update.text = string_field(query, "data");
            if (query.contains("message") && query["message"].is_object()) {
                const auto& message = query["message"];
                update.chat_id = id_string(message.contains("chat") ? message["chat"] : json());
            }
        } else if (item.contains("message") && item["message"].is_object()) {
            const auto& message = item["message"];
            update.kind = UpdateKind::Command;
            update.text = string_field(message, "text");
            update.chat_id = id_string(message.contains("chat") ? message["chat"] : json());
        }
        // Unrelated update types still advance the offset.
        updates.push_back(std::move(update));
    }
    return updates;
}

}  // namespace speedwatch
