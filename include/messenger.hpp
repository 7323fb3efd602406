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
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "include/config.hpp"
#include "include/http_client.hpp"

namespace speedwatch {

struct InlineButton {
    std::string text;
    std::string callback_data;
};

using InlineKeyboard = std::vector<std::vector<InlineButton>>;

enum class UpdateKind { Command, Callback };

struct ChatUpdate {
    std::int64_t update_id = 0;
    UpdateKind kind = UpdateKind::Command;
    std::string chat_id;
    std::string text;
    std::string callback_id;
};

// Outbound side of the messaging API.
class Messenger {
   public:
    virtual ~Messenger() = default;

    virtual std::expected<void, std::string> send_message(const std::string& recipient_id,
                                                          const std::string& text,
                                                          const InlineKeyboard& keyboard) = 0;

    std::expected<void, std::string> send_message(const std::string& recipient_id,
                                                  const std::string& text) {
        return send_message(recipient_id, text, {});
    }
};

// Adds the inbound side used for interactive preference changes.
class ChatApi : public Messenger {
   public:
    using Messenger::send_message;

    virtual std::expected<std::vector<ChatUpdate>, std::string> poll_updates(std::int64_t offset,
                                                                             long timeout_sec) = 0;
    virtual std::expected<void, std::string> answer_callback(const std::string& callback_id,
                                                             const std::string& text) = 0;
};

struct RetryPolicy {
    int attempts = Config::TELEGRAM_RETRY_COUNT;
    std::chrono::milliseconds initial_delay = Config::TELEGRAM_RETRY_DELAY;
    std::chrono::milliseconds max_delay = std::chrono::seconds(30);
};

using HttpPostFn = std::function<std::expected<HttpResponse, std::string>(
    const std::string& url, const std::string& body, long timeout_sec)>;

// Telegram Bot API over libcurl.
class TelegramMessenger final : public ChatApi {
   public:
    // An empty `post` uses a fresh HttpClient per request.
    TelegramMessenger(std::string bot_token, std::string api_base = std::string(Config::TELEGRAM_API_BASE),
                      RetryPolicy policy = {}, HttpPostFn post = {});

    using ChatApi::send_message;

    std::expected<void, std::string> send_message(const std::string& recipient_id,
                                                  const std::string& text,
                                                  const InlineKeyboard& keyboard) override;
    std::expected<std::vector<ChatUpdate>, std::string> poll_updates(std::int64_t offset,
                                                                     long timeout_sec) override;
    std::expected<void, std::string> answer_callback(const std::string& callback_id,
                                                     const std::string& text) override;

    // Calls a Bot API method, retrying transient failures per the policy.
    std::expected<nlohmann::json, std::string> call(std::string_view method,
                                                    const nlohmann::json& payload,
                                                    long timeout_sec = Config::HTTP_TIMEOUT_SEC);

   private:
    std::string bot_token_;
    std::string api_base_;
    RetryPolicy policy_;
    HttpPostFn post_;
};

[[nodiscard]] nlohmann::json keyboard_to_json(const InlineKeyboard& keyboard);
[[nodiscard]] std::vector<ChatUpdate> parse_updates(const nlohmann::json& result);

}  // namespace speedwatch
