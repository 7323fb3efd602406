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
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "speedwatch";
    constexpr std::string_view APP_VERSION = "2.1.0";
    constexpr std::string_view DEFAULT_CONFIG_FILE = "config.json";
    constexpr std::string_view CONFIG_ENV = "SPEEDWATCH_CONFIG";
    constexpr std::string_view BOT_TOKEN_ENV = "TELEGRAM_BOT_TOKEN";

    constexpr long HTTP_TIMEOUT_SEC = 30;
    constexpr long HTTP_CONNECT_TIMEOUT_SEC = 10;
    constexpr long TELEGRAM_POLL_TIMEOUT_SEC = 25;
    constexpr std::string_view TELEGRAM_API_BASE = "https://api.telegram.org";
    constexpr std::size_t TELEGRAM_MAX_MESSAGE_LENGTH = 4096;
    constexpr int TELEGRAM_RETRY_COUNT = 3;
    constexpr auto TELEGRAM_RETRY_DELAY = std::chrono::seconds(2);

    constexpr std::string_view REPORT_PATH = "/api/v1/report";
    constexpr std::string_view HEALTH_PATH = "/health";
    constexpr std::size_t MAX_REQUEST_BYTES = 64 * 1024;
    constexpr int SOCKET_TIMEOUT_SEC = 5;
    constexpr int LISTEN_BACKLOG = 64;
    constexpr std::size_t DEFAULT_HTTP_WORKERS = 4;
    constexpr std::size_t MAX_PENDING_CONNECTIONS = 64;
    constexpr auto REQUEST_DEADLINE = std::chrono::seconds(10);

    constexpr auto SPEEDTEST_DEFAULT_TIMEOUT = std::chrono::seconds(90);
    constexpr std::size_t MAX_CLI_OUTPUT = 10 * 1024 * 1024;

    constexpr std::size_t LOG_MAX_BYTES = 10 * 1024 * 1024;
    constexpr int LOG_BACKUP_COUNT = 3;
}
