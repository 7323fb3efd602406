/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace speedwatch::log {

namespace {

struct LogState {
    std::atomic<Level> level{Level::Info};
    Options options;
    std::unique_ptr<std::ofstream> file;
    bool tty = false;
    std::mutex mutex;
};

LogState& state() {
    static LogState instance;
    return instance;
}

// ANSI escapes, used only when stderr is a terminal.
constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kGray = "\033[90m";

std::string_view level_color(Level level) {
    switch (level) {
        case Level::Debug:
            return kGray;
        case Level::Info:
            return "\033[32m";
        case Level::Warning:
            return "\033[33m";
        case Level::Error:
            return "\033[31m";
    }
    return kReset;
}

std::string paint(std::string_view text, std::string_view color, bool enabled) {
    if (!enabled) return std::string(text);
    return std::format("{}{}{}", color, text, kReset);
}

void open_file(LogState& s) {
    s.file.reset();
    if (!s.options.file) return;

    auto stream = std::make_unique<std::ofstream>(*s.options.file, std::ios::app);
    if (!*stream) {
        std::println(stderr, "Cannot open log file '{}', logging to console only",
                     s.options.file->string());
        return;
    }
    s.file = std::move(stream);
}

// Called with the mutex held.
void rotate_if_needed(LogState& s) {
    if (!s.file || !s.options.file) return;
    if (s.options.max_bytes == 0 || s.options.backup_count <= 0) return;

    std::error_code ec;
    const auto& base = *s.options.file;
    const auto size = fs::file_size(base, ec);
    if (ec || size < s.options.max_bytes) return;

    s.file.reset();
    for (int i = s.options.backup_count - 1; i >= 1; --i) {
        fs::path from = base.string() + "." + std::to_string(i);
        fs::path to = base.string() + "." + std::to_string(i + 1);
        if (fs::exists(from, ec)) {
            fs::rename(from, to, ec);
        }
    }
    fs::rename(base, base.string() + ".1", ec);
    open_file(s);
}

std::string timestamp() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%d %H:%M:%S}", now);
}

}  // namespace

void configure(const Options& options) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.options = options;
    s.level = options.level;
    s.tty = ::isatty(STDERR_FILENO) == 1;
    open_file(s);
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(state().level.load());
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "DEBUG" || name == "debug") return Level::Debug;
    if (name == "INFO" || name == "info") return Level::Info;
    if (name == "WARNING" || name == "warning" || name == "WARN" || name == "warn")
        return Level::Warning;
    if (name == "ERROR" || name == "error" || name == "CRITICAL" || name == "critical")
        return Level::Error;
    return std::nullopt;
}

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
    }
    return "INFO";
}

void write(Level level, std::string_view message) {
    auto& s = state();
    const std::string ts = timestamp();
    const std::string padded = std::format("{:<7}", level_name(level));

    std::lock_guard lock(s.mutex);
    if (s.options.console) {
        std::println(stderr, "{} | {} | {}",
                     paint(ts, kGray, s.tty),
                     paint(padded, level_color(level), s.tty),
                     message);
    }
    if (s.file) {
        std::println(*s.file, "{} | {} | {}", ts, padded, message);
        s.file->flush();
        rotate_if_needed(s);
    }
}

}  // namespace speedwatch::log
