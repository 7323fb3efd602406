/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <charconv>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace speedwatch {

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string trim(std::string_view str) {
    return std::string(trim_sv(str));
}

template <typename T>
std::expected<T, std::errc> parse_number(std::string_view sv) {
    T value;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc()) {
        if (ptr == sv.data() + sv.size()) {
            return value;
        }
        return std::unexpected(std::errc::invalid_argument);
    }
    return std::unexpected(ec);
}

[[nodiscard]] std::string to_lower(std::string_view text);

// Escapes &, < and > for Telegram's HTML parse mode.
[[nodiscard]] std::string html_escape(std::string_view text);

[[nodiscard]] std::string format_speed(double mbps);
[[nodiscard]] std::string format_ping(double ms);

// Splits on line boundaries so that no chunk exceeds max_len bytes; a single
// longer line is cut hard.
[[nodiscard]] std::vector<std::string> split_message(std::string_view text, std::size_t max_len);

[[nodiscard]] std::filesystem::path get_exe_dir();

}  // namespace speedwatch
