/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/system_info.hpp"

#include <array>
#include <format>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/utsname.h>
#include <unistd.h>

#include "include/utils.hpp"

namespace speedwatch {

std::string SystemInfo::parse_pretty_name(std::string_view os_release) {
    while (!os_release.empty()) {
        auto eol = os_release.find('\n');
        std::string_view line = trim_sv(os_release.substr(0, eol));
        os_release.remove_prefix(eol == std::string_view::npos ? os_release.size() : eol + 1);

        if (!line.starts_with("PRETTY_NAME=")) continue;

        auto pretty_name = line.substr(12);
        if (!pretty_name.empty() && (pretty_name.front() == '"' || pretty_name.front() == '\'')) {
            pretty_name.remove_prefix(1);
        }
        if (!pretty_name.empty() && (pretty_name.back() == '"' || pretty_name.back() == '\'')) {
            pretty_name.remove_suffix(1);
        }
        return std::string(pretty_name);
    }
    return {};
}

std::string SystemInfo::get_os() {
    std::ifstream os_file("/etc/os-release");
    if (os_file) {
        std::stringstream buffer;
        buffer << os_file.rdbuf();
        if (auto name = parse_pretty_name(buffer.str()); !name.empty()) {
            return name;
        }
    }
    return "Linux";
}

std::string SystemInfo::get_kernel() {
    struct utsname buffer;
    if (uname(&buffer) == 0)
        return buffer.release;
    return "Unknown";
}

std::string SystemInfo::get_arch() {
    struct utsname buffer;
    if (uname(&buffer) == 0)
        return buffer.machine;
    return "unknown";
}

std::string SystemInfo::get_hostname() {
    std::array<char, 256> name{};
    if (::gethostname(name.data(), name.size() - 1) == 0 && name[0] != '\0') {
        return name.data();
    }
    return "unknown-host";
}

std::string SystemInfo::os_summary() {
    return std::format("{}, kernel {} ({})", get_os(), get_kernel(), get_arch());
}

}  // namespace speedwatch
