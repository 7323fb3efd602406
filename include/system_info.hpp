// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <string>
#include <string_view>

namespace speedwatch {

// Host facts attached to reports.
class SystemInfo {
public:
    static std::string get_os();
    static std::string get_kernel();
    static std::string get_arch();
    static std::string get_hostname();

    // "<PRETTY_NAME>, kernel <release> (<arch>)"
    static std::string os_summary();

    // PRETTY_NAME from an os-release document, unquoted; empty if absent.
    static std::string parse_pretty_name(std::string_view os_release);
};

}  // namespace speedwatch
