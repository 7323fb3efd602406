/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

#include "include/config.hpp"
#include "include/file_descriptor.hpp"

namespace speedwatch {

// Runs a command with stdout and stderr joined into one pipe. The child is
// terminated (SIGTERM, then SIGKILL) if still running on destruction.
class ShellPipe {
    FileDescriptor read_fd_;
    int pid_ = -1;
    int exit_status_ = -1;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    // Reads until EOF. Fails on timeout, interruption or a read error.
    std::expected<std::string, std::string> read_all(
        std::chrono::milliseconds timeout,
        std::size_t max_output = Config::MAX_CLI_OUTPUT);

    // Reaps the child and returns its exit code (128 + signal when killed).
    int wait();
};

}  // namespace speedwatch
