// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/interrupts.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace speedwatch {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) noexcept {
    g_interrupted = true;
}

void wait_until_interrupted(std::chrono::milliseconds poll) {
    while (!g_interrupted) {
        std::this_thread::sleep_for(poll);
    }
}

bool interruptible_sleep(std::chrono::milliseconds duration) {
    constexpr auto step = std::chrono::milliseconds(100);
    while (duration.count() > 0) {
        if (g_interrupted) return false;
        auto chunk = std::min(duration, step);
        std::this_thread::sleep_for(chunk);
        duration -= chunk;
    }
    return !g_interrupted;
}

SignalGuard::SignalGuard() {
    struct sigaction sa = {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

}  // namespace speedwatch
