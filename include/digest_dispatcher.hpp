/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "include/aggregator.hpp"
#include "include/messenger.hpp"
#include "include/node_state_store.hpp"
#include "include/preferences.hpp"

namespace speedwatch {

struct DispatchSummary {
    int sent = 0;
    int failed = 0;
};

// Renders the cluster digest for every recipient in that recipient's
// language and view mode and sends it. Scheduled and immediate digests both
// go through build_and_dispatch(), which never runs concurrently with itself.
class DigestDispatcher {
   public:
    DigestDispatcher(const NodeStateStore& state, PreferenceStore& preferences, Messenger& messenger,
                     AggregationPolicy policy, std::vector<std::string> recipients,
                     ClockFn clock = system_now);
    ~DigestDispatcher();

    DigestDispatcher(const DigestDispatcher&) = delete;
    DigestDispatcher& operator=(const DigestDispatcher&) = delete;

    DispatchSummary build_and_dispatch(std::string_view reason);

    // Queues a digest on the background worker. Requests arriving while one
    // is pending are merged into it.
    void request_immediate();

    void start();
    void stop();

   private:
    void run(std::stop_token stop);

    const NodeStateStore& state_;
    PreferenceStore& preferences_;
    Messenger& messenger_;
    AggregationPolicy policy_;
    std::vector<std::string> recipients_;
    ClockFn clock_;

    std::mutex dispatch_mutex_;

    std::mutex pending_mutex_;
    std::condition_variable_any pending_cv_;
    bool pending_ = false;
    std::jthread worker_;
};

// Fires build_and_dispatch() every `interval`; the first tick comes one
// interval after start().
class DigestScheduler {
   public:
    DigestScheduler(DigestDispatcher& dispatcher, std::chrono::milliseconds interval);
    ~DigestScheduler();

    DigestScheduler(const DigestScheduler&) = delete;
    DigestScheduler& operator=(const DigestScheduler&) = delete;

    void start();
    void stop();

    [[nodiscard]] int ticks() const { return ticks_.load(); }

   private:
    void run(std::stop_token stop);

    DigestDispatcher& dispatcher_;
    std::chrono::milliseconds interval_;
    std::atomic<int> ticks_{0};

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread worker_;
};

}  // namespace speedwatch
