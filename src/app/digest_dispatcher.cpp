/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/digest_dispatcher.hpp"

#include <exception>
#include <utility>

#include "include/digest_renderer.hpp"
#include "include/log.hpp"

namespace speedwatch {

DigestDispatcher::DigestDispatcher(const NodeStateStore& state, PreferenceStore& preferences,
                                   Messenger& messenger, AggregationPolicy policy,
                                   std::vector<std::string> recipients, ClockFn clock)
    : state_(state),
      preferences_(preferences),
      messenger_(messenger),
      policy_(std::move(policy)),
      recipients_(std::move(recipients)),
      clock_(std::move(clock)) {}

DigestDispatcher::~DigestDispatcher() {
    stop();
}

DispatchSummary DigestDispatcher::build_and_dispatch(std::string_view reason) {
    std::lock_guard guard(dispatch_mutex_);

    const AggregatedView view = build_view(state_.snapshot(), policy_, clock_());
    log::info("Dispatching {} digest: {} node(s), cluster {}", reason, view.nodes.size(),
              view.cluster == ClusterStatus::Ok ? "ok" : "degraded");

    DispatchSummary summary;
    for (const auto& recipient : recipients_) {
        try {
            const RecipientPref pref = preferences_.get_or_default(recipient);
            const std::string text = Renderer::render_digest(view, pref.language, pref.view_mode);

            if (auto sent = messenger_.send_message(recipient, text); !sent) {
                log::error("Digest to chat {} failed: {}", recipient, sent.error());
                ++summary.failed;
                continue;
            }
            ++summary.sent;
        } catch (const std::exception& e) {
            log::error("Digest to chat {} failed: {}", recipient, e.what());
            ++summary.failed;
        }
    }

    log::info("Digest done: {} sent, {} failed", summary.sent, summary.failed);
    return summary;
}

void DigestDispatcher::request_immediate() {
    {
        std::lock_guard lock(pending_mutex_);
        pending_ = true;
    }
    pending_cv_.notify_one();
}

void DigestDispatcher::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void DigestDispatcher::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    pending_cv_.notify_all();
    worker_.join();
}

void DigestDispatcher::run(std::stop_token stop) {
    while (true) {
        {
            std::unique_lock lock(pending_mutex_);
            if (!pending_cv_.wait(lock, stop, [this] { return pending_; })) {
                return;
            }
            pending_ = false;
        }

        try {
            build_and_dispatch("immediate");
        } catch (const std::exception& e) {
            log::error("Immediate digest failed: {}", e.what());
        }
    }
}

DigestScheduler::DigestScheduler(DigestDispatcher& dispatcher, std::chrono::milliseconds interval)
    : dispatcher_(dispatcher), interval_(interval) {}

DigestScheduler::~DigestScheduler() {
    stop();
}

void DigestScheduler::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
    log::info("Digest scheduler started, interval {} min",
              std::chrono::duration_cast<std::chrono::minutes>(interval_).count());
}

void DigestScheduler::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    cv_.notify_all();
    worker_.join();
}

void DigestScheduler::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            // Wakes early only when a stop is requested.
            (void)cv_.wait_for(lock, stop, interval_, [] { return false; });
        }
        if (stop.stop_requested()) return;

        ++ticks_;
        try {
            dispatcher_.build_and_dispatch("scheduled");
        } catch (const std::exception& e) {
            log::error("Scheduled digest failed: {}", e.what());
        }
    }
}

}  // namespace speedwatch
