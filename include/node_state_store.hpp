/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

#include "include/report.hpp"

namespace speedwatch {

using NodeSnapshot = std::map<std::string, Report>;

class NodeStateStore {
   public:
    virtual ~NodeStateStore() = default;

    // Replaces the whole record for report.node_id.
    virtual void put(Report report) = 0;
    [[nodiscard]] virtual std::optional<Report> get(const std::string& node_id) const = 0;
    // Point-in-time copy of every stored report.
    [[nodiscard]] virtual NodeSnapshot snapshot() const = 0;
};

class InMemoryNodeStateStore final : public NodeStateStore {
    mutable std::shared_mutex mutex_;
    NodeSnapshot reports_;

   public:
    InMemoryNodeStateStore() = default;

    InMemoryNodeStateStore(const InMemoryNodeStateStore&) = delete;
    InMemoryNodeStateStore& operator=(const InMemoryNodeStateStore&) = delete;

    void put(Report report) override;
    [[nodiscard]] std::optional<Report> get(const std::string& node_id) const override;
    [[nodiscard]] NodeSnapshot snapshot() const override;
};

}  // namespace speedwatch
