#include "include/node_state_store.hpp"

#include <mutex>
#include <utility>

namespace speedwatch {

void InMemoryNodeStateStore::put(Report report) {
    std::string key = report.node_id;
    std::unique_lock lock(mutex_);
    reports_.insert_or_assign(std::move(key), std::move(report));
}

std::optional<Report> InMemoryNodeStateStore::get(const std::string& node_id) const {
    std::shared_lock lock(mutex_);
    auto it = reports_.find(node_id);
    if (it == reports_.end()) return std::nullopt;
    return it->second;
}

NodeSnapshot InMemoryNodeStateStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return reports_;
}

}  // namespace speedwatch
