/**
 * @file snapshot_store.cpp
 * @brief SnapshotStore implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/snapshot_store.hpp"

#include <mutex>

namespace kasad {
namespace core {

SnapshotStore::SnapshotStore()
    : current_(std::make_shared<const Snapshot>())
{}

void SnapshotStore::publish(std::shared_ptr<const Snapshot> snapshot) {
    if (!snapshot) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    current_ = std::move(snapshot);
}

std::shared_ptr<const Snapshot> SnapshotStore::getSnapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_;
}

}  // namespace core
}  // namespace kasad
