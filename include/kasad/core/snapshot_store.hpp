/**
 * @file snapshot_store.hpp
 * @brief Immutable per-cycle snapshots shared with readers.
 *
 * The orchestrator builds a complete Snapshot at the end of every cycle and
 * publishes it by swapping one pointer. Readers keep whatever snapshot they
 * fetched for as long as they need it; they never see a half-built cycle.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"
#include "kasad/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace kasad {
namespace core {

/**
 * @struct SnapshotEntry
 * @brief A device currently considered reachable, with its latest reading.
 */
struct KASAD_CORE_API SnapshotEntry {
    std::string device_id;
    std::string alias;
    Reading reading;
};

/**
 * @struct DeviceStatus
 * @brief Status row for every known device, reachable or not.
 */
struct KASAD_CORE_API DeviceStatus {
    std::string device_id;
    std::string alias;
    DeviceState state;
    uint32_t consecutive_failures;
    bool in_snapshot;
};

/**
 * @struct Snapshot
 * @brief Result of one poll cycle.
 */
struct KASAD_CORE_API Snapshot {
    uint64_t generation = 0;                    ///< 0 before the first cycle
    TimePoint published_at;
    std::chrono::milliseconds cycle_duration{0};
    std::map<std::string, SnapshotEntry> entries;  ///< Keyed by device id
    std::vector<DeviceStatus> devices;          ///< Ordered by device id

    bool contains(const std::string& deviceId) const { return entries.count(deviceId) > 0; }
};

/**
 * @class SnapshotStore
 * @brief Single-writer, many-reader holder of the latest snapshot.
 *
 * The lock only guards the pointer swap and copy, never snapshot
 * construction, so readers are not held up by a cycle in progress.
 */
class KASAD_CORE_API SnapshotStore {
public:
    SnapshotStore();

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    void publish(std::shared_ptr<const Snapshot> snapshot);

    /**
     * @brief The most recently published snapshot (never null).
     */
    std::shared_ptr<const Snapshot> getSnapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const Snapshot> current_;
};

}  // namespace core
}  // namespace kasad
