/**
 * @file poll_orchestrator.hpp
 * @brief Refresh cycles over all known devices and per-device health.
 *
 * The PollOrchestrator handles:
 * - Merging sourcing results into the known-device set
 * - Polling every known device concurrently, bounded by max_in_flight
 * - The DISCOVERED -> REACHABLE <-> UNREACHABLE state machine
 * - Building and publishing a Snapshot at the end of every cycle
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/device_registry.hpp"
#include "kasad/core/export.hpp"
#include "kasad/core/snapshot_store.hpp"
#include "kasad/core/types.hpp"
#include "kasad/core/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kasad {
namespace core {

/**
 * @struct HealthPolicy
 * @brief Thresholds of the device state machine.
 */
struct KASAD_CORE_API HealthPolicy {
    uint32_t unreachable_after;             ///< Consecutive failures to become UNREACHABLE
    uint32_t reachable_after;               ///< Consecutive successes to become REACHABLE
    std::chrono::milliseconds stale_after;  ///< Max reading age in a snapshot (0 = no limit)
    uint32_t remove_after_missed;           ///< Missed sourcing passes before removal (0 = never)

    HealthPolicy()
        : unreachable_after(3)
        , reachable_after(1)
        , stale_after(300000)
        , remove_after_missed(5)
    {}
};

/**
 * @struct OrchestratorConfig
 * @brief Configuration for the poll orchestrator.
 */
struct KASAD_CORE_API OrchestratorConfig {
    size_t max_in_flight;
    HealthPolicy health;

    OrchestratorConfig() : max_in_flight(8) {}
};

/**
 * @struct CycleReport
 * @brief Summary of one refresh cycle.
 */
struct KASAD_CORE_API CycleReport {
    uint64_t generation = 0;
    size_t polled = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t in_snapshot = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Performs one poll of one device; must not throw.
 */
using DeviceQueryFn = std::function<PollOutcome(const DeviceRecord&)>;

/**
 * @class PollOrchestrator
 * @brief Drives refresh cycles and owns the known-device set.
 *
 * Usage:
 * @code
 * DeviceClient client(clientConfig);
 * auto store = std::make_shared<SnapshotStore>();
 * PollOrchestrator orchestrator(config,
 *     [&client](const DeviceRecord& r) { return client.poll(r); }, store);
 *
 * orchestrator.ingestCandidates(discovery.discover(timeout, broadcast));
 * orchestrator.refreshCycle();
 * auto snapshot = store->getSnapshot();
 * @endcode
 */
class KASAD_CORE_API PollOrchestrator {
public:
    PollOrchestrator(const OrchestratorConfig& config,
                     DeviceQueryFn query,
                     std::shared_ptr<SnapshotStore> store);

    // Non-copyable
    PollOrchestrator(const PollOrchestrator&) = delete;
    PollOrchestrator& operator=(const PollOrchestrator&) = delete;

    /**
     * @brief Merge a sourcing pass into the known-device set.
     * @param ageAbsent False when a source failed during the pass, so
     *        devices it would have reported are not counted as missed.
     */
    MergeStats ingestCandidates(const std::vector<DeviceCandidate>& candidates,
                                bool ageAbsent = true);

    /**
     * @brief Poll every known device once and publish a snapshot.
     *
     * Blocks until every device has answered or timed out. Calls are
     * serialized; a second caller waits for the running cycle.
     */
    CycleReport refreshCycle();

    std::vector<DeviceRecord> knownDevices() const { return registry_.all(); }

    std::optional<DeviceRecord> getDevice(const std::string& deviceId) const {
        return registry_.get(deviceId);
    }

    const std::shared_ptr<SnapshotStore>& store() const { return store_; }

    const OrchestratorConfig& config() const { return config_; }

    /**
     * @brief Fold one outcome into a record (counters, state, reading).
     * @return True if the state changed.
     */
    static bool applyOutcome(DeviceRecord& record, const PollOutcome& outcome,
                             const HealthPolicy& policy, TimePoint now);

    /**
     * @brief Whether a record's reading belongs in a snapshot taken at @p now.
     */
    static bool includeInSnapshot(const DeviceRecord& record, const HealthPolicy& policy,
                                  TimePoint now);

private:
    OrchestratorConfig config_;
    DeviceQueryFn query_;
    std::shared_ptr<SnapshotStore> store_;

    DeviceRegistry registry_;
    WorkerPool pool_;

    std::mutex cycleMutex_;
    std::atomic<uint64_t> generation_{0};

    std::shared_ptr<const Snapshot> buildSnapshot(uint64_t generation,
                                                  std::chrono::milliseconds duration,
                                                  TimePoint now) const;
};

}  // namespace core
}  // namespace kasad
