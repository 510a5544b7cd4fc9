/**
 * @file device_registry.hpp
 * @brief Thread-safe set of known devices keyed by device id.
 *
 * The DeviceRegistry maintains:
 * - One DeviceRecord per device id
 * - Address and alias refresh from sourcing passes
 * - Missed-sighting counts and removal of devices that went away
 *
 * All access goes through a read-write lock (shared_mutex) that is never
 * held across network I/O: callers copy records out, talk to devices, then
 * fold results back in with update().
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"
#include "kasad/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kasad {
namespace core {

/**
 * @struct MergeStats
 * @brief What one merge() changed.
 */
struct KASAD_CORE_API MergeStats {
    size_t added = 0;
    size_t updated = 0;     ///< Existing records whose address, alias or model changed
    size_t missed = 0;      ///< Absent records whose miss count went up
    size_t removed = 0;
};

/**
 * @class DeviceRegistry
 * @brief Known-device set.
 *
 * Usage:
 * @code
 * DeviceRegistry registry;
 * registry.merge(candidates, true, 5);
 *
 * for (const auto& record : registry.all()) {
 *     PollOutcome outcome = client.poll(record);
 *     registry.update(record.device_id, [&](DeviceRecord& r) { ... });
 * }
 * @endcode
 */
class KASAD_CORE_API DeviceRegistry {
public:
    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    // Non-copyable
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // =========================================================================
    // Sourcing
    // =========================================================================

    /**
     * @brief Merge candidates from a sourcing pass.
     *
     * Candidates are applied in order, so a later candidate for the same id
     * wins. An empty alias or model never erases a known one.
     *
     * @param ageAbsent Count the pass as a miss for records not in @p candidates.
     * @param removeAfterMissed Remove records after this many consecutive
     *        misses (0 = never remove).
     * @param now Sighting time.
     */
    MergeStats merge(const std::vector<DeviceCandidate>& candidates,
                     bool ageAbsent,
                     uint32_t removeAfterMissed,
                     TimePoint now = SystemClock::now());

    // =========================================================================
    // Access
    // =========================================================================

    std::optional<DeviceRecord> get(const std::string& deviceId) const;

    /**
     * @brief Copy of every record, ordered by device id.
     */
    std::vector<DeviceRecord> all() const;

    size_t size() const;

    bool contains(const std::string& deviceId) const;

    /**
     * @brief Apply @p fn to a record under the write lock.
     * @return False if the device is not known (e.g. removed meanwhile).
     */
    bool update(const std::string& deviceId, const std::function<void(DeviceRecord&)>& fn);

    bool remove(const std::string& deviceId);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DeviceRecord> devices_;
};

}  // namespace core
}  // namespace kasad
