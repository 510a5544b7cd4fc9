/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/device_registry.hpp"
#include "kasad/utils/logger.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace kasad {
namespace core {

// =============================================================================
// Sourcing
// =============================================================================

MergeStats DeviceRegistry::merge(const std::vector<DeviceCandidate>& candidates,
                                 bool ageAbsent,
                                 uint32_t removeAfterMissed,
                                 TimePoint now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    MergeStats stats;
    std::unordered_set<std::string> sighted;
    std::unordered_set<std::string> changed;

    for (const auto& candidate : candidates) {
        if (candidate.device_id.empty()) {
            continue;
        }
        sighted.insert(candidate.device_id);

        auto it = devices_.find(candidate.device_id);
        if (it == devices_.end()) {
            DeviceRecord record;
            record.device_id = candidate.device_id;
            record.alias = candidate.alias;
            record.address = candidate.address;
            record.model = candidate.model;
            record.hw_version = candidate.hw_version;
            record.first_seen_at = now;
            record.last_sighted_at = now;
            devices_.emplace(candidate.device_id, std::move(record));
            ++stats.added;
            LOG_INFO("Registry", "New device {} '{}' at {}",
                     candidate.device_id, candidate.alias, candidate.address.toString());
            continue;
        }

        DeviceRecord& record = it->second;
        bool recordChanged = false;

        if (record.address != candidate.address) {
            LOG_INFO("Registry", "Device {} moved: {} -> {}", record.device_id,
                     record.address.toString(), candidate.address.toString());
            record.address = candidate.address;
            recordChanged = true;
        }
        if (!candidate.alias.empty() && record.alias != candidate.alias) {
            LOG_DEBUG("Registry", "Device {} renamed: '{}' -> '{}'",
                      record.device_id, record.alias, candidate.alias);
            record.alias = candidate.alias;
            recordChanged = true;
        }
        if (!candidate.model.empty() &&
            (record.model != candidate.model || record.hw_version != candidate.hw_version)) {
            record.model = candidate.model;
            record.hw_version = candidate.hw_version;
            recordChanged = true;
        }

        record.missed_sightings = 0;
        record.last_sighted_at = now;

        if (recordChanged) {
            changed.insert(record.device_id);
        }
    }
    stats.updated = changed.size();

    if (ageAbsent) {
        for (auto it = devices_.begin(); it != devices_.end();) {
            if (sighted.count(it->first) > 0) {
                ++it;
                continue;
            }

            DeviceRecord& record = it->second;
            ++record.missed_sightings;
            ++stats.missed;

            if (removeAfterMissed > 0 && record.missed_sightings >= removeAfterMissed) {
                LOG_INFO("Registry", "Removing device {} '{}' after {} missed passes",
                         record.device_id, record.alias, record.missed_sightings);
                it = devices_.erase(it);
                ++stats.removed;
            } else {
                ++it;
            }
        }
    }

    return stats;
}

// =============================================================================
// Access
// =============================================================================

std::optional<DeviceRecord> DeviceRegistry::get(const std::string& deviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeviceRecord> DeviceRegistry::all() const {
    std::vector<DeviceRecord> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& entry : devices_) {
            result.push_back(entry.second);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const DeviceRecord& a, const DeviceRecord& b) {
                  return a.device_id < b.device_id;
              });
    return result;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

bool DeviceRegistry::contains(const std::string& deviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.count(deviceId) > 0;
}

bool DeviceRegistry::update(const std::string& deviceId,
                            const std::function<void(DeviceRecord&)>& fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return false;
    }
    fn(it->second);
    return true;
}

bool DeviceRegistry::remove(const std::string& deviceId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return devices_.erase(deviceId) > 0;
}

}  // namespace core
}  // namespace kasad
