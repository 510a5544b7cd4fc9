/**
 * @file poll_orchestrator.cpp
 * @brief PollOrchestrator implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/poll_orchestrator.hpp"
#include "kasad/utils/logger.hpp"

#include <exception>

namespace kasad {
namespace core {

PollOrchestrator::PollOrchestrator(const OrchestratorConfig& config,
                                   DeviceQueryFn query,
                                   std::shared_ptr<SnapshotStore> store)
    : config_(config)
    , query_(std::move(query))
    , store_(store ? std::move(store) : std::make_shared<SnapshotStore>())
    , pool_(config.max_in_flight)
{
    LOG_INFO("Orchestrator", "Created with {} worker(s), unreachable after {} failure(s)",
             pool_.size(), config_.health.unreachable_after);
}

// =============================================================================
// Sourcing
// =============================================================================

MergeStats PollOrchestrator::ingestCandidates(const std::vector<DeviceCandidate>& candidates,
                                              bool ageAbsent) {
    MergeStats stats = registry_.merge(candidates, ageAbsent,
                                       config_.health.remove_after_missed);

    LOG_DEBUG("Orchestrator", "Ingested {} candidate(s): {} added, {} updated, {} removed, {} known",
              candidates.size(), stats.added, stats.updated, stats.removed, registry_.size());
    return stats;
}

// =============================================================================
// Refresh cycle
// =============================================================================

CycleReport PollOrchestrator::refreshCycle() {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);

    auto started = std::chrono::steady_clock::now();
    CycleReport report;
    report.generation = generation_.load() + 1;

    // Copy out; the registry lock is not held while devices are queried
    std::vector<DeviceRecord> records = registry_.all();
    std::vector<std::optional<PollOutcome>> outcomes(records.size());

    std::vector<std::function<void()>> tasks;
    tasks.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        tasks.push_back([this, &records, &outcomes, i]() {
            try {
                outcomes[i] = query_(records[i]);
            } catch (const std::exception& e) {
                outcomes[i] = PollOutcome::failure(ErrorKind::PROTOCOL,
                                                   std::string("query failed: ") + e.what());
            }
        });
    }
    pool_.runAll(std::move(tasks));

    TimePoint now = SystemClock::now();
    for (size_t i = 0; i < records.size(); ++i) {
        if (!outcomes[i]) {
            continue;
        }
        const PollOutcome& outcome = *outcomes[i];
        ++report.polled;
        if (outcome.ok()) {
            ++report.succeeded;
        } else {
            ++report.failed;
            LOG_DEBUG("Orchestrator", "Poll of {} at {} failed ({}): {}",
                      records[i].device_id, records[i].address.toString(),
                      errorKindToString(outcome.error()), outcome.detail());
        }

        bool known = registry_.update(records[i].device_id, [&](DeviceRecord& record) {
            DeviceState before = record.state;
            if (applyOutcome(record, outcome, config_.health, now)) {
                if (record.state == DeviceState::UNREACHABLE) {
                    LOG_WARN("Orchestrator", "Device {} '{}' is unreachable after {} failure(s): {}",
                             record.device_id, record.alias, record.consecutive_failures,
                             record.last_error_detail);
                } else {
                    LOG_INFO("Orchestrator", "Device {} '{}' is {} (was {})",
                             record.device_id, record.alias,
                             deviceStateToString(record.state), deviceStateToString(before));
                }
            }
        });
        if (!known) {
            LOG_DEBUG("Orchestrator", "Device {} removed during cycle", records[i].device_id);
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    auto snapshot = buildSnapshot(report.generation, report.duration, now);
    report.in_snapshot = snapshot->entries.size();
    store_->publish(snapshot);
    generation_.store(report.generation);

    LOG_INFO("Orchestrator", "Cycle {}: polled {}, ok {}, failed {}, exposed {} in {} ms",
             report.generation, report.polled, report.succeeded, report.failed,
             report.in_snapshot, report.duration.count());
    return report;
}

bool PollOrchestrator::applyOutcome(DeviceRecord& record, const PollOutcome& outcome,
                                    const HealthPolicy& policy, TimePoint now) {
    DeviceState before = record.state;

    if (outcome.ok()) {
        ++record.consecutive_successes;
        record.consecutive_failures = 0;
        record.last_success_at = now;
        record.last_reading = outcome.reading();
        record.last_error.reset();
        record.last_error_detail.clear();

        const DeviceIdentity& identity = outcome.identity();
        if (!identity.alias.empty()) {
            record.alias = identity.alias;
        }
        if (!identity.model.empty()) {
            record.model = identity.model;
            record.hw_version = identity.hw_version;
        }

        if (record.state != DeviceState::REACHABLE &&
            record.consecutive_successes >= policy.reachable_after) {
            record.state = DeviceState::REACHABLE;
        }
    } else {
        ++record.consecutive_failures;
        record.consecutive_successes = 0;
        record.last_error = outcome.error();
        record.last_error_detail = outcome.detail();

        if (record.state != DeviceState::UNREACHABLE &&
            record.consecutive_failures >= policy.unreachable_after) {
            record.state = DeviceState::UNREACHABLE;
        }
    }

    return record.state != before;
}

bool PollOrchestrator::includeInSnapshot(const DeviceRecord& record, const HealthPolicy& policy,
                                         TimePoint now) {
    if (!record.last_reading || !record.last_success_at) {
        return false;
    }
    if (record.state != DeviceState::REACHABLE) {
        return false;
    }
    if (policy.stale_after.count() > 0 && now - *record.last_success_at > policy.stale_after) {
        return false;
    }
    return true;
}

std::shared_ptr<const Snapshot> PollOrchestrator::buildSnapshot(
    uint64_t generation, std::chrono::milliseconds duration, TimePoint now) const
{
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->generation = generation;
    snapshot->published_at = now;
    snapshot->cycle_duration = duration;

    for (const auto& record : registry_.all()) {
        bool included = includeInSnapshot(record, config_.health, now);
        if (included) {
            SnapshotEntry entry;
            entry.device_id = record.device_id;
            entry.alias = record.alias;
            entry.reading = *record.last_reading;
            snapshot->entries.emplace(record.device_id, std::move(entry));
        }

        DeviceStatus status;
        status.device_id = record.device_id;
        status.alias = record.alias;
        status.state = record.state;
        status.consecutive_failures = record.consecutive_failures;
        status.in_snapshot = included;
        snapshot->devices.push_back(std::move(status));
    }

    return snapshot;
}

}  // namespace core
}  // namespace kasad
