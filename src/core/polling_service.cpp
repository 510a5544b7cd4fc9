/**
 * @file polling_service.cpp
 * @brief PollingService implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/polling_service.hpp"
#include "kasad/utils/logger.hpp"

#include <exception>

namespace kasad {
namespace core {

PollingService::PollingService(const PollingConfig& config,
                               std::shared_ptr<PollOrchestrator> orchestrator,
                               std::shared_ptr<DiscoveryClient> discovery,
                               std::vector<std::shared_ptr<DirectoryProvider>> directories)
    : config_(config)
    , orchestrator_(std::move(orchestrator))
    , discovery_(std::move(discovery))
    , directories_(std::move(directories))
{
    LOG_INFO("Polling", "Discovery {} ({} every {} ms), {} director{}, poll every {} ms",
             config_.discovery_enabled && discovery_ ? "on" : "off",
             config_.broadcast_address.toString(), config_.discovery_interval.count(),
             directories_.size(), directories_.size() == 1 ? "y" : "ies",
             config_.poll_interval.count());
}

PollingService::~PollingService() {
    stop();
}

bool PollingService::start() {
    if (running_.load()) {
        LOG_WARN("Polling", "Service already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        firstPassDone_ = false;
    }
    running_.store(true);

    sourcingThread_ = std::thread(&PollingService::sourcingLoop, this);
    pollingThread_ = std::thread(&PollingService::pollingLoop, this);

    LOG_INFO("Polling", "Service started");
    return true;
}

void PollingService::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Polling", "Stopping service...");
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        running_.store(false);
    }
    wake_.notify_all();

    if (sourcingThread_.joinable()) {
        sourcingThread_.join();
    }
    if (pollingThread_.joinable()) {
        pollingThread_.join();
    }

    LOG_INFO("Polling", "Service stopped");
}

bool PollingService::runSourcingPass() {
    std::vector<DeviceCandidate> candidates;
    bool complete = true;

    // Directories first, discovery last: a LAN reply carries the freshest address
    for (const auto& directory : directories_) {
        try {
            auto devices = directory->listDevices();
            LOG_DEBUG("Polling", "Directory '{}' listed {} device(s)",
                      directory->name(), devices.size());
            candidates.insert(candidates.end(), devices.begin(), devices.end());
        } catch (const std::exception& e) {
            LOG_WARN("Polling", "Directory '{}' failed: {}", directory->name(), e.what());
            complete = false;
        }
    }

    if (config_.discovery_enabled && discovery_) {
        try {
            auto devices = discovery_->discover(config_.discovery_timeout,
                                                config_.broadcast_address);
            candidates.insert(candidates.end(), devices.begin(), devices.end());
        } catch (const std::exception& e) {
            LOG_WARN("Polling", "Discovery failed: {}", e.what());
            complete = false;
        }
    }

    orchestrator_->ingestCandidates(candidates, complete);
    ++sourcingPasses_;
    return complete;
}

void PollingService::sourcingLoop() {
    LOG_DEBUG("Polling", "Sourcing thread started");

    auto next = std::chrono::steady_clock::now();
    while (running_.load()) {
        try {
            runSourcingPass();
        } catch (const std::exception& e) {
            LOG_ERROR("Polling", "Sourcing pass failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            firstPassDone_ = true;
        }
        wake_.notify_all();

        next += config_.discovery_interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            next = now;
        }
        if (!waitUntil(next)) {
            break;
        }
    }

    LOG_DEBUG("Polling", "Sourcing thread stopped");
}

void PollingService::pollingLoop() {
    LOG_DEBUG("Polling", "Polling thread started");

    {
        std::unique_lock<std::mutex> lock(waitMutex_);
        wake_.wait(lock, [this] { return firstPassDone_ || !running_.load(); });
    }

    auto next = std::chrono::steady_clock::now();
    while (running_.load()) {
        try {
            orchestrator_->refreshCycle();
            ++pollCycles_;
        } catch (const std::exception& e) {
            LOG_ERROR("Polling", "Refresh cycle failed: {}", e.what());
        }

        // Fixed rate; skip ticks missed by a long cycle
        next += config_.poll_interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            LOG_WARN("Polling", "Cycle overran the {} ms poll interval",
                     config_.poll_interval.count());
            next = now;
        }
        if (!waitUntil(next)) {
            break;
        }
    }

    LOG_DEBUG("Polling", "Polling thread stopped");
}

bool PollingService::waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    wake_.wait_until(lock, deadline, [this] { return !running_.load(); });
    return running_.load();
}

}  // namespace core
}  // namespace kasad
