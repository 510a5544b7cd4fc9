/**
 * @file polling_service.hpp
 * @brief The two periodic background tasks: sourcing and polling.
 *
 * The PollingService handles:
 * - Running discovery and every directory provider each discovery interval
 * - Feeding the results to the orchestrator
 * - Running a refresh cycle each poll interval, once the first sourcing
 *   pass has completed
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/directory_provider.hpp"
#include "kasad/core/discovery_client.hpp"
#include "kasad/core/export.hpp"
#include "kasad/core/poll_orchestrator.hpp"
#include "kasad/net/socket_address.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace kasad {
namespace core {

/**
 * @struct PollingConfig
 * @brief Schedule of the background tasks.
 */
struct KASAD_CORE_API PollingConfig {
    bool discovery_enabled;
    net::SocketAddress broadcast_address;
    std::chrono::milliseconds discovery_timeout;
    std::chrono::milliseconds discovery_interval;
    std::chrono::milliseconds poll_interval;

    PollingConfig()
        : discovery_enabled(true)
        , broadcast_address("255.255.255.255", DEFAULT_DEVICE_PORT)
        , discovery_timeout(1000)
        , discovery_interval(60000)
        , poll_interval(15000)
    {}
};

/**
 * @class PollingService
 * @brief Runs sourcing and polling on two background threads.
 *
 * Usage:
 * @code
 * PollingService service(config, orchestrator, discovery, {directory});
 * service.start();
 * // ... serve scrapes from orchestrator->store() ...
 * service.stop();
 * @endcode
 */
class KASAD_CORE_API PollingService {
public:
    /**
     * @param discovery May be null when discovery is disabled.
     */
    PollingService(const PollingConfig& config,
                   std::shared_ptr<PollOrchestrator> orchestrator,
                   std::shared_ptr<DiscoveryClient> discovery,
                   std::vector<std::shared_ptr<DirectoryProvider>> directories);

    /**
     * @brief Destructor - stops the service if running.
     */
    ~PollingService();

    // Non-copyable
    PollingService(const PollingService&) = delete;
    PollingService& operator=(const PollingService&) = delete;

    /**
     * @brief Start both threads.
     * @return False if already running.
     */
    bool start();

    /**
     * @brief Stop both threads.
     * Wakes sleeping tasks at once; a cycle in progress runs to completion.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Run one sourcing pass on the calling thread.
     * @return True if every source answered.
     */
    bool runSourcingPass();

    uint64_t sourcingPasses() const { return sourcingPasses_.load(); }
    uint64_t pollCycles() const { return pollCycles_.load(); }

private:
    PollingConfig config_;
    std::shared_ptr<PollOrchestrator> orchestrator_;
    std::shared_ptr<DiscoveryClient> discovery_;
    std::vector<std::shared_ptr<DirectoryProvider>> directories_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sourcingPasses_{0};
    std::atomic<uint64_t> pollCycles_{0};

    std::mutex waitMutex_;
    std::condition_variable wake_;
    bool firstPassDone_ = false;

    std::thread sourcingThread_;
    std::thread pollingThread_;

    void sourcingLoop();
    void pollingLoop();

    // Sleep until @p deadline or stop(); false if stopping
    bool waitUntil(std::chrono::steady_clock::time_point deadline);
};

}  // namespace core
}  // namespace kasad
