/**
 * @file main.cpp
 * @brief kasad daemon entry point
 *
 * This is the thin executable that wires together the library components:
 * - Discovery client and static directory for device sourcing
 * - Poll orchestrator and polling service for the refresh cycles
 * - Snapshot collector served on the Prometheus metrics endpoint
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include <kasad/core/device_client.hpp>
#include <kasad/core/directory_provider.hpp>
#include <kasad/core/discovery_client.hpp>
#include <kasad/core/poll_orchestrator.hpp>
#include <kasad/core/polling_service.hpp>
#include <kasad/daemon/config.hpp>
#include <kasad/exporter/metrics_endpoint.hpp>
#include <kasad/net/platform.hpp>
#include <kasad/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace kasad;
using namespace kasad::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    Config config;
    std::vector<core::DeviceCandidate> devices;

    try {
        config = parseArgs(argc, argv);
        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }
        validateConfig(config);
        devices = staticDevices(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 2;
    }

    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "kasad starting...");
    LOG_INFO("Daemon", "Metrics endpoint: http://{}/metrics", config.web_listen_address);
    LOG_INFO("Daemon", "Discovery: {} ({}:{})", config.discovery ? "on" : "off",
             config.broadcast_addr, config.device_port);
    LOG_INFO("Daemon", "Static devices: {}", devices.size());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    net::SocketInitializer sockets;

    try {
        auto client = std::make_shared<core::DeviceClient>(toDeviceClientConfig(config));
        auto store = std::make_shared<core::SnapshotStore>();
        auto orchestrator = std::make_shared<core::PollOrchestrator>(
            toOrchestratorConfig(config),
            [client](const core::DeviceRecord& record) { return client->poll(record); },
            store);

        std::shared_ptr<core::DiscoveryClient> discovery;
        if (config.discovery) {
            discovery = std::make_shared<core::DiscoveryClient>(toDiscoveryConfig(config));
        }

        std::vector<std::shared_ptr<core::DirectoryProvider>> directories;
        if (!devices.empty()) {
            directories.push_back(std::make_shared<core::StaticDirectoryProvider>(devices));
        }

        // Bind before polling starts: a busy endpoint is the one fatal error
        std::unique_ptr<exporter::MetricsEndpoint> endpoint;
        try {
            endpoint = std::make_unique<exporter::MetricsEndpoint>(config.web_listen_address,
                                                                   store);
        } catch (const std::exception& e) {
            LOG_ERROR("Daemon", "Cannot listen on {}: {}", config.web_listen_address, e.what());
            return 1;
        }

        core::PollingService service(toPollingConfig(config), orchestrator, discovery,
                                     directories);
        service.start();
        LOG_INFO("Daemon", "kasad is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Daemon", "Shutting down...");
        service.stop();

        LOG_INFO("Daemon", "kasad stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
