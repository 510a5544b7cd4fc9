/**
 * @file config.hpp
 * @brief kasad daemon configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/device_client.hpp"
#include "kasad/core/directory_provider.hpp"
#include "kasad/core/discovery_client.hpp"
#include "kasad/core/poll_orchestrator.hpp"
#include "kasad/core/polling_service.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace kasad {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string web_listen_address = "[::1]:12345";
    std::string broadcast_addr = "255.255.255.255";
    uint16_t device_port = 9999;
    bool discovery = true;
    std::string log_level = "INFO";
    bool help = false;

    // Schedule
    int64_t discovery_timeout_ms = 1000;
    int64_t discovery_interval_ms = 60000;
    int64_t poll_interval_ms = 15000;

    // Device exchange
    int64_t connect_timeout_ms = 1000;
    int64_t read_timeout_ms = 2000;
    uint32_t max_in_flight = 8;

    // Health
    uint32_t unreachable_after = 3;
    uint32_t reachable_after = 1;
    int64_t stale_after_ms = 300000;     ///< 0 disables the age check
    uint32_t remove_after_missed = 5;    ///< 0 never removes

    std::vector<std::string> devices;    ///< --device specs, "<id>,<alias>,<host>[:<port>]"
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "kasad - Smart-plug telemetry exporter\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --web.listen-address <addr>  Metrics endpoint address (default: [::1]:12345)\n"
              << "  --log-level <level>          Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\nDevice Sourcing Options:\n"
              << "  --discovery <on|off>          UDP broadcast discovery (default: on)\n"
              << "  --broadcast-addr <addr>       Discovery broadcast address (default: 255.255.255.255)\n"
              << "  --device-port <port>          Device TCP/UDP port (default: 9999)\n"
              << "  --discovery-timeout-ms <ms>   Reply window per discovery pass (default: 1000)\n"
              << "  --discovery-interval-ms <ms>  Interval between sourcing passes (default: 60000)\n"
              << "  --device <id>,<alias>,<host>[:<port>]  Static device, repeatable\n"
              << "\nPolling Options:\n"
              << "  --poll-interval-ms <ms>       Interval between poll cycles (default: 15000)\n"
              << "  --connect-timeout-ms <ms>     TCP connect timeout (default: 1000)\n"
              << "  --read-timeout-ms <ms>        Request/response timeout (default: 2000)\n"
              << "  --max-in-flight <n>           Concurrent device queries (default: 8)\n"
              << "\nHealth Options:\n"
              << "  --unreachable-after <n>       Failures before a device is unreachable (default: 3)\n"
              << "  --reachable-after <n>         Successes before it is reachable again (default: 1)\n"
              << "  --stale-after-ms <ms>         Max age of an exported reading, 0=no limit (default: 300000)\n"
              << "  --remove-after-missed <n>     Sourcing passes before an absent device is forgotten, 0=never (default: 5)\n"
              << "\n  --help                        Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --web.listen-address 0.0.0.0:12345 --poll-interval-ms 10000\n"
              << "  " << program_name << " --discovery off --device 8006A1B2,Fridge,192.168.1.20\n";
}

/**
 * @brief Parse a port number
 * @throws std::invalid_argument if not in 1..65535
 */
inline uint16_t parsePort(const char* option, const char* value) {
    long port = std::stol(value);
    if (port < 1 || port > 65535) {
        throw std::invalid_argument(std::string(option) + ": port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

/**
 * @brief Parse an on/off switch
 * @throws std::invalid_argument on anything else
 */
inline bool parseSwitch(const char* option, const char* value) {
    if (std::strcmp(value, "on") == 0 || std::strcmp(value, "true") == 0) {
        return true;
    }
    if (std::strcmp(value, "off") == 0 || std::strcmp(value, "false") == 0) {
        return false;
    }
    throw std::invalid_argument(std::string(option) + ": expected on or off, got " + value);
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 * @throws std::invalid_argument on an unknown option, a missing value or a
 *         malformed value; std::out_of_range on a numeric overflow
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--web.listen-address") == 0) {
            config.web_listen_address = value;
        } else if (std::strcmp(arg, "--broadcast-addr") == 0) {
            config.broadcast_addr = value;
        } else if (std::strcmp(arg, "--device-port") == 0) {
            config.device_port = parsePort(arg, value);
        } else if (std::strcmp(arg, "--discovery") == 0) {
            config.discovery = parseSwitch(arg, value);
        } else if (std::strcmp(arg, "--discovery-timeout-ms") == 0) {
            config.discovery_timeout_ms = std::stoll(value);
        } else if (std::strcmp(arg, "--discovery-interval-ms") == 0) {
            config.discovery_interval_ms = std::stoll(value);
        } else if (std::strcmp(arg, "--poll-interval-ms") == 0) {
            config.poll_interval_ms = std::stoll(value);
        } else if (std::strcmp(arg, "--connect-timeout-ms") == 0) {
            config.connect_timeout_ms = std::stoll(value);
        } else if (std::strcmp(arg, "--read-timeout-ms") == 0) {
            config.read_timeout_ms = std::stoll(value);
        } else if (std::strcmp(arg, "--max-in-flight") == 0) {
            config.max_in_flight = static_cast<uint32_t>(std::stoul(value));
        } else if (std::strcmp(arg, "--unreachable-after") == 0) {
            config.unreachable_after = static_cast<uint32_t>(std::stoul(value));
        } else if (std::strcmp(arg, "--reachable-after") == 0) {
            config.reachable_after = static_cast<uint32_t>(std::stoul(value));
        } else if (std::strcmp(arg, "--stale-after-ms") == 0) {
            config.stale_after_ms = std::stoll(value);
        } else if (std::strcmp(arg, "--remove-after-missed") == 0) {
            config.remove_after_missed = static_cast<uint32_t>(std::stoul(value));
        } else if (std::strcmp(arg, "--device") == 0) {
            config.devices.push_back(value);
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            throw std::invalid_argument(std::string("unknown option ") + arg);
        }
    }

    return config;
}

/**
 * @brief Reject settings the daemon cannot run with
 * @throws std::invalid_argument naming the first bad setting
 */
inline void validateConfig(const Config& config) {
    auto positive = [](int64_t value, const char* name) {
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be greater than 0");
        }
    };

    positive(config.discovery_timeout_ms, "--discovery-timeout-ms");
    positive(config.discovery_interval_ms, "--discovery-interval-ms");
    positive(config.poll_interval_ms, "--poll-interval-ms");
    positive(config.connect_timeout_ms, "--connect-timeout-ms");
    positive(config.read_timeout_ms, "--read-timeout-ms");
    positive(config.max_in_flight, "--max-in-flight");
    positive(config.unreachable_after, "--unreachable-after");
    positive(config.reachable_after, "--reachable-after");

    if (config.stale_after_ms < 0) {
        throw std::invalid_argument("--stale-after-ms must not be negative");
    }
    if (config.web_listen_address.empty()) {
        throw std::invalid_argument("--web.listen-address must not be empty");
    }
    if (!config.discovery && config.devices.empty()) {
        throw std::invalid_argument("discovery is off and no --device is given");
    }
}

// =============================================================================
// Component configuration
// =============================================================================

inline core::DiscoveryConfig toDiscoveryConfig(const Config& config) {
    core::DiscoveryConfig discovery;
    discovery.device_port = config.device_port;
    return discovery;
}

inline core::DeviceClientConfig toDeviceClientConfig(const Config& config) {
    core::DeviceClientConfig client;
    client.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    client.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
    return client;
}

inline core::OrchestratorConfig toOrchestratorConfig(const Config& config) {
    core::OrchestratorConfig orchestrator;
    orchestrator.max_in_flight = config.max_in_flight;
    orchestrator.health.unreachable_after = config.unreachable_after;
    orchestrator.health.reachable_after = config.reachable_after;
    orchestrator.health.stale_after = std::chrono::milliseconds(config.stale_after_ms);
    orchestrator.health.remove_after_missed = config.remove_after_missed;
    return orchestrator;
}

inline core::PollingConfig toPollingConfig(const Config& config) {
    core::PollingConfig polling;
    polling.discovery_enabled = config.discovery;
    polling.broadcast_address = net::SocketAddress(config.broadcast_addr, config.device_port);
    polling.discovery_timeout = std::chrono::milliseconds(config.discovery_timeout_ms);
    polling.discovery_interval = std::chrono::milliseconds(config.discovery_interval_ms);
    polling.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    return polling;
}

/**
 * @brief Parse every --device spec
 * @throws std::invalid_argument on the first malformed spec
 */
inline std::vector<core::DeviceCandidate> staticDevices(const Config& config) {
    std::vector<core::DeviceCandidate> devices;
    devices.reserve(config.devices.size());
    for (const auto& spec : config.devices) {
        devices.push_back(core::parseDeviceSpec(spec, config.device_port));
    }
    return devices;
}

} // namespace daemon
} // namespace kasad
