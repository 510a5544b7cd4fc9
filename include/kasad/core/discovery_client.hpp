/**
 * @file discovery_client.hpp
 * @brief UDP broadcast discovery of smart plugs on the local network.
 *
 * One discover() call is one pass: a single encrypted system-info query is
 * broadcast, then unicast replies are collected until the timeout elapses.
 * Nothing is kept between passes.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"
#include "kasad/core/types.hpp"
#include "kasad/net/socket_address.hpp"
#include "kasad/protocol/json_value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kasad {
namespace core {

constexpr uint16_t DEFAULT_DEVICE_PORT = 9999;

/// Feature flag of plugs with an energy meter.
constexpr const char* ENERGY_METER_FEATURE = "ENE";

/**
 * @struct DiscoveryConfig
 * @brief Configuration for the discovery client.
 */
struct KASAD_CORE_API DiscoveryConfig {
    std::string bind_address;   ///< Local address for the query socket
    uint16_t bind_port;         ///< Local port (0 = ephemeral)
    uint16_t device_port;       ///< TCP port recorded for replying devices

    DiscoveryConfig()
        : bind_address("0.0.0.0")
        , bind_port(0)
        , device_port(DEFAULT_DEVICE_PORT)
    {}
};

/**
 * @class DiscoveryClient
 * @brief Finds devices by broadcasting a system-info query.
 *
 * Usage:
 * @code
 * DiscoveryClient client(DiscoveryConfig{});
 * auto candidates = client.discover(std::chrono::milliseconds(1000),
 *                                   net::SocketAddress("255.255.255.255", 9999));
 * @endcode
 */
class KASAD_CORE_API DiscoveryClient {
public:
    explicit DiscoveryClient(const DiscoveryConfig& config);

    /**
     * @brief Run one discovery pass.
     * @param timeout How long to listen for replies.
     * @param broadcastAddress Where to send the query.
     * @return One candidate per replying source address.
     * @throws DiscoveryError if the socket cannot be opened, configured or sent on.
     */
    std::vector<DeviceCandidate> discover(std::chrono::milliseconds timeout,
                                          const net::SocketAddress& broadcastAddress) const;

    /**
     * @brief The query payload, {"system":{"get_sysinfo":{}}}.
     */
    static protocol::JsonValue discoveryQuery();

    /**
     * @brief Turn a decoded reply into a candidate.
     * @param reason Output: why the reply was rejected.
     * @return The candidate, or nullopt if the reply has no device id or
     *         the device has no energy meter.
     */
    static std::optional<DeviceCandidate> parseReply(const protocol::JsonValue& reply,
                                                     const net::SocketAddress& sender,
                                                     uint16_t devicePort,
                                                     std::string& reason);

    const DiscoveryConfig& config() const { return config_; }

private:
    DiscoveryConfig config_;
};

}  // namespace core
}  // namespace kasad
