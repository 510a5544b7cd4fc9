/**
 * @file device_client.hpp
 * @brief One framed request/response exchange with a device over TCP.
 *
 * Every exit path closes the connection, and every failure is reported as
 * a PollOutcome rather than thrown.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"
#include "kasad/core/types.hpp"
#include "kasad/net/socket_address.hpp"
#include "kasad/protocol/device_model.hpp"
#include "kasad/protocol/json_value.hpp"

#include <chrono>
#include <cstddef>

namespace kasad {
namespace core {

/**
 * @struct DeviceClientConfig
 * @brief Timeouts and limits for device exchanges.
 */
struct KASAD_CORE_API DeviceClientConfig {
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds read_timeout;   ///< Budget for sending the request and reading the reply
    size_t max_response_bytes;                ///< Larger declared frames are rejected

    DeviceClientConfig()
        : connect_timeout(1000)
        , read_timeout(2000)
        , max_response_bytes(64 * 1024)
    {}
};

/**
 * @class DeviceClient
 * @brief Queries devices for telemetry.
 *
 * Stateless apart from its configuration, so one instance may be used
 * from many threads at once.
 */
class KASAD_CORE_API DeviceClient {
public:
    explicit DeviceClient(const DeviceClientConfig& config,
                          protocol::ModelTable models = protocol::ModelTable::defaults());

    /**
     * @brief Send @p payload to @p address and map the reply with @p profile.
     *
     * Connect failure or timeout gives UNREACHABLE, a read timeout gives
     * TIMEOUT, an undecodable or oversized reply gives PROTOCOL and a reply
     * without the expected fields gives UNEXPECTED_SCHEMA.
     */
    PollOutcome query(const net::SocketAddress& address,
                      const protocol::JsonValue& payload,
                      std::chrono::milliseconds connectTimeout,
                      std::chrono::milliseconds readTimeout,
                      const protocol::ModelProfile& profile) const;

    /**
     * @brief Poll a known device with the request for its model.
     *
     * A reply carrying another device id is UNEXPECTED_SCHEMA: the address
     * has been handed to a different device.
     */
    PollOutcome poll(const DeviceRecord& record) const;

    const DeviceClientConfig& config() const { return config_; }
    const protocol::ModelTable& models() const { return models_; }

private:
    DeviceClientConfig config_;
    protocol::ModelTable models_;

    PollOutcome interpret(const protocol::JsonValue& response,
                          const protocol::ModelProfile& profile) const;
};

}  // namespace core
}  // namespace kasad
