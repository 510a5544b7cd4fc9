/**
 * @file discovery_client.cpp
 * @brief DiscoveryClient implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/discovery_client.hpp"
#include "kasad/net/udp_socket.hpp"
#include "kasad/protocol/device_model.hpp"
#include "kasad/protocol/wire_codec.hpp"
#include "kasad/utils/logger.hpp"

#include <map>

namespace kasad {
namespace core {

namespace {

constexpr size_t MAX_DATAGRAM_SIZE = 65535;

}  // namespace

DiscoveryClient::DiscoveryClient(const DiscoveryConfig& config)
    : config_(config)
{}

protocol::JsonValue DiscoveryClient::discoveryQuery() {
    protocol::JsonValue query = protocol::makeObject();
    protocol::member(protocol::member(query, "system"), "get_sysinfo").mutable_struct_value();
    return query;
}

std::optional<DeviceCandidate> DiscoveryClient::parseReply(const protocol::JsonValue& reply,
                                                           const net::SocketAddress& sender,
                                                           uint16_t devicePort,
                                                           std::string& reason) {
    const protocol::JsonValue* sysinfo = protocol::findSysinfo(reply);
    if (!sysinfo) {
        reason = "no system info";
        return std::nullopt;
    }

    auto deviceId = protocol::stringMember(*sysinfo, "deviceId");
    if (!deviceId || deviceId->empty()) {
        reason = "no deviceId";
        return std::nullopt;
    }

    auto feature = protocol::stringMember(*sysinfo, "feature");
    if (feature && feature->find(ENERGY_METER_FEATURE) == std::string::npos) {
        reason = "no energy meter (feature " + *feature + ")";
        return std::nullopt;
    }

    DeviceCandidate candidate;
    candidate.device_id = *deviceId;
    candidate.alias = protocol::stringMember(*sysinfo, "alias").value_or("");
    candidate.address = net::SocketAddress(sender.host, devicePort);
    candidate.model = protocol::stringMember(*sysinfo, "model").value_or("");
    candidate.hw_version = protocol::stringMember(*sysinfo, "hw_ver").value_or("");
    return candidate;
}

std::vector<DeviceCandidate> DiscoveryClient::discover(
    std::chrono::milliseconds timeout,
    const net::SocketAddress& broadcastAddress) const
{
    net::UdpSocket socket;
    if (!socket.isValid()) {
        throw DiscoveryError("cannot create discovery socket: error " +
                             std::to_string(socket.getLastError()));
    }
    if (!socket.bind(config_.bind_port, config_.bind_address)) {
        throw DiscoveryError("cannot bind discovery socket to " + config_.bind_address +
                             ": error " + std::to_string(socket.getLastError()));
    }
    if (!socket.setBroadcast(true)) {
        throw DiscoveryError("cannot enable broadcast: error " +
                             std::to_string(socket.getLastError()));
    }

    std::vector<uint8_t> query = protocol::encodeDatagram(discoveryQuery());
    if (socket.sendTo(broadcastAddress, query.data(), query.size()) < 0) {
        throw DiscoveryError("cannot send discovery query to " + broadcastAddress.toString() +
                             ": error " + std::to_string(socket.getLastError()));
    }

    LOG_DEBUG("Discovery", "Sent query to {}, listening for {} ms",
              broadcastAddress.toString(), timeout.count());

    // Source address -> candidate; a later reply from the same source wins
    std::map<std::string, DeviceCandidate> bySource;
    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            break;
        }

        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer.data(), buffer.size(),
                                          static_cast<int>(left), sender);
        if (received == 0) {
            continue;
        }
        if (received < 0) {
            if (net::isInterrupted(socket.getLastError())) {
                continue;
            }
            LOG_WARN("Discovery", "Receive error: {}", socket.getLastError());
            break;
        }

        protocol::JsonValue reply;
        try {
            reply = protocol::decodeDatagram(buffer.data(), static_cast<size_t>(received));
        } catch (const protocol::CodecError& e) {
            LOG_WARN("Discovery", "Dropping undecodable reply from {}: {}",
                     sender.toString(), e.what());
            continue;
        }

        std::string reason;
        auto candidate = parseReply(reply, sender, config_.device_port, reason);
        if (!candidate) {
            LOG_DEBUG("Discovery", "Ignoring reply from {}: {}", sender.toString(), reason);
            continue;
        }

        LOG_TRACE("Discovery", "Reply from {}: {} '{}'",
                  sender.toString(), candidate->device_id, candidate->alias);
        bySource[sender.toString()] = std::move(*candidate);
    }

    std::vector<DeviceCandidate> result;
    result.reserve(bySource.size());
    for (auto& entry : bySource) {
        result.push_back(std::move(entry.second));
    }

    LOG_DEBUG("Discovery", "Pass found {} device(s)", result.size());
    return result;
}

}  // namespace core
}  // namespace kasad
