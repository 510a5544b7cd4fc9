/**
 * @file device_client.cpp
 * @brief DeviceClient implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/device_client.hpp"
#include "kasad/net/tcp_socket.hpp"
#include "kasad/protocol/wire_codec.hpp"
#include "kasad/utils/logger.hpp"

#include <vector>

namespace kasad {
namespace core {

namespace {

// Maps a failed read to an outcome; @p what names the part being read
PollOutcome readFailure(net::IoStatus status, const char* what, size_t received,
                        size_t expected, int socketError) {
    switch (status) {
        case net::IoStatus::TIMEOUT:
            return PollOutcome::failure(ErrorKind::TIMEOUT,
                std::string("timed out reading ") + what + " (" + std::to_string(received) +
                "/" + std::to_string(expected) + " bytes)");
        case net::IoStatus::CLOSED:
            return PollOutcome::failure(ErrorKind::PROTOCOL,
                std::string("connection closed in ") + what + " (" + std::to_string(received) +
                "/" + std::to_string(expected) + " bytes)");
        default:
            return PollOutcome::failure(ErrorKind::UNREACHABLE,
                std::string("socket error reading ") + what + ": " + std::to_string(socketError));
    }
}

}  // namespace

DeviceClient::DeviceClient(const DeviceClientConfig& config, protocol::ModelTable models)
    : config_(config)
    , models_(std::move(models))
{}

PollOutcome DeviceClient::query(const net::SocketAddress& address,
                                const protocol::JsonValue& payload,
                                std::chrono::milliseconds connectTimeout,
                                std::chrono::milliseconds readTimeout,
                                const protocol::ModelProfile& profile) const {
    std::vector<uint8_t> request;
    try {
        request = protocol::encode(payload);
    } catch (const protocol::CodecError& e) {
        return PollOutcome::failure(ErrorKind::PROTOCOL,
                                    std::string("cannot encode request: ") + e.what());
    }

    net::TcpSocket socket;
    net::IoStatus status = socket.connect(address, static_cast<int>(connectTimeout.count()));
    if (status == net::IoStatus::TIMEOUT) {
        return PollOutcome::failure(ErrorKind::UNREACHABLE,
                                    "connect to " + address.toString() + " timed out");
    }
    if (status != net::IoStatus::OK) {
        return PollOutcome::failure(ErrorKind::UNREACHABLE,
            "connect to " + address.toString() + " failed: error " +
            std::to_string(socket.getLastError()));
    }

    auto deadline = net::TcpSocket::Clock::now() + readTimeout;

    status = socket.sendAll(request.data(), request.size(),
                            static_cast<int>(readTimeout.count()));
    if (status == net::IoStatus::TIMEOUT) {
        return PollOutcome::failure(ErrorKind::TIMEOUT, "timed out sending request");
    }
    if (status != net::IoStatus::OK) {
        return PollOutcome::failure(ErrorKind::UNREACHABLE,
            "send failed: error " + std::to_string(socket.getLastError()));
    }

    uint8_t header[protocol::FRAME_HEADER_SIZE];
    size_t received = 0;
    status = socket.receiveExact(header, sizeof(header), deadline, &received);
    if (status != net::IoStatus::OK) {
        return readFailure(status, "frame header", received, sizeof(header),
                           socket.getLastError());
    }

    uint32_t length = protocol::readFrameLength(header);
    if (length > config_.max_response_bytes) {
        return PollOutcome::failure(ErrorKind::PROTOCOL,
            "frame length " + std::to_string(length) + " exceeds limit " +
            std::to_string(config_.max_response_bytes));
    }

    std::vector<uint8_t> body(length);
    if (length > 0) {
        status = socket.receiveExact(body.data(), body.size(), deadline, &received);
        if (status != net::IoStatus::OK) {
            return readFailure(status, "frame body", received, body.size(),
                               socket.getLastError());
        }
    }
    socket.close();

    protocol::JsonValue response;
    try {
        response = protocol::decodeBody(body.data(), body.size());
    } catch (const protocol::CodecError& e) {
        return PollOutcome::failure(ErrorKind::PROTOCOL, e.what());
    }

    return interpret(response, profile);
}

PollOutcome DeviceClient::poll(const DeviceRecord& record) const {
    const protocol::ModelProfile& profile = models_.profileFor(record.model, record.hw_version);

    LOG_TRACE("DeviceClient", "Polling {} at {} with profile {}",
              record.device_id, record.address.toString(), profile.tag);

    PollOutcome outcome = query(record.address, protocol::buildTelemetryRequest(profile),
                                config_.connect_timeout, config_.read_timeout, profile);
    if (!outcome.ok()) {
        return outcome;
    }

    const std::string& reported = outcome.identity().device_id;
    if (reported != record.device_id) {
        return PollOutcome::failure(ErrorKind::UNEXPECTED_SCHEMA,
            record.address.toString() + " answered as " + reported);
    }
    return outcome;
}

PollOutcome DeviceClient::interpret(const protocol::JsonValue& response,
                                    const protocol::ModelProfile& profile) const {
    const protocol::JsonValue* sysinfo = protocol::findSysinfo(response);
    if (!sysinfo) {
        return PollOutcome::failure(ErrorKind::UNEXPECTED_SCHEMA, "no system info in response");
    }

    DeviceIdentity identity;
    identity.device_id = protocol::stringMember(*sysinfo, "deviceId").value_or("");
    if (identity.device_id.empty()) {
        return PollOutcome::failure(ErrorKind::UNEXPECTED_SCHEMA, "no deviceId in system info");
    }
    identity.alias = protocol::stringMember(*sysinfo, "alias").value_or("");
    identity.model = protocol::stringMember(*sysinfo, "model").value_or("");
    identity.hw_version = protocol::stringMember(*sysinfo, "hw_ver").value_or("");

    std::string problem;
    auto values = protocol::extractRealtime(profile, response, problem);
    if (!values) {
        return PollOutcome::failure(ErrorKind::UNEXPECTED_SCHEMA, problem);
    }

    Reading reading;
    reading.current_amperes = values->get(protocol::Quantity::CURRENT);
    reading.voltage_volts = values->get(protocol::Quantity::VOLTAGE);
    reading.power_watts = values->get(protocol::Quantity::POWER);
    reading.energy_joules_total = values->get(protocol::Quantity::ENERGY);
    reading.observed_at = SystemClock::now();

    return PollOutcome::success(reading, identity);
}

}  // namespace core
}  // namespace kasad
