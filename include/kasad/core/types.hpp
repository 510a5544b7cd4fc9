/**
 * @file types.hpp
 * @brief Device records, readings and poll outcomes.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"
#include "kasad/net/socket_address.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace kasad {
namespace core {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;

/**
 * @enum ErrorKind
 * @brief Why a poll attempt failed.
 */
enum class ErrorKind {
    UNREACHABLE,        ///< Connect failed or timed out, or the socket broke
    TIMEOUT,            ///< Connected, but no complete response in time
    PROTOCOL,           ///< Response could not be decoded
    UNEXPECTED_SCHEMA   ///< Decoded, but lacks the expected telemetry
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNREACHABLE: return "unreachable";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::PROTOCOL: return "protocol";
        case ErrorKind::UNEXPECTED_SCHEMA: return "unexpected-schema";
        default: return "unknown";
    }
}

/**
 * @enum DeviceState
 * @brief Health state of a known device.
 */
enum class DeviceState {
    DISCOVERED,   ///< Sighted, not yet polled successfully
    REACHABLE,    ///< Recent polls succeed
    UNREACHABLE   ///< Failure streak reached the threshold
};

inline const char* deviceStateToString(DeviceState state) {
    switch (state) {
        case DeviceState::DISCOVERED: return "discovered";
        case DeviceState::REACHABLE: return "reachable";
        case DeviceState::UNREACHABLE: return "unreachable";
        default: return "unknown";
    }
}

/**
 * @struct Reading
 * @brief One successful meter reading in SI units.
 */
struct KASAD_CORE_API Reading {
    double current_amperes;
    double voltage_volts;
    double power_watts;
    double energy_joules_total;   ///< May reset when the device reboots
    TimePoint observed_at;

    Reading()
        : current_amperes(0.0)
        , voltage_volts(0.0)
        , power_watts(0.0)
        , energy_joules_total(0.0)
    {}
};

/**
 * @struct DeviceIdentity
 * @brief What a device says about itself in its system info.
 */
struct KASAD_CORE_API DeviceIdentity {
    std::string device_id;
    std::string alias;
    std::string model;
    std::string hw_version;
};

/**
 * @struct DeviceCandidate
 * @brief A device reported by discovery or a directory.
 */
struct KASAD_CORE_API DeviceCandidate {
    std::string device_id;
    std::string alias;
    net::SocketAddress address;
    std::string model;
    std::string hw_version;
};

/**
 * @struct DeviceRecord
 * @brief A known device and its polling state.
 */
struct KASAD_CORE_API DeviceRecord {
    std::string device_id;          ///< Identity; never changes
    std::string alias;
    net::SocketAddress address;     ///< Refreshed by sourcing passes
    std::string model;
    std::string hw_version;

    DeviceState state;
    uint32_t consecutive_failures;
    uint32_t consecutive_successes;
    std::optional<TimePoint> last_success_at;
    std::optional<ErrorKind> last_error;
    std::string last_error_detail;
    std::optional<Reading> last_reading;

    uint32_t missed_sightings;      ///< Complete sourcing passes without a sighting
    TimePoint first_seen_at;
    TimePoint last_sighted_at;

    DeviceRecord()
        : state(DeviceState::DISCOVERED)
        , consecutive_failures(0)
        , consecutive_successes(0)
        , missed_sightings(0)
    {}
};

/**
 * @class PollOutcome
 * @brief Result of one poll attempt: a reading or an error kind.
 */
class KASAD_CORE_API PollOutcome {
public:
    static PollOutcome success(const Reading& reading, const DeviceIdentity& identity) {
        PollOutcome outcome;
        outcome.reading_ = reading;
        outcome.identity_ = identity;
        return outcome;
    }

    static PollOutcome failure(ErrorKind kind, std::string detail) {
        PollOutcome outcome;
        outcome.error_ = kind;
        outcome.detail_ = std::move(detail);
        return outcome;
    }

    bool ok() const { return !error_.has_value(); }

    /// @pre ok()
    const Reading& reading() const { return *reading_; }
    const DeviceIdentity& identity() const { return identity_; }

    /// @pre !ok()
    ErrorKind error() const { return *error_; }
    const std::string& detail() const { return detail_; }

private:
    PollOutcome() = default;

    std::optional<Reading> reading_;
    DeviceIdentity identity_;
    std::optional<ErrorKind> error_;
    std::string detail_;
};

class KASAD_CORE_API DirectoryError : public std::runtime_error {
public:
    explicit DirectoryError(const std::string& what) : std::runtime_error(what) {}
};

class KASAD_CORE_API DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace core
}  // namespace kasad
