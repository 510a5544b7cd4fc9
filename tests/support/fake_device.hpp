/**
 * @file fake_device.hpp
 * @brief Loopback stand-ins for smart plugs, for unit and integration tests.
 *
 * FakeDevice answers framed TCP queries the way a plug does; a
 * FakeDiscoveryResponder answers UDP discovery queries, optionally from
 * several source ports so one responder can play several devices.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include <kasad/net/socket_address.hpp>
#include <kasad/net/udp_socket.hpp>
#include <kasad/protocol/json_value.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kasad {
namespace fakes {

/**
 * @enum FakeMode
 * @brief How a FakeDevice answers.
 */
enum class FakeMode {
    OK,               ///< System info plus realtime block
    SILENT,           ///< Accepts, reads the request, never answers
    GARBAGE,          ///< Well-framed body that does not decrypt to JSON
    NO_EMETER,        ///< System info only
    CLOSE_MID_FRAME,  ///< Header promises more bytes than are sent
    OVERSIZE          ///< Header declares a 1 MiB body
};

/**
 * @struct FakeSysinfo
 * @brief Identity reported by a fake.
 */
struct FakeSysinfo {
    std::string device_id;
    std::string alias;
    std::string model = "KP115(EU)";
    std::string hw_ver = "1.0";
    std::string feature = "TIM:ENE";
};

/// get_realtime block in emeter.v2 units (mA, mV, mW, Wh).
protocol::JsonValue realtimeV2(double currentMa, double voltageMv, double powerMw, double totalWh);

/// get_realtime block in emeter.v1 units (A, V, W, kWh).
protocol::JsonValue realtimeV1(double current, double voltage, double power, double totalKwh);

/// Plain system-info reply, as sent to discovery.
protocol::JsonValue sysinfoReply(const FakeSysinfo& info);

/**
 * @class FakeDevice
 * @brief TCP plug on 127.0.0.1, one connection at a time.
 */
class FakeDevice {
public:
    explicit FakeDevice(FakeSysinfo info, FakeMode mode = FakeMode::OK);
    ~FakeDevice();

    FakeDevice(const FakeDevice&) = delete;
    FakeDevice& operator=(const FakeDevice&) = delete;

    /**
     * @brief Listen on an ephemeral loopback port and start serving.
     */
    bool start();
    void stop();

    uint16_t port() const { return port_; }
    net::SocketAddress address() const { return net::SocketAddress("127.0.0.1", port_); }

    void setMode(FakeMode mode);
    void setDelay(std::chrono::milliseconds delay);
    void setSysinfo(const FakeSysinfo& info);

    /// Realtime block returned for the "emeter" module (default: 1.5 A, 230 V, 345 W, 2 kWh).
    void setRealtime(const protocol::JsonValue& realtime);

    size_t requestCount() const { return requests_.load(); }
    protocol::JsonValue lastRequest() const;

private:
    mutable std::mutex mutex_;
    FakeSysinfo info_;
    FakeMode mode_;
    std::chrono::milliseconds delay_{0};
    protocol::JsonValue realtime_;
    protocol::JsonValue lastRequest_;

    int listener_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<size_t> requests_{0};
    std::thread thread_;

    void serveLoop();
    void handle(int connection);
    protocol::JsonValue buildResponse(const protocol::JsonValue& request) const;

    // Sleeps in small steps; false if stopped meanwhile
    bool pause(std::chrono::milliseconds duration) const;
};

/**
 * @class FakeDiscoveryResponder
 * @brief UDP endpoint answering each discovery query with canned datagrams.
 */
class FakeDiscoveryResponder {
public:
    FakeDiscoveryResponder();
    ~FakeDiscoveryResponder();

    FakeDiscoveryResponder(const FakeDiscoveryResponder&) = delete;
    FakeDiscoveryResponder& operator=(const FakeDiscoveryResponder&) = delete;

    /**
     * @brief Queue a reply sent for every query.
     * @param voice Index of the source socket; each voice has its own port.
     */
    void addReply(const protocol::JsonValue& reply, size_t voice = 0);
    void addRawReply(const std::vector<uint8_t>& datagram, size_t voice = 0);

    bool start();
    void stop();

    uint16_t port() const { return socket_.getLocalPort(); }
    net::SocketAddress address() const { return net::SocketAddress("127.0.0.1", port()); }

    size_t queryCount() const { return queries_.load(); }
    protocol::JsonValue lastQuery() const;

private:
    struct Reply {
        std::vector<uint8_t> datagram;
        size_t voice;
    };

    mutable std::mutex mutex_;
    net::UdpSocket socket_;
    std::vector<std::unique_ptr<net::UdpSocket>> voices_;
    std::vector<Reply> replies_;
    protocol::JsonValue lastQuery_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> queries_{0};
    std::thread thread_;

    void serveLoop();
    net::UdpSocket& voice(size_t index);
};

}  // namespace fakes
}  // namespace kasad
