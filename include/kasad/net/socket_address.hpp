/**
 * @file socket_address.hpp
 * @brief Host and port pair used by the UDP and TCP sockets.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/net/export.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kasad {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address (or resolvable host name) and port pair.
 */
struct KASAD_NET_API SocketAddress {
    std::string host;
    uint16_t port;

    SocketAddress() : host("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& host_, uint16_t port_) : host(host_), port(port_) {}

    std::string toString() const { return host + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return host == other.host && port == other.port;
    }

    bool operator!=(const SocketAddress& other) const {
        return !(*this == other);
    }

    /**
     * @brief Parse "host" or "host:port".
     * @param text The text to parse.
     * @param defaultPort Port used when the text carries none.
     * @return The address, or nullopt if the host is empty or the port is
     *         not a number in 1..65535.
     */
    static std::optional<SocketAddress> parse(const std::string& text,
                                              uint16_t defaultPort);
};

}  // namespace net
}  // namespace kasad
