/**
 * @file udp_socket.hpp
 * @brief Datagram socket used for the discovery broadcast.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/net/export.hpp"
#include "kasad/net/platform.hpp"
#include "kasad/net/socket_address.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace kasad {
namespace net {

/**
 * @class UdpSocket
 * @brief Owns one IPv4 datagram socket; closed on destruction.
 *
 * Addresses passed to bind() and sendTo() must be dotted IPv4 literals.
 * Name resolution is left to the caller.
 *
 * @code
 * UdpSocket sock;
 * sock.setBroadcast(true);
 * sock.bind(0);
 * sock.sendTo(SocketAddress("255.255.255.255", 9999), query.data(), query.size());
 *
 * SocketAddress from;
 * int n = sock.receiveFrom(buf.data(), buf.size(), 250, from);
 * @endcode
 */
class KASAD_NET_API UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind to a local endpoint.
     *
     * An empty address or "0.0.0.0" binds every interface. Port 0 lets the
     * kernel pick; getLocalPort() reports the choice.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /// Bound port, or 0 when unbound or closed.
    uint16_t getLocalPort() const;

    /// SO_REUSEADDR. Only meaningful before bind().
    bool setReuseAddress(bool enable);

    /// SO_BROADCAST. Required before sending to a broadcast address.
    bool setBroadcast(bool enable);

    /**
     * @brief Send one datagram.
     * @return Bytes handed to the kernel, or -1.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Wait up to @p timeoutMs for one datagram.
     *
     * A negative timeout blocks. @p sender is written only when a datagram
     * arrives.
     *
     * @return Datagram size, 0 when the wait expired, -1 on a socket error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    bool setFlag(int option, bool enable);
    int waitReadable(int timeoutMs);
    void setLastError();

    SocketHandle socket_;
    int lastError_;
};

}  // namespace net
}  // namespace kasad
