/**
 * @file tcp_socket.hpp
 * @brief RAII TCP client socket with deadline-bounded I/O.
 *
 * Every blocking point (connect, send, receive) waits in select() with an
 * explicit timeout, so a caller can bound the total time spent on one
 * device exchange.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/net/export.hpp"
#include "kasad/net/platform.hpp"
#include "kasad/net/socket_address.hpp"

#include <chrono>
#include <cstddef>

namespace kasad {
namespace net {

/**
 * @enum IoStatus
 * @brief Result of a TCP operation.
 */
enum class IoStatus {
    OK,        ///< Operation completed
    TIMEOUT,   ///< Deadline elapsed first
    CLOSED,    ///< Peer closed the connection before completion
    ERROR      ///< Resolution or socket error (see getLastError())
};

inline const char* ioStatusToString(IoStatus status) {
    switch (status) {
        case IoStatus::OK: return "ok";
        case IoStatus::TIMEOUT: return "timeout";
        case IoStatus::CLOSED: return "closed";
        case IoStatus::ERROR: return "error";
        default: return "unknown";
    }
}

/**
 * @class TcpSocket
 * @brief Non-blocking TCP client connection, closed on destruction.
 *
 * Usage:
 * @code
 * TcpSocket sock;
 * if (sock.connect(SocketAddress("192.168.1.20", 9999), 1000) != IoStatus::OK) {
 *     // unreachable
 * }
 * sock.sendAll(frame.data(), frame.size(), 1000);
 * auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
 * sock.receiveExact(header, 4, deadline);
 * @endcode
 */
class KASAD_NET_API TcpSocket {
public:
    using Clock = std::chrono::steady_clock;

    TcpSocket();
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Resolve and connect to an IPv4 endpoint.
     * @param dest Host name or dotted address plus port.
     * @param timeoutMs Connect timeout in milliseconds.
     * @return OK, TIMEOUT, or ERROR (resolution failure, refusal, ...).
     */
    IoStatus connect(const SocketAddress& dest, int timeoutMs);

    /**
     * @brief Write the whole buffer.
     * @param timeoutMs Time limit for the whole write.
     */
    IoStatus sendAll(const void* data, size_t length, int timeoutMs);

    /**
     * @brief Read exactly @p length bytes before @p deadline.
     * @param received Output: bytes actually read (may be short on failure).
     */
    IoStatus receiveExact(void* buffer, size_t length, Clock::time_point deadline,
                          size_t* received = nullptr);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    // Waits until the socket is readable (or writable); 0 on timeout, <0 on error
    int waitFor(bool forWrite, int timeoutMs);
    void setLastError();
};

}  // namespace net
}  // namespace kasad
