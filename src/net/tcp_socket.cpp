/**
 * @file tcp_socket.cpp
 * @brief TcpSocket implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/net/tcp_socket.hpp"
#include "kasad/utils/logger.hpp"

#include <string>
#include <utility>

namespace kasad {
namespace net {

namespace {

int remainingMs(TcpSocket::Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - TcpSocket::Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(std::exchange(other.socket_, INVALID_SOCKET_HANDLE))
    , lastError_(other.lastError_)
{}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = std::exchange(other.socket_, INVALID_SOCKET_HANDLE);
        lastError_ = other.lastError_;
    }
    return *this;
}

IoStatus TcpSocket::connect(const SocketAddress& dest, int timeoutMs) {
    close();

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(dest.port);
    int rc = ::getaddrinfo(dest.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        lastError_ = rc;
        LOG_DEBUG("TcpSocket", "Cannot resolve {}: {}", dest.host, gai_strerror(rc));
        return IoStatus::ERROR;
    }

    socket_ = ::socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        ::freeaddrinfo(result);
        LOG_ERROR("TcpSocket", "Failed to create socket: error {}", lastError_);
        return IoStatus::ERROR;
    }

    if (!setNonBlocking(socket_, true)) {
        setLastError();
        ::freeaddrinfo(result);
        close();
        return IoStatus::ERROR;
    }

    int one = 1;
    setsockopt(socket_, IPPROTO_TCP, TCP_NODELAY,
               reinterpret_cast<const char*>(&one), sizeof(one));

    rc = ::connect(socket_, result->ai_addr, static_cast<socklen_t>(result->ai_addrlen));
    ::freeaddrinfo(result);

    if (rc == 0) {
        return IoStatus::OK;
    }

    setLastError();
    if (!isConnectInProgress(lastError_)) {
        close();
        return IoStatus::ERROR;
    }

    int ready = waitFor(true, timeoutMs);
    if (ready == 0) {
        close();
        return IoStatus::TIMEOUT;
    }
    if (ready < 0) {
        close();
        return IoStatus::ERROR;
    }

    // Writable: the handshake finished, successfully or not
    int soError = 0;
    socklen_t len = sizeof(soError);
    if (getsockopt(socket_, SOL_SOCKET, SO_ERROR,
                   reinterpret_cast<char*>(&soError), &len) != 0) {
        setLastError();
        close();
        return IoStatus::ERROR;
    }
    if (soError != 0) {
        lastError_ = soError;
        close();
        return IoStatus::ERROR;
    }

    return IoStatus::OK;
}

IoStatus TcpSocket::sendAll(const void* data, size_t length, int timeoutMs) {
    if (!isValid()) {
        return IoStatus::ERROR;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
    const char* cursor = static_cast<const char*>(data);
    size_t remaining = length;

    while (remaining > 0) {
        int ready = waitFor(true, remainingMs(deadline));
        if (ready == 0) {
            return IoStatus::TIMEOUT;
        }
        if (ready < 0) {
            return IoStatus::ERROR;
        }

#ifdef _WIN32
        int sent = ::send(socket_, cursor, static_cast<int>(remaining), SEND_FLAGS);
#else
        ssize_t sent = ::send(socket_, cursor, remaining, SEND_FLAGS);
#endif
        if (sent < 0) {
            setLastError();
            if (isInterrupted(lastError_) || isConnectInProgress(lastError_)) {
                continue;
            }
            return IoStatus::ERROR;
        }

        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return IoStatus::OK;
}

IoStatus TcpSocket::receiveExact(void* buffer, size_t length, Clock::time_point deadline,
                                 size_t* received) {
    size_t total = 0;
    if (received) {
        *received = 0;
    }
    if (!isValid()) {
        return IoStatus::ERROR;
    }

    char* cursor = static_cast<char*>(buffer);

    while (total < length) {
        int ready = waitFor(false, remainingMs(deadline));
        if (ready == 0) {
            return IoStatus::TIMEOUT;
        }
        if (ready < 0) {
            return IoStatus::ERROR;
        }

#ifdef _WIN32
        int got = ::recv(socket_, cursor + total, static_cast<int>(length - total), 0);
#else
        ssize_t got = ::recv(socket_, cursor + total, length - total, 0);
#endif
        if (got == 0) {
            return IoStatus::CLOSED;
        }
        if (got < 0) {
            setLastError();
            if (isInterrupted(lastError_) || isConnectInProgress(lastError_)) {
                continue;
            }
            return IoStatus::ERROR;
        }

        total += static_cast<size_t>(got);
        if (received) {
            *received = total;
        }
    }

    return IoStatus::OK;
}

void TcpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

int TcpSocket::waitFor(bool forWrite, int timeoutMs) {
    for (;;) {
        fd_set set;
        FD_ZERO(&set);
        FD_SET(socket_, &set);

        struct timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;

#ifdef _WIN32
        int result = ::select(0, forWrite ? nullptr : &set, forWrite ? &set : nullptr,
                              nullptr, &tv);
#else
        int result = ::select(socket_ + 1, forWrite ? nullptr : &set,
                              forWrite ? &set : nullptr, nullptr, &tv);
#endif
        if (result < 0) {
            setLastError();
            if (isInterrupted(lastError_)) {
                continue;
            }
        }
        return result;
    }
}

void TcpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace kasad
