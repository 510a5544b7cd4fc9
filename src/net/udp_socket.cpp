/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/net/udp_socket.hpp"
#include "kasad/utils/logger.hpp"

#include <utility>

namespace kasad {
namespace net {

namespace {

// Fills an IPv4 endpoint from a dotted literal; "" and "0.0.0.0" mean any
bool makeEndpoint(const std::string& host, uint16_t port, bool allowAny,
                  sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (allowAny && (host.empty() || host == "0.0.0.0")) {
        out.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return ::inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1;
}

SocketAddress fromEndpoint(const sockaddr_in& in) {
    char text[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &in.sin_addr, text, sizeof(text));
    return SocketAddress(text, ntohs(in.sin_port));
}

}  // namespace

UdpSocket::UdpSocket()
    : socket_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    , lastError_(0)
{
    if (!isValid()) {
        setLastError();
        LOG_ERROR("UdpSocket", "socket() failed (error {})", lastError_);
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(std::exchange(other.socket_, INVALID_SOCKET_HANDLE))
    , lastError_(other.lastError_)
{}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = std::exchange(other.socket_, INVALID_SOCKET_HANDLE);
        lastError_ = other.lastError_;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    sockaddr_in local;
    if (!makeEndpoint(address, port, true, local)) {
        LOG_ERROR("UdpSocket", "'{}' is not an IPv4 address", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Cannot bind {}:{} (error {})", address, port, lastError_);
        return false;
    }

    LOG_DEBUG("UdpSocket", "Listening on {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (!isValid() ||
        ::getsockname(socket_, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return 0;
    }
    return ntohs(local.sin_port);
}

bool UdpSocket::setReuseAddress(bool enable) {
    return setFlag(SO_REUSEADDR, enable);
}

bool UdpSocket::setBroadcast(bool enable) {
    return setFlag(SO_BROADCAST, enable);
}

bool UdpSocket::setFlag(int option, bool enable) {
    if (!isValid()) {
        return false;
    }
    int value = enable ? 1 : 0;
    if (::setsockopt(socket_, SOL_SOCKET, option,
                     reinterpret_cast<const char*>(&value), sizeof(value)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    sockaddr_in remote;
    if (!makeEndpoint(dest.host, dest.port, false, remote)) {
        LOG_WARN("UdpSocket", "Cannot send to '{}': not an IPv4 literal", dest.host);
        return -1;
    }

    auto sent = ::sendto(socket_, static_cast<const char*>(data),
#ifdef _WIN32
                         static_cast<int>(length),
#else
                         length,
#endif
                         0, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote));
    if (sent < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(sent);
}

int UdpSocket::waitReadable(int timeoutMs) {
    if (timeoutMs < 0) {
        return 1;
    }

    fd_set readable;
    FD_ZERO(&readable);
    FD_SET(socket_, &readable);

    timeval wait{};
    wait.tv_sec = timeoutMs / 1000;
    wait.tv_usec = (timeoutMs % 1000) * 1000;

    // The first argument is ignored by Winsock
    int ready = ::select(static_cast<int>(socket_) + 1, &readable, nullptr, nullptr, &wait);
    if (ready < 0) {
        setLastError();
    }
    return ready;
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    int ready = waitReadable(timeoutMs);
    if (ready <= 0) {
        return ready < 0 ? -1 : 0;
    }

    sockaddr_in remote{};
    socklen_t len = sizeof(remote);
    auto received = ::recvfrom(socket_, static_cast<char*>(buffer),
#ifdef _WIN32
                               static_cast<int>(bufferSize),
#else
                               bufferSize,
#endif
                               0, reinterpret_cast<sockaddr*>(&remote), &len);
    if (received < 0) {
        setLastError();
        return -1;
    }

    sender = fromEndpoint(remote);
    return static_cast<int>(received);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace kasad
