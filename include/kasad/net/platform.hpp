/**
 * @file platform.hpp
 * @brief Socket headers and the handful of calls that differ between
 *        Winsock and POSIX.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <WinSock2.h>
#include <WS2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace kasad {
namespace net {

#ifdef _WIN32
using SocketHandle = SOCKET;
constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;
#else
using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;
#endif

// A device that drops the connection mid-write must not raise SIGPIPE
#if defined(MSG_NOSIGNAL)
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

inline int getLastSocketError() {
#ifdef _WIN32
    return ::WSAGetLastError();
#else
    return errno;
#endif
}

inline void closeSocket(SocketHandle s) {
#ifdef _WIN32
    ::closesocket(s);
#else
    ::close(s);
#endif
}

inline bool setNonBlocking(SocketHandle s, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    return ::ioctlsocket(s, FIONBIO, &mode) == 0;
#else
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(s, F_SETFL, flags) == 0;
#endif
}

/// True for the error a non-blocking connect() reports while the handshake runs.
inline bool isConnectInProgress(int error) {
#ifdef _WIN32
    return error == WSAEWOULDBLOCK || error == WSAEINPROGRESS;
#else
    return error == EINPROGRESS || error == EWOULDBLOCK;
#endif
}

inline bool isInterrupted(int error) {
#ifdef _WIN32
    return error == WSAEINTR;
#else
    return error == EINTR;
#endif
}

/**
 * @brief Holds Winsock open for the lifetime of the process.
 *
 * main() and every socket test fixture own one. On POSIX it does nothing.
 */
class SocketInitializer {
public:
    SocketInitializer() : ready_(startup()) {}
    ~SocketInitializer() {
#ifdef _WIN32
        if (ready_) {
            ::WSACleanup();
        }
#endif
    }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

    bool isInitialized() const { return ready_; }

private:
    static bool startup() {
#ifdef _WIN32
        WSADATA data;
        return ::WSAStartup(MAKEWORD(2, 2), &data) == 0;
#else
        return true;
#endif
    }

    bool ready_;
};

}  // namespace net
}  // namespace kasad
