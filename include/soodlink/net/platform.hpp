/**
 * @file platform.hpp
 * @brief Socket handle type and the few calls that differ between
 * Winsock2 and POSIX.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include <string>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>
#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <unistd.h>

    #include <cstring>
#endif

namespace soodlink {
namespace net {

#ifdef _WIN32
using SocketHandle = SOCKET;
constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

inline int getLastSocketError() { return WSAGetLastError(); }
inline bool isInterrupted(int error) { return error == WSAEINTR; }
inline void closeSocket(SocketHandle s) { ::closesocket(s); }

inline std::string socketErrorString(int error) {
    return "WSA error " + std::to_string(error);
}
#else
using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline bool isInterrupted(int error) { return error == EINTR; }
inline void closeSocket(SocketHandle s) { ::close(s); }

inline std::string socketErrorString(int error) {
    return std::strerror(error);
}
#endif

/**
 * @brief Holds Winsock open for its lifetime; nothing to do on POSIX.
 *
 * Create one before the first UdpSocket.
 */
class SocketInitializer {
public:
    SocketInitializer() {
#ifdef _WIN32
        WSADATA wsaData;
        initialized_ = WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
#endif
    }

    ~SocketInitializer() {
#ifdef _WIN32
        if (initialized_) {
            WSACleanup();
        }
#endif
    }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_ = true;
};

}  // namespace net
}  // namespace soodlink
