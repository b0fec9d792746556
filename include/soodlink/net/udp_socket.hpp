/**
 * @file udp_socket.hpp
 * @brief Cross-platform IPv4 UDP socket for discovery traffic.
 *
 * Provides a RAII wrapper around a UDP socket with broadcast and
 * multicast-send options and timeout-based receive.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/net/export.hpp"
#include "soodlink/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace soodlink {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct SOODLINK_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * The socket is created by open(), not by the constructor, so callers
 * can tell "could not get a socket at all" apart from later failures.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * if (!sock.open() || !sock.bind(0)) { ... }
 * sock.setBroadcast(true);
 * sock.sendTo(SocketAddress("239.255.90.90", 9003), query.data(), query.size());
 *
 * std::vector<uint8_t> buffer(UdpSocket::kMaxDatagramSize);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 250, sender);
 * @endcode
 */
class SOODLINK_NET_API UdpSocket {
public:
    /// Largest payload a single IPv4 UDP datagram can carry.
    static constexpr std::size_t kMaxDatagramSize = 65507;

    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Create the underlying socket.
     * @return True on success, or if already open.
     */
    bool open();

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for an ephemeral port).
     * @param address The local address to bind to (default: any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Enable address reuse (SO_REUSEADDR, plus SO_REUSEPORT where available).
     * Call before bind().
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Allow sending to broadcast addresses (SO_BROADCAST).
     */
    bool setBroadcast(bool enable);

    /**
     * @brief Set the multicast TTL (1 = local subnet only).
     */
    bool setMulticastTTL(int ttl);

    /**
     * @brief Send a datagram.
     * @return Number of bytes sent, or -1 on error (see getLastError()).
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    int sendTo(const SocketAddress& dest, const std::vector<uint8_t>& data) {
        return sendTo(dest, data.data(), data.size());
    }

    /**
     * @brief Receive one datagram, waiting at most timeoutMs.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = poll, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Bytes received, 0 on timeout or signal interruption, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    /**
     * @brief Error code of the last failed operation.
     */
    int getLastError() const { return lastError_; }

    std::string getLastErrorString() const { return socketErrorString(lastError_); }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace soodlink
