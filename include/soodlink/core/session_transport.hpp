/**
 * @file session_transport.hpp
 * @brief Seam for the application-level session with a server.
 *
 * The transport performs the handshake and authorization exchange; the
 * ConnectionManager only owns it and reacts to the events it raises.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace soodlink {
namespace core {

/**
 * @enum TransportEventType
 * @brief Asynchronous notifications raised by a SessionTransport.
 */
enum class TransportEventType {
    LINK_ESTABLISHED,
    LINK_FAILED,
    TOKEN_GRANTED,
    TOKEN_DENIED,
    LINK_LOST
};

inline const char* transportEventTypeToString(TransportEventType type) {
    switch (type) {
        case TransportEventType::LINK_ESTABLISHED: return "link_established";
        case TransportEventType::LINK_FAILED: return "link_failed";
        case TransportEventType::TOKEN_GRANTED: return "token_granted";
        case TransportEventType::TOKEN_DENIED: return "token_denied";
        case TransportEventType::LINK_LOST: return "link_lost";
        default: return "unknown";
    }
}

struct SOODLINK_CORE_API TransportEvent {
    TransportEventType type;
    std::string token;      ///< Set for TOKEN_GRANTED
    std::string detail;     ///< Optional diagnostic text

    static TransportEvent linkEstablished() {
        return TransportEvent{TransportEventType::LINK_ESTABLISHED, {}, {}};
    }
    static TransportEvent linkFailed(std::string why = std::string()) {
        return TransportEvent{TransportEventType::LINK_FAILED, {}, std::move(why)};
    }
    static TransportEvent tokenGranted(std::string token) {
        return TransportEvent{TransportEventType::TOKEN_GRANTED, std::move(token), {}};
    }
    static TransportEvent tokenDenied(std::string why = std::string()) {
        return TransportEvent{TransportEventType::TOKEN_DENIED, {}, std::move(why)};
    }
    static TransportEvent linkLost(std::string why = std::string()) {
        return TransportEvent{TransportEventType::LINK_LOST, {}, std::move(why)};
    }
};

/**
 * @brief Where a transport delivers its events. Callable from any thread.
 */
using TransportEventSink = std::function<void(TransportEvent)>;

/**
 * @class SessionTransport
 * @brief Session with one server at host:port.
 *
 * Contract:
 * - open() starts connecting and returns without waiting; the outcome
 *   arrives as LINK_ESTABLISHED or LINK_FAILED. It may throw
 *   std::exception when the attempt cannot even start.
 * - sendAuthRequest() asks for a token, reusing savedToken when present;
 *   the answer arrives as TOKEN_GRANTED or TOKEN_DENIED.
 * - After close() returns the sink must not be invoked again.
 */
class SOODLINK_CORE_API SessionTransport {
public:
    virtual ~SessionTransport() = default;

    virtual void open() = 0;
    virtual void sendAuthRequest(const std::optional<std::string>& savedToken) = 0;
    virtual void close() = 0;
};

/**
 * @brief Builds a transport toward host:port that reports through sink.
 */
using TransportFactory = std::function<std::unique_ptr<SessionTransport>(
    const std::string& host, uint16_t port, TransportEventSink sink)>;

}  // namespace core
}  // namespace soodlink
