/**
 * @file connection_types.hpp
 * @brief States, error codes and status records of the connection lifecycle.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"
#include "soodlink/core/server_descriptor.hpp"

#include <optional>
#include <string>

namespace soodlink {
namespace core {

/**
 * @enum ConnectionState
 * @brief Lifecycle of the single connection a ConnectionManager drives.
 */
enum class ConnectionState {
    DISCONNECTED,   ///< Idle, no target
    DISCOVERING,    ///< Discovery round in progress
    CONNECTING,     ///< Transport opening toward the target
    AUTHENTICATING, ///< Link up, waiting for a token
    CONNECTED,      ///< Authenticated session
    ERROR           ///< Attempt failed; see last_error, reset with disconnect()
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::DISCOVERING: return "discovering";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::AUTHENTICATING: return "authenticating";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::ERROR: return "error";
        default: return "unknown";
    }
}

/**
 * @enum ErrorCode
 * @brief Failures recorded in ConnectionSession::last_error.
 */
enum class ErrorCode {
    CONNECT_FAILED, ///< Transport could not establish the link
    AUTH_REJECTED,  ///< Server denied or revoked the token
    AUTH_TIMEOUT,   ///< Nobody authorized the client in time
    LINK_LOST       ///< Established link went away
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECT_FAILED: return "connect failed";
        case ErrorCode::AUTH_REJECTED: return "authorization rejected";
        case ErrorCode::AUTH_TIMEOUT: return "authorization timed out";
        case ErrorCode::LINK_LOST: return "link lost";
        default: return "unknown error";
    }
}

/**
 * @struct ConnectionError
 * @brief Structured error: code plus transport supplied detail.
 */
struct SOODLINK_CORE_API ConnectionError {
    ErrorCode code;
    std::string detail;

    ConnectionError(ErrorCode code_, std::string detail_ = std::string())
        : code(code_), detail(std::move(detail_)) {}

    std::string toString() const {
        return detail.empty() ? errorCodeToString(code)
                              : std::string(errorCodeToString(code)) + ": " + detail;
    }

    bool operator==(const ConnectionError& other) const {
        return code == other.code && detail == other.detail;
    }
};

/**
 * @enum CommandResult
 * @brief Synchronous outcome of a caller request. Anything but OK leaves
 * the state untouched.
 */
enum class CommandResult {
    OK,
    INVALID_TARGET,         ///< Missing id/host or port outside 1-65535
    ALREADY_CONNECTING,     ///< An attempt is in CONNECTING or AUTHENTICATING
    ALREADY_CONNECTED,      ///< A session is CONNECTED
    DISCOVERY_IN_PROGRESS,  ///< A discovery round owns the state
    RESET_REQUIRED,         ///< In ERROR; call disconnect() first
    NO_SAVED_SERVER,        ///< reconnectFromSaved() found nothing to use
    SHUT_DOWN               ///< shutdown() was called; no new attempts
};

inline const char* commandResultToString(CommandResult result) {
    switch (result) {
        case CommandResult::OK: return "ok";
        case CommandResult::INVALID_TARGET: return "invalid target";
        case CommandResult::ALREADY_CONNECTING: return "already connecting";
        case CommandResult::ALREADY_CONNECTED: return "already connected";
        case CommandResult::DISCOVERY_IN_PROGRESS: return "discovery in progress";
        case CommandResult::RESET_REQUIRED: return "reset required";
        case CommandResult::NO_SAVED_SERVER: return "no saved server";
        case CommandResult::SHUT_DOWN: return "shut down";
        default: return "unknown";
    }
}

/**
 * @struct ConnectionStatus
 * @brief What an observer receives for every transition.
 */
struct SOODLINK_CORE_API ConnectionStatus {
    ConnectionState state = ConnectionState::DISCONNECTED;
    std::optional<ConnectionError> last_error;
    std::optional<ServerDescriptor> target;

    /// True exactly for the AUTHENTICATING -> CONNECTED notification and later
    bool authenticated() const { return state == ConnectionState::CONNECTED; }
};

/**
 * @struct ConnectionSession
 * @brief Snapshot of the state machine's session record.
 */
struct SOODLINK_CORE_API ConnectionSession {
    ConnectionState state = ConnectionState::DISCONNECTED;
    std::optional<ServerDescriptor> target;
    std::optional<std::string> token;
    std::optional<ConnectionError> last_error;
};

}  // namespace core
}  // namespace soodlink
