/**
 * @file connection_manager.cpp
 * @brief ConnectionManager implementation.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#include "soodlink/core/connection_manager.hpp"
#include "soodlink/utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace soodlink {
namespace core {

namespace {

// Idle wait of the worker when no auth deadline is armed
constexpr auto kIdleWait = std::chrono::seconds(1);

// Dispatcher poll interval; it re-checks for close between waits
constexpr auto kDispatchPoll = std::chrono::milliseconds(100);

}  // namespace

ConnectionManager::ConnectionManager(std::shared_ptr<ServerDiscovery> discovery,
                                     std::shared_ptr<CredentialStore> store,
                                     TransportFactory transportFactory,
                                     ConnectionConfig config)
    : discovery_(std::move(discovery))
    , store_(std::move(store))
    , transportFactory_(std::move(transportFactory))
    , config_(config)
{
    if (!discovery_ || !store_ || !transportFactory_) {
        throw std::invalid_argument("ConnectionManager needs discovery, store and transport factory");
    }

    running_.store(true);
    workerThread_ = std::thread(&ConnectionManager::workerLoop, this);
    dispatcherThread_ = std::thread(&ConnectionManager::dispatcherLoop, this);

    LOG_DEBUG("Connection", "Manager started (auth timeout {}ms)",
              config_.auth_timeout.count());
}

ConnectionManager::~ConnectionManager() {
    shutdown();

    // The transport's sink points into this object; close it before members go
    std::lock_guard<std::mutex> lock(stateMutex_);
    releaseTransportLocked();
}

void ConnectionManager::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    events_.close();
    if (workerThread_.joinable()) {
        workerThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        releaseTransportLocked();
    }

    // Remaining notifications are delivered before the dispatcher exits
    notifications_.close();
    if (dispatcherThread_.joinable()) {
        dispatcherThread_.join();
    }

    LOG_DEBUG("Connection", "Manager stopped");
}

void ConnectionManager::setStatusObserver(StatusObserver observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observer_ = std::move(observer);
}

// ============================================================================
// Caller requests
// ============================================================================

CommandResult ConnectionManager::beginDiscovery(std::vector<ServerDescriptor>& servers) {
    return beginDiscovery(servers, config_.discovery_timeout);
}

CommandResult ConnectionManager::beginDiscovery(std::vector<ServerDescriptor>& servers,
                                                std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        applyPendingEventsLocked();
        CommandResult check = checkCanStartLocked();
        if (check != CommandResult::OK) {
            LOG_DEBUG("Connection", "Discovery refused: {}", commandResultToString(check));
            return check;
        }
        transitionLocked(ConnectionState::DISCOVERING);
    }

    std::vector<ServerDescriptor> found;
    try {
        found = discovery_->discover(timeout);
    } catch (...) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transitionLocked(ConnectionState::DISCONNECTED);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        lastDiscovered_ = found;
        transitionLocked(ConnectionState::DISCONNECTED);
    }

    servers = std::move(found);
    return CommandResult::OK;
}

CommandResult ConnectionManager::connect(const ServerDescriptor& target,
                                         std::optional<std::string> savedToken) {
    if (!target.isConnectable()) {
        LOG_WARN("Connection", "Refusing to connect to '{}' at {}: incomplete descriptor",
                 target.unique_id, target.endpoint());
        return CommandResult::INVALID_TARGET;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    applyPendingEventsLocked();
    return connectLocked(target, std::move(savedToken));
}

CommandResult ConnectionManager::reconnectFromSaved() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    applyPendingEventsLocked();

    CommandResult check = checkCanStartLocked();
    if (check != CommandResult::OK) {
        return check;
    }

    std::optional<SavedServer> saved = store_->loadSavedServer();
    if (!saved || !saved->server.isConnectable()) {
        LOG_INFO("Connection", "No saved server to reconnect to");
        return CommandResult::NO_SAVED_SERVER;
    }

    std::optional<std::string> token;
    if (!saved->token.empty()) {
        token = saved->token;
    }

    LOG_INFO("Connection", "Reconnecting to saved server {} ({}){}",
             saved->server.display_name, saved->server.unique_id,
             token ? " with saved token" : "");
    return connectLocked(saved->server, std::move(token));
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    applyPendingEventsLocked();

    if (session_.state == ConnectionState::DISCONNECTED ||
        session_.state == ConnectionState::DISCOVERING) {
        LOG_DEBUG("Connection", "disconnect() ignored in state {}",
                  connectionStateToString(session_.state));
        return;
    }

    releaseTransportLocked();
    session_.target.reset();
    session_.token.reset();
    session_.last_error.reset();
    transitionLocked(ConnectionState::DISCONNECTED);
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_.state;
}

ConnectionSession ConnectionManager::session() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_;
}

std::vector<ServerDescriptor> ConnectionManager::lastDiscovered() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastDiscovered_;
}

// ============================================================================
// Background threads
// ============================================================================

void ConnectionManager::workerLoop() {
    LOG_TRACE("Connection", "Worker thread started");

    while (running_.load()) {
        auto wakeAt = Clock::now() + kIdleWait;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (session_.state == ConnectionState::AUTHENTICATING) {
                wakeAt = std::min(wakeAt, authDeadline_);
            }
        }

        events_.waitUntilReady(wakeAt);
        if (!running_.load()) {
            break;
        }

        std::lock_guard<std::mutex> lock(stateMutex_);
        applyPendingEventsLocked();
        checkAuthDeadlineLocked();
    }

    LOG_TRACE("Connection", "Worker thread stopped");
}

void ConnectionManager::dispatcherLoop() {
    while (true) {
        std::optional<ConnectionStatus> status = notifications_.waitPop(kDispatchPoll);
        if (!status) {
            if (notifications_.isClosed()) {
                break;
            }
            continue;
        }

        StatusObserver observer;
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            observer = observer_;
        }
        if (!observer) {
            continue;
        }

        try {
            observer(*status);
        } catch (const std::exception& e) {
            LOG_ERROR("Connection", "Status observer threw: {}", e.what());
        }
    }
}

// ============================================================================
// State machine internals
// ============================================================================

CommandResult ConnectionManager::checkCanStartLocked() const {
    if (!running_.load()) {
        return CommandResult::SHUT_DOWN;
    }
    switch (session_.state) {
        case ConnectionState::DISCONNECTED:
            return CommandResult::OK;
        case ConnectionState::DISCOVERING:
            return CommandResult::DISCOVERY_IN_PROGRESS;
        case ConnectionState::CONNECTING:
        case ConnectionState::AUTHENTICATING:
            return CommandResult::ALREADY_CONNECTING;
        case ConnectionState::CONNECTED:
            return CommandResult::ALREADY_CONNECTED;
        case ConnectionState::ERROR:
        default:
            return CommandResult::RESET_REQUIRED;
    }
}

CommandResult ConnectionManager::connectLocked(const ServerDescriptor& target,
                                               std::optional<std::string> savedToken) {
    CommandResult check = checkCanStartLocked();
    if (check != CommandResult::OK) {
        LOG_DEBUG("Connection", "connect() refused: {}", commandResultToString(check));
        return check;
    }

    if (savedToken && savedToken->empty()) {
        savedToken.reset();
    }

    session_.target = target;
    session_.token = std::move(savedToken);
    session_.last_error.reset();

    const uint64_t attempt = ++attempt_;
    transitionLocked(ConnectionState::CONNECTING);

    LOG_INFO("Connection", "Connecting to {} ({}) at {}",
             target.display_name, target.unique_id, target.endpoint());

    TransportEventSink sink = [this, attempt](TransportEvent event) {
        events_.push(PendingEvent{attempt, std::move(event)});
    };

    try {
        transport_ = transportFactory_(target.host, target.port, std::move(sink));
        if (!transport_) {
            failLocked(ErrorCode::CONNECT_FAILED, "no transport for " + target.endpoint());
            return CommandResult::OK;
        }
        transport_->open();
    } catch (const std::exception& e) {
        failLocked(ErrorCode::CONNECT_FAILED, e.what());
    }

    return CommandResult::OK;
}

void ConnectionManager::applyPendingEventsLocked() {
    for (auto& pending : events_.drain()) {
        if (pending.attempt != attempt_ || !transport_) {
            LOG_DEBUG("Connection", "Dropping stale {} event",
                      transportEventTypeToString(pending.event.type));
            continue;
        }
        handleEventLocked(pending.event);
    }
}

void ConnectionManager::handleEventLocked(const TransportEvent& event) {
    const ConnectionState current = session_.state;

    switch (event.type) {
        case TransportEventType::LINK_ESTABLISHED:
            if (current == ConnectionState::CONNECTING) {
                enterAuthenticatingLocked();
                return;
            }
            break;

        case TransportEventType::LINK_FAILED:
            if (current == ConnectionState::CONNECTING) {
                failLocked(ErrorCode::CONNECT_FAILED, event.detail);
                return;
            }
            if (current == ConnectionState::AUTHENTICATING ||
                current == ConnectionState::CONNECTED) {
                failLocked(ErrorCode::LINK_LOST, event.detail);
                return;
            }
            break;

        case TransportEventType::TOKEN_GRANTED:
            if (current == ConnectionState::AUTHENTICATING) {
                if (event.token.empty()) {
                    LOG_WARN("Connection", "Ignoring grant without a token");
                    return;
                }
                grantLocked(event.token);
                return;
            }
            break;

        case TransportEventType::TOKEN_DENIED:
            if (current == ConnectionState::AUTHENTICATING ||
                current == ConnectionState::CONNECTED) {
                rejectLocked(event.detail);
                return;
            }
            break;

        case TransportEventType::LINK_LOST:
            if (current == ConnectionState::CONNECTING) {
                failLocked(ErrorCode::CONNECT_FAILED, event.detail);
                return;
            }
            if (current == ConnectionState::AUTHENTICATING ||
                current == ConnectionState::CONNECTED) {
                failLocked(ErrorCode::LINK_LOST, event.detail);
                return;
            }
            break;
    }

    LOG_DEBUG("Connection", "Ignoring {} in state {}",
              transportEventTypeToString(event.type), connectionStateToString(current));
}

void ConnectionManager::enterAuthenticatingLocked() {
    authDeadline_ = Clock::now() + config_.auth_timeout;
    transitionLocked(ConnectionState::AUTHENTICATING);
    events_.wake();

    if (session_.token) {
        LOG_INFO("Connection", "Link up, reauthenticating with saved token");
    } else {
        LOG_INFO("Connection", "Link up, waiting for the client to be authorized on {}",
                 session_.target ? session_.target->display_name : std::string("server"));
    }

    try {
        transport_->sendAuthRequest(session_.token);
    } catch (const std::exception& e) {
        failLocked(ErrorCode::CONNECT_FAILED, std::string("auth request failed: ") + e.what());
    }
}

void ConnectionManager::grantLocked(const std::string& token) {
    session_.token = token;
    session_.last_error.reset();

    if (session_.target && !store_->saveServer(*session_.target, token)) {
        LOG_WARN("Connection", "Token for {} could not be persisted",
                 session_.target->unique_id);
    }

    LOG_INFO("Connection", "Authorized by {}",
             session_.target ? session_.target->display_name : std::string("server"));
    transitionLocked(ConnectionState::CONNECTED);
}

void ConnectionManager::rejectLocked(const std::string& detail) {
    if (session_.target && !store_->clearToken(session_.target->unique_id)) {
        LOG_WARN("Connection", "Saved token for {} could not be cleared",
                 session_.target->unique_id);
    }
    session_.token.reset();
    failLocked(ErrorCode::AUTH_REJECTED, detail);
}

void ConnectionManager::checkAuthDeadlineLocked() {
    if (session_.state != ConnectionState::AUTHENTICATING) {
        return;
    }
    if (Clock::now() < authDeadline_) {
        return;
    }
    failLocked(ErrorCode::AUTH_TIMEOUT,
               "no authorization within " + std::to_string(config_.auth_timeout.count()) + "ms");
}

void ConnectionManager::failLocked(ErrorCode code, const std::string& detail) {
    releaseTransportLocked();
    session_.last_error = ConnectionError(code, detail);
    LOG_WARN("Connection", "Connection failed: {}", session_.last_error->toString());
    transitionLocked(ConnectionState::ERROR);
}

void ConnectionManager::releaseTransportLocked() {
    if (!transport_) {
        return;
    }

    // Anything this transport still raises is stale from here on
    ++attempt_;

    std::unique_ptr<SessionTransport> transport = std::move(transport_);
    try {
        transport->close();
    } catch (const std::exception& e) {
        LOG_WARN("Connection", "Transport close failed: {}", e.what());
    }
}

void ConnectionManager::transitionLocked(ConnectionState next) {
    const ConnectionState previous = session_.state;
    session_.state = next;

    LOG_DEBUG("Connection", "State {} -> {}",
              connectionStateToString(previous), connectionStateToString(next));

    ConnectionStatus status;
    status.state = next;
    status.last_error = session_.last_error;
    status.target = session_.target;
    notifications_.push(std::move(status));
}

}  // namespace core
}  // namespace soodlink
