/**
 * @file connection_manager.hpp
 * @brief Connection and authentication state machine.
 *
 * The ConnectionManager handles:
 * - Running discovery rounds on behalf of the caller
 * - Opening a session transport toward one chosen server
 * - Silent reauthentication with a saved token, or waiting for the user
 *   to authorize the client on the server
 * - Persisting the token on success and clearing it on rejection
 * - Reporting every state transition to one observer, in order
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/connection_types.hpp"
#include "soodlink/core/credential_store.hpp"
#include "soodlink/core/discovery_engine.hpp"
#include "soodlink/core/event_queue.hpp"
#include "soodlink/core/export.hpp"
#include "soodlink/core/session_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace soodlink {
namespace core {

/**
 * @struct ConnectionConfig
 * @brief Timing knobs for the state machine.
 */
struct SOODLINK_CORE_API ConnectionConfig {
    std::chrono::milliseconds auth_timeout;         ///< Max time in AUTHENTICATING
    std::chrono::milliseconds discovery_timeout;    ///< Round length for beginDiscovery()

    ConnectionConfig()
        : auth_timeout(std::chrono::seconds(120))
        , discovery_timeout(std::chrono::seconds(5))
    {}
};

/**
 * @brief Receives one ConnectionStatus per transition, on the dispatcher thread.
 */
using StatusObserver = std::function<void(const ConnectionStatus& status)>;

/**
 * @class ConnectionManager
 * @brief Single-writer state machine owning the session transport.
 *
 * Runs two background threads:
 * - Worker: applies transport events and enforces the auth deadline
 * - Dispatcher: delivers status notifications to the observer
 *
 * Transport events travel through an inbound queue. Caller requests apply
 * any queued events of the current attempt before acting, so a report from
 * the network is never overtaken by a concurrent request. Events raised by
 * a transport that has since been released are dropped.
 *
 * Usage:
 * @code
 * auto store = std::make_shared<config::FileCredentialStore>(path);
 * auto engine = std::make_shared<DiscoveryEngine>();
 * ConnectionManager manager(engine, store, makeTransport);
 * manager.setStatusObserver([](const ConnectionStatus& s) { ... });
 *
 * if (manager.reconnectFromSaved() == CommandResult::NO_SAVED_SERVER) {
 *     std::vector<ServerDescriptor> servers;
 *     manager.beginDiscovery(servers);
 *     if (!servers.empty()) manager.connect(servers.front());
 * }
 * @endcode
 */
class SOODLINK_CORE_API ConnectionManager {
public:
    /**
     * @throws std::invalid_argument if a collaborator is missing.
     */
    ConnectionManager(std::shared_ptr<ServerDiscovery> discovery,
                      std::shared_ptr<CredentialStore> store,
                      TransportFactory transportFactory,
                      ConnectionConfig config = ConnectionConfig());

    /**
     * @brief Destructor - releases the transport and stops both threads.
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Register the observer, replacing any previous one.
     *
     * The observer may call back into the manager, except shutdown().
     */
    void setStatusObserver(StatusObserver observer);

    /**
     * @brief Run a discovery round (DISCONNECTED -> DISCOVERING -> DISCONNECTED).
     *
     * Blocks for the round; the state lock is not held meanwhile, so
     * concurrent connect() calls get DISCOVERY_IN_PROGRESS.
     *
     * @param servers Receives the discovered servers on OK.
     * @throws DiscoveryError after returning to DISCONNECTED.
     */
    CommandResult beginDiscovery(std::vector<ServerDescriptor>& servers);
    CommandResult beginDiscovery(std::vector<ServerDescriptor>& servers,
                                 std::chrono::milliseconds timeout);

    /**
     * @brief Start connecting to target (DISCONNECTED -> CONNECTING).
     * @param target Server to connect to; needs id, host and a non-zero port.
     * @param savedToken Token from an earlier session, for silent reauthentication.
     * @return OK once the attempt started; its outcome is reported to the observer.
     */
    CommandResult connect(const ServerDescriptor& target,
                          std::optional<std::string> savedToken = std::nullopt);

    /**
     * @brief connect() to the server in the credential store, with its token.
     * @return NO_SAVED_SERVER (state untouched) if nothing usable is stored.
     */
    CommandResult reconnectFromSaved();

    /**
     * @brief Return to DISCONNECTED from CONNECTING, AUTHENTICATING,
     * CONNECTED or ERROR. The transport is closed and destroyed before
     * this returns. No-op in DISCONNECTED and DISCOVERING.
     */
    void disconnect();

    /**
     * @brief Release everything and stop the threads. Pending
     * notifications are still delivered. Idempotent.
     *
     * Later beginDiscovery(), connect() and reconnectFromSaved() calls
     * return SHUT_DOWN.
     */
    void shutdown();

    ConnectionState state() const;

    /**
     * @brief Copy of the session record.
     */
    ConnectionSession session() const;

    /**
     * @brief Result of the most recent successful discovery round.
     */
    std::vector<ServerDescriptor> lastDiscovered() const;

    const ConnectionConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct PendingEvent {
        uint64_t attempt;
        TransportEvent event;
    };

    std::shared_ptr<ServerDiscovery> discovery_;
    std::shared_ptr<CredentialStore> store_;
    TransportFactory transportFactory_;
    ConnectionConfig config_;

    // Guards everything below up to the queues
    mutable std::mutex stateMutex_;
    ConnectionSession session_;
    std::unique_ptr<SessionTransport> transport_;
    uint64_t attempt_ = 0;
    Clock::time_point authDeadline_;
    std::vector<ServerDescriptor> lastDiscovered_;

    EventQueue<PendingEvent> events_;
    EventQueue<ConnectionStatus> notifications_;

    std::mutex observerMutex_;
    StatusObserver observer_;

    std::atomic<bool> running_{false};
    std::thread workerThread_;
    std::thread dispatcherThread_;

    // Thread functions
    void workerLoop();
    void dispatcherLoop();

    // All *Locked helpers require stateMutex_
    CommandResult checkCanStartLocked() const;
    CommandResult connectLocked(const ServerDescriptor& target,
                                std::optional<std::string> savedToken);
    void applyPendingEventsLocked();
    void handleEventLocked(const TransportEvent& event);
    void checkAuthDeadlineLocked();
    void enterAuthenticatingLocked();
    void grantLocked(const std::string& token);
    void rejectLocked(const std::string& detail);
    void failLocked(ErrorCode code, const std::string& detail);
    void releaseTransportLocked();
    void transitionLocked(ConnectionState next);
};

}  // namespace core
}  // namespace soodlink
