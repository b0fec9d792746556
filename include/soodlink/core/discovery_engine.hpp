/**
 * @file discovery_engine.hpp
 * @brief One-shot SOOD discovery over multicast and broadcast.
 *
 * The DiscoveryEngine handles:
 * - Sending one service query to the multicast group and one to the
 *   broadcast address, from a single ephemeral-port socket
 * - Collecting responses until the round deadline
 * - Dropping foreign and malformed datagrams
 * - Deduplicating responders by unique id (first response wins)
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"
#include "soodlink/core/server_descriptor.hpp"
#include "soodlink/core/sood_codec.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace soodlink {
namespace core {

/**
 * @class DiscoveryError
 * @brief A discovery round could not start (no socket, bind refused).
 *
 * Never raised for an empty result.
 */
class SOODLINK_CORE_API DiscoveryError : public std::runtime_error {
public:
    DiscoveryError(const std::string& what, int errorCode)
        : std::runtime_error(what)
        , errorCode_(errorCode)
    {}

    /// errno (or WSA error) reported by the socket layer
    int errorCode() const { return errorCode_; }

private:
    int errorCode_;
};

/**
 * @struct DiscoveryConfig
 * @brief Configuration for the discovery engine.
 */
struct SOODLINK_CORE_API DiscoveryConfig {
    std::string mcast_addr;             ///< Multicast group queried
    std::string bcast_addr;             ///< Broadcast address queried
    uint16_t port;                      ///< SOOD port on both paths
    std::string bind_addr;              ///< Local address for the ephemeral socket
    int multicast_ttl;                  ///< 1 = local subnet
    std::chrono::milliseconds timeout;  ///< Default round length
    std::string service_id;             ///< Service class to query for

    DiscoveryConfig()
        : mcast_addr(sood::kDefaultMulticastGroup)
        , bcast_addr(sood::kDefaultBroadcastAddress)
        , port(sood::kDefaultPort)
        , bind_addr("0.0.0.0")
        , multicast_ttl(1)
        , timeout(std::chrono::milliseconds(5000))
        , service_id(sood::kServiceId)
    {}
};

/**
 * @struct DiscoveryStats
 * @brief Counters for the most recent round, for diagnostics.
 */
struct SOODLINK_CORE_API DiscoveryStats {
    int queries_sent = 0;
    int datagrams_received = 0;
    int datagrams_discarded = 0;
    int duplicates = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @class ServerDiscovery
 * @brief Anything able to produce a server list within a time budget.
 *
 * Implemented by DiscoveryEngine; the connection manager depends on this
 * interface so tests can substitute canned results.
 */
class SOODLINK_CORE_API ServerDiscovery {
public:
    virtual ~ServerDiscovery() = default;

    /**
     * @brief Run one discovery round.
     * @throws DiscoveryError if the round could not start.
     */
    virtual std::vector<ServerDescriptor> discover(std::chrono::milliseconds timeout) = 0;
};

/**
 * @class DiscoveryEngine
 * @brief Blocking, deadline-bounded SOOD discovery.
 *
 * Every call owns its own socket and result set, so concurrent calls
 * from different threads do not interfere.
 *
 * Usage:
 * @code
 * DiscoveryEngine engine;
 * try {
 *     for (const auto& server : engine.discover(std::chrono::seconds(3))) {
 *         LOG_INFO("App", "{} at {}", server.display_name, server.endpoint());
 *     }
 * } catch (const DiscoveryError& e) {
 *     // no usable network
 * }
 * @endcode
 */
class SOODLINK_CORE_API DiscoveryEngine : public ServerDiscovery {
public:
    explicit DiscoveryEngine(DiscoveryConfig config = DiscoveryConfig());

    /**
     * @brief Run a round with the configured default timeout.
     */
    std::vector<ServerDescriptor> discover();

    /**
     * @brief Run a round.
     * @param timeout Overall round length; the call returns shortly after it.
     * @return Servers in order of first response, unique by unique_id.
     * @throws DiscoveryError if the socket cannot be opened or bound.
     */
    std::vector<ServerDescriptor> discover(std::chrono::milliseconds timeout) override;

    const DiscoveryConfig& config() const { return config_; }

    /**
     * @brief Counters of the most recently completed round.
     */
    DiscoveryStats lastStats() const;

private:
    DiscoveryConfig config_;

    mutable std::mutex statsMutex_;
    DiscoveryStats stats_;
};

}  // namespace core
}  // namespace soodlink
