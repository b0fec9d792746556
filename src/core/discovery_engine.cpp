/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#include "soodlink/core/discovery_engine.hpp"
#include "soodlink/net/udp_socket.hpp"
#include "soodlink/utils/logger.hpp"
#include "soodlink/utils/uuid.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace soodlink {
namespace core {

namespace {

// Upper bound for one select() so signals and clock drift are re-checked
constexpr int kMaxPollMs = 250;

}  // namespace

DiscoveryEngine::DiscoveryEngine(DiscoveryConfig config)
    : config_(std::move(config))
{}

std::vector<ServerDescriptor> DiscoveryEngine::discover() {
    return discover(config_.timeout);
}

DiscoveryStats DiscoveryEngine::lastStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

std::vector<ServerDescriptor> DiscoveryEngine::discover(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    const auto start = Clock::now();
    const auto deadline = start + std::max(timeout, std::chrono::milliseconds(0));
    DiscoveryStats stats;

    net::UdpSocket socket;
    if (!socket.open()) {
        throw DiscoveryError("Cannot open discovery socket: " + socket.getLastErrorString(),
                             socket.getLastError());
    }
    if (!socket.bind(0, config_.bind_addr)) {
        throw DiscoveryError("Cannot bind discovery socket on " + config_.bind_addr + ": " +
                             socket.getLastErrorString(), socket.getLastError());
    }
    if (!socket.setBroadcast(true)) {
        throw DiscoveryError("Cannot enable broadcast: " + socket.getLastErrorString(),
                             socket.getLastError());
    }
    if (!socket.setMulticastTTL(config_.multicast_ttl)) {
        LOG_WARN("Discovery", "Failed to set multicast TTL {}", config_.multicast_ttl);
    }

    sood::DiscoveryQuery query;
    query.service_id = config_.service_id;
    query.transaction_id = utils::UUIDGenerator::generate();

    std::vector<uint8_t> datagram;
    if (!sood::encodeQuery(query, datagram)) {
        // Only reachable with an oversized service id from configuration
        LOG_ERROR("Discovery", "Service id '{}' does not fit a SOOD attribute",
                  config_.service_id);
        return {};
    }

    LOG_INFO("Discovery", "Starting round {} (timeout {}ms, local port {})",
             query.transaction_id, timeout.count(), socket.getLocalPort());

    const net::SocketAddress targets[] = {
        net::SocketAddress(config_.mcast_addr, config_.port),
        net::SocketAddress(config_.bcast_addr, config_.port),
    };
    for (const auto& target : targets) {
        if (socket.sendTo(target, datagram) < 0) {
            LOG_WARN("Discovery", "Query to {} failed: {}",
                     target.toString(), socket.getLastErrorString());
        } else {
            ++stats.queries_sent;
            LOG_DEBUG("Discovery", "Sent query to {} ({} bytes)",
                      target.toString(), datagram.size());
        }
    }

    std::vector<ServerDescriptor> servers;
    if (stats.queries_sent == 0) {
        LOG_ERROR("Discovery", "No query could be sent; ending round early");
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_ = stats;
        return servers;
    }

    std::unordered_set<std::string> seen;
    std::vector<uint8_t> buffer(net::UdpSocket::kMaxDatagramSize);

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            break;
        }

        // Round up so a sub-millisecond remainder still waits instead of spinning
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now + std::chrono::microseconds(999));
        int waitMs = static_cast<int>(std::min<int64_t>(remaining.count(), kMaxPollMs));

        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer.data(), buffer.size(), waitMs, sender);

        if (received < 0) {
            LOG_WARN("Discovery", "Receive error: {}", socket.getLastErrorString());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (received == 0) {
            continue;
        }

        ++stats.datagrams_received;

        ServerDescriptor server;
        sood::DecodeStatus status = sood::parseResponse(
            buffer.data(), static_cast<size_t>(received), sender, server);
        if (status != sood::DecodeStatus::OK) {
            ++stats.datagrams_discarded;
            LOG_TRACE("Discovery", "Ignoring {} byte datagram from {}: {}",
                      received, sender.toString(), sood::decodeStatusToString(status));
            continue;
        }

        if (!seen.insert(server.unique_id).second) {
            ++stats.duplicates;
            LOG_TRACE("Discovery", "Duplicate response for {} from {}",
                      server.unique_id, sender.toString());
            continue;
        }

        LOG_INFO("Discovery", "Discovered server: {} ({}) at {}",
                 server.display_name, server.unique_id, server.endpoint());
        servers.push_back(std::move(server));
    }

    socket.close();

    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start);
    LOG_INFO("Discovery", "Discovery complete. Found {} server(s) in {}ms",
             servers.size(), stats.elapsed.count());

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_ = stats;
    }

    return servers;
}

}  // namespace core
}  // namespace soodlink
