/**
 * @file server_descriptor.hpp
 * @brief Normalized record of one discovered server.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"

#include <cstdint>
#include <string>

namespace soodlink {
namespace core {

/**
 * @struct ServerDescriptor
 * @brief Information about a server that answered a SOOD query.
 *
 * unique_id is the identity: two descriptors with the same id describe
 * the same server, whichever path (multicast or broadcast) produced them.
 */
struct SOODLINK_CORE_API ServerDescriptor {
    std::string unique_id;      ///< Stable server id, dedup key
    std::string display_name;   ///< Human readable name
    std::string host;           ///< IPv4/IPv6 literal
    uint16_t port;              ///< Service port, 1-65535 when valid
    std::string version;        ///< Empty when not advertised

    ServerDescriptor() : port(0) {}

    ServerDescriptor(std::string id, std::string name, std::string host_,
                     uint16_t port_, std::string version_ = std::string())
        : unique_id(std::move(id))
        , display_name(std::move(name))
        , host(std::move(host_))
        , port(port_)
        , version(std::move(version_))
    {}

    std::string endpoint() const {
        // Bracket IPv6 literals so the port stays unambiguous
        if (host.find(':') != std::string::npos) {
            return "[" + host + "]:" + std::to_string(port);
        }
        return host + ":" + std::to_string(port);
    }

    /**
     * @brief True if this record can be handed to a session transport.
     */
    bool isConnectable() const {
        return !unique_id.empty() && !host.empty() && port != 0;
    }

    bool operator==(const ServerDescriptor& other) const {
        return unique_id == other.unique_id &&
               display_name == other.display_name &&
               host == other.host &&
               port == other.port &&
               version == other.version;
    }

    bool operator!=(const ServerDescriptor& other) const {
        return !(*this == other);
    }
};

}  // namespace core
}  // namespace soodlink
