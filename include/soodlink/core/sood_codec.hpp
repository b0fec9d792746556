/**
 * @file sood_codec.hpp
 * @brief SOOD datagram encoding and decoding.
 *
 * Wire layout (all datagrams):
 *
 *   +--------+------+-----------------------------+
 *   | "SOOD" | type | attr attr attr ...          |
 *   | 4 B    | 1 B  | tag:u8 len:u8 value[len]    |
 *   +--------+------+-----------------------------+
 *
 * type 0x01 is a service query, 0x02 a response. Attribute values are
 * raw bytes with no escaping; the port attribute is a 16-bit big-endian
 * integer, every other attribute is text.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"
#include "soodlink/core/server_descriptor.hpp"
#include "soodlink/net/udp_socket.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace soodlink {
namespace core {
namespace sood {

constexpr std::array<uint8_t, 4> kMagic = {{'S', 'O', 'O', 'D'}};
constexpr std::size_t kHeaderSize = 5;
constexpr std::size_t kMaxAttributeLength = 255;

constexpr const char* kDefaultMulticastGroup = "239.255.90.90";
constexpr const char* kDefaultBroadcastAddress = "255.255.255.255";
constexpr uint16_t kDefaultPort = 9003;

/// Service class advertised by music servers speaking this protocol
constexpr const char* kServiceId = "00720724-5143-4a9b-abac-0e50cba674bb";

/**
 * @enum MessageType
 * @brief One-byte type field following the magic.
 */
enum class MessageType : uint8_t {
    QUERY = 0x01,
    RESPONSE = 0x02
};

/**
 * @brief Protocol-fixed attribute tags.
 */
namespace tag {
constexpr uint8_t SERVICE_ID = 0x01;
constexpr uint8_t UNIQUE_ID = 0x02;
constexpr uint8_t DISPLAY_NAME = 0x03;
constexpr uint8_t VERSION = 0x04;
constexpr uint8_t HOST = 0x05;
constexpr uint8_t PORT = 0x06;
constexpr uint8_t TRANSACTION_ID = 0x07;
}  // namespace tag

/**
 * @enum DecodeStatus
 * @brief Why a datagram was or was not accepted.
 */
enum class DecodeStatus {
    OK,
    TOO_SHORT,      ///< Fewer bytes than magic + type
    BAD_MAGIC,      ///< Not SOOD traffic
    BAD_TYPE,       ///< Unknown message type byte
    MALFORMED_TLV,  ///< Attribute length runs past the datagram
    WRONG_TYPE,     ///< Valid datagram, but not the expected message type
    MISSING_ID,     ///< Response without a unique id
    BAD_PORT        ///< Port attribute not 2 bytes, or zero
};

inline const char* decodeStatusToString(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK: return "ok";
        case DecodeStatus::TOO_SHORT: return "too short";
        case DecodeStatus::BAD_MAGIC: return "bad magic";
        case DecodeStatus::BAD_TYPE: return "unknown message type";
        case DecodeStatus::MALFORMED_TLV: return "malformed attribute list";
        case DecodeStatus::WRONG_TYPE: return "unexpected message type";
        case DecodeStatus::MISSING_ID: return "missing unique id";
        case DecodeStatus::BAD_PORT: return "invalid port attribute";
        default: return "unknown";
    }
}

struct SOODLINK_CORE_API Attribute {
    uint8_t tag;
    std::string value;
};

/**
 * @struct Message
 * @brief A decoded datagram: type plus attributes in wire order.
 */
struct SOODLINK_CORE_API Message {
    MessageType type = MessageType::QUERY;
    std::vector<Attribute> attributes;

    /**
     * @brief First attribute with the given tag, or nullptr.
     */
    const std::string* find(uint8_t t) const;

    void add(uint8_t t, std::string value) {
        attributes.push_back(Attribute{t, std::move(value)});
    }
};

/**
 * @struct DiscoveryQuery
 * @brief Outbound probe. Built fresh for every discovery round.
 */
struct SOODLINK_CORE_API DiscoveryQuery {
    enum class QueryType { SERVICE_QUERY };

    QueryType query_type = QueryType::SERVICE_QUERY;
    std::string service_id = kServiceId;
    std::string transaction_id;     ///< Omitted from the datagram when empty
};

/**
 * @brief Serialize a message.
 * @param message Message to encode.
 * @param out Receives the datagram bytes (replaced, not appended).
 * @return False if an attribute value exceeds 255 bytes.
 */
SOODLINK_CORE_API bool encodeMessage(const Message& message, std::vector<uint8_t>& out);

/**
 * @brief Parse a datagram into a message.
 *
 * Checks magic and type and walks the attribute list. Never throws;
 * the out parameter is only meaningful when OK is returned.
 */
SOODLINK_CORE_API DecodeStatus decodeMessage(const uint8_t* data, std::size_t length,
                                             Message& out);

SOODLINK_CORE_API bool encodeQuery(const DiscoveryQuery& query, std::vector<uint8_t>& out);

/**
 * @brief Build the response datagram a server would send for a descriptor.
 *
 * Host and port attributes are only written when set, so responders can
 * rely on the receiver falling back to the packet source address.
 */
SOODLINK_CORE_API bool encodeResponse(const ServerDescriptor& server,
                                      std::vector<uint8_t>& out);

/**
 * @brief Parse a response datagram into a descriptor.
 * @param data Datagram bytes.
 * @param length Datagram length.
 * @param source Packet source, used when host or port are not advertised.
 * @param out Receives the descriptor on success.
 */
SOODLINK_CORE_API DecodeStatus parseResponse(const uint8_t* data, std::size_t length,
                                             const net::SocketAddress& source,
                                             ServerDescriptor& out);

}  // namespace sood
}  // namespace core
}  // namespace soodlink
