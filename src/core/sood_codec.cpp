/**
 * @file sood_codec.cpp
 * @brief SOOD datagram codec implementation.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#include "soodlink/core/sood_codec.hpp"

#include <algorithm>

namespace soodlink {
namespace core {
namespace sood {

namespace {

constexpr const char* kUnknownName = "Unknown";

bool appendAttribute(std::vector<uint8_t>& out, uint8_t t, const std::string& value) {
    if (value.size() > kMaxAttributeLength) {
        return false;
    }
    out.push_back(t);
    out.push_back(static_cast<uint8_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
    return true;
}

std::string encodePort(uint16_t port) {
    std::string value(2, '\0');
    value[0] = static_cast<char>((port >> 8) & 0xFF);
    value[1] = static_cast<char>(port & 0xFF);
    return value;
}

}  // namespace

const std::string* Message::find(uint8_t t) const {
    auto it = std::find_if(attributes.begin(), attributes.end(),
                           [t](const Attribute& a) { return a.tag == t; });
    return it == attributes.end() ? nullptr : &it->value;
}

bool encodeMessage(const Message& message, std::vector<uint8_t>& out) {
    std::vector<uint8_t> buffer;
    buffer.reserve(kHeaderSize + message.attributes.size() * 16);
    buffer.insert(buffer.end(), kMagic.begin(), kMagic.end());
    buffer.push_back(static_cast<uint8_t>(message.type));

    for (const auto& attr : message.attributes) {
        if (!appendAttribute(buffer, attr.tag, attr.value)) {
            return false;
        }
    }

    out = std::move(buffer);
    return true;
}

DecodeStatus decodeMessage(const uint8_t* data, std::size_t length, Message& out) {
    if (data == nullptr || length < kHeaderSize) {
        return DecodeStatus::TOO_SHORT;
    }
    if (!std::equal(kMagic.begin(), kMagic.end(), data)) {
        return DecodeStatus::BAD_MAGIC;
    }

    const uint8_t type = data[kMagic.size()];
    if (type != static_cast<uint8_t>(MessageType::QUERY) &&
        type != static_cast<uint8_t>(MessageType::RESPONSE)) {
        return DecodeStatus::BAD_TYPE;
    }

    Message message;
    message.type = static_cast<MessageType>(type);

    std::size_t offset = kHeaderSize;
    while (offset < length) {
        // Need both the tag and the length byte
        if (length - offset < 2) {
            return DecodeStatus::MALFORMED_TLV;
        }
        const uint8_t t = data[offset];
        const std::size_t valueLength = data[offset + 1];
        offset += 2;

        if (valueLength > length - offset) {
            return DecodeStatus::MALFORMED_TLV;
        }
        message.attributes.push_back(Attribute{
            t, std::string(reinterpret_cast<const char*>(data + offset), valueLength)});
        offset += valueLength;
    }

    out = std::move(message);
    return DecodeStatus::OK;
}

bool encodeQuery(const DiscoveryQuery& query, std::vector<uint8_t>& out) {
    Message message;
    message.type = MessageType::QUERY;
    message.add(tag::SERVICE_ID, query.service_id);
    if (!query.transaction_id.empty()) {
        message.add(tag::TRANSACTION_ID, query.transaction_id);
    }
    return encodeMessage(message, out);
}

bool encodeResponse(const ServerDescriptor& server, std::vector<uint8_t>& out) {
    Message message;
    message.type = MessageType::RESPONSE;
    message.add(tag::UNIQUE_ID, server.unique_id);
    message.add(tag::DISPLAY_NAME, server.display_name);
    if (!server.version.empty()) {
        message.add(tag::VERSION, server.version);
    }
    if (!server.host.empty()) {
        message.add(tag::HOST, server.host);
    }
    if (server.port != 0) {
        message.add(tag::PORT, encodePort(server.port));
    }
    return encodeMessage(message, out);
}

DecodeStatus parseResponse(const uint8_t* data, std::size_t length,
                           const net::SocketAddress& source,
                           ServerDescriptor& out) {
    Message message;
    DecodeStatus status = decodeMessage(data, length, message);
    if (status != DecodeStatus::OK) {
        return status;
    }
    if (message.type != MessageType::RESPONSE) {
        return DecodeStatus::WRONG_TYPE;
    }

    const std::string* uniqueId = message.find(tag::UNIQUE_ID);
    if (uniqueId == nullptr || uniqueId->empty()) {
        return DecodeStatus::MISSING_ID;
    }

    ServerDescriptor server;
    server.unique_id = *uniqueId;

    const std::string* name = message.find(tag::DISPLAY_NAME);
    server.display_name = (name != nullptr) ? *name : kUnknownName;

    if (const std::string* version = message.find(tag::VERSION)) {
        server.version = *version;
    }

    const std::string* host = message.find(tag::HOST);
    server.host = (host != nullptr && !host->empty()) ? *host : source.ip;

    if (const std::string* port = message.find(tag::PORT)) {
        if (port->size() != 2) {
            return DecodeStatus::BAD_PORT;
        }
        server.port = static_cast<uint16_t>(
            (static_cast<uint8_t>((*port)[0]) << 8) | static_cast<uint8_t>((*port)[1]));
        if (server.port == 0) {
            return DecodeStatus::BAD_PORT;
        }
    } else {
        server.port = source.port;
    }

    out = std::move(server);
    return DecodeStatus::OK;
}

}  // namespace sood
}  // namespace core
}  // namespace soodlink
