#pragma once

// Undefine Windows ERROR macro to avoid conflict with MessageType::ERROR
#ifdef ERROR
#undef ERROR
#endif

#include "common/protocol_error.hpp"
#include "common/uuid.hpp"
#include <boost/json.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rcp {

// Message kinds; the wire form is the lowercase name
enum class MessageType : uint8_t {
    AUTH,
    COMMAND,
    RESPONSE,
    EVENT,
    ERROR,
    PING,
    PONG,
};

std::string_view message_type_to_string(MessageType type);
std::optional<MessageType> message_type_from_string(std::string_view token);

// Byte strings travel as JSON arrays of integers 0-255
boost::json::array bytes_to_json(std::span<const uint8_t> bytes);
std::optional<std::vector<uint8_t>> bytes_from_json(const boost::json::value& value);

/**
 * Message - one unit of protocol exchange.
 *
 * Body layout (JSON):
 *   {"id": "<uuid>", "type": "auth|command|...", "timestamp": <secs>, "payload": {...}}
 *
 * The id is assigned at construction and used to correlate a Response
 * or Error (payload.request_id) with the request that caused it.
 */
struct Message {
    Uuid id;
    MessageType type = MessageType::PING;
    uint64_t timestamp = 0;
    boost::json::value payload;

    // New message with a fresh id and the current time
    static Message create(MessageType type, boost::json::value payload);

    // {username, credentials: [bytes], method}
    static Message auth(std::string_view username, std::span<const uint8_t> credentials,
                        std::string_view method);

    // {command, params}
    static Message command(std::string_view command, boost::json::value params);

    // {request_id, success, data}
    static Message response(const Uuid& request_id, bool success, boost::json::value data);

    // {request_id (null when absent), code, message}
    static Message error(std::optional<Uuid> request_id, uint32_t code, std::string_view message);

    // {event, data}
    static Message event(std::string_view event, boost::json::value data);

    // {}
    static Message ping();

    // {ping_id}
    static Message pong(const Uuid& ping_id);

    boost::json::value to_json() const;
    static std::expected<Message, ProtocolError> from_json(const boost::json::value& value);

    // Serialized body, without the length prefix
    std::expected<std::vector<uint8_t>, ProtocolError> encode() const;
    static std::expected<Message, ProtocolError> decode(std::span<const uint8_t> body);

    // payload.request_id when present and well formed
    std::optional<Uuid> request_id() const;

    bool operator==(const Message&) const = default;
};

} // namespace rcp
