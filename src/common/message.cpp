#include "common/message.hpp"
#include <chrono>

namespace json = boost::json;

namespace rcp {

namespace {

uint64_t now_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    return secs > 0 ? static_cast<uint64_t>(secs) : 0;
}

std::optional<uint64_t> as_u64(const json::value& v) {
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64() && v.as_int64() >= 0) return static_cast<uint64_t>(v.as_int64());
    return std::nullopt;
}

} // anonymous namespace

std::string_view message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::AUTH: return "auth";
        case MessageType::COMMAND: return "command";
        case MessageType::RESPONSE: return "response";
        case MessageType::EVENT: return "event";
        case MessageType::ERROR: return "error";
        case MessageType::PING: return "ping";
        case MessageType::PONG: return "pong";
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(std::string_view token) {
    if (token == "auth") return MessageType::AUTH;
    if (token == "command") return MessageType::COMMAND;
    if (token == "response") return MessageType::RESPONSE;
    if (token == "event") return MessageType::EVENT;
    if (token == "error") return MessageType::ERROR;
    if (token == "ping") return MessageType::PING;
    if (token == "pong") return MessageType::PONG;
    return std::nullopt;
}

json::array bytes_to_json(std::span<const uint8_t> bytes) {
    json::array arr;
    arr.reserve(bytes.size());
    for (uint8_t b : bytes) {
        arr.emplace_back(static_cast<int64_t>(b));
    }
    return arr;
}

std::optional<std::vector<uint8_t>> bytes_from_json(const json::value& value) {
    if (!value.is_array()) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(value.as_array().size());
    for (const auto& item : value.as_array()) {
        auto n = as_u64(item);
        if (!n || *n > 0xFF) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(*n));
    }
    return out;
}

Message Message::create(MessageType type, json::value payload) {
    Message msg;
    msg.id = Uuid::generate();
    msg.type = type;
    msg.timestamp = now_seconds();
    msg.payload = std::move(payload);
    return msg;
}

Message Message::auth(std::string_view username, std::span<const uint8_t> credentials,
                      std::string_view method) {
    return create(MessageType::AUTH, json::object{
        {"username", username},
        {"credentials", bytes_to_json(credentials)},
        {"method", method},
    });
}

Message Message::command(std::string_view command, json::value params) {
    return create(MessageType::COMMAND, json::object{
        {"command", command},
        {"params", std::move(params)},
    });
}

Message Message::response(const Uuid& request_id, bool success, json::value data) {
    return create(MessageType::RESPONSE, json::object{
        {"request_id", request_id.to_string()},
        {"success", success},
        {"data", std::move(data)},
    });
}

Message Message::error(std::optional<Uuid> request_id, uint32_t code, std::string_view message) {
    json::object payload;
    if (request_id) {
        payload["request_id"] = request_id->to_string();
    } else {
        payload["request_id"] = nullptr;
    }
    payload["code"] = static_cast<int64_t>(code);
    payload["message"] = message;
    return create(MessageType::ERROR, std::move(payload));
}

Message Message::event(std::string_view event, json::value data) {
    return create(MessageType::EVENT, json::object{
        {"event", event},
        {"data", std::move(data)},
    });
}

Message Message::ping() {
    return create(MessageType::PING, json::object{});
}

Message Message::pong(const Uuid& ping_id) {
    return create(MessageType::PONG, json::object{
        {"ping_id", ping_id.to_string()},
    });
}

json::value Message::to_json() const {
    return json::object{
        {"id", id.to_string()},
        {"type", message_type_to_string(type)},
        {"timestamp", timestamp},
        {"payload", payload},
    };
}

std::expected<Message, ProtocolError> Message::from_json(const json::value& value) {
    if (!value.is_object()) {
        return std::unexpected(ProtocolError::malformed("message body is not an object"));
    }
    const auto& obj = value.as_object();

    auto id_it = obj.find("id");
    if (id_it == obj.end() || !id_it->value().is_string()) {
        return std::unexpected(ProtocolError::malformed("missing field `id`"));
    }
    auto id = Uuid::parse(std::string_view(id_it->value().as_string()));
    if (!id) {
        return std::unexpected(ProtocolError::malformed("invalid message id"));
    }

    auto type_it = obj.find("type");
    if (type_it == obj.end() || !type_it->value().is_string()) {
        return std::unexpected(ProtocolError::malformed("missing field `type`"));
    }
    auto type = message_type_from_string(std::string_view(type_it->value().as_string()));
    if (!type) {
        return std::unexpected(ProtocolError::malformed(
            "unknown message type `" + std::string(type_it->value().as_string()) + "`"));
    }

    auto ts_it = obj.find("timestamp");
    if (ts_it == obj.end()) {
        return std::unexpected(ProtocolError::malformed("missing field `timestamp`"));
    }
    auto timestamp = as_u64(ts_it->value());
    if (!timestamp) {
        return std::unexpected(ProtocolError::malformed("invalid timestamp"));
    }

    auto payload_it = obj.find("payload");
    if (payload_it == obj.end()) {
        return std::unexpected(ProtocolError::malformed("missing field `payload`"));
    }

    Message msg;
    msg.id = *id;
    msg.type = *type;
    msg.timestamp = *timestamp;
    msg.payload = payload_it->value();
    return msg;
}

std::expected<std::vector<uint8_t>, ProtocolError> Message::encode() const {
    try {
        std::string body = json::serialize(to_json());
        return std::vector<uint8_t>(body.begin(), body.end());
    } catch (const std::exception& e) {
        return std::unexpected(ProtocolError::malformed(e.what()));
    }
}

std::expected<Message, ProtocolError> Message::decode(std::span<const uint8_t> body) {
    boost::system::error_code ec;
    json::value jv = json::parse(
        json::string_view(reinterpret_cast<const char*>(body.data()), body.size()), ec);
    if (ec) {
        return std::unexpected(ProtocolError::malformed(ec.message()));
    }
    return from_json(jv);
}

std::optional<Uuid> Message::request_id() const {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    const auto& obj = payload.as_object();
    auto it = obj.find("request_id");
    if (it == obj.end() || !it->value().is_string()) {
        return std::nullopt;
    }
    return Uuid::parse(std::string_view(it->value().as_string()));
}

} // namespace rcp
