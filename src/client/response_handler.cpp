#include "client/response_handler.hpp"

namespace json = boost::json;

namespace rcp::client {

std::expected<json::value, ProtocolError> handle_response(
    const Message& response, const Uuid& request_id) {
    if (response.type != MessageType::RESPONSE) {
        return std::unexpected(ProtocolError::other(
            "Expected response message, got " +
            std::string(message_type_to_string(response.type))));
    }

    const auto* payload = response.payload.if_object();
    if (!payload) {
        return json::value(json::object{});
    }

    // Only a request_id naming another request is rejected
    if (auto answered = response.request_id(); answered && *answered != request_id) {
        return std::unexpected(ProtocolError::other(
            "Response for wrong request: expected " + request_id.to_string() +
            ", got " + answered->to_string()));
    }

    const auto* success = payload->if_contains("success");
    if (success && success->is_bool() && !success->as_bool()) {
        std::string message = "Unknown error";
        if (const auto* m = payload->if_contains("message"); m && m->is_string()) {
            message = std::string(m->as_string());
        }
        return std::unexpected(ProtocolError{ProtocolErrc::SERVER_ERROR, std::move(message)});
    }

    if (const auto* data = payload->if_contains("data")) {
        return *data;
    }
    return json::value(json::object{});
}

} // namespace rcp::client
