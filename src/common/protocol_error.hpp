#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace rcp {

// Protocol-layer error codes
enum class ProtocolErrc {
    MALFORMED_PAYLOAD,
    TRANSPORT,
    AUTHENTICATION_FAILED,
    SERVER_ERROR,
    CHANNEL_CLOSED,
    TIMEOUT,
    OTHER,
};

std::string_view protocol_errc_name(ProtocolErrc code);

struct ProtocolError {
    ProtocolErrc code = ProtocolErrc::OTHER;
    std::string detail;

    // e.g. "Malformed message payload: expected object"
    std::string message() const;

    static ProtocolError malformed(std::string detail) {
        return {ProtocolErrc::MALFORMED_PAYLOAD, std::move(detail)};
    }
    static ProtocolError transport(std::string detail) {
        return {ProtocolErrc::TRANSPORT, std::move(detail)};
    }
    static ProtocolError channel_closed() {
        return {ProtocolErrc::CHANNEL_CLOSED, {}};
    }
    static ProtocolError timeout() {
        return {ProtocolErrc::TIMEOUT, {}};
    }
    static ProtocolError other(std::string detail) {
        return {ProtocolErrc::OTHER, std::move(detail)};
    }

    bool operator==(const ProtocolError&) const = default;
};

} // namespace rcp
