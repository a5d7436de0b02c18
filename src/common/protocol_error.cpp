#include "common/protocol_error.hpp"

namespace rcp {

std::string_view protocol_errc_name(ProtocolErrc code) {
    switch (code) {
        case ProtocolErrc::MALFORMED_PAYLOAD: return "MALFORMED_PAYLOAD";
        case ProtocolErrc::TRANSPORT: return "TRANSPORT";
        case ProtocolErrc::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case ProtocolErrc::SERVER_ERROR: return "SERVER_ERROR";
        case ProtocolErrc::CHANNEL_CLOSED: return "CHANNEL_CLOSED";
        case ProtocolErrc::TIMEOUT: return "TIMEOUT";
        case ProtocolErrc::OTHER: return "OTHER";
    }
    return "UNKNOWN";
}

std::string ProtocolError::message() const {
    switch (code) {
        case ProtocolErrc::MALFORMED_PAYLOAD: return "Malformed message payload: " + detail;
        case ProtocolErrc::TRANSPORT: return "Transport error: " + detail;
        case ProtocolErrc::AUTHENTICATION_FAILED: return "Authentication failed: " + detail;
        case ProtocolErrc::SERVER_ERROR: return "Server error: " + detail;
        case ProtocolErrc::CHANNEL_CLOSED: return "Channel closed";
        case ProtocolErrc::TIMEOUT: return "Operation timed out";
        case ProtocolErrc::OTHER: return "Protocol error: " + detail;
    }
    return "Unknown protocol error";
}

} // namespace rcp
