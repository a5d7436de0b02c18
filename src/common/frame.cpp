#include "common/frame.hpp"
#include <algorithm>
#include <limits>

namespace rcp {

std::string frame_error_message(FrameError error) {
    switch (error) {
        case FrameError::INCOMPLETE_HEADER: return "Incomplete frame header";
        case FrameError::INCOMPLETE_PAYLOAD: return "Incomplete frame payload";
        case FrameError::PAYLOAD_TOO_LARGE: return "Payload too large";
        default: return "Unknown error";
    }
}

std::expected<std::vector<uint8_t>, ProtocolError> FrameCodec::encode(
    const Message& message, size_t max_message_size) {
    auto body = message.encode();
    if (!body) {
        return std::unexpected(body.error());
    }

    size_t limit = std::min<size_t>(max_message_size, std::numeric_limits<uint32_t>::max());
    if (body->size() > limit) {
        return std::unexpected(ProtocolError::malformed(
            "encoded message is " + std::to_string(body->size()) +
            " bytes, limit is " + std::to_string(limit)));
    }

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + body->size());
    binary::write_u32_be(frame, static_cast<uint32_t>(body->size()));
    frame.insert(frame.end(), body->begin(), body->end());
    return frame;
}

std::expected<uint32_t, FrameError> FrameCodec::parse_header(
    std::span<const uint8_t> header, size_t max_message_size) {
    if (header.size() < FRAME_HEADER_SIZE) {
        return std::unexpected(FrameError::INCOMPLETE_HEADER);
    }

    uint32_t length = binary::read_u32_be(header.data());
    if (length > max_message_size) {
        return std::unexpected(FrameError::PAYLOAD_TOO_LARGE);
    }
    return length;
}

std::expected<std::pair<Message, size_t>, FrameCodec::DecodeError> FrameCodec::decode(
    std::span<const uint8_t> data, size_t max_message_size) {
    auto length = parse_header(data, max_message_size);
    if (!length) {
        return std::unexpected(DecodeError{length.error(), std::nullopt});
    }

    if (data.size() - FRAME_HEADER_SIZE < *length) {
        return std::unexpected(DecodeError{FrameError::INCOMPLETE_PAYLOAD, std::nullopt});
    }

    auto message = Message::decode(data.subspan(FRAME_HEADER_SIZE, *length));
    if (!message) {
        return std::unexpected(DecodeError{std::nullopt, message.error()});
    }

    return std::pair<Message, size_t>{std::move(*message), FRAME_HEADER_SIZE + *length};
}

} // namespace rcp
