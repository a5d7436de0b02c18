#pragma once

#include "common/message.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace rcp {

// Frame header size: Length(4), big-endian, counts body bytes only
inline constexpr size_t FRAME_HEADER_SIZE = 4;

// Upper bound on a single message body
inline constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

// Frame decode errors
enum class FrameError {
    INCOMPLETE_HEADER,
    INCOMPLETE_PAYLOAD,
    PAYLOAD_TOO_LARGE,
};

std::string frame_error_message(FrameError error);

namespace binary {

inline uint32_t read_u32_be(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

inline void write_u32_be(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>(val >> 24));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

} // namespace binary

// Frame codec: [u32 length][length bytes of JSON body]
class FrameCodec {
public:
    // Encode a message as a complete frame.
    // Bodies above max_message_size fail with MALFORMED_PAYLOAD.
    static std::expected<std::vector<uint8_t>, ProtocolError> encode(
        const Message& message, size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);

    // Read the declared body length from a 4-byte header
    static std::expected<uint32_t, FrameError> parse_header(
        std::span<const uint8_t> header, size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);

    // Decode one frame from the front of a buffer.
    // Returns the message and the number of bytes consumed. An incomplete
    // frame reports INCOMPLETE_HEADER / INCOMPLETE_PAYLOAD through
    // DecodeError::frame and leaves the caller free to retry with more bytes.
    struct DecodeError {
        std::optional<FrameError> frame;
        std::optional<ProtocolError> protocol;

        bool incomplete() const {
            return frame && (*frame == FrameError::INCOMPLETE_HEADER ||
                             *frame == FrameError::INCOMPLETE_PAYLOAD);
        }
    };

    static std::expected<std::pair<Message, size_t>, DecodeError> decode(
        std::span<const uint8_t> data, size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);
};

} // namespace rcp
