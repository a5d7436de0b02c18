#pragma once

#include "common/async_guard.hpp"
#include "common/config.hpp"
#include "common/frame.hpp"
#include "common/message.hpp"
#include <boost/asio.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <vector>

namespace rcp::client {

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Bounded message queue between the background loops and the Client.
// An element carrying an error code marks the end of the stream.
using MessageChannel =
    net::experimental::concurrent_channel<void(boost::system::error_code, Message)>;

/**
 * Transport - framed message I/O over one connected TCP socket.
 *
 * start() spawns two loops that live as long as the connection:
 * - reader: socket -> frame -> Message -> inbound channel
 * - writer: outbound channel -> Message -> frame -> socket
 *
 * Each direction has its own guard, held for one whole frame, so a read
 * never interleaves with another read and a write never with another write.
 *
 * Failures inside a loop are logged and end that loop only. The reader
 * ends the inbound stream with an end marker after every message it
 * already delivered; the writer closes the outbound channel so later
 * sends fail with CHANNEL_CLOSED.
 */
class Transport : public std::enable_shared_from_this<Transport> {
public:
    struct Endpoints {
        std::shared_ptr<Transport> transport;
        std::shared_ptr<MessageChannel> inbound;   // receive side for the Client
        std::shared_ptr<MessageChannel> outbound;  // send side for the Client
    };

    // Take ownership of a connected socket and start both loops
    static Endpoints start(tcp::socket socket, TransportOptions options = {});

    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Read exactly one frame (blocks until all of it has arrived)
    net::awaitable<std::expected<Message, ProtocolError>> read_message();

    // Write exactly one frame
    net::awaitable<std::expected<void, ProtocolError>> write_message(const Message& message);

    // Close the socket; a pending read or write completes with an error
    void close();

    struct Stats {
        uint64_t bytes_sent{0};
        uint64_t bytes_received{0};
        uint64_t frames_sent{0};
        uint64_t frames_received{0};
        std::chrono::steady_clock::time_point connected_at;
    };
    Stats stats() const;

private:
    Transport(tcp::socket socket, TransportOptions options);

    net::awaitable<void> reader(std::shared_ptr<MessageChannel> inbound);
    net::awaitable<void> writer(std::shared_ptr<MessageChannel> outbound);

    void close_socket();

    net::strand<net::any_io_executor> strand_;
    tcp::socket socket_;
    TransportOptions options_;

    std::vector<uint8_t> read_buffer_;
    AsyncGuard read_guard_;
    AsyncGuard write_guard_;

    bool peer_closed_ = false;
    bool closing_ = false;   // close_socket() ran; a pending read is aborted

    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_received_{0};
    std::chrono::steady_clock::time_point connected_at_;
};

} // namespace rcp::client
