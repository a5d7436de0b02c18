#include "client/transport.hpp"
#include "common/log.hpp"
#include <array>

namespace rcp::client {

namespace {

auto& log() { return log::Logger::get("client.transport"); }

void report_exception(const char* loop, std::exception_ptr ep) {
    if (!ep) {
        return;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        log().error("{} loop aborted: {}", loop, e.what());
    }
}

} // anonymous namespace

Transport::Transport(tcp::socket socket, TransportOptions options)
    : strand_(net::make_strand(socket.get_executor()))
    , socket_(std::move(socket))
    , options_(options)
    , read_guard_(strand_)
    , write_guard_(strand_)
    , connected_at_(std::chrono::steady_clock::now())
{
}

Transport::~Transport() {
    boost::system::error_code ec;
    socket_.close(ec);
}

Transport::Endpoints Transport::start(tcp::socket socket, TransportOptions options) {
    auto ex = socket.get_executor();
    std::shared_ptr<Transport> self(new Transport(std::move(socket), options));

    auto inbound = std::make_shared<MessageChannel>(ex, options.queue_capacity);
    auto outbound = std::make_shared<MessageChannel>(ex, options.queue_capacity);

    net::co_spawn(
        self->strand_,
        [self, inbound]() -> net::awaitable<void> {
            co_await self->reader(inbound);
        },
        [](std::exception_ptr ep) { report_exception("Reader", ep); });

    net::co_spawn(
        self->strand_,
        [self, outbound]() -> net::awaitable<void> {
            co_await self->writer(outbound);
        },
        [](std::exception_ptr ep) { report_exception("Writer", ep); });

    return Endpoints{std::move(self), std::move(inbound), std::move(outbound)};
}

net::awaitable<std::expected<Message, ProtocolError>> Transport::read_message() {
    auto lock = co_await read_guard_.lock();
    if (!lock.owns()) {
        co_return std::unexpected(ProtocolError::channel_closed());
    }

    std::array<uint8_t, FRAME_HEADER_SIZE> header{};
    auto [hec, hn] = co_await net::async_read(
        socket_, net::buffer(header), net::as_tuple(net::use_awaitable));
    if (hec) {
        if (hec == net::error::eof) {
            peer_closed_ = true;
        }
        co_return std::unexpected(ProtocolError::transport(hec.message()));
    }

    auto length = FrameCodec::parse_header(header, options_.max_message_size);
    if (!length) {
        co_return std::unexpected(ProtocolError::malformed(frame_error_message(length.error())));
    }

    read_buffer_.resize(*length);
    if (*length > 0) {
        auto [bec, bn] = co_await net::async_read(
            socket_, net::buffer(read_buffer_), net::as_tuple(net::use_awaitable));
        if (bec) {
            // A close in the middle of a frame is an error, not a clean end
            co_return std::unexpected(ProtocolError::transport(bec.message()));
        }
    }

    bytes_received_.fetch_add(FRAME_HEADER_SIZE + *length, std::memory_order_relaxed);

    auto message = Message::decode(read_buffer_);
    if (!message) {
        co_return std::unexpected(message.error());
    }

    frames_received_.fetch_add(1, std::memory_order_relaxed);
    log().trace("RX {} id={} size={}", message_type_to_string(message->type),
                message->id.to_string(), *length);
    co_return std::move(*message);
}

net::awaitable<std::expected<void, ProtocolError>> Transport::write_message(const Message& message) {
    auto frame = FrameCodec::encode(message, options_.max_message_size);
    if (!frame) {
        co_return std::unexpected(frame.error());
    }

    auto lock = co_await write_guard_.lock();
    if (!lock.owns()) {
        co_return std::unexpected(ProtocolError::channel_closed());
    }

    auto [ec, n] = co_await net::async_write(
        socket_, net::buffer(*frame), net::as_tuple(net::use_awaitable));
    if (ec) {
        co_return std::unexpected(ProtocolError::transport(ec.message()));
    }

    bytes_sent_.fetch_add(n, std::memory_order_relaxed);
    frames_sent_.fetch_add(1, std::memory_order_relaxed);
    log().trace("TX {} id={} size={}", message_type_to_string(message.type),
                message.id.to_string(), frame->size() - FRAME_HEADER_SIZE);
    co_return std::expected<void, ProtocolError>{};
}

net::awaitable<void> Transport::reader(std::shared_ptr<MessageChannel> inbound) {
    log().debug("Reader started");

    for (;;) {
        auto message = co_await read_message();
        if (!message) {
            if (closing_) {
                log().debug("Connection closed locally");
            } else if (peer_closed_) {
                log().info("Connection closed by peer");
            } else {
                log().error("Read failed: {}", message.error().message());
            }
            break;
        }

        auto [ec] = co_await inbound->async_send(
            boost::system::error_code{}, std::move(*message), net::as_tuple(net::use_awaitable));
        if (ec) {
            log().debug("Inbound channel closed, stopping reader");
            break;
        }
    }

    // End marker queues behind every delivered message
    if (inbound->is_open()) {
        auto [ec] = co_await inbound->async_send(
            net::error::make_error_code(net::error::eof), Message{}, net::as_tuple(net::use_awaitable));
        if (ec) {
            log().debug("Inbound channel closed before end of stream was delivered");
        }
    }

    read_guard_.close();
    log().debug("Reader stopped");
}

net::awaitable<void> Transport::writer(std::shared_ptr<MessageChannel> outbound) {
    log().debug("Writer started");

    for (;;) {
        auto [ec, message] = co_await outbound->async_receive(net::as_tuple(net::use_awaitable));
        if (ec) {
            // Client is gone: the session is over
            log().debug("Outbound channel closed, stopping writer");
            close_socket();
            break;
        }

        auto result = co_await write_message(message);
        if (!result) {
            log().error("Write failed: {}", result.error().message());
            break;
        }
    }

    outbound->close();
    write_guard_.close();
    log().debug("Writer stopped");
}

void Transport::close() {
    net::post(strand_, [self = shared_from_this()]() { self->close_socket(); });
}

void Transport::close_socket() {
    closing_ = true;
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        log().debug("Socket shutdown: {}", ec.message());
    }
    socket_.close(ec);
    if (ec) {
        log().warn("Socket close failed: {}", ec.message());
    }
}

Transport::Stats Transport::stats() const {
    Stats s;
    s.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
    s.bytes_received = bytes_received_.load(std::memory_order_relaxed);
    s.frames_sent = frames_sent_.load(std::memory_order_relaxed);
    s.frames_received = frames_received_.load(std::memory_order_relaxed);
    s.connected_at = connected_at_;
    return s;
}

} // namespace rcp::client
