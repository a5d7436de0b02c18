#pragma once

#include "client/client.hpp"
#include "common/frame.hpp"
#include "common/log.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <boost/asio.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace rcp::test {

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Run one test coroutine on `ioc` until it finishes or `limit` passes.
// Coroutines report with EXPECT_* (ASSERT_* cannot return from a coroutine).
inline void run_test(net::io_context& ioc, net::awaitable<void> task,
                     std::chrono::seconds limit = std::chrono::seconds(10)) {
    bool done = false;
    std::exception_ptr error;

    net::co_spawn(ioc, std::move(task), [&](std::exception_ptr ep) {
        error = ep;
        done = true;
        ioc.stop();
    });

    ioc.run_for(limit);
    if (error) {
        std::rethrow_exception(error);
    }
    EXPECT_TRUE(done) << "test coroutine did not finish in time";
}

// Listener on 127.0.0.1 with an ephemeral port
class Loopback {
public:
    explicit Loopback(net::io_context& ioc)
        : acceptor_(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {}

    uint16_t port() const { return acceptor_.local_endpoint().port(); }
    tcp::acceptor& acceptor() { return acceptor_; }

private:
    tcp::acceptor acceptor_;
};

struct Session {
    client::Client client;
    tcp::socket peer;
};

// Connect a Client to the loopback listener and accept the server side.
// The kernel completes the handshake before accept, so the two can run
// one after the other.
inline net::awaitable<Session> open_session(Loopback& server, client::ClientOptions options = {}) {
    auto client = co_await client::Client::connect("127.0.0.1", server.port(), options);
    if (!client) {
        throw std::runtime_error("connect failed: " + client.error().message());
    }
    auto peer = co_await server.acceptor().async_accept(net::use_awaitable);
    co_return Session{std::move(*client), std::move(peer)};
}

// Server side: read one frame
inline net::awaitable<Message> read_frame(tcp::socket& socket) {
    std::array<uint8_t, FRAME_HEADER_SIZE> header{};
    co_await net::async_read(socket, net::buffer(header), net::use_awaitable);

    std::vector<uint8_t> body(binary::read_u32_be(header.data()));
    co_await net::async_read(socket, net::buffer(body), net::use_awaitable);

    auto message = Message::decode(body);
    if (!message) {
        throw std::runtime_error("peer got a bad frame: " + message.error().message());
    }
    co_return std::move(*message);
}

// Server side: write one frame
inline net::awaitable<void> write_frame(tcp::socket& socket, const Message& message) {
    auto frame = FrameCodec::encode(message);
    if (!frame) {
        throw std::runtime_error("cannot encode: " + frame.error().message());
    }
    co_await net::async_write(socket, net::buffer(*frame), net::use_awaitable);
}

inline net::awaitable<void> sleep_for(std::chrono::milliseconds duration) {
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(duration);
    co_await timer.async_wait(net::use_awaitable);
}

// Captures every log line emitted while it is alive
class LogCapture {
public:
    LogCapture() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
        sink_->set_pattern("[%n] [%l] %v");
        log::add_sink(sink_);
    }
    ~LogCapture() { log::remove_sink(sink_); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(const std::string& text) const {
        auto lines = sink_->last_formatted();
        return std::any_of(lines.begin(), lines.end(),
                           [&](const std::string& line) { return line.find(text) != std::string::npos; });
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace rcp::test
