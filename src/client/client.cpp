#include "client/client.hpp"
#include "auth/auth_provider.hpp"
#include "client/response_handler.hpp"
#include "common/log.hpp"
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

namespace rcp::client {

namespace {

auto& log() { return log::Logger::get("client"); }

} // anonymous namespace

const char* client_state_name(Client::State state) {
    switch (state) {
        case Client::State::CONNECTED: return "CONNECTED";
        case Client::State::AUTHENTICATING: return "AUTHENTICATING";
        case Client::State::AUTHENTICATED: return "AUTHENTICATED";
        case Client::State::AUTH_FAILED: return "AUTH_FAILED";
        case Client::State::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

ClientOptions ClientOptions::from_config(const ClientConfig& config) {
    ClientOptions options;
    options.transport = config.transport;
    options.await_auth_response = config.auth.await_response;
    options.auth_timeout = config.auth.response_timeout;
    return options;
}

// ============================================================================
// Connection
// ============================================================================

net::awaitable<std::expected<Client, ProtocolError>> Client::connect(
    std::string address, uint16_t port, ClientOptions options) {
    auto ex = co_await net::this_coro::executor;
    std::string peer = address + ":" + std::to_string(port);

    tcp::resolver resolver(ex);
    auto [rec, endpoints] = co_await resolver.async_resolve(
        address, std::to_string(port), net::as_tuple(net::use_awaitable));
    if (rec) {
        log().error("Failed to resolve {}: {}", peer, rec.message());
        co_return std::unexpected(ProtocolError::transport(
            "failed to resolve " + peer + ": " + rec.message()));
    }

    tcp::socket socket(ex);
    auto [cec, endpoint] = co_await net::async_connect(
        socket, endpoints, net::as_tuple(net::use_awaitable));
    if (cec) {
        log().error("Failed to connect to {}: {}", peer, cec.message());
        co_return std::unexpected(ProtocolError::transport(
            "failed to connect to " + peer + ": " + cec.message()));
    }

    boost::system::error_code ec;
    socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
        log().debug("TCP_NODELAY not set: {}", ec.message());
    }

    log().info("Connected to {}", peer);
    co_return Client(Transport::start(std::move(socket), options.transport), options, std::move(peer));
}

net::awaitable<std::expected<Client, ProtocolError>> Client::connect_tls(
    std::string address, uint16_t port,
    std::optional<std::string> client_cert, std::optional<std::string> client_key,
    bool verify_server, ClientOptions options) {
    log().warn("TLS support not yet implemented, using insecure connection");
    if (client_cert || client_key) {
        log().warn("Client certificate ignored: {}", client_cert.value_or(client_key.value_or("")));
    }
    if (verify_server) {
        log().debug("Server verification requested but unavailable without TLS");
    }

    auto client = co_await connect(std::move(address), port, std::move(options));
    if (client) {
        client->encrypted_ = false;
    }
    co_return client;
}

net::awaitable<std::expected<Client, ProtocolError>> Client::connect(const ClientConfig& config) {
    auto options = ClientOptions::from_config(config);
    const auto& server = config.server;
    if (server.use_tls) {
        co_return co_await connect_tls(server.address, server.port, server.client_cert_path,
                                       server.client_key_path, server.verify_server, options);
    }
    co_return co_await connect(server.address, server.port, options);
}

Client::Client(Transport::Endpoints endpoints, ClientOptions options, std::string peer)
    : transport_(std::move(endpoints.transport))
    , inbound_(std::move(endpoints.inbound))
    , outbound_(std::move(endpoints.outbound))
    , options_(options)
    , peer_(std::move(peer))
{
}

Client::Client(Client&& other) noexcept
    : transport_(std::move(other.transport_))
    , inbound_(std::move(other.inbound_))
    , outbound_(std::move(other.outbound_))
    , pending_(std::move(other.pending_))
    , inbound_ended_(other.inbound_ended_)
    , options_(other.options_)
    , state_(other.state_)
    , encrypted_(other.encrypted_)
    , peer_(std::move(other.peer_))
{
    other.state_ = State::CLOSED;
}

Client& Client::operator=(Client&& other) noexcept {
    if (this != &other) {
        release();
        transport_ = std::move(other.transport_);
        inbound_ = std::move(other.inbound_);
        outbound_ = std::move(other.outbound_);
        pending_ = std::move(other.pending_);
        inbound_ended_ = other.inbound_ended_;
        options_ = other.options_;
        state_ = other.state_;
        encrypted_ = other.encrypted_;
        peer_ = std::move(other.peer_);
        other.state_ = State::CLOSED;
    }
    return *this;
}

Client::~Client() {
    release();
}

void Client::close() {
    if (state_ == State::CLOSED) {
        return;
    }
    release();
    set_state(State::CLOSED);
    log().info("Closed connection to {}", peer_);
}

void Client::release() {
    if (outbound_) {
        if (outbound_->is_open()) {
            // The end marker queues behind pending messages; the writer
            // closes the socket when it reaches it
            outbound_->async_send(
                net::error::make_error_code(net::error::eof), Message{},
                [transport = transport_, outbound = outbound_](boost::system::error_code ec) {
                    if (ec) {
                        transport->close();
                    }
                });
        } else if (transport_) {
            transport_->close();
        }
    }
    if (inbound_) {
        inbound_->close();
    }
    transport_.reset();
    inbound_.reset();
    outbound_.reset();
    pending_.clear();
}

void Client::set_state(State new_state) {
    if (state_ != new_state) {
        log().debug("{}: State {} -> {}", peer_, client_state_name(state_), client_state_name(new_state));
        state_ = new_state;
    }
}

Transport::Stats Client::stats() const {
    return transport_ ? transport_->stats() : Transport::Stats{};
}

// ============================================================================
// Messaging
// ============================================================================

net::awaitable<std::expected<void, ProtocolError>> Client::send(Message message) {
    if (!outbound_ || !outbound_->is_open()) {
        co_return std::unexpected(ProtocolError::channel_closed());
    }

    auto [ec] = co_await outbound_->async_send(
        boost::system::error_code{}, std::move(message), net::as_tuple(net::use_awaitable));
    if (ec) {
        co_return std::unexpected(ProtocolError::channel_closed());
    }
    co_return std::expected<void, ProtocolError>{};
}

net::awaitable<std::optional<Message>> Client::receive() {
    if (!pending_.empty()) {
        Message message = std::move(pending_.front());
        pending_.pop_front();
        co_return message;
    }
    if (inbound_ended_ || !inbound_) {
        co_return std::nullopt;
    }

    auto [ec, message] = co_await inbound_->async_receive(net::as_tuple(net::use_awaitable));
    if (ec) {
        inbound_ended_ = true;
        co_return std::nullopt;
    }
    co_return std::move(message);
}

net::awaitable<std::expected<Message, ProtocolError>> Client::receive_with_timeout(
    std::chrono::steady_clock::duration timeout) {
    if (!pending_.empty()) {
        Message message = std::move(pending_.front());
        pending_.pop_front();
        co_return message;
    }
    co_return co_await next_inbound(timeout);
}

net::awaitable<std::expected<Message, ProtocolError>> Client::next_inbound(
    std::chrono::steady_clock::duration timeout) {
    if (inbound_ended_ || !inbound_) {
        co_return std::unexpected(ProtocolError::channel_closed());
    }

    // Keep the channel alive across the wait even if the Client is closed
    auto inbound = inbound_;
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(timeout);

    // The group waits for both operations; a receive that completed in the
    // same pass as the timer still holds its message
    auto [order, rec, message, tec] =
        co_await net::experimental::make_parallel_group(
            inbound->async_receive(net::deferred),
            timer.async_wait(net::deferred))
        .async_wait(net::experimental::wait_for_one(), net::use_awaitable);

    if (!rec) {
        if (order[0] == 1) {
            log().trace("Message arrived as the receive timed out; delivering it");
        }
        co_return std::move(message);
    }

    if (rec == net::error::eof || rec == net::experimental::error::channel_closed) {
        inbound_ended_ = true;
        co_return std::unexpected(ProtocolError::channel_closed());
    }

    // The timer cancelled the receive; nothing was taken off the channel
    co_return std::unexpected(ProtocolError::timeout());
}

// ============================================================================
// Authentication
// ============================================================================

net::awaitable<std::expected<bool, ProtocolError>> Client::authenticate(
    std::string_view username, std::span<const uint8_t> credentials, std::string_view method) {
    co_return co_await submit_auth(Message::auth(username, credentials, method));
}

net::awaitable<std::expected<bool, ProtocolError>> Client::submit_auth(Message auth) {
    if (state_ == State::CLOSED) {
        co_return std::unexpected(ProtocolError::channel_closed());
    }
    set_state(State::AUTHENTICATING);
    Uuid auth_id = auth.id;

    auto sent = co_await send(std::move(auth));
    if (!sent) {
        set_state(State::AUTH_FAILED);
        co_return std::unexpected(sent.error());
    }

    if (!options_.await_auth_response) {
        log().debug("Auth message {} sent, not waiting for confirmation", auth_id.to_string());
        set_state(State::AUTHENTICATED);
        co_return true;
    }

    auto accepted = co_await await_auth_result(auth_id);
    if (!accepted) {
        log().warn("No authentication result from {}: {}", peer_, accepted.error().message());
        set_state(State::AUTH_FAILED);
        co_return std::unexpected(accepted.error());
    }

    set_state(*accepted ? State::AUTHENTICATED : State::AUTH_FAILED);
    co_return *accepted;
}

net::awaitable<std::expected<bool, ProtocolError>> Client::await_auth_result(const Uuid& auth_id) {
    auto deadline = std::chrono::steady_clock::now() + options_.auth_timeout;

    for (;;) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            co_return std::unexpected(ProtocolError::timeout());
        }

        auto message = co_await next_inbound(remaining);
        if (!message) {
            co_return std::unexpected(message.error());
        }

        auto answered = message->request_id();
        if (answered && *answered == auth_id) {
            if (message->type == MessageType::RESPONSE) {
                auto data = handle_response(*message, auth_id);
                if (data) {
                    log().info("Authenticated with {}", peer_);
                    co_return true;
                }
                if (data.error().code == ProtocolErrc::SERVER_ERROR) {
                    log().warn("Authentication rejected by {}: {}", peer_, data.error().detail);
                    co_return false;
                }
                co_return std::unexpected(data.error());
            }
            if (message->type == MessageType::ERROR) {
                const auto& payload = message->payload.as_object();
                const auto* text = payload.if_contains("message");
                log().warn("Authentication rejected by {}: {}", peer_,
                           text && text->is_string() ? std::string(text->as_string()) : "Unknown error");
                co_return false;
            }
        }

        // Not ours: keep it for receive()
        pending_.push_back(std::move(*message));
    }
}

net::awaitable<std::expected<bool, auth::AuthError>> Client::authenticate_with_provider(
    auth::AuthProvider& provider) {
    if (state_ == State::CLOSED) {
        co_return std::unexpected(auth::AuthError::from_protocol(ProtocolError::channel_closed()));
    }

    set_state(State::AUTHENTICATING);
    auto result = co_await provider.authenticate(*this);
    if (!result) {
        log().warn("{} authentication failed: {}",
                   auth::auth_method_to_string(provider.method()), result.error().message());
        set_state(State::AUTH_FAILED);
    }
    co_return result;
}

} // namespace rcp::client
