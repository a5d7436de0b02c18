#pragma once

#include "auth/auth_error.hpp"
#include "auth/auth_session.hpp"
#include "client/transport.hpp"
#include "common/config.hpp"
#include "common/message.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace rcp::auth {
class AuthProvider;
}

namespace rcp::client {

struct ClientOptions {
    TransportOptions transport;

    // Wait for a Response/Error correlated with the Auth message id before
    // reporting success. Off: success is reported once the message is sent.
    bool await_auth_response = false;
    std::chrono::seconds auth_timeout{10};

    static ClientOptions from_config(const ClientConfig& config);
};

/**
 * Client - one protocol session over one TCP connection.
 *
 * State machine:
 *   CONNECTED -> AUTHENTICATING -> AUTHENTICATED | AUTH_FAILED -> CLOSED
 *
 * The Client owns the Client side of both message channels. Closing or
 * destroying it ends the session: the writer flushes what is queued,
 * then closes the socket, which stops the reader.
 *
 * Not thread-safe: one coroutine drives a Client at a time.
 */
class Client : public auth::AuthSession {
public:
    enum class State {
        CONNECTED,
        AUTHENTICATING,
        AUTHENTICATED,
        AUTH_FAILED,
        CLOSED,
    };

    // Plain TCP connection; no retry
    static net::awaitable<std::expected<Client, ProtocolError>> connect(
        std::string address, uint16_t port, ClientOptions options = {});

    // Encrypted variant. No TLS layer is wired in: a warning is logged and
    // the session runs in plaintext with is_encrypted() == false.
    static net::awaitable<std::expected<Client, ProtocolError>> connect_tls(
        std::string address, uint16_t port,
        std::optional<std::string> client_cert, std::optional<std::string> client_key,
        bool verify_server, ClientOptions options = {});

    // connect or connect_tls depending on config.server.use_tls
    static net::awaitable<std::expected<Client, ProtocolError>> connect(const ClientConfig& config);

    Client(Client&& other) noexcept;
    Client& operator=(Client&& other) noexcept;
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Queue a message for the writer. Suspends while the outbound queue is
    // full. CHANNEL_CLOSED once the writer has stopped.
    net::awaitable<std::expected<void, ProtocolError>> send(Message message);

    // Next inbound message, or nullopt once the stream has ended
    net::awaitable<std::optional<Message>> receive();

    // Next inbound message within `timeout`. TIMEOUT leaves any message that
    // arrives later queued for the next call; CHANNEL_CLOSED at end of stream.
    net::awaitable<std::expected<Message, ProtocolError>> receive_with_timeout(
        std::chrono::steady_clock::duration timeout);

    // Build and submit an Auth message with byte credentials
    net::awaitable<std::expected<bool, ProtocolError>> authenticate(
        std::string_view username, std::span<const uint8_t> credentials, std::string_view method);

    net::awaitable<std::expected<bool, ProtocolError>> submit_auth(Message auth) override;

    // Run the provider's exchange over this session
    net::awaitable<std::expected<bool, auth::AuthError>> authenticate_with_provider(
        auth::AuthProvider& provider);

    // Release the channels; queued outbound messages are still written
    void close();

    State state() const { return state_; }
    bool is_authenticated() const { return state_ == State::AUTHENTICATED; }
    bool is_encrypted() const { return encrypted_; }
    const std::string& peer() const { return peer_; }
    Transport::Stats stats() const;

private:
    Client(Transport::Endpoints endpoints, ClientOptions options, std::string peer);

    net::awaitable<std::expected<Message, ProtocolError>> next_inbound(
        std::chrono::steady_clock::duration timeout);
    net::awaitable<std::expected<bool, ProtocolError>> await_auth_result(const Uuid& auth_id);

    void set_state(State new_state);
    void release();

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<MessageChannel> inbound_;
    std::shared_ptr<MessageChannel> outbound_;

    // Messages that arrived while waiting for an auth result
    std::deque<Message> pending_;
    bool inbound_ended_ = false;

    ClientOptions options_;
    State state_ = State::CONNECTED;
    bool encrypted_ = false;
    std::string peer_;
};

const char* client_state_name(Client::State state);

} // namespace rcp::client
