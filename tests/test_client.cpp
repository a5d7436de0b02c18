#include "test_support.hpp"
#include "auth/password_provider.hpp"
#include "client/response_handler.hpp"
#include "common/config.hpp"

using namespace rcp;
using namespace rcp::client;
using namespace rcp::test;
using namespace std::chrono_literals;
namespace json = boost::json;

class ClientTest : public ::testing::Test {
protected:
    net::io_context ioc_;
    Loopback server_{ioc_};
};

TEST_F(ClientTest, ConnectRefusedIsTransportError) {
    uint16_t port = server_.port();
    server_.acceptor().close();

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto client = co_await Client::connect("127.0.0.1", port);
        EXPECT_FALSE(client.has_value());
        if (!client) {
            EXPECT_EQ(client.error().code, ProtocolErrc::TRANSPORT);
        }
    }());
}

TEST_F(ClientTest, TlsRequestFallsBackToPlaintextWithWarning) {
    LogCapture capture;

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto client = co_await Client::connect_tls("127.0.0.1", server_.port(),
                                                   std::nullopt, std::nullopt, true);
        EXPECT_TRUE(client.has_value());
        if (client) {
            EXPECT_FALSE(client->is_encrypted());
            EXPECT_EQ(client->state(), Client::State::CONNECTED);
        }
    }());

    EXPECT_TRUE(capture.contains("TLS support not yet implemented, using insecure connection"));
}

TEST_F(ClientTest, ConnectFromConfig) {
    ClientConfig config;
    config.server.port = server_.port();
    ASSERT_TRUE(config.validate().has_value());

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto client = co_await Client::connect(config);
        EXPECT_TRUE(client.has_value());
        if (client) {
            EXPECT_EQ(client->peer(), "127.0.0.1:" + std::to_string(server_.port()));
        }
    }());
}

// Documented gap: without a confirmation requirement a silent server
// still yields success once the Auth message is sent.
TEST_F(ClientTest, ProviderAuthSucceedsOnceSentAgainstSilentServer) {
    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_);

        auth::PasswordProvider provider("alice");
        provider.with_password("s3cret");

        auto result = co_await session.client.authenticate_with_provider(provider);
        EXPECT_TRUE(result.has_value());
        if (result) {
            EXPECT_TRUE(*result);
        }
        EXPECT_EQ(session.client.state(), Client::State::AUTHENTICATED);

        auto auth = co_await read_frame(session.peer);
        EXPECT_EQ(auth.type, MessageType::AUTH);
        const auto& payload = auth.payload.as_object();
        EXPECT_EQ(payload.at("username").as_string(), "alice");
        EXPECT_EQ(payload.at("credentials").as_string(), "s3cret");
        EXPECT_EQ(payload.at("method").as_string(), "password");
    }());
}

TEST_F(ClientTest, LowLevelAuthenticateSendsByteCredentials) {
    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_);

        std::vector<uint8_t> secret = {1, 2, 3};
        auto result = co_await session.client.authenticate("bob", secret, "native");
        EXPECT_TRUE(result.has_value() && *result);

        auto auth = co_await read_frame(session.peer);
        const auto& payload = auth.payload.as_object();
        EXPECT_EQ(payload.at("username").as_string(), "bob");
        EXPECT_EQ(bytes_from_json(payload.at("credentials")).value_or(std::vector<uint8_t>{}), secret);
    }());
}

TEST_F(ClientTest, AwaitedAuthKeepsUnrelatedMessagesForReceive) {
    ClientOptions options;
    options.await_auth_response = true;

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_, options);

        auth::PasswordProvider provider("alice");
        provider.with_password("s3cret");

        auto unrelated = Message::event("motd", json::object{{"text", "hello"}});

        // Server: read the Auth message, send an event, then accept
        net::co_spawn(co_await net::this_coro::executor,
            [&]() -> net::awaitable<void> {
                auto auth = co_await read_frame(session.peer);
                co_await write_frame(session.peer, unrelated);
                co_await write_frame(session.peer,
                                     Message::response(auth.id, true, json::object{{"session", "x"}}));
            }, net::detached);

        auto result = co_await session.client.authenticate_with_provider(provider);
        EXPECT_TRUE(result.has_value() && *result);
        EXPECT_EQ(session.client.state(), Client::State::AUTHENTICATED);

        auto next = co_await session.client.receive();
        EXPECT_TRUE(next.has_value());
        if (next) {
            EXPECT_EQ(*next, unrelated);
        }
    }());
}

TEST_F(ClientTest, AwaitedAuthRejectedByResponse) {
    ClientOptions options;
    options.await_auth_response = true;

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_, options);

        net::co_spawn(co_await net::this_coro::executor,
            [&]() -> net::awaitable<void> {
                auto auth = co_await read_frame(session.peer);
                auto reply = Message::response(auth.id, false, nullptr);
                reply.payload.as_object()["message"] = "bad password";
                co_await write_frame(session.peer, reply);
            }, net::detached);

        auto result = co_await session.client.authenticate("alice", std::vector<uint8_t>{}, "password");
        EXPECT_TRUE(result.has_value());
        if (result) {
            EXPECT_FALSE(*result);
        }
        EXPECT_EQ(session.client.state(), Client::State::AUTH_FAILED);
    }());
}

TEST_F(ClientTest, AwaitedAuthRejectedByError) {
    ClientOptions options;
    options.await_auth_response = true;

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_, options);

        net::co_spawn(co_await net::this_coro::executor,
            [&]() -> net::awaitable<void> {
                auto auth = co_await read_frame(session.peer);
                co_await write_frame(session.peer, Message::error(auth.id, 401, "unauthorized"));
            }, net::detached);

        auto result = co_await session.client.authenticate("alice", std::vector<uint8_t>{}, "password");
        EXPECT_TRUE(result.has_value());
        if (result) {
            EXPECT_FALSE(*result);
        }
        EXPECT_EQ(session.client.state(), Client::State::AUTH_FAILED);
    }());
}

TEST_F(ClientTest, AwaitedAuthTimesOutAgainstSilentServer) {
    ClientOptions options;
    options.await_auth_response = true;
    options.auth_timeout = 1s;

    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_, options);

        auth::PasswordProvider provider("alice");
        provider.with_password("s3cret");

        auto result = co_await session.client.authenticate_with_provider(provider);
        EXPECT_FALSE(result.has_value());
        if (!result) {
            EXPECT_EQ(result.error().code, auth::AuthErrc::TIMEOUT);
        }
        EXPECT_EQ(session.client.state(), Client::State::AUTH_FAILED);
    }());
}

TEST_F(ClientTest, ProviderFailureMarksAuthFailed) {
    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_);

        // No override, no store, no prompt
        auth::PasswordProvider provider("alice");
        auto result = co_await session.client.authenticate_with_provider(provider);
        EXPECT_FALSE(result.has_value());
        if (!result) {
            EXPECT_EQ(result.error().code, auth::AuthErrc::OTHER);
        }
        EXPECT_EQ(session.client.state(), Client::State::AUTH_FAILED);
    }());
}

// Messages that land while receives keep timing out are all delivered, in order
TEST_F(ClientTest, MessagesArrivingAtTimeoutAreNeverLost) {
    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_);

        constexpr size_t total = 200;
        std::vector<Message> sent;
        bool peer_done = false;

        net::co_spawn(co_await net::this_coro::executor,
            [&]() -> net::awaitable<void> {
                for (size_t i = 0; i < total; ++i) {
                    co_await sleep_for(std::chrono::milliseconds(1 + i % 3));
                    sent.push_back(Message::event("tick", json::object{{"n", static_cast<int64_t>(i)}}));
                    co_await write_frame(session.peer, sent.back());
                }
                peer_done = true;
            }, net::detached);

        std::vector<Message> received;
        int idle_after_done = 0;
        while (received.size() < total && idle_after_done < 100) {
            auto timeout = std::chrono::microseconds(500 + (received.size() % 4) * 250);
            auto got = co_await session.client.receive_with_timeout(timeout);
            if (got) {
                received.push_back(std::move(*got));
                continue;
            }
            EXPECT_EQ(got.error().code, ProtocolErrc::TIMEOUT);
            if (got.error().code != ProtocolErrc::TIMEOUT) {
                break;
            }
            if (peer_done) {
                ++idle_after_done;
            }
        }

        EXPECT_EQ(received.size(), total);
        EXPECT_EQ(received, sent);
    }());
}

TEST_F(ClientTest, AuthenticateAfterCloseKeepsClosedState) {
    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_);
        session.client.close();

        auto result = co_await session.client.authenticate("alice", std::vector<uint8_t>{}, "password");
        EXPECT_FALSE(result.has_value());
        if (!result) {
            EXPECT_EQ(result.error().code, ProtocolErrc::CHANNEL_CLOSED);
        }
        EXPECT_EQ(session.client.state(), Client::State::CLOSED);

        auth::PasswordProvider provider("alice");
        provider.with_password("s3cret");
        auto via_provider = co_await session.client.authenticate_with_provider(provider);
        EXPECT_FALSE(via_provider.has_value());
        EXPECT_EQ(session.client.state(), Client::State::CLOSED);
    }());
}

TEST_F(ClientTest, MovedClientKeepsSession) {
    run_test(ioc_, [&]() -> net::awaitable<void> {
        auto session = co_await open_session(server_);

        Client moved = std::move(session.client);
        EXPECT_EQ(session.client.state(), Client::State::CLOSED);

        auto ping = Message::ping();
        auto sent = co_await moved.send(ping);
        EXPECT_TRUE(sent.has_value());
        auto got = co_await read_frame(session.peer);
        EXPECT_EQ(got, ping);

        auto stale = co_await session.client.send(Message::ping());
        EXPECT_FALSE(stale.has_value());
    }());
}

TEST(ClientStateTest, Names) {
    EXPECT_STREQ(client_state_name(Client::State::CONNECTED), "CONNECTED");
    EXPECT_STREQ(client_state_name(Client::State::AUTHENTICATING), "AUTHENTICATING");
    EXPECT_STREQ(client_state_name(Client::State::AUTHENTICATED), "AUTHENTICATED");
    EXPECT_STREQ(client_state_name(Client::State::AUTH_FAILED), "AUTH_FAILED");
    EXPECT_STREQ(client_state_name(Client::State::CLOSED), "CLOSED");
}

// ============================================================================
// Response handling
// ============================================================================

TEST(ResponseHandlerTest, ReturnsDataOfMatchingResponse) {
    auto request = Message::command("status", json::object{});
    auto response = Message::response(request.id, true, json::object{{"load", 3}});

    auto data = handle_response(response, request.id);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->as_object().at("load").as_int64(), 3);
}

TEST(ResponseHandlerTest, MissingDataBecomesEmptyObject) {
    auto request = Message::command("status", json::object{});
    auto response = Message::response(request.id, true, nullptr);
    response.payload.as_object().erase("data");

    auto data = handle_response(response, request.id);
    ASSERT_TRUE(data.has_value());
    ASSERT_TRUE(data->is_object());
    EXPECT_TRUE(data->as_object().empty());
}

// Only a conflicting request_id or an explicit success:false is rejected
TEST(ResponseHandlerTest, AcceptsResponseWithoutIdOrSuccess) {
    auto request = Message::command("status", json::object{});
    auto response = Message::create(MessageType::RESPONSE, json::object{{"data", "ok"}});

    auto data = handle_response(response, request.id);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->as_string(), "ok");

    auto unparsable_id = Message::create(MessageType::RESPONSE,
                                         json::object{{"request_id", "not-a-uuid"}, {"success", true}});
    EXPECT_TRUE(handle_response(unparsable_id, request.id).has_value());
}

TEST(ResponseHandlerTest, RejectsOtherMessageTypes) {
    auto request = Message::command("status", json::object{});
    auto data = handle_response(Message::pong(request.id), request.id);
    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().code, ProtocolErrc::OTHER);
    EXPECT_EQ(data.error().detail, "Expected response message, got pong");
}

TEST(ResponseHandlerTest, RejectsResponseForAnotherRequest) {
    auto request = Message::command("status", json::object{});
    auto other = Message::command("other", json::object{});
    auto response = Message::response(other.id, true, nullptr);

    auto data = handle_response(response, request.id);
    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().code, ProtocolErrc::OTHER);
    EXPECT_EQ(data.error().detail, "Response for wrong request: expected " +
                                   request.id.to_string() + ", got " + other.id.to_string());
}

TEST(ResponseHandlerTest, UnsuccessfulResponseIsServerError) {
    auto request = Message::command("status", json::object{});

    auto with_message = Message::response(request.id, false, nullptr);
    with_message.payload.as_object()["message"] = "disk full";
    auto data = handle_response(with_message, request.id);
    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().code, ProtocolErrc::SERVER_ERROR);
    EXPECT_EQ(data.error().detail, "disk full");

    auto bare = Message::response(request.id, false, nullptr);
    auto unknown = handle_response(bare, request.id);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().detail, "Unknown error");
    EXPECT_EQ(unknown.error().message(), "Server error: Unknown error");
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ClientConfigTest, DefaultsAreValid) {
    ClientConfig config;
    EXPECT_EQ(config.server.address, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8717);
    EXPECT_FALSE(config.server.use_tls);
    EXPECT_EQ(config.auth.method, "password");
    EXPECT_EQ(config.transport.queue_capacity, 100u);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(ClientConfigTest, RejectsBadValues) {
    ClientConfig no_address;
    no_address.server.address.clear();
    ASSERT_FALSE(no_address.validate().has_value());
    EXPECT_EQ(no_address.validate().error(), ConfigError::MISSING_REQUIRED);

    ClientConfig no_port;
    no_port.server.port = 0;
    EXPECT_EQ(no_port.validate().error(), ConfigError::INVALID_VALUE);

    ClientConfig bad_method;
    bad_method.auth.method = "kerberos";
    EXPECT_EQ(bad_method.validate().error(), ConfigError::INVALID_VALUE);

    ClientConfig half_cert;
    half_cert.server.client_cert_path = "client.pem";
    EXPECT_EQ(half_cert.validate().error(), ConfigError::INVALID_VALUE);

    ClientConfig upper_method;
    upper_method.auth.method = "PSK";
    EXPECT_TRUE(upper_method.validate().has_value());
}

TEST(ClientConfigTest, OptionsFollowConfig) {
    ClientConfig config;
    config.auth.await_response = true;
    config.auth.response_timeout = std::chrono::seconds(3);
    config.transport.queue_capacity = 7;

    auto options = ClientOptions::from_config(config);
    EXPECT_TRUE(options.await_auth_response);
    EXPECT_EQ(options.auth_timeout, std::chrono::seconds(3));
    EXPECT_EQ(options.transport.queue_capacity, 7u);
}
