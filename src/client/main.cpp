#include "auth/auth_provider.hpp"
#include "auth/password_provider.hpp"
#include "auth/psk_provider.hpp"
#include "client/client.hpp"
#include "common/config.hpp"
#include "common/log.hpp"
#include "common/uuid.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace rcp;
using namespace rcp::client;

namespace {

auto& logger() { return log::Logger::get("main"); }

void print_usage(const char* program) {
    std::cout << "RCP Client\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Connects to an RCP server and authenticates. Without --auth-method\n"
              << "the password, psk and native methods are tried in turn.\n\n"
              << "Options:\n"
              << "  -s, --server <host[:port]>  Server address (default: 127.0.0.1:8717)\n"
              << "  -p, --port <port>           Server port (overrides the one in --server)\n"
              << "  -u, --username <name>       Username for password/native auth\n"
              << "      --auth-method <m>       password | psk | native | publickey\n"
              << "      --password <secret>     Password for password auth\n"
              << "      --psk <key>             Pre-shared key for psk auth\n"
              << "      --tls                   Request an encrypted connection\n"
              << "      --await-response        Wait for the server to confirm authentication\n"
              << "  -v, --verbose               More logging (-vv for trace)\n"
              << "  -h, --help                  Show help\n\n"
              << "Environment:\n"
              << "  RCP_LOG_LEVEL               trace/debug/info/warn/error/critical/off\n"
              << "  RCP_LOG_FILE                Also log to this file\n\n"
              << "Examples:\n"
              << "  " << program << " -s 127.0.0.1:8717 -u alice --password secret\n"
              << "  " << program << " --auth-method psk --psk shared-key --await-response\n"
              << std::endl;
}

bool parse_port(const std::string& text, uint16_t& port) {
    try {
        size_t used = 0;
        unsigned long value = std::stoul(text, &used);
        if (used != text.size() || value == 0 || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// host, host:port or [v6]:port
bool parse_server(const std::string& text, ServerConfig& server) {
    std::string host = text;
    std::string port;

    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string::npos) {
            return false;
        }
        host = text.substr(1, close - 1);
        if (close + 1 < text.size()) {
            if (text[close + 1] != ':') {
                return false;
            }
            port = text.substr(close + 2);
        }
    } else if (auto colon = text.rfind(':');
               colon != std::string::npos && text.find(':') == colon) {
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    if (host.empty()) {
        return false;
    }
    server.address = host;
    return port.empty() || parse_port(port, server.port);
}

struct Options {
    ClientConfig config;
    std::optional<std::string> password;
    bool method_given = false;
    int verbosity = 0;
};

net::awaitable<bool> try_method(Client& client, auth::AuthMethod method, const Options& options,
                                const auth::ProviderContext& context) {
    std::string username = options.config.auth.username.value_or("");
    std::unique_ptr<auth::AuthProvider> provider;

    if (method == auth::AuthMethod::PSK) {
        auto psk = std::make_unique<auth::PskProvider>(context);
        if (options.config.auth.psk) {
            psk->with_key(*options.config.auth.psk);
        }
        provider = std::move(psk);
    } else if (method == auth::AuthMethod::PASSWORD) {
        auto password = std::make_unique<auth::PasswordProvider>(username, context);
        if (options.password) {
            password->with_password(*options.password);
        }
        provider = std::move(password);
    } else {
        provider = auth::create_provider(method, username, context);
    }

    std::cout << "Trying " << auth::auth_method_to_string(method) << " authentication... ";
    auto result = co_await client.authenticate_with_provider(*provider);
    if (!result) {
        std::cout << "failed: " << result.error().message() << "\n";
        co_return false;
    }
    std::cout << (*result ? "accepted" : "rejected") << "\n";
    co_return *result;
}

net::awaitable<int> run(Options options) {
    auto client = co_await Client::connect(options.config);
    if (!client) {
        std::cerr << "Connection failed: " << client.error().message() << "\n";
        co_return 2;
    }
    std::cout << "Connected to " << client->peer()
              << (client->is_encrypted() ? " (encrypted)" : " (plaintext)") << "\n";

    auth::ProviderContext context;
    context.store = std::make_shared<auth::MemorySecretStore>();
    context.save_credentials = options.config.auth.save_credentials;

    std::vector<auth::AuthMethod> methods;
    if (options.method_given) {
        // validate() already rejected unknown tokens
        methods.push_back(*auth::auth_method_from_string(options.config.auth.method));
    } else {
        methods = {auth::AuthMethod::PASSWORD, auth::AuthMethod::PSK, auth::AuthMethod::NATIVE};
    }

    bool authenticated = false;
    for (auto method : methods) {
        if (co_await try_method(*client, method, options, context)) {
            authenticated = true;
            break;
        }
    }

    auto stats = client->stats();
    logger().debug("Sent {} frames ({} bytes), received {} frames ({} bytes)",
                stats.frames_sent, stats.bytes_sent, stats.frames_received, stats.bytes_received);

    std::cout << "State: " << client_state_name(client->state()) << "\n";
    client->close();
    co_return authenticated ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--server") {
            const char* value = next();
            if (!value || !parse_server(value, options.config.server)) {
                std::cerr << "Error: invalid server address\n";
                return 1;
            }
        } else if (arg == "-p" || arg == "--port") {
            const char* value = next();
            if (!value || !parse_port(value, options.config.server.port)) {
                std::cerr << "Error: invalid port\n";
                return 1;
            }
        } else if (arg == "-u" || arg == "--username") {
            const char* value = next();
            if (!value) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            options.config.auth.username = value;
        } else if (arg == "--auth-method") {
            const char* value = next();
            if (!value) {
                std::cerr << "Error: --auth-method requires a value\n";
                return 1;
            }
            options.config.auth.method = value;
            options.method_given = true;
        } else if (arg == "--password") {
            const char* value = next();
            if (!value) {
                std::cerr << "Error: --password requires a value\n";
                return 1;
            }
            options.password = value;
        } else if (arg == "--psk") {
            const char* value = next();
            if (!value) {
                std::cerr << "Error: --psk requires a value\n";
                return 1;
            }
            options.config.auth.psk = value;
        } else if (arg == "--tls") {
            options.config.server.use_tls = true;
        } else if (arg == "--await-response") {
            options.config.auth.await_response = true;
        } else if (arg == "-v" || arg == "--verbose") {
            ++options.verbosity;
        } else if (arg == "-vv") {
            options.verbosity += 2;
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    log::init_from_env();
    if (options.verbosity >= 2) {
        log::set_level(log::Level::Trace);
    } else if (options.verbosity == 1) {
        log::set_level(log::Level::Debug);
    }

    if (auto valid = options.config.validate(); !valid) {
        std::cerr << "Error: " << config_error_message(valid.error()) << "\n";
        return 1;
    }

    if (!crypto_init()) {
        std::cerr << "Error: failed to initialize libsodium\n";
        return 1;
    }

    net::io_context ioc;
    int exit_code = 1;

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (!ec) {
            logger().info("Received signal {}, shutting down...", sig);
            ioc.stop();
        }
    });

    net::co_spawn(
        ioc,
        run(std::move(options)),
        [&](std::exception_ptr ep, int code) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    logger().critical("Unhandled exception: {}", e.what());
                }
            } else {
                exit_code = code;
            }
            boost::system::error_code ignored;
            signals.cancel(ignored);
        });

    ioc.run();
    log::shutdown();
    return exit_code;
}
