#include "common/config.hpp"
#include "common/log.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace rcp {

namespace {

auto& logger() { return log::Logger::get("config"); }

bool is_known_method(std::string token) {
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    constexpr std::array<std::string_view, 4> methods = {"password", "psk", "native", "publickey"};
    return std::find(methods.begin(), methods.end(), token) != methods.end();
}

} // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::expected<void, ConfigError> ClientConfig::validate() const {
    if (server.address.empty()) {
        logger().error("server.address is required");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (server.port == 0) {
        logger().error("server.port must be non-zero");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (!is_known_method(auth.method)) {
        logger().error("Unknown auth method: {}", auth.method);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (server.client_cert_path.has_value() != server.client_key_path.has_value()) {
        logger().error("client_cert_path and client_key_path must be given together");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (transport.queue_capacity == 0 || transport.max_message_size == 0) {
        logger().error("transport queue_capacity and max_message_size must be non-zero");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (auth.response_timeout.count() <= 0) {
        logger().error("auth.response_timeout must be positive");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return {};
}

} // namespace rcp
