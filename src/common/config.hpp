#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace rcp {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Transport tuning
// ============================================================================

struct TransportOptions {
    size_t queue_capacity = 100;                  // inbound/outbound channel depth
    size_t max_message_size = 16 * 1024 * 1024;   // largest accepted body
};

// ============================================================================
// Client Configuration
// ============================================================================

struct ServerConfig {
    std::string address = "127.0.0.1";
    uint16_t port = 8717;
    bool use_tls = false;
    std::optional<std::string> client_cert_path;
    std::optional<std::string> client_key_path;
    bool verify_server = true;
};

struct AuthConfig {
    std::string method = "password";           // password | psk | native | publickey
    std::optional<std::string> username;
    std::optional<std::string> psk;
    bool save_credentials = false;              // write prompted secrets back to the store
    bool await_response = false;                // wait for a correlated Response
    std::chrono::seconds response_timeout{10};
};

struct ClientConfig {
    ServerConfig server;
    AuthConfig auth;
    TransportOptions transport;

    // Empty address, port 0, an unknown auth method or a zero queue
    // capacity are rejected.
    std::expected<void, ConfigError> validate() const;
};

} // namespace rcp
