#pragma once

#include "auth/secret_store.hpp"
#include "common/protocol_error.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rcp::auth {

enum class AuthErrc {
    USER_DECLINED,
    INVALID_CREDENTIALS,
    UNSUPPORTED_METHOD,
    TIMEOUT,
    OS_AUTH_FAILURE,
    SECRET_STORE,
    POLICY_BLOCKED,
    PROTOCOL,
    OTHER,
};

std::string_view auth_errc_name(AuthErrc code);

// Authentication-layer failure. Store and protocol failures keep the
// underlying error.
struct AuthError {
    AuthErrc code = AuthErrc::OTHER;
    std::string detail;
    std::optional<ProtocolError> protocol;
    std::optional<SecretStoreError> store;

    std::string message() const;

    static AuthError other(std::string detail) {
        return {AuthErrc::OTHER, std::move(detail), std::nullopt, std::nullopt};
    }
    static AuthError invalid_credentials() {
        return {AuthErrc::INVALID_CREDENTIALS, {}, std::nullopt, std::nullopt};
    }
    static AuthError unsupported(std::string detail) {
        return {AuthErrc::UNSUPPORTED_METHOD, std::move(detail), std::nullopt, std::nullopt};
    }
    static AuthError os_failure(std::string detail) {
        return {AuthErrc::OS_AUTH_FAILURE, std::move(detail), std::nullopt, std::nullopt};
    }
    static AuthError from_store(SecretStoreError error) {
        return {AuthErrc::SECRET_STORE, {}, std::nullopt, std::move(error)};
    }
    static AuthError from_protocol(ProtocolError error) {
        // Timeouts stay distinguishable from other protocol failures
        AuthErrc code = error.code == ProtocolErrc::TIMEOUT ? AuthErrc::TIMEOUT : AuthErrc::PROTOCOL;
        return {code, {}, std::move(error), std::nullopt};
    }
};

} // namespace rcp::auth
