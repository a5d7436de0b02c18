#pragma once

#include "auth/auth_error.hpp"
#include <expected>
#include <string>

namespace rcp::auth {

// Interactive source of secrets, asked last after overrides and the store
class CredentialPrompt {
public:
    virtual ~CredentialPrompt() = default;

    virtual std::expected<std::string, AuthError> ask_password(const std::string& username) = 0;
    virtual std::expected<std::string, AuthError> ask_psk() = 0;
};

// No interactive surface: every request fails with OTHER
class UnavailablePrompt : public CredentialPrompt {
public:
    std::expected<std::string, AuthError> ask_password(const std::string& username) override;
    std::expected<std::string, AuthError> ask_psk() override;
};

} // namespace rcp::auth
