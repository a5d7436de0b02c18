#pragma once

#include "auth/auth_provider.hpp"
#include <optional>

namespace rcp::auth {

// Username + password. Payload: {username, credentials: "<password>", method: "password"}
class PasswordProvider : public AuthProvider {
public:
    explicit PasswordProvider(std::string username, ProviderContext context = {});

    // Use this password instead of consulting the store or the prompt
    PasswordProvider& with_password(std::string password);

    AuthMethod method() const override { return AuthMethod::PASSWORD; }
    std::expected<Credentials, AuthError> get_credentials() override;
    std::expected<Message, AuthError> build_auth_message(const Credentials& credentials) const override;

    const std::string& username() const { return username_; }

private:
    std::string username_;
    std::optional<std::string> password_;
};

} // namespace rcp::auth
