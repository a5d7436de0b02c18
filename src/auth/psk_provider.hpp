#pragma once

#include "auth/auth_provider.hpp"
#include <optional>

namespace rcp::auth {

// Secret store account holding the pre-shared key
inline constexpr const char* PSK_ACCOUNT = "psk";

// Pre-shared key. Payload: {credentials: "<key>", method: "psk"}
class PskProvider : public AuthProvider {
public:
    explicit PskProvider(ProviderContext context = {});

    PskProvider& with_key(std::string key);

    AuthMethod method() const override { return AuthMethod::PSK; }
    std::expected<Credentials, AuthError> get_credentials() override;
    std::expected<Message, AuthError> build_auth_message(const Credentials& credentials) const override;

private:
    std::optional<std::string> key_;
};

} // namespace rcp::auth
