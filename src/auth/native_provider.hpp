#pragma once

#include "auth/auth_provider.hpp"

namespace rcp::auth {

// Login name of the current OS user: $USER, $USERNAME, then the
// password database entry for the real uid
std::expected<std::string, AuthError> current_os_username();

// Kernel name reported in the native Auth payload (e.g. "Linux")
std::string os_name();

/**
 * NativeProvider - authenticates as the logged-in OS user.
 *
 * An empty username means "the current OS user". The credential is a
 * fresh 32-byte random token per attempt.
 * Payload: {username, credentials: [token bytes], method: "native", os}
 */
class NativeProvider : public AuthProvider {
public:
    static constexpr size_t TOKEN_SIZE = 32;

    explicit NativeProvider(std::string username = {}, ProviderContext context = {});

    AuthMethod method() const override { return AuthMethod::NATIVE; }
    std::expected<Credentials, AuthError> get_credentials() override;
    std::expected<Message, AuthError> build_auth_message(const Credentials& credentials) const override;

private:
    std::string username_;
};

} // namespace rcp::auth
