#include "auth/credential_prompt.hpp"

namespace rcp::auth {

std::expected<std::string, AuthError> UnavailablePrompt::ask_password(const std::string&) {
    return std::unexpected(AuthError::other("Password dialog not implemented"));
}

std::expected<std::string, AuthError> UnavailablePrompt::ask_psk() {
    return std::unexpected(AuthError::other("PSK dialog not implemented"));
}

} // namespace rcp::auth
