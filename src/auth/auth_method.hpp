#pragma once

#include <optional>
#include <string_view>

namespace rcp::auth {

enum class AuthMethod {
    PASSWORD,
    PSK,
    NATIVE,
    PUBLIC_KEY,
};

// Lowercase wire/config token: password, psk, native, publickey
std::string_view auth_method_to_string(AuthMethod method);

// Case-insensitive. Unknown tokens yield std::nullopt; the caller picks
// the fallback.
std::optional<AuthMethod> auth_method_from_string(std::string_view token);

} // namespace rcp::auth
