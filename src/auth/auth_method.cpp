#include "auth/auth_method.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace rcp::auth {

std::string_view auth_method_to_string(AuthMethod method) {
    switch (method) {
        case AuthMethod::PASSWORD: return "password";
        case AuthMethod::PSK: return "psk";
        case AuthMethod::NATIVE: return "native";
        case AuthMethod::PUBLIC_KEY: return "publickey";
    }
    return "unknown";
}

std::optional<AuthMethod> auth_method_from_string(std::string_view token) {
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "password") return AuthMethod::PASSWORD;
    if (lower == "psk") return AuthMethod::PSK;
    if (lower == "native") return AuthMethod::NATIVE;
    if (lower == "publickey") return AuthMethod::PUBLIC_KEY;
    return std::nullopt;
}

} // namespace rcp::auth
