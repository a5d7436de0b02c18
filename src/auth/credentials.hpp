#pragma once

#include "auth/auth_method.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rcp::auth {

// Secret material for one authentication attempt, one alternative per
// AuthMethod. Built fresh by a provider on every request.

struct PasswordCredentials {
    std::string username;
    std::string password;
};

struct PskCredentials {
    std::string key;
};

struct NativeCredentials {
    std::string username;
    std::vector<uint8_t> token;
};

struct PublicKeyCredentials {
    std::string username;
    std::vector<uint8_t> signature;
};

using Credentials = std::variant<PasswordCredentials, PskCredentials,
                                 NativeCredentials, PublicKeyCredentials>;

inline AuthMethod credentials_method(const Credentials& credentials) {
    switch (credentials.index()) {
        case 0: return AuthMethod::PASSWORD;
        case 1: return AuthMethod::PSK;
        case 2: return AuthMethod::NATIVE;
        default: return AuthMethod::PUBLIC_KEY;
    }
}

} // namespace rcp::auth
