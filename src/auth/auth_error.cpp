#include "auth/auth_error.hpp"

namespace rcp::auth {

std::string_view auth_errc_name(AuthErrc code) {
    switch (code) {
        case AuthErrc::USER_DECLINED: return "USER_DECLINED";
        case AuthErrc::INVALID_CREDENTIALS: return "INVALID_CREDENTIALS";
        case AuthErrc::UNSUPPORTED_METHOD: return "UNSUPPORTED_METHOD";
        case AuthErrc::TIMEOUT: return "TIMEOUT";
        case AuthErrc::OS_AUTH_FAILURE: return "OS_AUTH_FAILURE";
        case AuthErrc::SECRET_STORE: return "SECRET_STORE";
        case AuthErrc::POLICY_BLOCKED: return "POLICY_BLOCKED";
        case AuthErrc::PROTOCOL: return "PROTOCOL";
        case AuthErrc::OTHER: return "OTHER";
    }
    return "UNKNOWN";
}

std::string AuthError::message() const {
    switch (code) {
        case AuthErrc::USER_DECLINED: return "User declined authentication";
        case AuthErrc::INVALID_CREDENTIALS: return "Invalid credentials";
        case AuthErrc::UNSUPPORTED_METHOD: return "Authentication method not supported: " + detail;
        case AuthErrc::TIMEOUT: return "Authentication timed out";
        case AuthErrc::OS_AUTH_FAILURE: return "Failed to interact with OS authentication: " + detail;
        case AuthErrc::SECRET_STORE:
            return "Failed to load credentials: " + (store ? store->message() : detail);
        case AuthErrc::POLICY_BLOCKED: return "Authentication blocked by system policy";
        case AuthErrc::PROTOCOL:
            return "Protocol error: " + (protocol ? protocol->message() : detail);
        case AuthErrc::OTHER: return "Authentication error: " + detail;
    }
    return "Unknown authentication error";
}

} // namespace rcp::auth
