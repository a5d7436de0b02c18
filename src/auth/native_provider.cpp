#include "auth/native_provider.hpp"
#include "common/uuid.hpp"
#include <sodium.h>
#include <cstdlib>
#include <vector>

#ifndef _WIN32
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace json = boost::json;

namespace rcp::auth {

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // anonymous namespace

std::expected<std::string, AuthError> current_os_username() {
    if (auto user = env_value("USER")) {
        return *user;
    }
    if (auto user = env_value("USERNAME")) {
        return *user;
    }

#ifndef _WIN32
    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size > 0 ? static_cast<size_t>(size) : 16384);
    struct passwd pwd{};
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result) {
        return std::string(result->pw_name);
    }
#endif

    return std::unexpected(AuthError::os_failure("Could not determine OS username"));
}

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info{};
    if (uname(&info) == 0) {
        return info.sysname;
    }
    return "Unknown";
#endif
}

NativeProvider::NativeProvider(std::string username, ProviderContext context)
    : AuthProvider(std::move(context))
    , username_(std::move(username))
{
}

std::expected<Credentials, AuthError> NativeProvider::get_credentials() {
    std::string username = username_;
    if (username.empty()) {
        auto os_user = current_os_username();
        if (!os_user) {
            return std::unexpected(os_user.error());
        }
        username = std::move(*os_user);
    }

    if (!crypto_init()) {
        return std::unexpected(AuthError::os_failure("Random source unavailable"));
    }

    std::vector<uint8_t> token(TOKEN_SIZE);
    randombytes_buf(token.data(), token.size());
    return NativeCredentials{std::move(username), std::move(token)};
}

std::expected<Message, AuthError> NativeProvider::build_auth_message(const Credentials& credentials) const {
    const auto* native = std::get_if<NativeCredentials>(&credentials);
    if (!native) {
        return std::unexpected(AuthError::invalid_credentials());
    }
    return Message::create(MessageType::AUTH, json::object{
        {"username", native->username},
        {"credentials", bytes_to_json(native->token)},
        {"method", "native"},
        {"os", os_name()},
    });
}

} // namespace rcp::auth
