#include "auth/password_provider.hpp"

namespace json = boost::json;

namespace rcp::auth {

PasswordProvider::PasswordProvider(std::string username, ProviderContext context)
    : AuthProvider(std::move(context))
    , username_(std::move(username))
{
}

PasswordProvider& PasswordProvider::with_password(std::string password) {
    password_ = std::move(password);
    return *this;
}

std::expected<Credentials, AuthError> PasswordProvider::get_credentials() {
    if (password_) {
        return PasswordCredentials{username_, *password_};
    }

    auto password = lookup_secret(username_, [this](CredentialPrompt& prompt) {
        return prompt.ask_password(username_);
    });
    if (!password) {
        return std::unexpected(password.error());
    }
    return PasswordCredentials{username_, std::move(*password)};
}

std::expected<Message, AuthError> PasswordProvider::build_auth_message(const Credentials& credentials) const {
    const auto* password = std::get_if<PasswordCredentials>(&credentials);
    if (!password) {
        return std::unexpected(AuthError::invalid_credentials());
    }
    return Message::create(MessageType::AUTH, json::object{
        {"username", password->username},
        {"credentials", password->password},
        {"method", "password"},
    });
}

} // namespace rcp::auth
