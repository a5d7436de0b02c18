#include "auth/psk_provider.hpp"

namespace json = boost::json;

namespace rcp::auth {

PskProvider::PskProvider(ProviderContext context)
    : AuthProvider(std::move(context))
{
}

PskProvider& PskProvider::with_key(std::string key) {
    key_ = std::move(key);
    return *this;
}

std::expected<Credentials, AuthError> PskProvider::get_credentials() {
    if (key_) {
        return PskCredentials{*key_};
    }

    auto key = lookup_secret(PSK_ACCOUNT, [](CredentialPrompt& prompt) {
        return prompt.ask_psk();
    });
    if (!key) {
        return std::unexpected(key.error());
    }
    return PskCredentials{std::move(*key)};
}

std::expected<Message, AuthError> PskProvider::build_auth_message(const Credentials& credentials) const {
    const auto* psk = std::get_if<PskCredentials>(&credentials);
    if (!psk) {
        return std::unexpected(AuthError::invalid_credentials());
    }
    return Message::create(MessageType::AUTH, json::object{
        {"credentials", psk->key},
        {"method", "psk"},
    });
}

} // namespace rcp::auth
