#include "auth/auth_provider.hpp"
#include "auth/native_provider.hpp"
#include "auth/password_provider.hpp"
#include "auth/psk_provider.hpp"
#include "common/log.hpp"

namespace rcp::auth {

namespace {

auto& log() { return log::Logger::get("auth"); }

} // anonymous namespace

AuthProvider::AuthProvider(ProviderContext context)
    : context_(std::move(context))
{
    if (!context_.prompt) {
        context_.prompt = std::make_shared<UnavailablePrompt>();
    }
}

boost::asio::awaitable<std::expected<bool, AuthError>> AuthProvider::authenticate(AuthSession& session) {
    auto credentials = get_credentials();
    if (!credentials) {
        log().warn("{} credentials unavailable: {}",
                   auth_method_to_string(method()), credentials.error().message());
        co_return std::unexpected(credentials.error());
    }

    auto message = build_auth_message(*credentials);
    if (!message) {
        co_return std::unexpected(message.error());
    }

    log().debug("Submitting {} authentication", auth_method_to_string(method()));
    auto accepted = co_await session.submit_auth(std::move(*message));
    if (!accepted) {
        co_return std::unexpected(AuthError::from_protocol(accepted.error()));
    }
    co_return *accepted;
}

std::expected<std::string, AuthError> AuthProvider::lookup_secret(
    const std::string& account,
    const std::function<std::expected<std::string, AuthError>(CredentialPrompt&)>& ask) {
    if (context_.store) {
        auto stored = context_.store->get(SECRET_SERVICE, account);
        if (!stored) {
            log().error("Secret store lookup for '{}' failed: {}", account, stored.error().message());
            return std::unexpected(AuthError::from_store(stored.error()));
        }
        if (stored->has_value()) {
            log().debug("Using stored secret for '{}'", account);
            return std::move(**stored);
        }
    }

    auto secret = ask(*context_.prompt);
    if (!secret) {
        return std::unexpected(secret.error());
    }

    if (context_.save_credentials && context_.store) {
        auto saved = context_.store->set(SECRET_SERVICE, account, *secret);
        if (!saved) {
            log().warn("Could not save secret for '{}': {}", account, saved.error().message());
        }
    }
    return secret;
}

std::unique_ptr<AuthProvider> create_provider(AuthMethod method, const std::string& username,
                                              ProviderContext context) {
    switch (method) {
        case AuthMethod::PASSWORD:
            return std::make_unique<PasswordProvider>(username, std::move(context));
        case AuthMethod::PSK:
            return std::make_unique<PskProvider>(std::move(context));
        case AuthMethod::NATIVE:
            return std::make_unique<NativeProvider>(username, std::move(context));
        case AuthMethod::PUBLIC_KEY:
            log().warn("Public key authentication not implemented yet, falling back to password");
            return std::make_unique<PasswordProvider>(username, std::move(context));
    }
    return std::make_unique<PasswordProvider>(username, std::move(context));
}

} // namespace rcp::auth
