#pragma once

#include "auth/auth_error.hpp"
#include "auth/auth_method.hpp"
#include "auth/auth_session.hpp"
#include "auth/credential_prompt.hpp"
#include "auth/credentials.hpp"
#include "auth/secret_store.hpp"
#include "common/message.hpp"
#include <boost/asio/awaitable.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace rcp::auth {

// Collaborators a provider consults for secrets
struct ProviderContext {
    std::shared_ptr<SecretStore> store;          // may be null: no store
    std::shared_ptr<CredentialPrompt> prompt;    // null means UnavailablePrompt
    bool save_credentials = false;               // write prompted secrets to the store
};

/**
 * AuthProvider - one authentication method.
 *
 * get_credentials() resolves secrets in order:
 *   1. value set on the provider (with_password / with_key)
 *   2. secret store; "no entry" falls through, a store failure is returned
 *   3. interactive prompt
 *
 * authenticate() turns the credentials into an Auth message and submits
 * it through the session.
 */
class AuthProvider {
public:
    explicit AuthProvider(ProviderContext context);
    virtual ~AuthProvider() = default;

    AuthProvider(const AuthProvider&) = delete;
    AuthProvider& operator=(const AuthProvider&) = delete;

    virtual AuthMethod method() const = 0;

    virtual std::expected<Credentials, AuthError> get_credentials() = 0;

    boost::asio::awaitable<std::expected<bool, AuthError>> authenticate(AuthSession& session);

    // Auth message for these credentials; INVALID_CREDENTIALS when they
    // belong to another method
    virtual std::expected<Message, AuthError> build_auth_message(const Credentials& credentials) const = 0;

protected:
    std::expected<std::string, AuthError> lookup_secret(
        const std::string& account,
        const std::function<std::expected<std::string, AuthError>(CredentialPrompt&)>& ask);

    ProviderContext context_;
};

// Provider for `method`. PUBLIC_KEY has no implementation of its own and
// yields a password provider after logging a warning.
std::unique_ptr<AuthProvider> create_provider(AuthMethod method, const std::string& username,
                                              ProviderContext context = {});

} // namespace rcp::auth
