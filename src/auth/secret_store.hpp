#pragma once

#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace rcp::auth {

// Service name every provider files its secrets under
inline constexpr const char* SECRET_SERVICE = "rcp-client";

enum class SecretStoreErrc {
    UNAVAILABLE,
    ACCESS_DENIED,
    BACKEND_FAILURE,
};

struct SecretStoreError {
    SecretStoreErrc code = SecretStoreErrc::BACKEND_FAILURE;
    std::string detail;

    std::string message() const;

    bool operator==(const SecretStoreError&) const = default;
};

/**
 * SecretStore - persistent secret lookup keyed by (service, account).
 *
 * get() distinguishes "no entry" (an engaged expected holding nullopt)
 * from a failing backend (an error).
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual std::expected<std::optional<std::string>, SecretStoreError> get(
        const std::string& service, const std::string& account) = 0;

    virtual std::expected<void, SecretStoreError> set(
        const std::string& service, const std::string& account, const std::string& secret) = 0;
};

// Process-local store
class MemorySecretStore : public SecretStore {
public:
    std::expected<std::optional<std::string>, SecretStoreError> get(
        const std::string& service, const std::string& account) override;

    std::expected<void, SecretStoreError> set(
        const std::string& service, const std::string& account, const std::string& secret) override;

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::string> entries_;
};

} // namespace rcp::auth
