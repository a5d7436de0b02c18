#include "auth/secret_store.hpp"

namespace rcp::auth {

std::string SecretStoreError::message() const {
    std::string prefix;
    switch (code) {
        case SecretStoreErrc::UNAVAILABLE: prefix = "Secret store unavailable"; break;
        case SecretStoreErrc::ACCESS_DENIED: prefix = "Secret store access denied"; break;
        case SecretStoreErrc::BACKEND_FAILURE: prefix = "Secret store failure"; break;
        default: prefix = "Secret store error"; break;
    }
    return detail.empty() ? prefix : prefix + ": " + detail;
}

std::expected<std::optional<std::string>, SecretStoreError> MemorySecretStore::get(
    const std::string& service, const std::string& account) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find({service, account});
    if (it == entries_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

std::expected<void, SecretStoreError> MemorySecretStore::set(
    const std::string& service, const std::string& account, const std::string& secret) {
    std::lock_guard lock(mutex_);
    entries_[{service, account}] = secret;
    return {};
}

} // namespace rcp::auth
