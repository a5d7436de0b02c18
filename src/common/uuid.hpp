#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rcp {

// Initialize libsodium (call once at startup, safe to call again)
bool crypto_init();

// RFC 4122 identifier used for message ids and request correlation
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    // Random version-4 UUID
    static Uuid generate();

    // Accepts the canonical 8-4-4-4-12 hex form, either case
    static std::optional<Uuid> parse(std::string_view text);

    // Lowercase canonical form
    std::string to_string() const;

    bool is_nil() const;

    auto operator<=>(const Uuid&) const = default;
};

} // namespace rcp
