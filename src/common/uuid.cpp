#include "common/uuid.hpp"
#include <sodium.h>
#include <algorithm>
#include <atomic>

namespace rcp {

namespace {

std::atomic<bool> g_sodium_ready{false};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

bool crypto_init() {
    if (g_sodium_ready.load(std::memory_order_acquire)) {
        return true;
    }
    // sodium_init() returns 1 when already initialized
    bool ok = sodium_init() >= 0;
    g_sodium_ready.store(ok, std::memory_order_release);
    return ok;
}

Uuid Uuid::generate() {
    crypto_init();

    Uuid id;
    randombytes_buf(id.bytes.data(), id.bytes.size());

    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);  // version 4
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return id;
}

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) {
        return std::nullopt;
    }

    Uuid id;
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id.bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}

std::string Uuid::to_string() const {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);

    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(hex[(bytes[i] >> 4) & 0x0F]);
        result.push_back(hex[bytes[i] & 0x0F]);
    }
    return result;
}

bool Uuid::is_nil() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

} // namespace rcp
