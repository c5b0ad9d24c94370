#include "hmac.hpp"
#include "rangegate/error.hpp"
#include <sodium.h>

namespace rangegate::crypto {

namespace {
    struct SodiumInitializer {
        SodiumInitializer() {
            if (sodium_init() < 0) {
                throw CryptoException(ErrorCode::CryptoInitFailed,
                                      "failed to initialize libsodium");
            }
        }
    };
}

void ensure_sodium_initialized() {
    static SodiumInitializer sodium_init_instance;
}

Mac256 HmacSha256::compute(const std::string& key, const std::string& message) {
    ensure_sodium_initialized();

    Mac256 mac;
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state,
                                reinterpret_cast<const unsigned char*>(key.data()),
                                key.size());
    crypto_auth_hmacsha256_update(&state,
                                  reinterpret_cast<const unsigned char*>(message.data()),
                                  message.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

bool HmacSha256::equal(const Mac256& a, const Mac256& b) {
    ensure_sodium_initialized();
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string HmacSha256::to_hex(const Mac256& mac) {
    return bytes_to_hex(mac.data(), mac.size());
}

std::optional<Mac256> HmacSha256::from_hex(const std::string& hex) {
    Mac256 mac;
    if (!hex_to_bytes(hex, mac.data(), mac.size())) {
        return std::nullopt;
    }
    return mac;
}

} // namespace rangegate::crypto
