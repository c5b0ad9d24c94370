#pragma once

#include "rangegate/common.hpp"
#include <string>

namespace rangegate::crypto {

/**
 * HMAC-SHA256 wrapper (libsodium)
 * Keys may be any length, as with RFC 2104.
 */
class HmacSha256 {
public:
    /**
     * Compute the MAC of a message
     * @param key Secret key bytes
     * @param message Message to authenticate
     * @return 32-byte MAC
     */
    static Mac256 compute(const std::string& key, const std::string& message);

    /**
     * Compare two MACs in constant time
     */
    static bool equal(const Mac256& a, const Mac256& b);

    static std::string to_hex(const Mac256& mac);

    /**
     * Parse a hex MAC; nullopt on wrong length or non-hex input
     */
    static std::optional<Mac256> from_hex(const std::string& hex);
};

/**
 * Initialize libsodium once per process
 * @throws CryptoException if the library cannot be initialized
 */
void ensure_sodium_initialized();

} // namespace rangegate::crypto
