#pragma once

#include "rangegate/common.hpp"

namespace rangegate::crypto {

/**
 * Random number generation (CSPRNG)
 * Cryptographically secure random bytes
 */
class Random {
public:
    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);

    /**
     * Generate a random hex string of `size` bytes of entropy
     */
    static std::string generate_hex(size_t size);
};

} // namespace rangegate::crypto
