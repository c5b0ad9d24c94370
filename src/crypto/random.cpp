#include "random.hpp"
#include "hmac.hpp"
#include <sodium.h>

namespace rangegate::crypto {

bytes Random::generate(size_t size) {
    ensure_sodium_initialized();
    bytes result(size);
    randombytes_buf(result.data(), size);
    return result;
}

std::string Random::generate_hex(size_t size) {
    return bytes_to_hex(generate(size));
}

} // namespace rangegate::crypto
