#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// Rangegate Version
#define RANGEGATE_VERSION_MAJOR 0
#define RANGEGATE_VERSION_MINOR 1
#define RANGEGATE_VERSION_PATCH 0
#define RANGEGATE_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef RANGEGATE_PLATFORM_WINDOWS
        #define RANGEGATE_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef RANGEGATE_PLATFORM_LINUX
        #define RANGEGATE_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef RANGEGATE_PLATFORM_MACOS
        #define RANGEGATE_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define RANGEGATE_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define RANGEGATE_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define RANGEGATE_DISALLOW_COPY_AND_MOVE(TypeName) \
    RANGEGATE_DISALLOW_COPY(TypeName); \
    RANGEGATE_DISALLOW_MOVE(TypeName)

// Constants
namespace rangegate {
namespace constants {

// Network constants
constexpr uint16_t DEFAULT_PORT = 8000;
constexpr size_t DEFAULT_WORKER_THREADS = 16;

// Upstream block protocol
constexpr uint64_t DEFAULT_ALIGNMENT = 4096;             // 4 KiB
constexpr uint64_t DEFAULT_BLOCK_SIZE = 1024 * 1024;     // 1 MiB

// Streaming
constexpr size_t DEFAULT_MAX_CONCURRENT_STREAMS = 6;
constexpr uint32_t DEFAULT_UPSTREAM_TIMEOUT_SECONDS = 30;
constexpr uint32_t BUSY_RETRY_AFTER_SECONDS = 5;

// Tokens
constexpr uint32_t DEFAULT_TOKEN_TTL_SECONDS = 3600;     // 1 hour
constexpr size_t HMAC_SHA256_SIZE = 32;
constexpr size_t MIN_SECRET_SIZE = 16;

} // namespace constants
} // namespace rangegate

// Core types
namespace rangegate {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Mac256 = fixed_bytes<constants::HMAC_SHA256_SIZE>;

// Hex encoding
std::string bytes_to_hex(const byte* data, size_t len);
std::string bytes_to_hex(const bytes& data);
bool hex_to_bytes(const std::string& hex, byte* out, size_t out_len);

// Percent-encoding for URL query components (RFC 3986 unreserved set kept)
std::string url_encode(const std::string& value);
std::optional<std::string> url_decode(const std::string& value);

// Strict unsigned decimal parse; rejects signs, spaces and overflow
std::optional<uint64_t> parse_u64(const std::string& text);

// Human readable byte count ("512 B", "1.50 MB")
std::string format_size(uint64_t size);

} // namespace rangegate
