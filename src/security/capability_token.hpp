#pragma once

#include "rangegate/common.hpp"
#include "rangegate/time_utils.hpp"
#include <map>
#include <optional>
#include <string>

namespace rangegate::security {

/**
 * SigningScheme - Which fields the token signature covers
 */
enum class SigningScheme {
    RESOURCE_AND_EXPIRY,       // HMAC(resource_id || expiry); size travels unsigned
    RESOURCE_SIZE_AND_EXPIRY   // HMAC(resource_id ":" size ":" expiry)
};

/**
 * CapabilityToken - Time-bound grant to stream one resource
 *
 * Carried in the query string of a stream link as
 * resource_id, size, token (hex HMAC-SHA256) and exp (Unix seconds).
 */
struct CapabilityToken {
    std::string resource_id;
    uint64_t size{0};
    uint64_t expires_at{0};
    std::string signature;

    bool is_expired(uint64_t now) const { return now > expires_at; }

    /**
     * Encode as "resource_id=..&size=..&token=..&exp=.." (identifier percent-encoded)
     */
    std::string to_query() const;

    /**
     * Build from already-decoded query parameters
     * @return nullopt when a field is missing or not a decimal number
     */
    static std::optional<CapabilityToken> from_params(
        const std::map<std::string, std::string>& params);

    /**
     * Parse a raw query string (with or without a leading URL and '?')
     */
    static std::optional<CapabilityToken> from_query(const std::string& query);
};

/**
 * TokenConfig - Signing parameters, process-wide
 */
struct TokenConfig {
    std::string secret;
    uint32_t ttl_seconds{constants::DEFAULT_TOKEN_TTL_SECONDS};
    SigningScheme scheme{SigningScheme::RESOURCE_SIZE_AND_EXPIRY};
};

/**
 * TokenCodec - Issues and verifies capability tokens
 *
 * Verification is a total function: expired, tampered or malformed
 * tokens all yield false. The signature comparison is constant time.
 */
class TokenCodec {
public:
    /**
     * @throws ConfigException if the secret is empty
     */
    explicit TokenCodec(TokenConfig config,
                        time::UnixClock clock = time::timestamp_seconds);

    /**
     * Mint a token expiring `ttl_seconds` from now
     */
    CapabilityToken mint(const std::string& resource_id, uint64_t size,
                         uint32_t ttl_seconds) const;

    /**
     * Mint and encode a token for a URL query string
     */
    std::string issue(const std::string& resource_id, uint64_t size,
                      uint32_t ttl_seconds) const;
    std::string issue(const std::string& resource_id, uint64_t size) const;

    bool verify(const std::string& resource_id, uint64_t size,
                uint64_t expires_at, const std::string& signature) const;
    bool verify(const CapabilityToken& token) const;

    uint32_t ttl_seconds() const { return config_.ttl_seconds; }
    SigningScheme scheme() const { return config_.scheme; }

private:
    std::string signing_payload(const std::string& resource_id, uint64_t size,
                                uint64_t expires_at) const;

    TokenConfig config_;
    time::UnixClock clock_;
};

const char* signing_scheme_to_string(SigningScheme scheme);

} // namespace rangegate::security
