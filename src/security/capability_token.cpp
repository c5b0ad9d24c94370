#include "capability_token.hpp"
#include "crypto/hmac.hpp"
#include "rangegate/error.hpp"
#include "utils/logger.hpp"
#include <sstream>

namespace rangegate::security {

namespace {

std::optional<std::map<std::string, std::string>> split_query(const std::string& query) {
    std::map<std::string, std::string> params;

    auto start = query.find('?');
    start = (start == std::string::npos) ? 0 : start + 1;

    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }

        auto pair = query.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            auto key = url_decode(pair.substr(0, eq));
            auto value = url_decode(eq == std::string::npos ? "" : pair.substr(eq + 1));
            if (!key || !value) {
                return std::nullopt;
            }
            params.emplace(*key, *value);
        }
        start = end + 1;
    }
    return params;
}

} // anonymous namespace

const char* signing_scheme_to_string(SigningScheme scheme) {
    switch (scheme) {
        case SigningScheme::RESOURCE_AND_EXPIRY: return "resource+expiry";
        case SigningScheme::RESOURCE_SIZE_AND_EXPIRY: return "resource+size+expiry";
        default: return "unknown";
    }
}

std::string CapabilityToken::to_query() const {
    std::ostringstream oss;
    oss << "resource_id=" << url_encode(resource_id)
        << "&size=" << size
        << "&token=" << signature
        << "&exp=" << expires_at;
    return oss.str();
}

std::optional<CapabilityToken> CapabilityToken::from_params(
    const std::map<std::string, std::string>& params
) {
    auto id_it = params.find("resource_id");
    auto size_it = params.find("size");
    auto token_it = params.find("token");
    auto exp_it = params.find("exp");
    if (id_it == params.end() || size_it == params.end() ||
        token_it == params.end() || exp_it == params.end()) {
        return std::nullopt;
    }

    auto size = parse_u64(size_it->second);
    auto expires_at = parse_u64(exp_it->second);
    if (!size || !expires_at || id_it->second.empty()) {
        return std::nullopt;
    }

    CapabilityToken token;
    token.resource_id = id_it->second;
    token.size = *size;
    token.expires_at = *expires_at;
    token.signature = token_it->second;
    return token;
}

std::optional<CapabilityToken> CapabilityToken::from_query(const std::string& query) {
    auto params = split_query(query);
    if (!params) {
        return std::nullopt;
    }
    return from_params(*params);
}

TokenCodec::TokenCodec(TokenConfig config, time::UnixClock clock)
    : config_(std::move(config))
    , clock_(std::move(clock))
{
    if (config_.secret.empty()) {
        throw ConfigException("token signing secret must not be empty");
    }
    if (config_.secret.size() < constants::MIN_SECRET_SIZE) {
        RANGEGATE_LOG_WARN("Token secret is only {} bytes; use at least {}",
                           config_.secret.size(), constants::MIN_SECRET_SIZE);
    }
    if (config_.scheme == SigningScheme::RESOURCE_AND_EXPIRY) {
        RANGEGATE_LOG_WARN("Token signatures do not cover the resource size; "
                           "clients can alter the size parameter");
    }
}

std::string TokenCodec::signing_payload(
    const std::string& resource_id,
    uint64_t size,
    uint64_t expires_at
) const {
    if (config_.scheme == SigningScheme::RESOURCE_AND_EXPIRY) {
        return resource_id + std::to_string(expires_at);
    }
    return resource_id + ":" + std::to_string(size) + ":" + std::to_string(expires_at);
}

CapabilityToken TokenCodec::mint(
    const std::string& resource_id,
    uint64_t size,
    uint32_t ttl_seconds
) const {
    CapabilityToken token;
    token.resource_id = resource_id;
    token.size = size;
    token.expires_at = clock_() + ttl_seconds;

    auto mac = crypto::HmacSha256::compute(
        config_.secret, signing_payload(resource_id, size, token.expires_at));
    token.signature = crypto::HmacSha256::to_hex(mac);
    return token;
}

std::string TokenCodec::issue(
    const std::string& resource_id,
    uint64_t size,
    uint32_t ttl_seconds
) const {
    return mint(resource_id, size, ttl_seconds).to_query();
}

std::string TokenCodec::issue(const std::string& resource_id, uint64_t size) const {
    return issue(resource_id, size, config_.ttl_seconds);
}

bool TokenCodec::verify(
    const std::string& resource_id,
    uint64_t size,
    uint64_t expires_at,
    const std::string& signature
) const {
    if (clock_() > expires_at) {
        return false;
    }

    auto presented = crypto::HmacSha256::from_hex(signature);
    if (!presented) {
        return false;
    }

    auto expected = crypto::HmacSha256::compute(
        config_.secret, signing_payload(resource_id, size, expires_at));
    return crypto::HmacSha256::equal(expected, *presented);
}

bool TokenCodec::verify(const CapabilityToken& token) const {
    return verify(token.resource_id, token.size, token.expires_at, token.signature);
}

} // namespace rangegate::security
