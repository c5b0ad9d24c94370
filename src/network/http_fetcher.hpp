#pragma once

#include "rangegate/common.hpp"
#include "stream/resource_fetcher.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace rangegate::network {

/**
 * Remote block source configuration
 */
struct HttpFetcherConfig {
    std::string base_url;                    // "http://host:port" or "https://host:port"
    std::string path{"/blocks"};
    std::chrono::seconds timeout{constants::DEFAULT_UPSTREAM_TIMEOUT_SECONDS};
};

/**
 * Block source reached over HTTP
 *
 *   GET  <path>?id=<id>&offset=<o>&limit=<l>  -> 200 with up to <l> bytes
 *   HEAD <path>?id=<id>                       -> Content-Length = resource size
 *
 * 404 maps to ResourceNotFound, 400 to UpstreamMisaligned, and any other
 * status, connect failure or timeout to UpstreamTransientError. Connect
 * and read timeouts bound every call, so a stalled upstream fails the
 * fetch instead of holding the stream open.
 */
class HttpBlockFetcher : public stream::ResourceFetcher {
public:
    explicit HttpBlockFetcher(HttpFetcherConfig config);

    Result<bytes> fetch(const std::string& resource_id,
                        uint64_t offset,
                        uint64_t limit) override;

    std::optional<uint64_t> resource_size(const std::string& resource_id) override;

    const HttpFetcherConfig& config() const { return config_; }

private:
    HttpFetcherConfig config_;
};

} // namespace rangegate::network
