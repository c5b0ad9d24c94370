#include "http_fetcher.hpp"
#include "utils/logger.hpp"

#include <httplib.h>

#include <memory>

namespace rangegate::network {

namespace {

// One client per call: httplib::Client serializes requests on a single
// connection, and streams must not queue behind each other.
std::unique_ptr<httplib::Client> make_client(const HttpFetcherConfig& config) {
    auto client = std::make_unique<httplib::Client>(config.base_url);
    client->set_connection_timeout(config.timeout);
    client->set_read_timeout(config.timeout);
    client->set_write_timeout(config.timeout);
    client->set_keep_alive(false);
    return client;
}

} // anonymous namespace

HttpBlockFetcher::HttpBlockFetcher(HttpFetcherConfig config)
    : config_(std::move(config))
{
    if (config_.base_url.empty()) {
        throw ConfigException("upstream_url is required for the http upstream");
    }
    RANGEGATE_LOG_INFO("Remote block source: {}{} (timeout {}s)",
                       config_.base_url, config_.path, config_.timeout.count());
}

Result<bytes> HttpBlockFetcher::fetch(
    const std::string& resource_id,
    uint64_t offset,
    uint64_t limit
) {
    auto client = make_client(config_);
    auto target = config_.path + "?id=" + url_encode(resource_id) +
                  "&offset=" + std::to_string(offset) +
                  "&limit=" + std::to_string(limit);

    auto res = client->Get(target);
    if (!res) {
        return Result<bytes>::Err(Error(ErrorCode::UpstreamTransientError,
                                        "upstream request failed",
                                        httplib::to_string(res.error())));
    }

    switch (res->status) {
        case 200:
            break;
        case 404:
            return Result<bytes>::Err(Error(ErrorCode::ResourceNotFound,
                                            "upstream has no such resource", resource_id));
        case 400:
            return Result<bytes>::Err(Error(ErrorCode::UpstreamMisaligned,
                                            "upstream rejected offset",
                                            std::to_string(offset)));
        default:
            return Result<bytes>::Err(Error(ErrorCode::UpstreamTransientError,
                                            "unexpected upstream status",
                                            std::to_string(res->status)));
    }

    if (res->body.size() > limit) {
        // Never trust upstream to honor the limit; surplus is dropped
        RANGEGATE_LOG_WARN("Upstream returned {} bytes for a {} byte limit",
                           res->body.size(), limit);
        res->body.resize(static_cast<size_t>(limit));
    }

    return Result<bytes>::Ok(bytes(res->body.begin(), res->body.end()));
}

std::optional<uint64_t> HttpBlockFetcher::resource_size(const std::string& resource_id) {
    auto client = make_client(config_);
    auto res = client->Head(config_.path + "?id=" + url_encode(resource_id));
    if (!res || res->status != 200 || !res->has_header("Content-Length")) {
        return std::nullopt;
    }
    return parse_u64(res->get_header_value("Content-Length"));
}

} // namespace rangegate::network
