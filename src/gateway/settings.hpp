#pragma once

#include "rangegate/gateway/gateway_server.hpp"
#include "rangegate/gateway/stream_handler.hpp"
#include "network/http_fetcher.hpp"
#include "security/capability_token.hpp"
#include "storage/blob_store.hpp"
#include "stream/chunk_assembler.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <memory>
#include <string>

namespace rangegate::gateway {

/**
 * Where blocks come from
 */
enum class UpstreamKind {
    DIRECTORY,   // storage::BlobStore
    HTTP         // network::HttpBlockFetcher
};

/**
 * Settings - Typed view of the configuration document
 *
 * Every component config is filled from the flat JSON keys, with the
 * compiled-in defaults for absent keys.
 */
struct Settings {
    utils::LogConfig log;

    GatewayConfig gateway;
    std::string base_url{"http://localhost:8000"};

    security::TokenConfig token;
    bool secret_generated{false};   // no secret configured; links die with the process

    size_t max_concurrent_streams{constants::DEFAULT_MAX_CONCURRENT_STREAMS};
    stream::AssemblerConfig assembler;
    StreamHandlerConfig handler;

    UpstreamKind upstream{UpstreamKind::DIRECTORY};
    storage::BlobStoreConfig blob_store;
    network::HttpFetcherConfig http_fetcher;

    /**
     * @throws ConfigException on out-of-range or inconsistent values
     */
    static Settings from_config(const utils::Config& config);
};

/**
 * Build the block source selected by `upstream`
 */
std::shared_ptr<stream::ResourceFetcher> make_fetcher(const Settings& settings);

} // namespace rangegate::gateway
