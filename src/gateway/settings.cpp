#include "settings.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"

#include <limits>

namespace rangegate::gateway {

namespace {

// Integer keys arrive as JSON numbers; negative or oversized ones are rejected
template<typename T>
T get_unsigned(const utils::Config& config, const std::string& key, T default_value) {
    if (!config.has(key)) {
        return default_value;
    }
    auto value = config.get<int64_t>(key);
    if (!value || *value < 0 ||
        static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
        throw ConfigException("'" + key + "' must be a non-negative integer");
    }
    return static_cast<T>(*value);
}

} // anonymous namespace

Settings Settings::from_config(const utils::Config& config) {
    Settings settings;

    // Logging
    auto& log = settings.log;
    log.level = config.get_or<std::string>("log_level", log.level);
    log.to_file = config.get_or<bool>("log_to_file", log.to_file);
    log.file_path = config.get_or<std::string>("log_file", log.file_path);
    log.max_file_size = get_unsigned<size_t>(config, "log_max_size", log.max_file_size);
    log.max_files = get_unsigned<size_t>(config, "log_max_files", log.max_files);
    if (!utils::Logger::parse_level(log.level)) {
        throw ConfigException("unknown 'log_level' '" + log.level +
                              "' (expected trace, debug, info, warn, error, critical or off)");
    }
    if (log.to_file && (log.file_path.empty() || log.max_file_size == 0 || log.max_files == 0)) {
        throw ConfigException("'log_to_file' requires 'log_file', 'log_max_size' and 'log_max_files'");
    }

    // Server
    auto& gw = settings.gateway;
    gw.bind_address = config.get_or<std::string>("bind_address", gw.bind_address);
    gw.http_port = get_unsigned<uint16_t>(config, "http_port", gw.http_port);
    gw.worker_threads = get_unsigned<size_t>(config, "worker_threads", gw.worker_threads);
    gw.enable_tls = config.get_or<bool>("enable_tls", gw.enable_tls);
    gw.tls_cert_path = config.get_or<std::string>("tls_cert_path", gw.tls_cert_path);
    gw.tls_key_path = config.get_or<std::string>("tls_key_path", gw.tls_key_path);
    gw.enable_cors = config.get_or<bool>("enable_cors", gw.enable_cors);
    gw.cors_origin = config.get_or<std::string>("cors_origin", gw.cors_origin);
    if (gw.worker_threads == 0) {
        throw ConfigException("'worker_threads' must be at least 1");
    }
    if (gw.enable_tls && (gw.tls_cert_path.empty() || gw.tls_key_path.empty())) {
        throw ConfigException("'enable_tls' requires 'tls_cert_path' and 'tls_key_path'");
    }
    settings.base_url = config.get_or<std::string>("base_url", settings.base_url);

    // Links
    settings.token.secret = config.get_or<std::string>("secret", "");
    if (settings.token.secret.empty()) {
        settings.token.secret = crypto::Random::generate_hex(32);
        settings.secret_generated = true;
    }
    settings.token.ttl_seconds = get_unsigned<uint32_t>(
        config, "token_ttl_seconds", settings.token.ttl_seconds);
    if (settings.token.ttl_seconds == 0) {
        throw ConfigException("'token_ttl_seconds' must be at least 1");
    }
    settings.token.scheme = config.get_or<bool>("token_bind_size", true)
        ? security::SigningScheme::RESOURCE_SIZE_AND_EXPIRY
        : security::SigningScheme::RESOURCE_AND_EXPIRY;

    // Streaming
    settings.max_concurrent_streams = get_unsigned<size_t>(
        config, "max_concurrent_streams", settings.max_concurrent_streams);
    if (settings.max_concurrent_streams == 0) {
        throw ConfigException("'max_concurrent_streams' must be at least 1");
    }

    auto& asm_cfg = settings.assembler;
    asm_cfg.alignment = get_unsigned<uint64_t>(config, "alignment", asm_cfg.alignment);
    asm_cfg.block_size = get_unsigned<uint64_t>(config, "block_size", asm_cfg.block_size);
    asm_cfg.retry_failed_fetch = config.get_or<bool>("retry_failed_fetch", asm_cfg.retry_failed_fetch);
    auto policy_name = config.get_or<std::string>("limit_policy", "full_block");
    auto policy = stream::limit_policy_from_string(policy_name);
    if (!policy) {
        throw ConfigException("unknown 'limit_policy' '" + policy_name +
                              "' (expected full_block or capped)");
    }
    asm_cfg.limit_policy = *policy;
    asm_cfg.validate();

    settings.handler.content_type = config.get_or<std::string>("content_type", settings.handler.content_type);

    // Upstream
    auto upstream = config.get_or<std::string>("upstream", "directory");
    if (upstream == "directory") {
        settings.upstream = UpstreamKind::DIRECTORY;
    } else if (upstream == "http") {
        settings.upstream = UpstreamKind::HTTP;
    } else {
        throw ConfigException("unknown 'upstream' '" + upstream + "' (expected directory or http)");
    }

    settings.blob_store.root = config.get_or<std::string>("blob_dir", "./blobs");
    settings.blob_store.alignment = asm_cfg.alignment;
    settings.blob_store.max_read = get_unsigned<uint64_t>(config, "max_read", asm_cfg.block_size);
    if (settings.blob_store.max_read == 0) {
        throw ConfigException("'max_read' must be at least 1");
    }
    // A capped read must end on a boundary the store accepts as the next offset
    if (settings.blob_store.max_read % asm_cfg.alignment != 0) {
        throw ConfigException("'max_read' (" + std::to_string(settings.blob_store.max_read) +
                              ") must be a multiple of 'alignment' (" +
                              std::to_string(asm_cfg.alignment) + ")");
    }

    settings.http_fetcher.base_url = config.get_or<std::string>("upstream_url", "");
    settings.http_fetcher.path = config.get_or<std::string>("upstream_path", settings.http_fetcher.path);
    settings.http_fetcher.timeout = std::chrono::seconds(get_unsigned<uint32_t>(
        config, "upstream_timeout_seconds", constants::DEFAULT_UPSTREAM_TIMEOUT_SECONDS));
    if (settings.upstream == UpstreamKind::HTTP && settings.http_fetcher.base_url.empty()) {
        throw ConfigException("'upstream' http requires 'upstream_url'");
    }

    return settings;
}

std::shared_ptr<stream::ResourceFetcher> make_fetcher(const Settings& settings) {
    switch (settings.upstream) {
        case UpstreamKind::HTTP:
            return std::make_shared<network::HttpBlockFetcher>(settings.http_fetcher);
        case UpstreamKind::DIRECTORY:
        default:
            return std::make_shared<storage::BlobStore>(settings.blob_store);
    }
}

} // namespace rangegate::gateway
