#include <iostream>
#include <memory>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <optional>
#include <string>
#include <thread>

// Gateway
#include "rangegate/gateway/gateway_server.hpp"
#include "rangegate/gateway/link_issuer.hpp"
#include "rangegate/gateway/stream_handler.hpp"
#include "gateway/settings.hpp"

// Streaming
#include "security/capability_token.hpp"
#include "stream/admission.hpp"

// Utilities
#include "rangegate/time_utils.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "rangegate/common.hpp"

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [config]                         serve (default config: rangegate.conf)\n"
              << "  " << program << " issue <config> <resource_id> [size]  print a signed stream link\n";
}

rangegate::utils::Config load_config(const std::string& config_path) {
    // Missing file means defaults; a present but broken one is fatal
    rangegate::utils::Config config;
    if (std::filesystem::exists(config_path)) {
        config = rangegate::utils::Config::load_from_file(config_path);
    }
    config.apply_env_override("secret", "RANGEGATE_SECRET");
    return config;
}

int run_issue(const std::string& config_path, const std::string& resource_id,
              const std::optional<std::string>& size_arg) {
    auto settings = rangegate::gateway::Settings::from_config(load_config(config_path));
    rangegate::utils::LogConfig quiet;
    quiet.level = "warn";
    rangegate::utils::Logger::init(quiet);

    if (settings.secret_generated) {
        std::cerr << "No secret configured (set 'secret' or RANGEGATE_SECRET); "
                  << "a link signed with a throwaway secret would never verify\n";
        return 1;
    }

    auto codec = std::make_shared<rangegate::security::TokenCodec>(settings.token);
    rangegate::gateway::LinkIssuer issuer(settings.base_url, codec);

    if (size_arg) {
        auto size = rangegate::parse_u64(*size_arg);
        if (!size) {
            std::cerr << "Invalid size '" << *size_arg << "'\n";
            return 1;
        }
        std::cout << issuer.issue_link(resource_id, *size) << std::endl;
        return 0;
    }

    auto fetcher = rangegate::gateway::make_fetcher(settings);
    auto link = issuer.issue_link(resource_id, *fetcher);
    if (link.is_err()) {
        std::cerr << link.error().to_string() << "\n";
        return 1;
    }
    std::cout << link.value() << std::endl;
    return 0;
}

int run_server(const std::string& config_path) {
    auto config = load_config(config_path);
    auto settings = rangegate::gateway::Settings::from_config(config);

    // Initialize logging
    rangegate::utils::Logger::init(settings.log);

    RANGEGATE_LOG_INFO("=================================================");
    RANGEGATE_LOG_INFO("    Rangegate Streaming Gateway v{}.{}.{}",
        RANGEGATE_VERSION_MAJOR,
        RANGEGATE_VERSION_MINOR,
        RANGEGATE_VERSION_PATCH
    );
    RANGEGATE_LOG_INFO("=================================================");

    if (!std::filesystem::exists(config_path)) {
        RANGEGATE_LOG_WARN("Config file '{}' not found, using defaults", config_path);
    }
    if (settings.secret_generated) {
        RANGEGATE_LOG_WARN("No secret configured; generated one for this process only");
        RANGEGATE_LOG_WARN("Links issued elsewhere will not verify and all links die on restart");
    }

    // ========================================================================
    // INITIALIZE COMPONENTS
    // ========================================================================

    // 1. Block source
    RANGEGATE_LOG_INFO("Initializing block source...");
    auto fetcher = rangegate::gateway::make_fetcher(settings);

    // 2. Link signing
    auto codec = std::make_shared<rangegate::security::TokenCodec>(settings.token);
    RANGEGATE_LOG_INFO("Link signing: {} scheme, {}s TTL",
        rangegate::security::signing_scheme_to_string(codec->scheme()),
        codec->ttl_seconds());

    // 3. Admission
    auto admission = std::make_shared<rangegate::stream::AdmissionController>(
        settings.max_concurrent_streams);

    // 4. Stream handler
    auto handler = std::make_shared<rangegate::gateway::StreamHandler>(
        settings.handler, settings.assembler, codec, admission, fetcher);
    RANGEGATE_LOG_INFO("Upstream blocks: alignment {}, block {}, limit policy {}",
        settings.assembler.alignment,
        rangegate::format_size(settings.assembler.block_size),
        rangegate::stream::limit_policy_to_string(settings.assembler.limit_policy));

    // 5. Gateway server
    auto gateway = std::make_shared<rangegate::gateway::GatewayServer>(settings.gateway, handler);

    // ========================================================================
    // START SERVICES
    // ========================================================================

    if (!gateway->start()) {
        RANGEGATE_LOG_ERROR("Failed to start gateway server");
        return 1;
    }

    rangegate::time::Timer uptime;

    RANGEGATE_LOG_INFO("");
    RANGEGATE_LOG_INFO(" Rangegate is running! (since {})",
        rangegate::time::to_string(rangegate::time::now()));
    RANGEGATE_LOG_INFO("");
    RANGEGATE_LOG_INFO("  Streams:    {}/stream", settings.base_url);
    RANGEGATE_LOG_INFO("  Health:     {}/health", settings.base_url);
    RANGEGATE_LOG_INFO("  Capacity:   {} concurrent streams", admission->capacity());
    RANGEGATE_LOG_INFO("");
    RANGEGATE_LOG_INFO("Press Ctrl+C to shutdown");
    RANGEGATE_LOG_INFO("");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // ========================================================================
    // GRACEFUL SHUTDOWN
    // ========================================================================

    RANGEGATE_LOG_INFO("Shutting down...");
    gateway->stop();

    auto stats = handler->get_statistics();
    RANGEGATE_LOG_INFO("Served {} streams ({} completed, {} aborted), {}",
        stats.streams_started, stats.streams_completed, stats.streams_aborted,
        rangegate::format_size(stats.bytes_sent));
    RANGEGATE_LOG_INFO("Gateway stopped after {:.0f}s. Goodbye!", uptime.elapsed_seconds());
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        // Install signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (argc > 1 && std::string(argv[1]) == "issue") {
            if (argc < 4 || argc > 5) {
                print_usage(argv[0]);
                return 2;
            }
            std::optional<std::string> size_arg;
            if (argc == 5) {
                size_arg = argv[4];
            }
            return run_issue(argv[2], argv[3], size_arg);
        }

        if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" ||
                                       std::string(argv[1]) == "--help"))) {
            print_usage(argv[0]);
            return argc > 2 ? 2 : 0;
        }

        // Determine config file path
        std::string config_path = "rangegate.conf";
        if (argc > 1) {
            config_path = argv[1];
        }
        return run_server(config_path);

    } catch (const rangegate::ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        RANGEGATE_LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
