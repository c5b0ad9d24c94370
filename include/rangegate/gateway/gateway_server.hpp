#pragma once

#include "rangegate/common.hpp"
#include "rangegate/gateway/http_message.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rangegate {
namespace gateway {

class StreamHandler;

/**
 * Gateway server configuration
 */
struct GatewayConfig {
    std::string bind_address{"0.0.0.0"};
    uint16_t http_port{constants::DEFAULT_PORT};   // 0 binds an ephemeral port
    size_t worker_threads{constants::DEFAULT_WORKER_THREADS};

    bool enable_tls{false};
    std::string tls_cert_path;
    std::string tls_key_path;

    // CORS settings
    bool enable_cors{true};
    std::string cors_origin{"*"};
};

/**
 * Main gateway server
 *
 * HTTP front of the streaming gateway:
 *
 *   GET /stream       signed, ranged resource stream (StreamHandler)
 *   GET /health       liveness and current stream load
 *   GET /api/status   request and stream counters
 *
 * Each request runs on one worker of the server's thread pool; a stream
 * occupies its worker until the body completes or the client goes away.
 */
class GatewayServer {
public:
    GatewayServer(const GatewayConfig& config, std::shared_ptr<StreamHandler> stream_handler);
    ~GatewayServer();

    RANGEGATE_DISALLOW_COPY_AND_MOVE(GatewayServer);

    /**
     * Bind and start serving in a background thread
     * @return false if the address could not be bound
     */
    bool start();

    void stop();

    bool is_running() const { return running_; }

    /**
     * Bound port (the ephemeral one when configured with port 0)
     */
    uint16_t port() const { return port_; }

    struct Statistics {
        size_t total_requests{0};
        size_t failed_requests{0};
        std::chrono::steady_clock::time_point started_at;
    };

    Statistics get_statistics() const;

private:
    void setup_http_routes();

    HttpResponse handle_health(const HttpRequest& req);
    HttpResponse handle_status(const HttpRequest& req);

    /**
     * Run a route, turning escaped exceptions into 500
     */
    template<typename Fn>
    HttpResponse dispatch(const HttpRequest& request, Fn&& fn);

    void apply_cors_headers(HttpResponse& response) const;

    GatewayConfig config_;
    std::shared_ptr<StreamHandler> stream_handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> listening_done_{false};
    uint16_t port_{0};
    std::thread server_thread_;

    // HTTP server (forward declared, defined in cpp)
    class HttpServerImpl;
    std::unique_ptr<HttpServerImpl> http_server_;

    mutable std::mutex stats_mutex_;
    Statistics stats_;
};

} // namespace gateway
} // namespace rangegate
