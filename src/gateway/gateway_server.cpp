#include "rangegate/gateway/gateway_server.hpp"
#include "rangegate/gateway/stream_handler.hpp"
#include "stream/admission.hpp"
#include "utils/logger.hpp"

#include <httplib.h>

#include <algorithm>
#include <sstream>

namespace rangegate {
namespace gateway {

// Wrapper for httplib::Server to avoid exposing it in public header
class GatewayServer::HttpServerImpl {
public:
    std::unique_ptr<httplib::Server> server;
};

namespace {

/**
 * Chunk sink over the connection of one httplib content provider call
 */
class DataSinkAdapter : public ChunkSink {
public:
    explicit DataSinkAdapter(httplib::DataSink& sink) : sink_(sink) {}

    bool writable() const override {
        return !sink_.is_writable || sink_.is_writable();
    }

    bool write(const bytes& chunk) override {
        return sink_.write(reinterpret_cast<const char*>(chunk.data()), chunk.size());
    }

private:
    httplib::DataSink& sink_;
};

HttpRequest to_request(const httplib::Request& req) {
    HttpRequest request;
    request.method = req.method == "HEAD" ? HttpMethod::HEAD
                   : req.method == "OPTIONS" ? HttpMethod::OPTIONS
                   : HttpMethod::GET;
    request.path = req.path;
    request.client_ip = req.remote_addr;
    for (const auto& [key, value] : req.headers) {
        request.headers.emplace(key, value);
    }
    // httplib has already percent-decoded the query
    for (const auto& [key, value] : req.params) {
        request.query_params.emplace(key, value);
    }
    return request;
}

void write_plain_response(const HttpResponse& response, httplib::Response& res) {
    res.status = static_cast<int>(response.status);
    std::string content_type = "application/json";
    for (const auto& [key, value] : response.headers) {
        if (key == "Content-Type") {
            content_type = value;
        } else if (key != "Content-Length") {
            res.set_header(key, value);
        }
    }
    if (!response.body.empty()) {
        std::string body_str(response.body.begin(), response.body.end());
        res.set_content(body_str, content_type);
    }
}

/**
 * Take framing of /stream away from httplib
 *
 * httplib parses Range into req.ranges before routing and slices every
 * sized content provider by it, answering several ranges as multipart.
 * The stream handler resolves the raw header itself, so the parsed
 * ranges are dropped. The Request is httplib's own per-connection object;
 * routes only see it through a const reference.
 */
void drop_transport_ranges(const httplib::Request& req) {
    const_cast<httplib::Request&>(req).ranges.clear();
}

// httplib's own 416 for a Range header it could not parse, sent before routing
bool is_transport_range_rejection(const httplib::Request& req, const httplib::Response& res) {
    return res.status == 416 && !res.has_header("Content-Range") &&
           req.has_header("Range") && (req.method == "GET" || req.method == "HEAD");
}

/**
 * Hand a 206 body to httplib as a content provider spanning exactly the window
 */
void write_stream_response(const HttpResponse& response, httplib::Response& res) {
    auto body = response.stream;
    const uint64_t base = body->window().start;

    res.status = static_cast<int>(response.status);
    std::string content_type = "application/octet-stream";
    for (const auto& [key, value] : response.headers) {
        if (key == "Content-Type") {
            content_type = value;
        } else if (key != "Content-Length") {
            res.set_header(key, value);
        }
    }

    res.set_content_provider(
        static_cast<size_t>(body->window().length()),
        content_type,
        [body, base](size_t offset, size_t /* length */, httplib::DataSink& sink) {
            DataSinkAdapter adapter(sink);
            return body->pump(base + offset, adapter);
        },
        [body](bool success) {
            body->on_transfer_end(success);
        });
}

} // anonymous namespace

GatewayServer::GatewayServer(const GatewayConfig& config, std::shared_ptr<StreamHandler> stream_handler)
    : config_(config)
    , stream_handler_(std::move(stream_handler))
    , http_server_(std::make_unique<HttpServerImpl>())
{
    if (!stream_handler_) {
        throw std::invalid_argument("GatewayServer requires a stream handler");
    }

    if (config_.enable_tls) {
        http_server_->server = std::make_unique<httplib::SSLServer>(
            config_.tls_cert_path.c_str(), config_.tls_key_path.c_str());
        if (!http_server_->server->is_valid()) {
            throw ConfigException("cannot load TLS certificate '" + config_.tls_cert_path +
                                  "' or key '" + config_.tls_key_path + "'");
        }
    } else {
        http_server_->server = std::make_unique<httplib::Server>();
    }

    const size_t threads = std::max<size_t>(1, config_.worker_threads);
    http_server_->server->new_task_queue = [threads] {
        return new httplib::ThreadPool(threads);
    };

    stats_.started_at = std::chrono::steady_clock::now();
    setup_http_routes();
}

GatewayServer::~GatewayServer() {
    if (running_) {
        stop();
    }
}

bool GatewayServer::start() {
    if (running_) {
        RANGEGATE_LOG_WARN("Gateway server already running");
        return false;
    }

    auto& server = *http_server_->server;
    if (config_.http_port == 0) {
        int bound = server.bind_to_any_port(config_.bind_address);
        if (bound <= 0) {
            RANGEGATE_LOG_ERROR("Failed to bind to {}:<any>", config_.bind_address);
            return false;
        }
        port_ = static_cast<uint16_t>(bound);
    } else {
        if (!server.bind_to_port(config_.bind_address, config_.http_port)) {
            RANGEGATE_LOG_ERROR("Failed to bind to {}:{}", config_.bind_address, config_.http_port);
            return false;
        }
        port_ = config_.http_port;
    }

    running_ = true;
    listening_done_ = false;

    server_thread_ = std::thread([this]() {
        RANGEGATE_LOG_DEBUG("HTTP server thread starting");

        // This blocks until stop() is called
        if (!http_server_->server->listen_after_bind() && running_) {
            RANGEGATE_LOG_ERROR("HTTP server on port {} stopped unexpectedly", port_);
        }

        listening_done_ = true;
        RANGEGATE_LOG_DEBUG("HTTP server thread exiting");
    });

    // stop() is a no-op until the accept loop is live
    while (!server.is_running() && !listening_done_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    RANGEGATE_LOG_INFO("Gateway server listening on {}://{}:{} ({} workers)",
                       config_.enable_tls ? "https" : "http",
                       config_.bind_address, port_, config_.worker_threads);
    return true;
}

void GatewayServer::stop() {
    if (!running_) {
        return;
    }

    RANGEGATE_LOG_INFO("Stopping gateway server");
    running_ = false;

    // Unblocks listen_after_bind(); in-flight streams see their sockets close
    http_server_->server->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    RANGEGATE_LOG_INFO("Gateway server stopped");
}

template<typename Fn>
HttpResponse GatewayServer::dispatch(const HttpRequest& request, Fn&& fn) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_requests++;
    }

    try {
        auto response = fn(request);
        apply_cors_headers(response);
        return response;
    } catch (const std::exception& e) {
        RANGEGATE_LOG_ERROR("Handler error on {}: {}", request.path, e.what());
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.failed_requests++;
        }
        HttpResponse response;
        response.status = HttpStatus::INTERNAL_ERROR;
        response.set_json_body(R"({"error": "internal_error"})");
        apply_cors_headers(response);
        return response;
    }
}

void GatewayServer::setup_http_routes() {
    auto& server = *http_server_->server;

    auto serve_stream = [this](const httplib::Request& req, httplib::Response& res) {
        drop_transport_ranges(req);

        auto request = to_request(req);
        auto response = dispatch(request, [this](const HttpRequest& r) {
            return stream_handler_->handle(r);
        });

        if (response.stream) {
            write_stream_response(response, res);
        } else {
            write_plain_response(response, res);
        }
    };

    // GET /stream - signed ranged stream
    server.Get("/stream", serve_stream);

    // OPTIONS /stream - CORS preflight for players on other origins
    server.Options("/stream", [this](const httplib::Request&, httplib::Response& res) {
        HttpResponse response;
        response.status = HttpStatus::NO_CONTENT;
        apply_cors_headers(response);
        write_plain_response(response, res);
    });

    // GET /health - liveness
    server.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        auto request = to_request(req);
        write_plain_response(dispatch(request, [this](const HttpRequest& r) {
            return handle_health(r);
        }), res);
    });

    // GET /api/status - counters
    server.Get("/api/status", [this](const httplib::Request& req, httplib::Response& res) {
        auto request = to_request(req);
        write_plain_response(dispatch(request, [this](const HttpRequest& r) {
            return handle_status(r);
        }), res);
    });

    server.set_error_handler([serve_stream](const httplib::Request& req, httplib::Response& res) {
        // The token is checked before the Range header is judged, and an
        // unparseable header means the whole resource
        if (req.path == "/stream" && is_transport_range_rejection(req, res)) {
            serve_stream(req, res);
            return;
        }
        // Only fill in a body where no handler wrote one
        if (res.status == 404 && res.body.empty()) {
            res.set_content(R"({"error": "not_found"})", "application/json");
        }
    });

    RANGEGATE_LOG_DEBUG("HTTP routes configured");
}

HttpResponse GatewayServer::handle_health(const HttpRequest& /* req */) {
    const auto& admission = stream_handler_->admission();

    std::stringstream json;
    json << "{";
    json << R"("status": "ok",)";
    json << R"("active_streams": )" << admission.active() << ",";
    json << R"("capacity": )" << admission.capacity();
    json << "}";

    HttpResponse response;
    response.set_json_body(json.str());
    return response;
}

HttpResponse GatewayServer::handle_status(const HttpRequest& /* req */) {
    auto stats = get_statistics();
    auto streams = stream_handler_->get_statistics();
    auto admission = stream_handler_->admission().get_statistics();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - stats.started_at);

    std::stringstream json;
    json << "{";
    json << R"("service": "rangegate",)";
    json << R"("version": ")" << RANGEGATE_VERSION_STRING << R"(",)";
    json << R"("uptime_seconds": )" << uptime.count() << ",";
    json << R"("total_requests": )" << stats.total_requests << ",";
    json << R"("failed_requests": )" << stats.failed_requests << ",";
    json << R"("stream_requests": )" << streams.total_requests << ",";
    json << R"("streams_started": )" << streams.streams_started << ",";
    json << R"("streams_completed": )" << streams.streams_completed << ",";
    json << R"("streams_aborted": )" << streams.streams_aborted << ",";
    json << R"("rejected_token": )" << streams.rejected_token << ",";
    json << R"("rejected_range": )" << streams.rejected_range << ",";
    json << R"("rejected_busy": )" << streams.rejected_busy << ",";
    json << R"("bytes_sent": )" << streams.bytes_sent << ",";
    json << R"("active_streams": )" << stream_handler_->admission().active() << ",";
    json << R"("peak_streams": )" << admission.peak_active << ",";
    json << R"("capacity": )" << stream_handler_->admission().capacity();
    json << "}";

    HttpResponse response;
    response.set_json_body(json.str());
    return response;
}

void GatewayServer::apply_cors_headers(HttpResponse& response) const {
    if (config_.enable_cors) {
        response.headers["Access-Control-Allow-Origin"] = config_.cors_origin;
        response.headers["Access-Control-Allow-Methods"] = "GET, HEAD, OPTIONS";
        response.headers["Access-Control-Allow-Headers"] = "Range";
        response.headers["Access-Control-Expose-Headers"] =
            "Content-Range, Content-Length, Accept-Ranges, Retry-After";
        response.headers["Access-Control-Max-Age"] = "86400";
    }
}

GatewayServer::Statistics GatewayServer::get_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace gateway
} // namespace rangegate
