#include "rangegate/gateway/stream_handler.hpp"
#include "security/capability_token.hpp"
#include "stream/admission.hpp"
#include "stream/chunk_assembler.hpp"
#include "stream/range_resolver.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace rangegate {
namespace gateway {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Quoted-string safe ASCII fallback for the filename parameter
std::string ascii_filename(const std::string& name) {
    std::string result;
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c >= 0x7f || c == '"' || c == '\\') {
            result += '_';
        } else {
            result += ch;
        }
    }
    return result;
}

std::string content_disposition(bool attachment, const std::optional<std::string>& name) {
    std::string value = attachment ? "attachment" : "inline";
    if (name && !name->empty()) {
        value += "; filename=\"" + ascii_filename(*name) + "\"";
        value += "; filename*=UTF-8''" + url_encode(*name);
    }
    return value;
}

} // anonymous namespace

const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::RECEIVED: return "RECEIVED";
        case StreamState::TOKEN_VERIFIED: return "TOKEN_VERIFIED";
        case StreamState::WINDOW_RESOLVED: return "WINDOW_RESOLVED";
        case StreamState::ADMITTED: return "ADMITTED";
        case StreamState::STREAMING: return "STREAMING";
        case StreamState::COMPLETED: return "COMPLETED";
        case StreamState::ABORTED: return "ABORTED";
        case StreamState::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// StreamBody
// ============================================================================

StreamBody::StreamBody(
    std::unique_ptr<stream::ChunkAssembler> assembler,
    stream::StreamSlot slot,
    uint64_t resource_size,
    FinishCallback on_finish
)
    : assembler_(std::move(assembler))
    , slot_(std::make_unique<stream::StreamSlot>(std::move(slot)))
    , resource_size_(resource_size)
    , on_finish_(std::move(on_finish))
{
}

StreamBody::~StreamBody() {
    if (!finished()) {
        abort("response discarded before completion");
    }
}

const stream::ByteWindow& StreamBody::window() const {
    return assembler_->window();
}

void StreamBody::finish(StreamState outcome) {
    if (finished()) {
        return;
    }
    state_ = outcome;
    assembler_->cancel();

    // Counters settle before the slot becomes visible as free
    if (on_finish_) {
        on_finish_(outcome, bytes_sent_);
    }
    slot_->release();
}

void StreamBody::abort(const std::string& reason) {
    if (finished()) {
        return;
    }
    RANGEGATE_LOG_WARN("Stream {} [{}-{}] aborted after {} of {} bytes: {}",
                       assembler_->resource_id(), window().start, window().end,
                       bytes_sent_, window().length(), reason);
    finish(StreamState::ABORTED);
}

bool StreamBody::pump(uint64_t offset, ChunkSink& sink) {
    if (finished()) {
        return false;
    }

    if (offset != assembler_->position()) {
        abort("transport asked for offset " + std::to_string(offset) +
              ", stream is at " + std::to_string(assembler_->position()));
        return false;
    }

    // Do not fetch bytes nobody will read
    if (!sink.writable()) {
        abort("client disconnected");
        return false;
    }

    auto next = assembler_->next();
    if (next.is_err()) {
        abort(next.error().to_string());
        return false;
    }

    auto& chunk = next.value();
    if (!chunk) {
        if (assembler_->complete()) {
            finish(StreamState::COMPLETED);
        } else {
            abort("assembler stopped early");
        }
        return false;
    }

    if (!sink.write(*chunk)) {
        abort("client disconnected");
        return false;
    }
    bytes_sent_ += chunk->size();

    if (assembler_->complete()) {
        RANGEGATE_LOG_INFO("Stream {} [{}-{}] completed: {} in {} fetches",
                           assembler_->resource_id(), window().start, window().end,
                           format_size(bytes_sent_), assembler_->fetch_count());
        finish(StreamState::COMPLETED);
    }
    return true;
}

bool StreamBody::drain(ChunkSink& sink) {
    while (!finished() && pump(assembler_->position(), sink)) {
    }
    return state_ == StreamState::COMPLETED;
}

void StreamBody::on_transfer_end(bool success) {
    if (finished()) {
        return;
    }
    if (success && assembler_->complete()) {
        finish(StreamState::COMPLETED);
    } else {
        abort(success ? "transport ended before the window was delivered"
                      : "transfer failed");
    }
}

// ============================================================================
// StreamHandler
// ============================================================================

StreamHandler::StreamHandler(
    const StreamHandlerConfig& config,
    const stream::AssemblerConfig& assembler_config,
    std::shared_ptr<security::TokenCodec> codec,
    std::shared_ptr<stream::AdmissionController> admission,
    std::shared_ptr<stream::ResourceFetcher> fetcher
)
    : config_(config)
    , assembler_config_(std::make_unique<stream::AssemblerConfig>(assembler_config))
    , codec_(std::move(codec))
    , admission_(std::move(admission))
    , fetcher_(std::move(fetcher))
    , stats_(std::make_shared<SharedStats>())
{
    assembler_config_->validate();
    if (!codec_ || !admission_ || !fetcher_) {
        throw std::invalid_argument("StreamHandler requires a codec, admission controller and fetcher");
    }
}

StreamHandler::~StreamHandler() = default;

std::optional<std::string> StreamHandler::mime_type_for(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> types = {
        {"mp4", "video/mp4"},
        {"m4v", "video/mp4"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"ts", "video/mp2t"},
        {"mp3", "audio/mpeg"},
        {"m4a", "audio/mp4"},
        {"ogg", "audio/ogg"},
        {"flac", "audio/flac"},
        {"wav", "audio/wav"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
    };

    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) {
        return std::nullopt;
    }
    auto it = types.find(to_lower(filename.substr(dot + 1)));
    if (it == types.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpResponse StreamHandler::reject(ErrorCode code, const std::string& resource_id, uint64_t size) {
    HttpResponse response;
    {
        std::lock_guard<std::mutex> lock(stats_->mutex);
        switch (code) {
            case ErrorCode::InvalidToken: stats_->stats.rejected_token++; break;
            case ErrorCode::RangeNotSatisfiable: stats_->stats.rejected_range++; break;
            case ErrorCode::ServerBusy: stats_->stats.rejected_busy++; break;
            default: break;
        }
    }

    switch (code) {
        case ErrorCode::InvalidToken:
            response.status = HttpStatus::FORBIDDEN;
            response.set_json_body(
                R"({"error": "invalid_or_expired_link", "message": "This link is invalid or has expired"})");
            break;
        case ErrorCode::RangeNotSatisfiable:
            response.status = HttpStatus::RANGE_NOT_SATISFIABLE;
            response.headers["Content-Range"] = stream::RangeResolver::unsatisfied_content_range(size);
            break;
        case ErrorCode::ServerBusy:
            response.status = HttpStatus::SERVICE_UNAVAILABLE;
            response.headers["Retry-After"] = std::to_string(config_.busy_retry_after_seconds);
            response.set_json_body(
                R"({"error": "server_busy", "message": "Too many active streams, try again shortly"})");
            break;
        default:
            response.status = HttpStatus::INTERNAL_ERROR;
            response.set_json_body(R"({"error": "internal_error"})");
            break;
    }

    RANGEGATE_LOG_INFO("Stream request for '{}' {}: {}",
                       resource_id, stream_state_to_string(StreamState::REJECTED),
                       error_code_to_string(code));
    return response;
}

HttpResponse StreamHandler::handle(const HttpRequest& request) {
    {
        std::lock_guard<std::mutex> lock(stats_->mutex);
        stats_->stats.total_requests++;
    }
    RANGEGATE_LOG_DEBUG("Stream request from {} {}", request.client_ip,
                        stream_state_to_string(StreamState::RECEIVED));

    // RECEIVED -> TOKEN_VERIFIED
    auto token = security::CapabilityToken::from_params(request.query_params);
    if (!token || !codec_->verify(*token)) {
        return reject(ErrorCode::InvalidToken,
                      request.param("resource_id").value_or(""), 0);
    }
    RANGEGATE_LOG_DEBUG("Stream {} {} (size {})", token->resource_id,
                        stream_state_to_string(StreamState::TOKEN_VERIFIED), token->size);

    // -> WINDOW_RESOLVED
    auto resolution = stream::RangeResolver::resolve(request.header("Range"), token->size);
    if (!resolution.satisfiable()) {
        return reject(ErrorCode::RangeNotSatisfiable, token->resource_id, token->size);
    }
    const auto window = *resolution.window;
    RANGEGATE_LOG_DEBUG("Stream {} {} [{}-{}]", token->resource_id,
                        stream_state_to_string(StreamState::WINDOW_RESOLVED),
                        window.start, window.end);

    // -> ADMITTED, decided before any byte is written
    auto slot = admission_->try_acquire();
    if (!slot) {
        return reject(ErrorCode::ServerBusy, token->resource_id, token->size);
    }
    RANGEGATE_LOG_DEBUG("Stream {} {} ({}/{} active)", token->resource_id,
                        stream_state_to_string(StreamState::ADMITTED),
                        admission_->active(), admission_->capacity());

    // -> STREAMING
    auto assembler = std::make_unique<stream::ChunkAssembler>(
        fetcher_, token->resource_id, window, *assembler_config_);

    auto name = request.param("name");
    bool attachment = request.param("dl").value_or("0") == "1";
    std::string content_type = config_.content_type;
    if (name) {
        content_type = mime_type_for(*name).value_or(content_type);
    }

    HttpResponse response;
    response.status = HttpStatus::PARTIAL_CONTENT;
    response.headers["Content-Range"] = window.content_range(token->size);
    response.headers["Accept-Ranges"] = "bytes";
    response.headers["Content-Length"] = std::to_string(window.length());
    response.headers["Content-Type"] = content_type;
    if (attachment || name) {
        response.headers["Content-Disposition"] = content_disposition(attachment, name);
    }

    std::weak_ptr<SharedStats> weak_stats = stats_;
    response.stream = std::make_shared<StreamBody>(
        std::move(assembler), std::move(slot), token->size,
        [weak_stats](StreamState outcome, uint64_t bytes_sent) {
            auto shared = weak_stats.lock();
            if (!shared) {
                return;
            }
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (outcome == StreamState::COMPLETED) {
                shared->stats.streams_completed++;
            } else {
                shared->stats.streams_aborted++;
            }
            shared->stats.bytes_sent += bytes_sent;
        });

    {
        std::lock_guard<std::mutex> lock(stats_->mutex);
        stats_->stats.streams_started++;
    }

    RANGEGATE_LOG_INFO("Streaming {} {} to {} ({})", token->resource_id,
                       window.content_range(token->size), request.client_ip,
                       format_size(window.length()));
    return response;
}

StreamHandler::Statistics StreamHandler::get_statistics() const {
    std::lock_guard<std::mutex> lock(stats_->mutex);
    return stats_->stats;
}

} // namespace gateway
} // namespace rangegate
