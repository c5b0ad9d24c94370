#pragma once

#include "rangegate/common.hpp"
#include "rangegate/error.hpp"
#include "rangegate/gateway/http_message.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rangegate {

// Forward declarations
namespace security { class TokenCodec; }
namespace stream {
    class AdmissionController;
    class ChunkAssembler;
    class ResourceFetcher;
    class StreamSlot;
    struct AssemblerConfig;
    struct ByteWindow;
}

namespace gateway {

/**
 * Lifecycle of one stream request
 */
enum class StreamState {
    RECEIVED,
    TOKEN_VERIFIED,
    WINDOW_RESOLVED,
    ADMITTED,
    STREAMING,
    COMPLETED,
    ABORTED,
    REJECTED
};

const char* stream_state_to_string(StreamState state);

/**
 * Destination of streamed chunks (the client connection)
 */
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    /**
     * False once the peer is gone; checked before each upstream fetch
     */
    virtual bool writable() const { return true; }

    /**
     * Hand one chunk to the client; false if the write failed
     */
    virtual bool write(const bytes& chunk) = 0;
};

/**
 * StreamBody - Body of a 206 response
 *
 * Owns the chunk assembler and the admission slot of one stream. The slot
 * is released exactly once, when the stream completes, aborts, or the
 * body is destroyed, whichever happens first.
 */
class StreamBody {
public:
    using FinishCallback = std::function<void(StreamState outcome, uint64_t bytes_sent)>;

    StreamBody(std::unique_ptr<stream::ChunkAssembler> assembler,
               stream::StreamSlot slot,
               uint64_t resource_size,
               FinishCallback on_finish);
    ~StreamBody();

    RANGEGATE_DISALLOW_COPY_AND_MOVE(StreamBody);

    /**
     * Fetch and write the next chunk
     * @param offset Absolute offset the transport expects next
     * @return true if a chunk was written and the stream may continue
     */
    bool pump(uint64_t offset, ChunkSink& sink);

    /**
     * Pump until the stream completes or aborts
     * @return true if the whole window was delivered
     */
    bool drain(ChunkSink& sink);

    /**
     * Stop streaming: no further fetches, slot released
     */
    void abort(const std::string& reason);

    /**
     * Transport finished with the body (success = all bytes written)
     */
    void on_transfer_end(bool success);

    const stream::ByteWindow& window() const;
    uint64_t resource_size() const { return resource_size_; }
    uint64_t bytes_sent() const { return bytes_sent_; }
    StreamState state() const { return state_; }
    bool finished() const { return state_ == StreamState::COMPLETED || state_ == StreamState::ABORTED; }

private:
    void finish(StreamState outcome);

    std::unique_ptr<stream::ChunkAssembler> assembler_;
    std::unique_ptr<stream::StreamSlot> slot_;
    uint64_t resource_size_;
    FinishCallback on_finish_;

    StreamState state_{StreamState::STREAMING};
    uint64_t bytes_sent_{0};
};

/**
 * Stream handler configuration
 */
struct StreamHandlerConfig {
    std::string content_type{"video/mp4"};
    uint32_t busy_retry_after_seconds{constants::BUSY_RETRY_AFTER_SECONDS};
};

/**
 * StreamHandler - Serves GET /stream
 *
 * RECEIVED -> TOKEN_VERIFIED -> WINDOW_RESOLVED -> ADMITTED -> STREAMING
 *
 * Every rejection (403 bad token, 416 range, 503 busy) is decided before
 * a body exists, so it maps onto a status code. Once STREAMING, failures
 * can only end the body early.
 *
 * Query: resource_id, size, token, exp; optional dl=1 (attachment) and
 * name (download filename, also selects the content type).
 */
class StreamHandler {
public:
    StreamHandler(const StreamHandlerConfig& config,
                  const stream::AssemblerConfig& assembler_config,
                  std::shared_ptr<security::TokenCodec> codec,
                  std::shared_ptr<stream::AdmissionController> admission,
                  std::shared_ptr<stream::ResourceFetcher> fetcher);
    ~StreamHandler();

    HttpResponse handle(const HttpRequest& request);

    struct Statistics {
        size_t total_requests{0};
        size_t rejected_token{0};
        size_t rejected_range{0};
        size_t rejected_busy{0};
        size_t streams_started{0};
        size_t streams_completed{0};
        size_t streams_aborted{0};
        uint64_t bytes_sent{0};
    };

    Statistics get_statistics() const;

    const stream::AdmissionController& admission() const { return *admission_; }

    /**
     * MIME type for a filename extension; nullopt when unknown
     */
    static std::optional<std::string> mime_type_for(const std::string& filename);

private:
    HttpResponse reject(ErrorCode code, const std::string& resource_id, uint64_t size);

    StreamHandlerConfig config_;
    std::unique_ptr<stream::AssemblerConfig> assembler_config_;
    std::shared_ptr<security::TokenCodec> codec_;
    std::shared_ptr<stream::AdmissionController> admission_;
    std::shared_ptr<stream::ResourceFetcher> fetcher_;

    // Shared with live StreamBody callbacks, which may outlive this handler
    struct SharedStats {
        std::mutex mutex;
        Statistics stats;
    };
    std::shared_ptr<SharedStats> stats_;
};

} // namespace gateway
} // namespace rangegate
