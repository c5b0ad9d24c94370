#pragma once

#include "rangegate/common.hpp"
#include "rangegate/error.hpp"
#include "stream/range_resolver.hpp"
#include "stream/resource_fetcher.hpp"
#include <memory>
#include <optional>
#include <string>

namespace rangegate::stream {

/**
 * LimitPolicy - How much to ask the upstream for on each fetch
 */
enum class LimitPolicy {
    FULL_BLOCK,         // always block_size; excess is trimmed locally
    CAPPED_TO_WINDOW    // min(block_size, bytes left in the window)
};

/**
 * AssemblerConfig - Upstream block protocol parameters
 */
struct AssemblerConfig {
    uint64_t alignment{constants::DEFAULT_ALIGNMENT};
    uint64_t block_size{constants::DEFAULT_BLOCK_SIZE};
    LimitPolicy limit_policy{LimitPolicy::FULL_BLOCK};
    bool retry_failed_fetch{true};   // one retry per failed fetch, never per window

    /**
     * @throws ConfigException on zero alignment, zero block size, or a
     *         block size that is not a multiple of the alignment
     */
    void validate() const;
};

/**
 * ChunkAssembler - Produces exactly the bytes of a window from aligned fetches
 *
 * The first fetch starts at the window start rounded down to the
 * alignment; the excess head of the first block(s) is skipped and the
 * tail of the last block is trimmed. The cursor advances by the raw
 * number of bytes each fetch returned, so a short read is followed by
 * another fetch at the advanced offset.
 *
 * Pull-based: every call to next() performs at most one logical fetch
 * (plus one retry), so a consumer that stops calling stops all upstream
 * traffic for the stream.
 */
class ChunkAssembler {
public:
    ChunkAssembler(std::shared_ptr<ResourceFetcher> fetcher,
                   std::string resource_id,
                   ByteWindow window,
                   AssemblerConfig config);

    /**
     * Next chunk of the window
     * @return a non-empty chunk; nullopt once the window is complete; or
     *         an error (UpstreamExhausted, UpstreamTransientError, ...)
     *         after which the assembler is finished
     */
    Result<std::optional<bytes>> next();

    /**
     * Stop without further fetches (client went away)
     */
    void cancel();

    bool finished() const { return done_; }
    bool complete() const { return delivered_ == window_.length(); }

    const std::string& resource_id() const { return resource_id_; }
    const ByteWindow& window() const { return window_; }

    // Absolute offset of the next byte to be yielded
    uint64_t position() const { return window_.start + delivered_; }

    uint64_t delivered() const { return delivered_; }
    uint64_t remaining() const { return window_.length() - delivered_; }
    size_t fetch_count() const { return fetch_count_; }

private:
    Result<bytes> fetch_block(uint64_t limit);

    std::shared_ptr<ResourceFetcher> fetcher_;
    std::string resource_id_;
    ByteWindow window_;
    AssemblerConfig config_;

    // Fetch cursor, in raw upstream offsets
    uint64_t cursor_;
    uint64_t remaining_skip_;

    uint64_t delivered_{0};
    size_t fetch_count_{0};
    bool done_{false};
};

const char* limit_policy_to_string(LimitPolicy policy);
std::optional<LimitPolicy> limit_policy_from_string(const std::string& name);

} // namespace rangegate::stream
