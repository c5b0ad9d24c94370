#include "chunk_assembler.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace rangegate::stream {

const char* limit_policy_to_string(LimitPolicy policy) {
    switch (policy) {
        case LimitPolicy::FULL_BLOCK: return "full_block";
        case LimitPolicy::CAPPED_TO_WINDOW: return "capped";
        default: return "unknown";
    }
}

std::optional<LimitPolicy> limit_policy_from_string(const std::string& name) {
    if (name == "full_block") return LimitPolicy::FULL_BLOCK;
    if (name == "capped") return LimitPolicy::CAPPED_TO_WINDOW;
    return std::nullopt;
}

void AssemblerConfig::validate() const {
    if (alignment == 0) {
        throw ConfigException("alignment must be positive");
    }
    if (block_size == 0) {
        throw ConfigException("block_size must be positive");
    }
    if (block_size % alignment != 0) {
        throw ConfigException("block_size " + std::to_string(block_size) +
                              " is not a multiple of alignment " +
                              std::to_string(alignment));
    }
}

ChunkAssembler::ChunkAssembler(
    std::shared_ptr<ResourceFetcher> fetcher,
    std::string resource_id,
    ByteWindow window,
    AssemblerConfig config
)
    : fetcher_(std::move(fetcher))
    , resource_id_(std::move(resource_id))
    , window_(window)
    , config_(config)
{
    config_.validate();
    if (window_.end < window_.start) {
        throw std::invalid_argument("window end precedes start");
    }

    cursor_ = window_.start - (window_.start % config_.alignment);
    remaining_skip_ = window_.start - cursor_;

    RANGEGATE_LOG_DEBUG("Assembling {} [{}-{}]: first fetch at {}, skipping {} bytes",
                        resource_id_, window_.start, window_.end, cursor_, remaining_skip_);
}

void ChunkAssembler::cancel() {
    if (!done_) {
        RANGEGATE_LOG_DEBUG("Assembly of {} cancelled at offset {} ({}/{} bytes)",
                            resource_id_, position(), delivered_, window_.length());
    }
    done_ = true;
}

Result<bytes> ChunkAssembler::fetch_block(uint64_t limit) {
    if (cursor_ % config_.alignment != 0) {
        RANGEGATE_LOG_DEBUG("Fetching {} at unaligned offset {} after a short read",
                            resource_id_, cursor_);
    }

    fetch_count_++;
    auto result = fetcher_->fetch(resource_id_, cursor_, limit);
    if (result.is_ok() || !config_.retry_failed_fetch) {
        return result;
    }

    // Missing resources and rejected offsets will not improve on retry
    auto code = result.error().code();
    if (code == ErrorCode::ResourceNotFound || code == ErrorCode::UpstreamMisaligned) {
        return result;
    }

    RANGEGATE_LOG_WARN("Fetch of {} at offset {} failed, retrying once: {}",
                       resource_id_, cursor_, result.error().to_string());
    fetch_count_++;
    return fetcher_->fetch(resource_id_, cursor_, limit);
}

Result<std::optional<bytes>> ChunkAssembler::next() {
    using Next = Result<std::optional<bytes>>;

    while (!done_ && cursor_ <= window_.end) {
        uint64_t limit = config_.block_size;
        if (config_.limit_policy == LimitPolicy::CAPPED_TO_WINDOW) {
            limit = std::min(limit, window_.end - cursor_ + 1);
        }

        auto fetched = fetch_block(limit);
        if (fetched.is_err()) {
            done_ = true;
            RANGEGATE_LOG_ERROR("Upstream fetch of {} at offset {} failed: {}",
                                resource_id_, cursor_, fetched.error().to_string());
            return Next::Err(fetched.error());
        }

        bytes raw = std::move(fetched.value());
        const uint64_t raw_length = raw.size();

        if (raw_length == 0) {
            done_ = true;
            if (complete()) {
                return Next::Ok(std::nullopt);
            }
            RANGEGATE_LOG_WARN("Upstream exhausted for {} at offset {}: {} of {} bytes delivered",
                               resource_id_, cursor_, delivered_, window_.length());
            return Next::Err(Error(ErrorCode::UpstreamExhausted,
                                   "upstream returned no data before the window was filled",
                                   resource_id_ + " @" + std::to_string(cursor_)));
        }

        uint64_t begin = 0;
        if (remaining_skip_ > 0) {
            begin = std::min(remaining_skip_, raw_length);
            remaining_skip_ -= begin;
            if (begin == raw_length) {
                cursor_ += raw_length;
                continue;
            }
        }

        // raw[begin] sits at absolute offset cursor_ + begin
        uint64_t wanted = window_.end - (cursor_ + begin) + 1;
        uint64_t take = std::min(raw_length - begin, wanted);

        cursor_ += raw_length;
        delivered_ += take;
        if (cursor_ > window_.end || complete()) {
            done_ = true;
        }

        if (begin == 0 && take == raw_length) {
            return Next::Ok(std::move(raw));
        }
        return Next::Ok(bytes(raw.begin() + begin, raw.begin() + begin + take));
    }

    done_ = true;
    return Next::Ok(std::nullopt);
}

} // namespace rangegate::stream
