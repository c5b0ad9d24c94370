#pragma once

#include "rangegate/common.hpp"
#include "rangegate/error.hpp"
#include <optional>
#include <string>

namespace rangegate::stream {

/**
 * ResourceFetcher - Upstream block source
 *
 * Contract of fetch():
 * - `offset` must be a multiple of the upstream alignment unit; other
 *   offsets may be rejected with UpstreamMisaligned
 * - up to `limit` bytes are returned; fewer is a short read, not an error
 * - an empty buffer means there is no data at `offset`
 * - failures are reported as errors (ResourceNotFound, UpstreamTransientError)
 *
 * Implementations are shared between request threads and must be
 * safe for concurrent calls.
 */
class ResourceFetcher {
public:
    virtual ~ResourceFetcher() = default;

    virtual Result<bytes> fetch(const std::string& resource_id,
                                uint64_t offset,
                                uint64_t limit) = 0;

    /**
     * Size of a resource, when the upstream can tell
     */
    virtual std::optional<uint64_t> resource_size(const std::string& resource_id) = 0;
};

} // namespace rangegate::stream
