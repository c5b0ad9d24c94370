#pragma once

#include "rangegate/common.hpp"
#include <optional>
#include <string>

namespace rangegate::stream {

/**
 * ByteWindow - Inclusive byte range [start, end] of one resource
 */
struct ByteWindow {
    uint64_t start{0};
    uint64_t end{0};

    uint64_t length() const { return end - start + 1; }

    /**
     * "bytes <start>-<end>/<size>"
     */
    std::string content_range(uint64_t size) const;

    bool operator==(const ByteWindow& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * RangeResolution - Outcome of resolving a Range header
 */
struct RangeResolution {
    std::optional<ByteWindow> window;   // nullopt = not satisfiable
    bool from_header{false};            // false when the whole resource was implied

    bool satisfiable() const { return window.has_value(); }
};

/**
 * RangeResolver - Maps an HTTP Range header onto a concrete window
 *
 * - absent, empty or unparseable header: the whole resource
 * - "bytes=a-b", "bytes=a-", "bytes=-": open ends default to 0 / size-1
 * - "bytes=-N": the last N bytes; N == 0 or a malformed suffix is not satisfiable
 * - start >= size (or size == 0): not satisfiable
 * - end is clamped to size-1; only the first range of a list is used
 */
class RangeResolver {
public:
    static RangeResolution resolve(const std::optional<std::string>& header, uint64_t size);

    // "bytes */<size>" for 416 responses
    static std::string unsatisfied_content_range(uint64_t size);
};

} // namespace rangegate::stream
