#include "range_resolver.hpp"
#include <algorithm>
#include <cctype>

namespace rangegate::stream {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

RangeResolution whole_resource(uint64_t size, bool from_header) {
    RangeResolution resolution;
    resolution.window = ByteWindow{0, size - 1};
    resolution.from_header = from_header;
    return resolution;
}

RangeResolution not_satisfiable() {
    RangeResolution resolution;
    resolution.from_header = true;
    return resolution;
}

} // anonymous namespace

std::string ByteWindow::content_range(uint64_t size) const {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) +
           "/" + std::to_string(size);
}

std::string RangeResolver::unsatisfied_content_range(uint64_t size) {
    return "bytes */" + std::to_string(size);
}

RangeResolution RangeResolver::resolve(
    const std::optional<std::string>& header,
    uint64_t size
) {
    if (size == 0) {
        return not_satisfiable();
    }
    if (!header) {
        return whole_resource(size, false);
    }

    auto value = trim(*header);
    auto eq = value.find('=');
    if (eq == std::string::npos || to_lower(trim(value.substr(0, eq))) != "bytes") {
        return whole_resource(size, false);
    }

    // Only the first range of "bytes=a-b, c-d" is honored
    auto ranges = value.substr(eq + 1);
    auto first = trim(ranges.substr(0, ranges.find(',')));
    auto dash = first.find('-');
    if (dash == std::string::npos) {
        return whole_resource(size, false);
    }

    auto first_pos = trim(first.substr(0, dash));
    auto last_pos = trim(first.substr(dash + 1));

    if (first_pos.empty()) {
        if (last_pos.empty()) {
            return whole_resource(size, true);
        }

        // Suffix range: the last N bytes
        auto suffix = parse_u64(last_pos);
        if (!suffix || *suffix == 0) {
            return not_satisfiable();
        }
        auto length = std::min(*suffix, size);
        RangeResolution resolution;
        resolution.window = ByteWindow{size - length, size - 1};
        resolution.from_header = true;
        return resolution;
    }

    auto start = parse_u64(first_pos);
    if (!start) {
        return whole_resource(size, false);
    }

    // A start past the end wins over any defect in the end position
    if (*start >= size) {
        return not_satisfiable();
    }

    uint64_t end = size - 1;
    if (!last_pos.empty()) {
        auto parsed_end = parse_u64(last_pos);
        if (!parsed_end || *parsed_end < *start) {
            return whole_resource(size, false);
        }
        end = *parsed_end;
    }

    RangeResolution resolution;
    resolution.window = ByteWindow{*start, std::min(end, size - 1)};
    resolution.from_header = true;
    return resolution;
}

} // namespace rangegate::stream
