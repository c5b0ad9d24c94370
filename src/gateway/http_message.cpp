#include "rangegate/gateway/http_message.hpp"

#include <cctype>

namespace rangegate {
namespace gateway {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto exact = headers.find(name);
    if (exact != headers.end()) {
        return exact->second;
    }
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpRequest::param(const std::string& name) const {
    auto it = query_params.find(name);
    if (it == query_params.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace gateway
} // namespace rangegate
