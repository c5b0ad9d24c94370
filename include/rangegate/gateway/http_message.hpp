#pragma once

#include "rangegate/common.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rangegate {
namespace gateway {

class StreamBody;

/**
 * HTTP request method types
 */
enum class HttpMethod {
    GET,
    HEAD,
    OPTIONS
};

/**
 * HTTP status codes
 */
enum class HttpStatus {
    OK = 200,
    NO_CONTENT = 204,
    PARTIAL_CONTENT = 206,
    BAD_REQUEST = 400,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    RANGE_NOT_SATISFIABLE = 416,
    INTERNAL_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

/**
 * HTTP request representation
 * Query parameters are already percent-decoded.
 */
struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query_params;
    std::string client_ip;

    /**
     * Case-insensitive header lookup
     */
    std::optional<std::string> header(const std::string& name) const;

    std::optional<std::string> param(const std::string& name) const;
};

/**
 * HTTP response representation
 *
 * A streamed response carries its body in `stream`; `body` is then empty
 * and Content-Length describes the streamed window.
 */
struct HttpResponse {
    HttpStatus status;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::shared_ptr<StreamBody> stream;

    HttpResponse() : status(HttpStatus::OK) {
        headers["Server"] = "Rangegate/" RANGEGATE_VERSION_STRING;
    }

    void set_json_body(const std::string& json) {
        body.assign(json.begin(), json.end());
        headers["Content-Type"] = "application/json; charset=utf-8";
    }

    std::optional<std::string> header(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

} // namespace gateway
} // namespace rangegate
