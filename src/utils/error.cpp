#include "rangegate/error.hpp"
#include <sstream>

namespace rangegate {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";

        case ErrorCode::ConfigInvalid: return "Invalid configuration";
        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";

        case ErrorCode::InvalidToken: return "Invalid or expired token";
        case ErrorCode::RangeNotSatisfiable: return "Range not satisfiable";
        case ErrorCode::ServerBusy: return "Server busy";

        case ErrorCode::ResourceNotFound: return "Resource not found";
        case ErrorCode::UpstreamExhausted: return "Upstream exhausted";
        case ErrorCode::UpstreamTransientError: return "Upstream fetch failed";
        case ErrorCode::UpstreamMisaligned: return "Upstream rejected offset";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace rangegate
