#pragma once

#include "rangegate/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace rangegate {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,

    // Startup errors
    ConfigInvalid,
    CryptoInitFailed,

    // Request errors
    InvalidToken,
    RangeNotSatisfiable,
    ServerBusy,

    // Upstream errors
    ResourceNotFound,
    UpstreamExhausted,
    UpstreamTransientError,
    UpstreamMisaligned
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    T unwrap() {
        return value();
    }

    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return value();
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

    std::optional<Error> err() const {
        if (is_err()) {
            return std::get<Error>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    void expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Custom exception classes
class RangegateException : public std::runtime_error {
public:
    RangegateException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ConfigException : public RangegateException {
public:
    explicit ConfigException(const std::string& message)
        : RangegateException(ErrorCode::ConfigInvalid, "Config error: " + message) {}
};

class CryptoException : public RangegateException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : RangegateException(code, "Crypto error: " + message) {}
};

} // namespace rangegate
