#pragma once

#include "rangegate/common.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace rangegate {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Source of the current Unix time, injectable for tests
using UnixClock = std::function<uint64_t()>;

// Get current time
TimePoint now();

// Get current Unix timestamp (seconds since epoch)
uint64_t timestamp_seconds();

// Get current Unix timestamp (milliseconds since epoch)
uint64_t timestamp_milliseconds();

// Convert TimePoint to Unix timestamp (seconds)
uint64_t to_timestamp(const TimePoint& tp);

// Convert TimePoint to string (ISO 8601 format)
std::string to_string(const TimePoint& tp);

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(now()) {}

    void reset() { start_ = now(); }

    double elapsed_seconds() const {
        auto duration = now() - start_;
        return std::chrono::duration<double>(duration).count();
    }

private:
    TimePoint start_;
};

} // namespace time
} // namespace rangegate
