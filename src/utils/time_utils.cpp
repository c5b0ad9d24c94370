#include "rangegate/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace rangegate {
namespace time {

TimePoint now() {
    return Clock::now();
}

uint64_t timestamp_seconds() {
    return std::chrono::duration_cast<Seconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t timestamp_milliseconds() {
    return std::chrono::duration_cast<Milliseconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t to_timestamp(const TimePoint& tp) {
    return std::chrono::duration_cast<Seconds>(
        tp.time_since_epoch()
    ).count();
}

std::string to_string(const TimePoint& tp) {
    auto time_t_val = Clock::to_time_t(tp);
    std::tm tm_val;

#ifdef RANGEGATE_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    auto ms = std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

} // namespace time
} // namespace rangegate
