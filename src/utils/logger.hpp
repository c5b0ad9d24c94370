#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace rangegate::utils {

/**
 * Log output settings (log_level, log_to_file, log_file, log_max_size, log_max_files)
 */
struct LogConfig {
    std::string level{"info"};               // trace, debug, info, warn, error, critical, off
    bool to_file{false};
    std::string file_path{"rangegate.log"};
    size_t max_file_size{10 * 1024 * 1024};  // rotate after 10 MB
    size_t max_files{3};
};

/**
 * Process-wide spdlog logger
 *
 * Console output always, plus a size-rotated file when enabled. A get()
 * before init() installs console-only defaults, so stream workers and
 * tests can log without setup.
 */
class Logger {
public:
    /**
     * Replace the logger
     * @throws ConfigException on an unknown level or a log file that cannot be opened
     */
    static void init(const LogConfig& config);

    static std::shared_ptr<spdlog::logger> get();

    /**
     * nullopt for names spdlog does not know
     */
    static std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace rangegate::utils

// Convenience macros
#define RANGEGATE_LOG_TRACE(...)    rangegate::utils::Logger::get()->trace(__VA_ARGS__)
#define RANGEGATE_LOG_DEBUG(...)    rangegate::utils::Logger::get()->debug(__VA_ARGS__)
#define RANGEGATE_LOG_INFO(...)     rangegate::utils::Logger::get()->info(__VA_ARGS__)
#define RANGEGATE_LOG_WARN(...)     rangegate::utils::Logger::get()->warn(__VA_ARGS__)
#define RANGEGATE_LOG_ERROR(...)    rangegate::utils::Logger::get()->error(__VA_ARGS__)
#define RANGEGATE_LOG_CRITICAL(...) rangegate::utils::Logger::get()->critical(__VA_ARGS__)
