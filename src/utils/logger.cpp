#include "logger.hpp"
#include "rangegate/error.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace rangegate::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

std::once_flag default_init_flag;

// Thread id in every line: each stream runs on its own server worker
constexpr const char* CONSOLE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

} // anonymous namespace

std::optional<spdlog::level::level_enum> Logger::parse_level(const std::string& name) {
    // from_str() answers "off" for anything it does not recognize
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

void Logger::init(const LogConfig& config) {
    auto level = parse_level(config.level);
    if (!level) {
        throw ConfigException("unknown log level '" + config.level + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    if (config.to_file) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
            file_sink->set_pattern(FILE_PATTERN);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigException("cannot open log file '" + config.file_path + "': " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rangegate", sinks.begin(), sinks.end());
    logger->set_level(*level);
    logger->flush_on(spdlog::level::warn);

    logger_ = logger;
    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    // Stream workers may log before main() configured the logger
    std::call_once(default_init_flag, [] {
        if (!logger_) {
            init(LogConfig{});
        }
    });
    return logger_;
}

} // namespace rangegate::utils
