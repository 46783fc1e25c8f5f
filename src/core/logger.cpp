#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include <spdlog/pattern_formatter.h>

namespace chunkswarm::core {

namespace {
constexpr size_t LOG_FILE_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILES_KEPT = 3;
constexpr const char* CONSOLE_LOGGER = "chunkswarm-console";
}

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto spd_level = static_cast<spdlog::level::level_enum>(level);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spd_level);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, LOG_FILE_BYTES, LOG_FILES_KEPT);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("chunkswarm", sinks.begin(), sinks.end());
    logger_->set_level(spd_level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(spd_level);

    LOG_INFO("Logger initialized with level: {}", spdlog::level::to_string_view(spd_level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_.reset();
        auto console = spdlog::get(CONSOLE_LOGGER);
        if (!console) {
            console = spdlog::stdout_color_mt(CONSOLE_LOGGER);
        }
        spdlog::set_default_logger(console);
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    return spdlog::default_logger();
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(name);

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

}
