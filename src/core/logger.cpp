#include "mediaharvest/core/logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace mediaharvest::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

LogLevel log_level_from_string(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string file_error;
    if (!log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1048576 * 5, 3);
            file_sink->set_level(spdlog::level::debug);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }
    
    // The file sink records debug lines even when the console is quieter.
    auto logger_level = std::min(static_cast<spdlog::level::level_enum>(level),
                                 sinks.size() > 1 ? spdlog::level::debug : spdlog::level::off);
    logger_ = std::make_shared<spdlog::logger>("mediaharvest", sinks.begin(), sinks.end());
    logger_->set_level(logger_level);
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    
    if (!file_error.empty()) {
        LOG_WARN("Logging to console only, cannot open {}: {}", log_file, file_error);
    }
    LOG_DEBUG("Logger initialized with level {}",
              spdlog::level::to_string_view(static_cast<spdlog::level::level_enum>(level)));
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    
    static std::mutex fallback_mutex;
    std::lock_guard<std::mutex> lock(fallback_mutex);
    auto fallback = spdlog::default_logger();
    if (!fallback) {
        // spdlog::shutdown() drops the registry's default logger
        fallback = std::make_shared<spdlog::logger>(
            "mediaharvest", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        spdlog::set_default_logger(fallback);
    }
    return fallback;
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

}
