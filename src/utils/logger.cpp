#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <cctype>
#include <iostream>
#include <vector>

// Windows defines ERROR as a macro; undef it
#ifdef ERROR
#undef ERROR
#endif

namespace rolodex {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initConsole(Level level) {
    init(std::string(), level);
}

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        }

        logger_ = std::make_shared<spdlog::logger>("rolodex", sinks.begin(), sinks.end());
        logger_->set_level(detail::toSpdlogLevel(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");

        // Register as default logger
        spdlog::set_default_logger(logger_);

        logger_->info("Logger initialized (level={}, file={})", levelToString(level),
                      log_file.empty() ? "<console>" : log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(detail::toSpdlogLevel(level));
    }
}

void Logger::setPattern(const std::string& pattern) {
    if (logger_) {
        logger_->set_pattern(pattern);
    }
}

Logger::Level Logger::levelFromString(std::string_view name) {
    std::string s(name);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace rolodex
