#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <memory>
#include <string>
#include <string_view>

namespace spdlog { class logger; }

namespace rolodex {
namespace utils {

/**
 * Process-wide spdlog logger behind the ROLODEX_* macros.
 *
 * Until init() or initConsole() runs, every log call is a no-op, so library
 * code and tests log unconditionally. The CLI starts on the console and
 * re-initialises once the configuration names a log file.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    /// Console sink only
    static void initConsole(Level level = Level::INFO);
    /// Console sink plus a truncating file sink; an empty log_file is initConsole()
    static void init(const std::string& log_file, Level level = Level::INFO);
    /// Flushes and drops the logger; log calls are no-ops again afterwards
    static void shutdown();
    static bool isInitialized();

    // No effect before init
    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);

    /// Case-insensitive; "warning", "err" and "crit" are accepted, anything else is INFO
    static Level levelFromString(std::string_view name);
    static const char* levelToString(Level level);

    /// Nothing is formatted below the current level
    template<typename... Args>
    static void log(Level level, std::string_view fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace rolodex

#include "utils/logger_impl.h"

#define ROLODEX_TRACE(...) ::rolodex::utils::Logger::log(::rolodex::utils::Logger::Level::TRACE, __VA_ARGS__)
#define ROLODEX_DEBUG(...) ::rolodex::utils::Logger::log(::rolodex::utils::Logger::Level::DEBUG, __VA_ARGS__)
#define ROLODEX_INFO(...) ::rolodex::utils::Logger::log(::rolodex::utils::Logger::Level::INFO, __VA_ARGS__)
#define ROLODEX_WARN(...) ::rolodex::utils::Logger::log(::rolodex::utils::Logger::Level::WARN, __VA_ARGS__)
#define ROLODEX_ERROR(...) ::rolodex::utils::Logger::log(::rolodex::utils::Logger::Level::ERROR, __VA_ARGS__)
#define ROLODEX_CRITICAL(...) ::rolodex::utils::Logger::log(::rolodex::utils::Logger::Level::CRITICAL, __VA_ARGS__)
