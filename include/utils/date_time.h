#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rolodex {
namespace utils {

/// UTC date/time helpers. DATE fields are stored as seconds since the Unix epoch.
class DateTime {
public:
    /// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and "YYYY-MM-DD HH:MM:SS",
    /// optionally followed by fractional seconds and a trailing 'Z'.
    /// Returns nullopt for malformed or out-of-range input (e.g. 2024-02-30).
    static std::optional<int64_t> parse(std::string_view text);

    /// "YYYY-MM-DDTHH:MM:SSZ"
    static std::string formatIso(int64_t epoch_seconds);

    /// "YYYYmmdd_HHMMSS", used in export file names
    static std::string formatCompact(std::chrono::system_clock::time_point tp);

    static std::string nowIso();

    static int64_t toEpochSeconds(std::chrono::system_clock::time_point tp);
};

} // namespace utils
} // namespace rolodex
