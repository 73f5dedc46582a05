#include "utils/date_time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace rolodex {
namespace utils {

namespace {

std::tm toUtcTm(std::time_t t) {
    std::tm tm_val{};
#if defined(_WIN32)
    gmtime_s(&tm_val, &t);
#else
    gmtime_r(&t, &tm_val);
#endif
    return tm_val;
}

std::time_t fromUtcTm(std::tm& tm_val) {
#ifdef _WIN32
    return _mkgmtime(&tm_val);
#else
    return timegm(&tm_val);
#endif
}

bool tryFormat(const std::string& input, const char* format, std::tm& out) {
    std::tm tm_val{};
    std::istringstream ss(input);
    ss >> std::get_time(&tm_val, format);
    if (ss.fail()) {
        return false;
    }
    // Reject trailing garbage
    if (ss.peek() != std::char_traits<char>::eof()) {
        return false;
    }
    out = tm_val;
    return true;
}

} // namespace

std::optional<int64_t> DateTime::parse(std::string_view text) {
    std::string s(text);
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
    }
    // Drop fractional seconds; DATE precision is one second
    auto dot = s.find('.');
    if (dot != std::string::npos && dot > 10) {
        for (size_t i = dot + 1; i < s.size(); ++i) {
            if (s[i] < '0' || s[i] > '9') return std::nullopt;
        }
        s.erase(dot);
    }
    if (s.size() < 10) {
        return std::nullopt;
    }

    std::tm tm_val{};
    bool ok = false;
    if (s.size() == 10) {
        ok = tryFormat(s, "%Y-%m-%d", tm_val);
    } else if (s[10] == 'T' || s[10] == 't') {
        ok = tryFormat(s, "%Y-%m-%dT%H:%M:%S", tm_val);
    } else if (s[10] == ' ') {
        ok = tryFormat(s, "%Y-%m-%d %H:%M:%S", tm_val);
    }
    if (!ok) {
        return std::nullopt;
    }

    const int year = tm_val.tm_year;
    const int month = tm_val.tm_mon;
    const int day = tm_val.tm_mday;
    std::time_t t = fromUtcTm(tm_val);

    // timegm normalizes 2024-02-30 into March; treat that as malformed
    std::tm check = toUtcTm(t);
    if (check.tm_year != year || check.tm_mon != month || check.tm_mday != day) {
        return std::nullopt;
    }
    return static_cast<int64_t>(t);
}

std::string DateTime::formatIso(int64_t epoch_seconds) {
    std::tm tm_val = toUtcTm(static_cast<std::time_t>(epoch_seconds));
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string DateTime::formatCompact(std::chrono::system_clock::time_point tp) {
    std::tm tm_val = toUtcTm(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string DateTime::nowIso() {
    return formatIso(toEpochSeconds(std::chrono::system_clock::now()));
}

int64_t DateTime::toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace utils
} // namespace rolodex
