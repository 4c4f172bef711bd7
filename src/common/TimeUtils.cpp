#include "common/TimeUtils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace mdi::common {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

bool readDigits(std::string_view value, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > value.size()) {
        return false;
    }
    int result = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char ch = value[pos + i];
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
        result = result * 10 + (ch - '0');
    }
    pos += count;
    out = result;
    return true;
}

bool expect(std::string_view value, std::size_t& pos, char ch) {
    if (pos < value.size() && value[pos] == ch) {
        ++pos;
        return true;
    }
    return false;
}

}  // namespace

domain::TimestampMs nowMs() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::optional<domain::TimestampMs> parseIsoTimestampMs(std::string_view value) {
    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!readDigits(value, pos, 4, year) || !expect(value, pos, '-') || !readDigits(value, pos, 2, month)
        || !expect(value, pos, '-') || !readDigits(value, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    long long millis = 0;
    long long offsetMs = 0;

    if (pos < value.size()) {
        if (value[pos] != 'T' && value[pos] != 't' && value[pos] != ' ') {
            return std::nullopt;
        }
        ++pos;
        if (!readDigits(value, pos, 2, hour) || !expect(value, pos, ':') || !readDigits(value, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expect(value, pos, ':') && !readDigits(value, pos, 2, second)) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        if (expect(value, pos, '.')) {
            // Keep millisecond precision, ignore finer digits.
            int digits = 0;
            while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
                if (digits < 3) {
                    millis = millis * 10 + (value[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (int i = digits; i < 3; ++i) {
                millis *= 10;
            }
        }

        if (pos < value.size()) {
            const char zone = value[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            }
            else if (zone == '+' || zone == '-') {
                ++pos;
                int offHours = 0;
                int offMinutes = 0;
                if (!readDigits(value, pos, 2, offHours)) {
                    return std::nullopt;
                }
                expect(value, pos, ':');
                if (!readDigits(value, pos, 2, offMinutes)) {
                    return std::nullopt;
                }
                offsetMs = (static_cast<long long>(offHours) * 60 + offMinutes) * domain::kMillisPerMinute;
                if (zone == '-') {
                    offsetMs = -offsetMs;
                }
            }
        }
        if (pos != value.size()) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    if (raw == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<domain::TimestampMs>(raw) * domain::kMillisPerSecond + millis - offsetMs;
}

std::optional<domain::TimestampMs> parseDateArgument(const std::string& value, bool endOfDay) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (normalized == "now") {
        return nowMs();
    }

    auto parsed = parseIsoTimestampMs(value);
    if (!parsed) {
        return std::nullopt;
    }
    if (endOfDay && value.size() == 10) {
        return *parsed + domain::kMillisPerDay;
    }
    return parsed;
}

std::string formatIsoMs(domain::TimestampMs ms) {
    const auto seconds = static_cast<std::time_t>(domain::align_down_ms(ms, domain::kMillisPerSecond) / 1000);
    const int millis = static_cast<int>(ms - static_cast<domain::TimestampMs>(seconds) * 1000);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    char buffer[32];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900,
                  utc.tm_mon + 1,
                  utc.tm_mday,
                  utc.tm_hour,
                  utc.tm_min,
                  utc.tm_sec,
                  millis);
    return buffer;
}

YearMonth yearMonthOf(domain::TimestampMs ms) {
    const auto seconds = static_cast<std::time_t>(domain::align_down_ms(ms, domain::kMillisPerSecond) / 1000);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    return YearMonth{utc.tm_year + 1900, utc.tm_mon + 1};
}

YearMonth addMonths(YearMonth ym, int months) {
    const int zeroBased = ym.year * 12 + (ym.month - 1) + months;
    return YearMonth{zeroBased / 12, zeroBased % 12 + 1};
}

domain::TimestampMs monthStartMs(YearMonth ym) {
    std::tm tm{};
    tm.tm_year = ym.year - 1900;
    tm.tm_mon = ym.month - 1;
    tm.tm_mday = 1;
    tm.tm_isdst = 0;
    return static_cast<domain::TimestampMs>(timegm_compat(&tm)) * domain::kMillisPerSecond;
}

}  // namespace mdi::common
