#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

constexpr TimestampMs kMillisPerSecond = 1'000;
constexpr TimestampMs kMillisPerMinute = 60'000;
constexpr TimestampMs kMillisPerHour = 3'600'000;
constexpr TimestampMs kMillisPerDay = 86'400'000;
constexpr TimestampMs kMillisPerWeek = 7 * kMillisPerDay;

struct Interval {
    TimestampMs ms{0};
    constexpr bool valid() const noexcept { return ms > 0; }
};

constexpr bool operator==(Interval lhs, Interval rhs) noexcept { return lhs.ms == rhs.ms; }
constexpr bool operator!=(Interval lhs, Interval rhs) noexcept { return lhs.ms != rhs.ms; }
constexpr bool operator<(Interval lhs, Interval rhs) noexcept { return lhs.ms < rhs.ms; }

// Floor division so buckets before the epoch still align.
inline TimestampMs align_down_ms(TimestampMs t, TimestampMs step) {
    if (step <= 0) {
        return t;
    }
    const TimestampMs q = t / step;
    return (t % step < 0) ? (q - 1) * step : q * step;
}

inline TimestampMs align_up_ms(TimestampMs t, TimestampMs step) {
    const TimestampMs down = align_down_ms(t, step);
    return down == t ? t : down + step;
}

// Half-open [start, end).
struct TimeRange {
    TimestampMs start{0};
    TimestampMs end{0};
    bool empty() const noexcept { return end <= start; }
    TimestampMs length() const noexcept { return end - start; }
};

inline std::string interval_label(const Interval& interval) {
    if (!interval.valid()) {
        return "";
    }

    const auto ms = interval.ms;
    if (ms % kMillisPerWeek == 0) {
        return std::to_string(ms / kMillisPerWeek) + "w";
    }
    if (ms % kMillisPerDay == 0) {
        return std::to_string(ms / kMillisPerDay) + "d";
    }
    if (ms % kMillisPerHour == 0) {
        return std::to_string(ms / kMillisPerHour) + "h";
    }
    if (ms % kMillisPerMinute == 0) {
        return std::to_string(ms / kMillisPerMinute) + "m";
    }
    if (ms % kMillisPerSecond == 0) {
        return std::to_string(ms / kMillisPerSecond) + "s";
    }
    return std::to_string(ms) + "ms";
}

// Parses labels such as "1s", "5m", "4h", "10d", "1w" and "250ms". A bare number is
// read as milliseconds. Returns an invalid interval on anything else.
inline Interval interval_from_label(std::string_view label) {
    Interval interval{};
    std::size_t idx = 0;
    while (idx < label.size() && std::isspace(static_cast<unsigned char>(label[idx])) != 0) {
        ++idx;
    }

    const std::size_t startDigits = idx;
    long long value = 0;
    while (idx < label.size() && std::isdigit(static_cast<unsigned char>(label[idx])) != 0) {
        if (value > 1'000'000'000LL) {
            return interval;
        }
        value = value * 10 + (label[idx] - '0');
        ++idx;
    }
    if (startDigits == idx || value <= 0) {
        return interval;
    }

    std::string suffix;
    while (idx < label.size()) {
        const unsigned char ch = static_cast<unsigned char>(label[idx]);
        if (std::isspace(ch) == 0) {
            suffix.push_back(static_cast<char>(std::tolower(ch)));
        }
        ++idx;
    }

    long long multiplier = 0;
    if (suffix.empty() || suffix == "ms") {
        multiplier = 1;
    }
    else if (suffix == "s") {
        multiplier = kMillisPerSecond;
    }
    else if (suffix == "m") {
        multiplier = kMillisPerMinute;
    }
    else if (suffix == "h") {
        multiplier = kMillisPerHour;
    }
    else if (suffix == "d") {
        multiplier = kMillisPerDay;
    }
    else if (suffix == "w") {
        multiplier = kMillisPerWeek;
    }
    else {
        return interval;
    }

    interval.ms = value * multiplier;
    return interval;
}

}  // namespace domain
