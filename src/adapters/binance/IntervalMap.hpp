#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters::binance {

std::string binance_interval(domain::Interval interval);
domain::Interval from_binance_interval(const std::string &value);

namespace detail {

constexpr std::string_view binance_interval_literal(domain::Interval interval) {
    switch (interval.ms) {
    case 1'000:
        return "1s";
    case 60'000:
        return "1m";
    case 3 * 60'000:
        return "3m";
    case 5 * 60'000:
        return "5m";
    case 15 * 60'000:
        return "15m";
    case 30 * 60'000:
        return "30m";
    case 60 * 60'000:
        return "1h";
    case 2 * 60 * 60'000:
        return "2h";
    case 4 * 60 * 60'000:
        return "4h";
    case 6 * 60 * 60'000:
        return "6h";
    case 8 * 60 * 60'000:
        return "8h";
    case 12 * 60 * 60'000:
        return "12h";
    case 24 * 60 * 60'000:
        return "1d";
    case 3 * 24 * 60 * 60'000:
        return "3d";
    case 7 * 24 * 60 * 60'000:
        return "1w";
    }
    throw std::invalid_argument("Unsupported Binance kline interval");
}

constexpr domain::Interval from_binance_interval_literal(std::string_view value) {
    constexpr domain::TimestampMs kSupported[] = {1'000,
                                                  60'000,
                                                  3 * 60'000,
                                                  5 * 60'000,
                                                  15 * 60'000,
                                                  30 * 60'000,
                                                  60 * 60'000,
                                                  2 * 60 * 60'000,
                                                  4 * 60 * 60'000,
                                                  6 * 60 * 60'000,
                                                  8 * 60 * 60'000,
                                                  12 * 60 * 60'000,
                                                  24 * 60 * 60'000,
                                                  3 * 24 * 60 * 60'000,
                                                  7 * 24 * 60 * 60'000};
    for (const auto ms : kSupported) {
        if (binance_interval_literal(domain::Interval{ms}) == value) {
            return domain::Interval{ms};
        }
    }
    throw std::invalid_argument("Unsupported Binance interval");
}

} // namespace detail

static_assert(detail::binance_interval_literal(domain::Interval{1'000}) == std::string_view{"1s"});
static_assert(detail::binance_interval_literal(domain::Interval{5 * 60'000}) == std::string_view{"5m"});
static_assert(detail::from_binance_interval_literal("4h").ms == 4 * 60 * 60'000);
static_assert(detail::from_binance_interval_literal("1w").ms == 7 * 24 * 60 * 60'000);

} // namespace adapters::binance
