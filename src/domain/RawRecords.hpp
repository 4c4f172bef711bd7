#pragma once

#include "domain/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace domain {

// Provider-shaped records as decoded by the adapters. Every field a provider may omit is
// optional so the normalizer can report what is missing. Event times stay as the raw
// token the provider sent (epoch integer or ISO-8601 text).

enum class TimeUnit { Milliseconds, Nanoseconds };

struct TradePrint {
    std::optional<std::string> tradeId;
    std::optional<double> price;
    std::optional<double> size;
    std::optional<std::string> side;
    std::optional<std::string> eventTime;
};

struct BookTop {
    std::optional<double> bidPrice;
    std::optional<double> bidSize;
    std::optional<double> askPrice;
    std::optional<double> askSize;
    std::optional<double> lastPrice;
    std::optional<double> lastSize;
    std::optional<std::string> eventTime;
};

struct Bar {
    Interval granularity{};
    std::optional<std::string> bucketStart;
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> close;
    std::optional<double> volume;
    std::optional<std::int64_t> tradeCount;
};

struct Keepalive {};

struct DecodeError {
    std::string reason;
};

using ProviderPayload = std::variant<TradePrint, BookTop, Bar, Keepalive, DecodeError>;

struct RawRecord {
    std::string provider;
    Symbol symbol;
    TimestampMs receivedAt{0};
    TimeUnit timeUnit{TimeUnit::Milliseconds};
    std::string sequence;
    std::string raw;
    std::string correlationId;
    ProviderPayload payload;

    bool isKeepalive() const noexcept { return std::holds_alternative<Keepalive>(payload); }
    bool isDecodeError() const noexcept { return std::holds_alternative<DecodeError>(payload); }
};

}  // namespace domain
