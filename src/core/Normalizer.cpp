#include "core/Normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <limits>
#include <utility>

#include "common/TimeUtils.hpp"

namespace core {
namespace {

constexpr long long kNanosPerMilli = 1'000'000;

ValidationFailure missing(const char* field) {
    return ValidationFailure{FailureReason::MissingField, field, "absent"};
}

std::string formatNumber(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.10g", value);
    return buffer;
}

// Negative, NaN and infinite values are out of range.
std::optional<ValidationFailure> checkNonNegative(const char* field, const std::optional<double>& value) {
    if (!value) {
        return std::nullopt;
    }
    if (!std::isfinite(*value) || *value < 0.0) {
        return ValidationFailure{FailureReason::OutOfRange, field, formatNumber(*value)};
    }
    return std::nullopt;
}

std::optional<long long> parseInteger(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    std::size_t pos = 0;
    bool negative = false;
    if (token[0] == '-' || token[0] == '+') {
        negative = token[0] == '-';
        pos = 1;
    }
    if (pos >= token.size()) {
        return std::nullopt;
    }
    long long value = 0;
    for (; pos < token.size(); ++pos) {
        const char ch = token[pos];
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        const int digit = ch - '0';
        if (value > (std::numeric_limits<long long>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return negative ? -value : value;
}

domain::TradeSide parseSide(const std::optional<std::string>& token) {
    if (!token) {
        return domain::TradeSide::Unknown;
    }
    std::string lowered = *token;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "buy" || lowered == "b") {
        return domain::TradeSide::Buy;
    }
    if (lowered == "sell" || lowered == "s") {
        return domain::TradeSide::Sell;
    }
    return domain::TradeSide::Unknown;
}

const std::string& correlationOf(const domain::RawRecord& record, std::string& fallback) {
    if (!record.correlationId.empty()) {
        return record.correlationId;
    }
    fallback = domain::newCorrelationId();
    return fallback;
}

}  // namespace

const char* to_string(FailureReason reason) {
    switch (reason) {
    case FailureReason::MissingField:
        return "MissingField";
    case FailureReason::OutOfRange:
        return "OutOfRange";
    case FailureReason::MalformedTimestamp:
        return "MalformedTimestamp";
    }
    return "MissingField";
}

std::string ValidationFailure::describe() const {
    std::string text = std::string(to_string(reason)) + "(" + field + ")";
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

Normalizer::Normalizer() : Normalizer(Settings{}) {}

Normalizer::Normalizer(Settings settings) : settings_(std::move(settings)) {
    if (!settings_.clock) {
        settings_.clock = [] { return mdi::common::nowMs(); };
    }
}

std::variant<domain::TimestampMs, ValidationFailure> Normalizer::parseEventTime(
    const std::string& field,
    const std::optional<std::string>& token,
    domain::TimeUnit unit) {
    if (!token || token->empty()) {
        return ValidationFailure{FailureReason::MissingField, field, "absent"};
    }

    domain::TimestampMs value = 0;
    if (auto integer = parseInteger(*token)) {
        value = unit == domain::TimeUnit::Nanoseconds ? *integer / kNanosPerMilli : *integer;
    }
    else if (auto iso = mdi::common::parseIsoTimestampMs(*token)) {
        value = *iso;
    }
    else {
        return ValidationFailure{FailureReason::MalformedTimestamp, field, *token};
    }

    if (value <= 0) {
        return ValidationFailure{FailureReason::MalformedTimestamp, field, *token};
    }
    return value;
}

std::optional<ValidationFailure> Normalizer::checkSkew_(domain::TimestampMs eventTime) const {
    const auto limit = settings_.clock() + static_cast<domain::TimestampMs>(settings_.maxClockSkew.count());
    if (eventTime > limit) {
        return ValidationFailure{FailureReason::OutOfRange,
                                 "event_time",
                                 mdi::common::formatIsoMs(eventTime) + " is ahead of the clock"};
    }
    return std::nullopt;
}

Normalized Normalizer::normalize(const domain::RawRecord& record,
                                 const domain::Provider& provider,
                                 const domain::Instrument& instrument) const {
    if (const auto* print = std::get_if<domain::TradePrint>(&record.payload)) {
        return trade_(record, *print, provider, instrument);
    }
    if (const auto* top = std::get_if<domain::BookTop>(&record.payload)) {
        return quote_(record, *top, provider, instrument);
    }
    if (const auto* bar = std::get_if<domain::Bar>(&record.payload)) {
        return candle_(record, *bar, provider, instrument);
    }
    if (const auto* error = std::get_if<domain::DecodeError>(&record.payload)) {
        return ValidationFailure{FailureReason::MissingField, "payload", error->reason};
    }
    return ValidationFailure{FailureReason::MissingField, "payload", "keepalive carries no market data"};
}

Normalized Normalizer::trade_(const domain::RawRecord& record,
                              const domain::TradePrint& print,
                              const domain::Provider& provider,
                              const domain::Instrument& instrument) const {
    if (!print.price) {
        return missing("price");
    }
    if (!print.size) {
        return missing("size");
    }
    if (auto failure = checkNonNegative("price", print.price)) {
        return *failure;
    }
    if (auto failure = checkNonNegative("size", print.size)) {
        return *failure;
    }

    auto eventTime = parseEventTime("event_time", print.eventTime, record.timeUnit);
    if (auto* failure = std::get_if<ValidationFailure>(&eventTime)) {
        return *failure;
    }
    const auto eventMs = std::get<domain::TimestampMs>(eventTime);
    if (auto failure = checkSkew_(eventMs)) {
        return *failure;
    }

    std::string fallback;
    domain::Trade trade;
    trade.provider = provider.name;
    trade.symbol = instrument.symbol;
    if (print.tradeId && !print.tradeId->empty()) {
        trade.tradeId = print.tradeId;
    }
    trade.price = *print.price;
    trade.size = *print.size;
    trade.side = parseSide(print.side);
    trade.eventTime = eventMs;
    trade.receivedAt = record.receivedAt;
    trade.correlationId = correlationOf(record, fallback);
    return trade;
}

Normalized Normalizer::quote_(const domain::RawRecord& record,
                              const domain::BookTop& top,
                              const domain::Provider& provider,
                              const domain::Instrument& instrument) const {
    if (!top.bidPrice && !top.askPrice && !top.lastPrice) {
        return missing("bid_price");
    }
    for (const auto& field : {std::make_pair("bid_price", top.bidPrice),
                              std::make_pair("bid_size", top.bidSize),
                              std::make_pair("ask_price", top.askPrice),
                              std::make_pair("ask_size", top.askSize),
                              std::make_pair("last_price", top.lastPrice),
                              std::make_pair("last_size", top.lastSize)}) {
        if (auto failure = checkNonNegative(field.first, field.second)) {
            return *failure;
        }
    }

    auto eventTime = parseEventTime("event_time", top.eventTime, record.timeUnit);
    if (auto* failure = std::get_if<ValidationFailure>(&eventTime)) {
        return *failure;
    }
    const auto eventMs = std::get<domain::TimestampMs>(eventTime);
    if (auto failure = checkSkew_(eventMs)) {
        return *failure;
    }

    std::string fallback;
    domain::Quote quote;
    quote.provider = provider.name;
    quote.symbol = instrument.symbol;
    quote.bidPrice = top.bidPrice;
    quote.bidSize = top.bidSize;
    quote.askPrice = top.askPrice;
    quote.askSize = top.askSize;
    quote.lastPrice = top.lastPrice;
    quote.lastSize = top.lastSize;
    quote.eventTime = eventMs;
    quote.receivedAt = record.receivedAt;
    quote.correlationId = correlationOf(record, fallback);
    return quote;
}

Normalized Normalizer::candle_(const domain::RawRecord& record,
                               const domain::Bar& bar,
                               const domain::Provider& provider,
                               const domain::Instrument& instrument) const {
    if (!bar.granularity.valid()) {
        return missing("granularity");
    }
    const std::pair<const char*, const std::optional<double>*> required[] = {
        {"open", &bar.open}, {"high", &bar.high}, {"low", &bar.low}, {"close", &bar.close}, {"volume", &bar.volume}};
    for (const auto& field : required) {
        if (!*field.second) {
            return missing(field.first);
        }
        if (auto failure = checkNonNegative(field.first, *field.second)) {
            return *failure;
        }
    }

    const double open = *bar.open;
    const double high = *bar.high;
    const double low = *bar.low;
    const double close = *bar.close;
    if (high < std::max(open, close)) {
        return ValidationFailure{FailureReason::OutOfRange,
                                 "high",
                                 formatNumber(high) + " below max(open, close)"};
    }
    if (low > std::min(open, close)) {
        return ValidationFailure{FailureReason::OutOfRange,
                                 "low",
                                 formatNumber(low) + " above min(open, close)"};
    }
    if (bar.tradeCount && *bar.tradeCount < 0) {
        return ValidationFailure{FailureReason::OutOfRange, "trade_count", std::to_string(*bar.tradeCount)};
    }

    auto bucketStart = parseEventTime("bucket_start", bar.bucketStart, record.timeUnit);
    if (auto* failure = std::get_if<ValidationFailure>(&bucketStart)) {
        return *failure;
    }
    const auto startMs = std::get<domain::TimestampMs>(bucketStart);
    if (auto failure = checkSkew_(startMs)) {
        return *failure;
    }

    std::string fallback;
    domain::Candle candle;
    candle.provider = provider.name;
    candle.symbol = instrument.symbol;
    candle.granularity = bar.granularity;
    candle.bucketStart = startMs;
    candle.open = open;
    candle.high = high;
    candle.low = low;
    candle.close = close;
    candle.volume = *bar.volume;
    candle.tradeCount = bar.tradeCount.value_or(0);
    candle.lastEventTime = candle.bucketEnd() - 1;
    candle.correlationId = correlationOf(record, fallback);
    return candle;
}

domain::RawEnvelope Normalizer::envelope(const domain::RawRecord& record,
                                         domain::StreamKind kind,
                                         domain::TimestampMs eventTime) {
    domain::RawEnvelope envelope;
    envelope.provider = record.provider;
    envelope.symbol = record.symbol;
    envelope.streamKind = kind;
    envelope.receivedAt = record.receivedAt;
    envelope.eventTime = eventTime > 0 ? eventTime : record.receivedAt;
    envelope.payload = record.raw;
    envelope.correlationId = record.correlationId.empty() ? domain::newCorrelationId() : record.correlationId;
    return envelope;
}

}  // namespace core
