#include <iostream>
#include <string>
#include <variant>

#include "TestSupport.hpp"
#include "core/Normalizer.hpp"

namespace {

constexpr domain::TimestampMs kNow = 1'700'000'000'000LL;

core::Normalizer makeNormalizer() {
    core::Normalizer::Settings settings;
    settings.maxClockSkew = std::chrono::milliseconds(30000);
    settings.clock = [] { return kNow; };
    return core::Normalizer(settings);
}

domain::Provider provider() {
    domain::Provider p;
    p.name = "binance";
    return p;
}

domain::Instrument instrument() {
    domain::Instrument i;
    i.symbol = "BTCUSDT";
    i.provider = "binance";
    return i;
}

domain::RawRecord tradeRecord(std::optional<double> price, std::optional<double> size, std::optional<std::string> time) {
    domain::RawRecord record;
    record.provider = "binance";
    record.symbol = "BTCUSDT";
    record.receivedAt = kNow;
    record.correlationId = "corr-1";
    record.raw = R"({"e":"trade"})";
    domain::TradePrint print;
    print.tradeId = "42";
    print.price = price;
    print.size = size;
    print.side = "sell";
    print.eventTime = std::move(time);
    record.payload = print;
    return record;
}

const core::ValidationFailure* failureOf(const core::Normalized& result) {
    return std::get_if<core::ValidationFailure>(&result);
}

int validTrade() {
    const auto normalizer = makeNormalizer();
    const auto result = normalizer.normalize(tradeRecord(100.5, 0.25, std::to_string(kNow - 1000)), provider(), instrument());
    const auto* trade = std::get_if<domain::Trade>(&result);
    CHECK(trade != nullptr);
    CHECK(trade->provider == "binance");
    CHECK(trade->symbol == "BTCUSDT");
    CHECK(trade->tradeId && *trade->tradeId == "42");
    CHECK(trade->price == 100.5);
    CHECK(trade->size == 0.25);
    CHECK(trade->side == domain::TradeSide::Sell);
    CHECK(trade->eventTime == kNow - 1000);
    CHECK(trade->receivedAt == kNow);
    CHECK(trade->correlationId == "corr-1");
    return 0;
}

int rejectsBadTrades() {
    const auto normalizer = makeNormalizer();

    const auto negative = normalizer.normalize(tradeRecord(-1.0, 1.0, std::to_string(kNow)), provider(), instrument());
    const auto* failure = failureOf(negative);
    CHECK(failure != nullptr);
    CHECK(failure->reason == core::FailureReason::OutOfRange);
    CHECK(failure->describe() == "OutOfRange(price): -1");

    const auto noSize = normalizer.normalize(tradeRecord(1.0, std::nullopt, std::to_string(kNow)), provider(), instrument());
    CHECK(failureOf(noSize) && failureOf(noSize)->reason == core::FailureReason::MissingField);
    CHECK(failureOf(noSize)->field == "size");

    const auto badTime = normalizer.normalize(tradeRecord(1.0, 1.0, std::string("yesterday")), provider(), instrument());
    CHECK(failureOf(badTime) && failureOf(badTime)->reason == core::FailureReason::MalformedTimestamp);

    const auto zeroTime = normalizer.normalize(tradeRecord(1.0, 1.0, std::string("0")), provider(), instrument());
    CHECK(failureOf(zeroTime) && failureOf(zeroTime)->reason == core::FailureReason::MalformedTimestamp);

    const auto future = normalizer.normalize(tradeRecord(1.0, 1.0, std::to_string(kNow + 60'000)), provider(), instrument());
    CHECK(failureOf(future) && failureOf(future)->reason == core::FailureReason::OutOfRange);
    CHECK(failureOf(future)->field == "event_time");

    const auto withinSkew = normalizer.normalize(tradeRecord(1.0, 1.0, std::to_string(kNow + 10'000)), provider(), instrument());
    CHECK(std::holds_alternative<domain::Trade>(withinSkew));
    return 0;
}

int timestampForms() {
    const auto iso = core::Normalizer::parseEventTime("t", std::string("2023-11-14T22:13:20.000Z"), domain::TimeUnit::Milliseconds);
    CHECK(std::holds_alternative<domain::TimestampMs>(iso));
    CHECK(std::get<domain::TimestampMs>(iso) == kNow);

    const auto nanos = core::Normalizer::parseEventTime("t", std::string("1700000000123456789"), domain::TimeUnit::Nanoseconds);
    CHECK(std::get<domain::TimestampMs>(nanos) == 1'700'000'000'123LL);

    const auto absent = core::Normalizer::parseEventTime("t", std::nullopt, domain::TimeUnit::Milliseconds);
    CHECK(std::get<core::ValidationFailure>(absent).reason == core::FailureReason::MissingField);
    return 0;
}

int quotes() {
    const auto normalizer = makeNormalizer();
    domain::RawRecord record;
    record.provider = "binance";
    record.symbol = "BTCUSDT";
    record.receivedAt = kNow;
    domain::BookTop top;
    top.bidPrice = 99.0;
    top.bidSize = 2.0;
    top.askPrice = 101.0;
    top.askSize = 3.0;
    top.eventTime = std::to_string(kNow);
    record.payload = top;

    const auto result = normalizer.normalize(record, provider(), instrument());
    const auto* quote = std::get_if<domain::Quote>(&result);
    CHECK(quote != nullptr);
    CHECK(quote->bidPrice && *quote->bidPrice == 99.0);
    CHECK(!quote->lastPrice);
    CHECK(!quote->correlationId.empty());

    domain::BookTop empty;
    empty.eventTime = std::to_string(kNow);
    record.payload = empty;
    CHECK(failureOf(normalizer.normalize(record, provider(), instrument())) != nullptr);

    top.askSize = -3.0;
    record.payload = top;
    const auto negative = normalizer.normalize(record, provider(), instrument());
    CHECK(failureOf(negative) && failureOf(negative)->field == "ask_size");
    return 0;
}

int bars() {
    const auto normalizer = makeNormalizer();
    domain::RawRecord record;
    record.provider = "binance";
    record.symbol = "BTCUSDT";
    domain::Bar bar;
    bar.granularity = domain::Interval{domain::kMillisPerMinute};
    bar.bucketStart = std::to_string(kNow - 120'000);
    bar.open = 10.0;
    bar.high = 12.0;
    bar.low = 9.0;
    bar.close = 11.0;
    bar.volume = 5.0;
    bar.tradeCount = 7;
    record.payload = bar;

    const auto result = normalizer.normalize(record, provider(), instrument());
    const auto* candle = std::get_if<domain::Candle>(&result);
    CHECK(candle != nullptr);
    CHECK(candle->bucketStart == kNow - 120'000);
    CHECK(candle->tradeCount == 7);
    CHECK(candle->lastEventTime == candle->bucketEnd() - 1);

    bar.high = 10.5;
    record.payload = bar;
    const auto lowHigh = normalizer.normalize(record, provider(), instrument());
    CHECK(failureOf(lowHigh) && failureOf(lowHigh)->field == "high");

    bar.high = 12.0;
    bar.volume.reset();
    record.payload = bar;
    const auto noVolume = normalizer.normalize(record, provider(), instrument());
    CHECK(failureOf(noVolume) && failureOf(noVolume)->field == "volume");
    return 0;
}

int decodeErrorsAndEnvelopes() {
    const auto normalizer = makeNormalizer();
    domain::RawRecord record;
    record.provider = "binance";
    record.symbol = "BTCUSDT";
    record.receivedAt = kNow;
    record.raw = "not json";
    record.payload = domain::DecodeError{"invalid JSON"};
    const auto result = normalizer.normalize(record, provider(), instrument());
    CHECK(failureOf(result) && failureOf(result)->field == "payload");

    const auto envelope = core::Normalizer::envelope(record, domain::StreamKind::Trades, 0);
    CHECK(envelope.eventTime == kNow);
    CHECK(envelope.payload == "not json");
    CHECK(!envelope.correlationId.empty());
    return 0;
}

}  // namespace

int main() {
    RUN(validTrade);
    RUN(rejectsBadTrades);
    RUN(timestampForms);
    RUN(quotes);
    RUN(bars);
    RUN(decodeErrorsAndEnvelopes);
    std::cout << "test_normalizer passed\n";
    return 0;
}
