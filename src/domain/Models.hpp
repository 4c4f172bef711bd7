#pragma once

#include "domain/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

enum class ProviderKind { Exchange, Broker, Vendor };
enum class AssetKind { Crypto, Equity, Fx, Other };
enum class TradeSide { Buy, Sell, Unknown };
enum class StreamKind { Trades, Quotes };
enum class JobKind { Backfill, RealtimeCatchup };
enum class JobStatus { Pending, Running, Completed, Failed };

struct Provider {
    std::string name;
    ProviderKind kind{ProviderKind::Exchange};
    std::string baseEndpoint;
    std::string streamEndpoint;
    double rateLimitPerMinute{0.0};
    bool active{true};
};

struct Instrument {
    Symbol symbol;
    std::string provider;
    AssetKind assetKind{AssetKind::Other};
    std::string baseCurrency;
    std::string quoteCurrency;
    bool active{true};
};

// Verbatim provider payload kept for audit and replay.
struct RawEnvelope {
    std::string provider;
    Symbol symbol;
    StreamKind streamKind{StreamKind::Trades};
    TimestampMs receivedAt{0};
    TimestampMs eventTime{0};
    std::string payload;
    std::string correlationId;
};

struct Trade {
    std::string provider;
    Symbol symbol;
    std::optional<std::string> tradeId;
    double price{0.0};
    double size{0.0};
    TradeSide side{TradeSide::Unknown};
    TimestampMs eventTime{0};
    TimestampMs receivedAt{0};
    std::string correlationId;
};

struct Quote {
    std::string provider;
    Symbol symbol;
    std::optional<double> bidPrice;
    std::optional<double> bidSize;
    std::optional<double> askPrice;
    std::optional<double> askSize;
    std::optional<double> lastPrice;
    std::optional<double> lastSize;
    TimestampMs eventTime{0};
    TimestampMs receivedAt{0};
    std::string correlationId;
};

struct Candle {
    std::string provider;
    Symbol symbol;
    Interval granularity{};
    TimestampMs bucketStart{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    std::int64_t tradeCount{0};
    TimestampMs lastEventTime{0};
    std::string correlationId;

    TimestampMs bucketEnd() const noexcept { return bucketStart + granularity.ms; }
};

struct FetchJob {
    std::int64_t id{0};
    std::string provider;
    Symbol symbol;
    JobKind kind{JobKind::Backfill};
    Interval granularity{};
    TimestampMs startMs{0};
    TimestampMs endMs{0};
    JobStatus status{JobStatus::Pending};
    std::optional<TimestampMs> lastProcessedMs;
    std::string errorMessage;
    std::int32_t attempts{0};
    TimestampMs createdAt{0};
    TimestampMs updatedAt{0};

    // Where the next chunk starts: the checkpoint if one exists, otherwise the job start.
    TimestampMs resumeFrom() const noexcept {
        return lastProcessedMs && *lastProcessedMs > startMs ? *lastProcessedMs : startMs;
    }
};

struct StreamKey {
    std::string provider;
    Symbol symbol;
    StreamKind kind{StreamKind::Trades};

    bool operator==(const StreamKey& other) const noexcept {
        return kind == other.kind && provider == other.provider && symbol == other.symbol;
    }
};

struct StreamKeyHash {
    std::size_t operator()(const StreamKey& key) const noexcept;
};

struct StreamOffset {
    StreamKey key;
    std::string lastOffset;
    TimestampMs lastEventTime{0};
    TimestampMs updatedAt{0};
};

struct DeadLetterRecord {
    std::int64_t id{0};
    std::string provider;
    std::optional<Symbol> symbol;
    std::optional<StreamKind> streamKind;
    std::string payload;
    std::string reason;
    std::int32_t retryCount{0};
    TimestampMs createdAt{0};
};

const char* to_string(ProviderKind kind);
const char* to_string(AssetKind kind);
const char* to_string(TradeSide side);
const char* to_string(StreamKind kind);
const char* to_string(JobKind kind);
const char* to_string(JobStatus status);

std::optional<ProviderKind> provider_kind_from_string(std::string_view value);
std::optional<AssetKind> asset_kind_from_string(std::string_view value);
std::optional<TradeSide> trade_side_from_string(std::string_view value);
std::optional<StreamKind> stream_kind_from_string(std::string_view value);
std::optional<JobKind> job_kind_from_string(std::string_view value);
std::optional<JobStatus> job_status_from_string(std::string_view value);

std::string describe(const StreamKey& key);

// Random UUID used to follow a record from receipt to storage.
std::string newCorrelationId();

}  // namespace domain
