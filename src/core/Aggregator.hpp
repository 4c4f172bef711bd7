#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Models.hpp"

namespace core {

struct AggregationKey {
    std::string provider;
    domain::Symbol symbol;
    domain::TimestampMs granularityMs{0};

    bool operator==(const AggregationKey& other) const noexcept {
        return granularityMs == other.granularityMs && provider == other.provider && symbol == other.symbol;
    }
};

struct AggregationKeyHash {
    std::size_t operator()(const AggregationKey& key) const noexcept;
};

// Tick-to-candle accumulation, one open bucket per (provider, symbol, granularity).
// Granularities are independent of each other. Not thread-safe; each stream worker owns
// its own instance.
class Aggregator {
public:
    struct Config {
        std::vector<domain::Interval> granularities;
        std::chrono::milliseconds latenessWindow{10000};
    };

    struct Output {
        // Closed buckets, plus the still-open ones on flushAll(). Each holds only trades
        // this instance saw, so a row an earlier run stored for the bucket is merged, not
        // replaced.
        std::vector<domain::Candle> flushed;
        // Single-trade deltas for buckets already flushed; stored by merging.
        std::vector<domain::Candle> corrections;
        std::size_t lateDropped{0};

        bool empty() const noexcept { return flushed.empty() && corrections.empty() && lateDropped == 0; }
        void append(Output&& other);
    };

    explicit Aggregator(Config config);

    Output onTrade(const domain::Trade& trade);

    // Moves the watermark forward (never back) and flushes every bucket ending at or
    // before it.
    Output advanceWatermark(domain::TimestampMs watermark);

    // Gives up every open bucket, partial ones included.
    Output flushAll();

    std::optional<domain::Candle> openCandle(const std::string& provider,
                                             const domain::Symbol& symbol,
                                             domain::Interval granularity) const;

    domain::TimestampMs watermark() const noexcept { return watermark_; }
    const Config& config() const noexcept { return config_; }

private:
    void accumulate_(domain::Candle& candle, const domain::Trade& trade) const;
    domain::Candle startBucket_(const domain::Trade& trade, domain::Interval granularity, domain::TimestampMs bucket) const;
    void flushClosed_(Output& output);

    Config config_;
    domain::TimestampMs watermark_{0};
    std::unordered_map<AggregationKey, domain::Candle, AggregationKeyHash> buckets_;
};

}  // namespace core
