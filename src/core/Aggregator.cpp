#include "core/Aggregator.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <utility>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace core {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::AGG;

bool candleOrder(const domain::Candle& lhs, const domain::Candle& rhs) {
    if (lhs.bucketStart != rhs.bucketStart) {
        return lhs.bucketStart < rhs.bucketStart;
    }
    if (lhs.granularity != rhs.granularity) {
        return lhs.granularity < rhs.granularity;
    }
    return lhs.symbol < rhs.symbol;
}

}  // namespace

std::size_t AggregationKeyHash::operator()(const AggregationKey& key) const noexcept {
    std::size_t seed = std::hash<std::string>{}(key.provider);
    seed ^= std::hash<std::string>{}(key.symbol) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= std::hash<long long>{}(key.granularityMs) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

void Aggregator::Output::append(Output&& other) {
    flushed.insert(flushed.end(),
                   std::make_move_iterator(other.flushed.begin()),
                   std::make_move_iterator(other.flushed.end()));
    corrections.insert(corrections.end(),
                       std::make_move_iterator(other.corrections.begin()),
                       std::make_move_iterator(other.corrections.end()));
    lateDropped += other.lateDropped;
}

Aggregator::Aggregator(Config config) : config_(std::move(config)) {
    auto& granularities = config_.granularities;
    granularities.erase(std::remove_if(granularities.begin(),
                                       granularities.end(),
                                       [](const domain::Interval& g) { return !g.valid(); }),
                        granularities.end());
    std::sort(granularities.begin(), granularities.end());
    granularities.erase(std::unique(granularities.begin(), granularities.end()), granularities.end());
}

domain::Candle Aggregator::startBucket_(const domain::Trade& trade,
                                 domain::Interval granularity,
                                 domain::TimestampMs bucket) const {
    domain::Candle candle;
    candle.provider = trade.provider;
    candle.symbol = trade.symbol;
    candle.granularity = granularity;
    candle.bucketStart = bucket;
    candle.open = trade.price;
    candle.high = trade.price;
    candle.low = trade.price;
    candle.close = trade.price;
    candle.volume = trade.size;
    candle.tradeCount = 1;
    candle.lastEventTime = trade.eventTime;
    candle.correlationId = trade.correlationId;
    return candle;
}

void Aggregator::accumulate_(domain::Candle& candle, const domain::Trade& trade) const {
    candle.high = std::max(candle.high, trade.price);
    candle.low = std::min(candle.low, trade.price);
    // Out-of-order trades inside the open bucket do not move the close backwards.
    if (trade.eventTime >= candle.lastEventTime) {
        candle.close = trade.price;
        candle.lastEventTime = trade.eventTime;
    }
    candle.volume += trade.size;
    candle.tradeCount += 1;
}

Aggregator::Output Aggregator::onTrade(const domain::Trade& trade) {
    Output output;
    const auto lateBound = watermark_ - static_cast<domain::TimestampMs>(config_.latenessWindow.count());

    for (const auto& granularity : config_.granularities) {
        const auto bucket = domain::align_down_ms(trade.eventTime, granularity.ms);
        AggregationKey key{trade.provider, trade.symbol, granularity.ms};
        auto it = buckets_.find(key);

        const bool behindOpen = it != buckets_.end() && bucket < it->second.bucketStart;
        const bool alreadyClosed = watermark_ > 0 && bucket + granularity.ms <= watermark_;
        if (behindOpen || (it == buckets_.end() && alreadyClosed)) {
            if (trade.eventTime < lateBound) {
                ++output.lateDropped;
                mdi::common::metrics::Registry::instance().incrementCounter(
                    mdi::common::metrics::seriesKey("aggregator_late_dropped_total",
                                                    {{"provider", trade.provider},
                                                     {"symbol", trade.symbol},
                                                     {"granularity", domain::interval_label(granularity)}}));
                LOG_DEBUG(kLogCategory,
                          "Aggregator dropped late trade symbol=%s granularity=%s event=%lld watermark=%lld",
                          trade.symbol.c_str(),
                          domain::interval_label(granularity).c_str(),
                          trade.eventTime,
                          watermark_);
                continue;
            }
            output.corrections.push_back(startBucket_(trade, granularity, bucket));
            continue;
        }

        if (it == buckets_.end()) {
            buckets_.emplace(std::move(key), startBucket_(trade, granularity, bucket));
            continue;
        }

        auto& candle = it->second;
        if (bucket > candle.bucketStart) {
            output.flushed.push_back(std::move(candle));
            candle = startBucket_(trade, granularity, bucket);
            continue;
        }
        accumulate_(candle, trade);
    }

    if (trade.eventTime > watermark_) {
        watermark_ = trade.eventTime;
        flushClosed_(output);
    }
    return output;
}

Aggregator::Output Aggregator::advanceWatermark(domain::TimestampMs watermark) {
    Output output;
    if (watermark <= watermark_) {
        return output;
    }
    watermark_ = watermark;
    flushClosed_(output);
    return output;
}

void Aggregator::flushClosed_(Output& output) {
    const auto before = output.flushed.size();
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (it->second.bucketEnd() <= watermark_) {
            output.flushed.push_back(std::move(it->second));
            it = buckets_.erase(it);
        }
        else {
            ++it;
        }
    }
    std::sort(output.flushed.begin() + static_cast<std::ptrdiff_t>(before), output.flushed.end(), candleOrder);
}

Aggregator::Output Aggregator::flushAll() {
    Output output;
    output.flushed.reserve(buckets_.size());
    for (auto& entry : buckets_) {
        output.flushed.push_back(std::move(entry.second));
    }
    buckets_.clear();
    std::sort(output.flushed.begin(), output.flushed.end(), candleOrder);
    if (!output.flushed.empty()) {
        LOG_DEBUG(kLogCategory, "Aggregator flushed %zu open candles", output.flushed.size());
    }
    return output;
}

std::optional<domain::Candle> Aggregator::openCandle(const std::string& provider,
                                                     const domain::Symbol& symbol,
                                                     domain::Interval granularity) const {
    auto it = buckets_.find(AggregationKey{provider, symbol, granularity.ms});
    if (it == buckets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace core
