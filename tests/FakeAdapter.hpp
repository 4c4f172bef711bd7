#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/exchange/IProviderAdapter.hpp"

namespace testing_support {

// One scripted step of a live session: a record, or a dropped connection.
struct StreamStep {
    std::optional<domain::RawRecord> record;

    static StreamStep deliver(domain::RawRecord record) { return StreamStep{std::move(record)}; }
    static StreamStep disconnect() { return StreamStep{std::nullopt}; }
};

// Plays its steps in order, then stays silent until closed.
class ScriptedStream : public domain::ILiveStream {
public:
    ScriptedStream(std::string provider, std::deque<StreamStep> steps)
        : provider_(std::move(provider)), steps_(std::move(steps)) {}

    std::optional<domain::RawRecord> next(std::chrono::milliseconds timeout) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw domain::TransientProviderError(provider_, "stream closed");
            }
            if (!steps_.empty()) {
                auto step = std::move(steps_.front());
                steps_.pop_front();
                if (!step.record) {
                    throw domain::TransientProviderError(provider_, "connection reset by peer");
                }
                return step.record;
            }
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
        return std::nullopt;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

private:
    std::string provider_;
    std::mutex mutex_;
    std::deque<StreamStep> steps_;
    bool closed_{false};
};

class FakeAdapter : public domain::IProviderAdapter {
public:
    using HistoricalSource = std::function<std::vector<domain::RawRecord>(
        const domain::Instrument&, domain::TimestampMs, domain::TimestampMs, domain::Interval)>;

    explicit FakeAdapter(std::string name = "fake") {
        provider_.name = std::move(name);
        provider_.kind = domain::ProviderKind::Exchange;
        provider_.rateLimitPerMinute = 600.0;
        historical_ = [this](const domain::Instrument& instrument,
                             domain::TimestampMs start,
                             domain::TimestampMs end,
                             domain::Interval granularity) {
            std::vector<domain::RawRecord> bars;
            for (auto t = start; t < end; t += granularity.ms) {
                bars.push_back(bar(instrument.symbol, t, granularity, 100.0));
            }
            return bars;
        };
    }

    const domain::Provider& provider() const override { return provider_; }

    domain::Instrument describeInstrument(const domain::Symbol& symbol) const override {
        domain::Instrument instrument;
        instrument.symbol = symbol;
        instrument.provider = provider_.name;
        instrument.assetKind = domain::AssetKind::Crypto;
        return instrument;
    }

    std::vector<domain::RawRecord> fetchHistorical(const domain::Instrument& instrument,
                                                   domain::TimestampMs start,
                                                   domain::TimestampMs end,
                                                   domain::Interval granularity) override {
        HistoricalSource source;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fetched_.push_back(domain::TimeRange{start, end});
            if (!historicalFailures_.empty()) {
                auto failure = historicalFailures_.front();
                historicalFailures_.pop_front();
                std::rethrow_exception(failure);
            }
            source = historical_;
        }
        return source(instrument, start, end, granularity);
    }

    std::unique_ptr<domain::ILiveStream> streamLive(const domain::Instrument&, domain::StreamKind) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++sessionsOpened_;
        std::deque<StreamStep> steps;
        if (!sessions_.empty()) {
            steps = std::move(sessions_.front());
            sessions_.pop_front();
        }
        return std::make_unique<ScriptedStream>(provider_.name, std::move(steps));
    }

    void addSession(std::deque<StreamStep> steps) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.push_back(std::move(steps));
    }

    void failNextFetch(std::exception_ptr failure) {
        std::lock_guard<std::mutex> lock(mutex_);
        historicalFailures_.push_back(std::move(failure));
    }

    void setHistorical(HistoricalSource source) {
        std::lock_guard<std::mutex> lock(mutex_);
        historical_ = std::move(source);
    }

    std::vector<domain::TimeRange> fetched() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetched_;
    }

    int sessionsOpened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessionsOpened_;
    }

    domain::RawRecord bar(const domain::Symbol& symbol,
                          domain::TimestampMs bucketStart,
                          domain::Interval granularity,
                          double price) const {
        domain::Bar payload;
        payload.granularity = granularity;
        payload.bucketStart = std::to_string(bucketStart);
        payload.open = price;
        payload.high = price + 1.0;
        payload.low = price - 1.0;
        payload.close = price;
        payload.volume = 10.0;
        payload.tradeCount = 5;

        domain::RawRecord record;
        record.provider = provider_.name;
        record.symbol = symbol;
        record.receivedAt = bucketStart + granularity.ms;
        record.raw = "{\"t\":" + std::to_string(bucketStart) + "}";
        record.payload = payload;
        return record;
    }

    domain::RawRecord trade(const domain::Symbol& symbol,
                            const std::string& id,
                            domain::TimestampMs eventTime,
                            double price,
                            double size = 1.0) const {
        domain::TradePrint payload;
        payload.tradeId = id;
        payload.price = price;
        payload.size = size;
        payload.side = "buy";
        payload.eventTime = std::to_string(eventTime);

        domain::RawRecord record;
        record.provider = provider_.name;
        record.symbol = symbol;
        record.receivedAt = eventTime;
        record.sequence = id;
        record.raw = "{\"id\":" + id + ",\"p\":" + std::to_string(price) + "}";
        record.payload = payload;
        return record;
    }

private:
    domain::Provider provider_;
    mutable std::mutex mutex_;
    HistoricalSource historical_;
    std::deque<std::exception_ptr> historicalFailures_;
    std::vector<domain::TimeRange> fetched_;
    std::deque<std::deque<StreamStep>> sessions_;
    int sessionsOpened_{0};
};

}  // namespace testing_support
