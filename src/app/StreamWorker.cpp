#include "app/StreamWorker.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>
#include <variant>

#include "adapters/duckdb/StorageWriter.hpp"
#include "app/StreamOffsetTracker.hpp"
#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
constexpr auto kRejectLogInterval = std::chrono::seconds(5);

using mdi::common::metrics::Registry;
using mdi::common::metrics::seriesKey;

std::string streamSeries(const char* name, const domain::StreamKey& key) {
    return seriesKey(name, {{"provider", key.provider}, {"symbol", key.symbol}, {"stream", domain::to_string(key.kind)}});
}

void countIngested(const std::string& provider, const char* kind, std::size_t count) {
    if (count == 0) {
        return;
    }
    Registry::instance().incrementCounter(seriesKey("ingested_records_total", {{"provider", provider}, {"kind", kind}}),
                                          count);
}

using adapters::duckdb::WriteOutcome;

template <typename Record>
std::vector<Record> withOutcome(const std::vector<Record>& records,
                                const adapters::duckdb::WriteResult& result,
                                WriteOutcome outcome) {
    std::vector<Record> kept;
    for (std::size_t i = 0; i < records.size() && i < result.outcomes.size(); ++i) {
        if (result.outcomes[i] == outcome) {
            kept.push_back(records[i]);
        }
    }
    return kept;
}

}  // namespace

const char* to_string(StreamState state) {
    switch (state) {
        case StreamState::Connecting:
            return "connecting";
        case StreamState::Streaming:
            return "streaming";
        case StreamState::Disconnected:
            return "disconnected";
        case StreamState::Stopped:
            return "stopped";
    }
    return "unknown";
}

StreamWorker::StreamWorker(domain::IProviderAdapter& adapter,
                           domain::Instrument instrument,
                           domain::StreamKind kind,
                           adapters::duckdb::StorageWriter& writer,
                           StreamOffsetTracker& offsets,
                           core::Normalizer normalizer,
                           Options options,
                           CatchupRequest catchup)
    : adapter_(adapter),
      instrument_(std::move(instrument)),
      writer_(writer),
      offsets_(offsets),
      normalizer_(std::move(normalizer)),
      options_(std::move(options)),
      catchup_(std::move(catchup)),
      backoff_(options_.reconnect) {
    key_.provider = adapter_.provider().name;
    key_.symbol = instrument_.symbol;
    key_.kind = kind;
    options_.batchSize = std::max<std::size_t>(1, options_.batchSize);
    options_.degradedAfter = std::max<std::size_t>(1, options_.degradedAfter);
    if (options_.pollInterval.count() <= 0 || options_.pollInterval > std::chrono::milliseconds(200)) {
        options_.pollInterval = std::chrono::milliseconds(200);
    }
    if (kind == domain::StreamKind::Trades && !options_.granularities.empty()) {
        aggregator_ = std::make_unique<core::Aggregator>(
            core::Aggregator::Config{options_.granularities, options_.latenessWindow});
    }
}

StreamWorker::~StreamWorker() {
    requestStop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StreamWorker::start() {
    if (thread_.joinable()) {
        return;
    }
    stopRequested_.store(false);
    {
        std::lock_guard<std::mutex> lock(doneMutex_);
        done_ = false;
    }
    thread_ = std::thread([this]() {
        try {
            LOG_INFO(kLogCategory, "StreamWorker %s thread starting", domain::describe(key_).c_str());
            run_();
            LOG_INFO(kLogCategory, "StreamWorker %s thread finished cleanly", domain::describe(key_).c_str());
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "StreamWorker %s thread crashed: %s", domain::describe(key_).c_str(), ex.what());
            setState_(StreamState::Stopped);
        }
        {
            std::lock_guard<std::mutex> lock(doneMutex_);
            done_ = true;
        }
        doneCv_.notify_all();
    });
}

void StreamWorker::requestStop() {
    stopRequested_.store(true);
}

bool StreamWorker::waitStopped(std::chrono::steady_clock::time_point deadline) {
    if (!thread_.joinable()) {
        return true;
    }
    {
        std::unique_lock<std::mutex> lock(doneMutex_);
        if (!doneCv_.wait_until(lock, deadline, [this]() { return done_; })) {
            return false;
        }
    }
    thread_.join();
    return true;
}

std::string StreamWorker::labels_() const {
    return domain::describe(key_);
}

void StreamWorker::setState_(StreamState state) {
    state_.store(state);
    Registry::instance().setGauge(streamSeries("stream_state", key_), static_cast<double>(state));
}

void StreamWorker::run_() {
    Registry::instance().setGauge(streamSeries("stream_degraded", key_), 0.0);
    lastFlush_ = std::chrono::steady_clock::now();

    while (!stopRequested_.load()) {
        setState_(StreamState::Connecting);
        std::string failure;
        try {
            session_();
        }
        catch (const domain::AuthenticationError& ex) {
            failure = std::string("authentication: ") + ex.what();
        }
        catch (const domain::ProviderError& ex) {
            failure = ex.what();
        }
        catch (const domain::StorageUnavailableError& ex) {
            failure = std::string("storage unavailable: ") + ex.what();
        }
        catch (const std::exception& ex) {
            failure = ex.what();
        }

        if (stopRequested_.load()) {
            break;
        }
        onFailure_(failure);

        const auto attempt = static_cast<std::uint32_t>(failures_.load());
        const auto delay = degraded_.load() ? options_.reconnect.cap : backoff_.delay(attempt);
        LOG_INFO(kLogCategory,
                 "StreamWorker %s reconnecting in %lld ms attempt=%u",
                 labels_().c_str(),
                 static_cast<long long>(delay.count()),
                 attempt);
        if (!mdi::common::sleepUnlessStopped(delay, stopRequested_)) {
            break;
        }
    }

    // Drain what is buffered; aggregators give up their open buckets.
    try {
        if (aggregator_) {
            batch_.aggregated.append(aggregator_->flushAll());
        }
        flush_();
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "StreamWorker %s final flush failed: %s", labels_().c_str(), ex.what());
    }
    setState_(StreamState::Stopped);
}

void StreamWorker::onFailure_(const std::string& reason) {
    const auto failures = failures_.fetch_add(1) + 1;
    reconnects_.fetch_add(1);
    setState_(StreamState::Disconnected);
    Registry::instance().incrementCounter(streamSeries("reconnects_total", key_));
    LOG_WARN(kLogCategory,
             "StreamWorker %s disconnected failures=%zu reason=%s",
             labels_().c_str(),
             failures,
             reason.c_str());
    if (failures >= options_.degradedAfter && !degraded_.exchange(true)) {
        Registry::instance().setGauge(streamSeries("stream_degraded", key_), 1.0);
        LOG_ERROR(kLogCategory, "StreamWorker %s degraded after %zu consecutive failures", labels_().c_str(), failures);
    }
}

void StreamWorker::maybeCatchup_(const std::optional<domain::StreamOffset>& offset) {
    if (!catchup_ || !offset || offset->lastEventTime <= 0 || key_.kind != domain::StreamKind::Trades) {
        return;
    }
    const auto now = mdi::common::nowMs();
    if (now - offset->lastEventTime <= options_.catchupThreshold.count()) {
        return;
    }
    LOG_INFO(kLogCategory,
             "StreamWorker %s offset is %lld ms old, requesting catch-up",
             labels_().c_str(),
             static_cast<long long>(now - offset->lastEventTime));
    try {
        catchup_(instrument_, offset->lastEventTime, now);
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "StreamWorker %s catch-up request failed: %s", labels_().c_str(), ex.what());
    }
}

void StreamWorker::session_() {
    // Leftovers from a failed flush go first so nothing is committed out of order.
    flush_();
    maybeCatchup_(offsets_.load(key_));

    auto stream = adapter_.streamLive(instrument_, key_.kind);
    receivedSinceConnect_ = false;
    setState_(StreamState::Streaming);
    LOG_INFO(kLogCategory, "StreamWorker %s streaming", labels_().c_str());

    try {
        consume_(*stream);
    }
    catch (...) {
        stream->close();
        throw;
    }
    stream->close();
}

void StreamWorker::consume_(domain::ILiveStream& stream) {
    auto lastActivity = std::chrono::steady_clock::now();

    while (!stopRequested_.load()) {
        auto record = stream.next(options_.pollInterval);
        const auto now = std::chrono::steady_clock::now();

        if (record) {
            lastActivity = now;
            if (!receivedSinceConnect_) {
                receivedSinceConnect_ = true;
                failures_.store(0);
                if (degraded_.exchange(false)) {
                    Registry::instance().setGauge(streamSeries("stream_degraded", key_), 0.0);
                    LOG_INFO(kLogCategory, "StreamWorker %s recovered", labels_().c_str());
                }
            }
            handle_(*record);
        } else if (now - lastActivity > options_.heartbeatTimeout) {
            Registry::instance().incrementCounter(streamSeries("heartbeat_timeouts_total", key_));
            throw domain::TransientProviderError(key_.provider,
                                                 "no data within " + std::to_string(options_.heartbeatTimeout.count())
                                                     + " ms");
        }

        if (batch_.records >= options_.batchSize || now - lastFlush_ >= options_.flushInterval) {
            if (aggregator_) {
                const auto grace = options_.watermarkGrace.count();
                batch_.aggregated.append(aggregator_->advanceWatermark(mdi::common::nowMs() - grace));
            }
            flush_();
        }
    }
}

void StreamWorker::deadLetter_(const domain::RawRecord& record, const std::string& reason) {
    domain::DeadLetterRecord letter;
    letter.provider = key_.provider;
    letter.symbol = key_.symbol;
    letter.streamKind = key_.kind;
    letter.payload = record.raw;
    letter.reason = reason;
    letter.createdAt = mdi::common::nowMs();
    if (!writer_.recordDeadLetter(letter)) {
        throw domain::StorageUnavailableError("dead letter for " + labels_() + " could not be stored");
    }
    deadLettered_.fetch_add(1);
}

void StreamWorker::warnRejected_(const char* what, const std::string& detail) {
    if (!rejectLog_.allow(what, kRejectLogInterval)) {
        return;
    }
    const auto suppressed = rejectLog_.takeSuppressed(what);
    if (suppressed > 0) {
        LOG_WARN(kLogCategory,
                 "StreamWorker %s %s: %s (%llu similar suppressed)",
                 labels_().c_str(),
                 what,
                 detail.c_str(),
                 static_cast<unsigned long long>(suppressed));
        return;
    }
    LOG_WARN(kLogCategory, "StreamWorker %s %s: %s", labels_().c_str(), what, detail.c_str());
}

void StreamWorker::handle_(const domain::RawRecord& record) {
    if (record.isKeepalive()) {
        return;
    }
    if (const auto* error = std::get_if<domain::DecodeError>(&record.payload)) {
        Registry::instance().incrementCounter(
            seriesKey("normalization_failures_total", {{"provider", key_.provider}, {"reason", "decode"}}));
        warnRejected_("undecodable frame", error->reason);
        deadLetter_(record, "decode_failed: " + error->reason);
        return;
    }

    auto normalized = normalizer_.normalize(record, adapter_.provider(), instrument_);
    if (const auto* failure = std::get_if<core::ValidationFailure>(&normalized)) {
        Registry::instance().incrementCounter(seriesKey("normalization_failures_total",
                                                        {{"provider", key_.provider},
                                                         {"reason", core::to_string(failure->reason)}}));
        warnRejected_("rejected record", failure->describe());
        deadLetter_(record, "normalize_failed: " + failure->describe());
        return;
    }

    domain::TimestampMs eventTime = 0;
    if (const auto* trade = std::get_if<domain::Trade>(&normalized)) {
        eventTime = trade->eventTime;
    } else if (const auto* quote = std::get_if<domain::Quote>(&normalized)) {
        eventTime = quote->eventTime;
    } else if (const auto* candle = std::get_if<domain::Candle>(&normalized)) {
        eventTime = candle->lastEventTime;
    }

    if (offsets_.alreadyProcessed(key_, record.sequence)) {
        Registry::instance().incrementCounter(streamSeries("stream_records_skipped_total", key_));
        return;
    }

    batch_.envelopes.push_back(core::Normalizer::envelope(record, key_.kind, eventTime));
    if (auto* trade = std::get_if<domain::Trade>(&normalized)) {
        batch_.trades.push_back(std::move(*trade));
    } else if (auto* quote = std::get_if<domain::Quote>(&normalized)) {
        batch_.quotes.push_back(std::move(*quote));
    } else if (auto* candle = std::get_if<domain::Candle>(&normalized)) {
        batch_.bars.push_back(std::move(*candle));
    }
    ++batch_.records;

    if (!batch_.offset) {
        batch_.offset = domain::StreamOffset{};
        batch_.offset->key = key_;
    }
    auto& offset = *batch_.offset;
    offset.lastEventTime = std::max(offset.lastEventTime, eventTime);
    if (const auto sequence = StreamOffsetTracker::numericSequence(record.sequence)) {
        const auto highest = StreamOffsetTracker::numericSequence(offset.lastOffset);
        if (!highest || *sequence > *highest) {
            offset.lastOffset = record.sequence;
        }
    }

    const auto lag = mdi::common::nowMs() - eventTime;
    Registry::instance().setGauge(streamSeries("stream_lag_ms", key_), static_cast<double>(std::max<long long>(lag, 0)));
}

void StreamWorker::settle_(const adapters::duckdb::WriteResult& result, const char* stage) {
    deadLettered_.fetch_add(result.deadLettered);
    if (!result.settled()) {
        throw domain::StorageUnavailableError(std::string(stage) + " left records without a dead-letter entry");
    }
}

void StreamWorker::flush_() {
    lastFlush_ = std::chrono::steady_clock::now();
    if (batch_.empty()) {
        return;
    }

    if (!batch_.envelopes.empty()) {
        settle_(writer_.appendRawEnvelopes(batch_.envelopes), "raw envelopes");
        batch_.envelopes.clear();
    }

    if (!batch_.trades.empty()) {
        const auto result = writer_.upsertTrades(batch_.trades);
        countIngested(key_.provider, "trade", result.inserted);
        ingested_.fetch_add(result.inserted);
        if (aggregator_) {
            for (const auto& trade : withOutcome(batch_.trades, result, WriteOutcome::Inserted)) {
                batch_.aggregated.append(aggregator_->onTrade(trade));
            }
        }
        // Inserted trades are already aggregated; a retry only replays the ones that failed.
        batch_.trades = withOutcome(batch_.trades, result, WriteOutcome::Failed);
        settle_(result, "trades");
        batch_.trades.clear();
    }

    if (!batch_.bars.empty()) {
        const auto result = writer_.upsertCandles(batch_.bars);
        settle_(result, "bars");
        countIngested(key_.provider, "candle", result.inserted);
        ingested_.fetch_add(result.inserted);
        batch_.bars.clear();
    }

    // Each aggregator output covers trades no earlier output counted, so it is merged into
    // whatever an earlier run already stored for the bucket.
    auto& aggregated = batch_.aggregated;
    aggregated.corrections.insert(aggregated.corrections.begin(),
                                  std::make_move_iterator(aggregated.flushed.begin()),
                                  std::make_move_iterator(aggregated.flushed.end()));
    aggregated.flushed.clear();
    if (!aggregated.corrections.empty()) {
        const auto result = writer_.applyCandleCorrections(aggregated.corrections);
        // Merges are not idempotent; only the candles that never landed are retried.
        aggregated.corrections = withOutcome(aggregated.corrections, result, WriteOutcome::Failed);
        settle_(result, "candles");
        aggregated.corrections.clear();
    }
    aggregated.lateDropped = 0;

    if (!batch_.quotes.empty()) {
        const auto result = writer_.upsertQuotes(batch_.quotes);
        settle_(result, "quotes");
        countIngested(key_.provider, "quote", result.inserted);
        ingested_.fetch_add(result.inserted);
        batch_.quotes.clear();
    }

    if (batch_.offset) {
        auto offset = *batch_.offset;
        offset.updatedAt = mdi::common::nowMs();
        if (!offsets_.commit(offset)) {
            throw domain::StorageUnavailableError("offset commit failed for " + labels_());
        }
        batch_.offset.reset();
    }

    LOG_DEBUG(kLogCategory, "StreamWorker %s flushed records=%zu", labels_().c_str(), batch_.records);
    batch_.records = 0;
}

}  // namespace app
