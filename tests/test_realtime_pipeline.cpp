#include <chrono>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <duckdb.hpp>

#include "FakeAdapter.hpp"
#include "TestSupport.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/duckdb/StorageWriter.hpp"
#include "app/FetchJobManager.hpp"
#include "app/RealtimePipeline.hpp"
#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"

namespace {

using adapters::duckdb::DuckStore;
using adapters::duckdb::StorageWriter;
using app::RealtimePipeline;
using testing_support::FakeAdapter;
using testing_support::StreamStep;

constexpr auto kStopTimeout = std::chrono::milliseconds(5000);
constexpr auto kWait = std::chrono::milliseconds(5000);

DuckStore::Options memoryStore() {
    DuckStore::Options options;
    options.path = adapters::duckdb::kInMemoryPath;
    options.poolSize = 4;
    return options;
}

StorageWriter::Options quickWriter() {
    StorageWriter::Options options;
    options.retryBase = std::chrono::milliseconds(1);
    options.maxRetries = 1;
    return options;
}

RealtimePipeline::Options fastOptions() {
    RealtimePipeline::Options options;
    options.worker.batchSize = 10;
    options.worker.flushInterval = std::chrono::milliseconds(20);
    options.worker.heartbeatTimeout = std::chrono::milliseconds(60);
    options.worker.reconnect =
        mdi::common::BackoffPolicy{std::chrono::milliseconds(5), std::chrono::milliseconds(20), 0.0};
    options.worker.degradedAfter = 3;
    options.worker.pollInterval = std::chrono::milliseconds(10);
    options.worker.watermarkGrace = std::chrono::milliseconds(0);
    return options;
}

struct Harness {
    Harness() : store(memoryStore()), writer(store, quickWriter()) { store.migrate(); }

    app::FetchJobManager::AdapterLookup lookup() {
        return [this](const std::string& provider) -> domain::IProviderAdapter& {
            if (provider != adapter.provider().name) {
                throw std::runtime_error("unknown provider: " + provider);
            }
            return adapter;
        };
    }

    std::unique_ptr<RealtimePipeline> pipeline(RealtimePipeline::Options options = fastOptions(),
                                               app::FetchJobManager* catchup = nullptr) {
        return std::make_unique<RealtimePipeline>(lookup(), writer, core::Normalizer(), options, catchup);
    }

    std::int64_t count(const std::string& query) {
        auto lease = store.acquire();
        auto result = lease.connection().Query(query);
        if (!result || result->HasError() || result->RowCount() == 0) {
            return -1;
        }
        return result->GetValue(0, 0).GetValue<std::int64_t>();
    }

    DuckStore store;
    StorageWriter writer;
    FakeAdapter adapter;
};

std::uint64_t counter(const std::string& name, const std::string& symbol) {
    return mdi::common::metrics::Registry::instance().counterValue(mdi::common::metrics::seriesKey(
        name, {{"provider", "fake"}, {"symbol", symbol}, {"stream", "trades"}}));
}

int silentStreamReconnects() {
    Harness h;
    auto pipeline = h.pipeline();
    pipeline->addStream("fake", "SILENTUSD", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return h.adapter.sessionsOpened() >= 2; }, kWait));
    CHECK(counter("heartbeat_timeouts_total", "SILENTUSD") >= 1);
    CHECK(counter("reconnects_total", "SILENTUSD") >= 1);
    CHECK(pipeline->status().front().reconnects >= 1);
    CHECK(pipeline->stop(kStopTimeout));
    CHECK(pipeline->status().front().state == app::StreamState::Stopped);
    return 0;
}

int rejectedRecordIsDeadLetteredOnly() {
    Harness h;
    const auto base = mdi::common::nowMs() - 1'000;
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("BTCUSDT", "1", base, 100.0)),
                          StreamStep::deliver(h.adapter.trade("BTCUSDT", "2", base + 1, -1.0)),
                          StreamStep::deliver(h.adapter.trade("BTCUSDT", "3", base + 2, 101.0))});
    auto pipeline = h.pipeline();
    pipeline->addStream("fake", "BTCUSDT", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return h.count("SELECT COUNT(*) FROM trades") == 2; }, kWait));
    CHECK(pipeline->stop(kStopTimeout));

    CHECK(h.count("SELECT COUNT(*) FROM trades WHERE price < 0") == 0);
    CHECK(h.count("SELECT COUNT(*) FROM dead_letter WHERE error_reason LIKE 'normalize_failed: OutOfRange(price)%'")
          == 1);
    CHECK(h.count("SELECT COUNT(*) FROM trades_raw") == 2);

    auto offset = h.writer.loadOffset(domain::StreamKey{"fake", "BTCUSDT", domain::StreamKind::Trades});
    CHECK(offset.has_value());
    CHECK(offset->lastOffset == "3");
    CHECK(offset->lastEventTime == base + 2);

    const auto status = pipeline->status().front();
    CHECK(status.ingested == 2);
    CHECK(status.deadLettered == 1);
    return 0;
}

int committedRecordsAreSkipped() {
    Harness h;
    const auto base = mdi::common::nowMs() - 1'000;
    domain::StreamOffset committed;
    committed.key = domain::StreamKey{"fake", "ETHUSDT", domain::StreamKind::Trades};
    committed.lastOffset = "2";
    committed.lastEventTime = base + 2;
    CHECK(h.writer.commitOffset(committed));

    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("ETHUSDT", "1", base + 1, 10.0)),
                          StreamStep::deliver(h.adapter.trade("ETHUSDT", "2", base + 2, 11.0)),
                          StreamStep::deliver(h.adapter.trade("ETHUSDT", "3", base + 2, 12.0)),
                          StreamStep::deliver(h.adapter.trade("ETHUSDT", "4", base + 3, 13.0))});
    auto pipeline = h.pipeline();
    pipeline->addStream("fake", "ETHUSDT", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return h.count("SELECT COUNT(*) FROM trades") == 2; }, kWait));
    CHECK(pipeline->stop(kStopTimeout));
    CHECK(h.count("SELECT COUNT(*) FROM trades WHERE trade_id IN ('1', '2')") == 0);
    CHECK(counter("stream_records_skipped_total", "ETHUSDT") >= 2);
    CHECK(pipeline->offsets().current(committed.key)->lastOffset == "4");
    return 0;
}

int tradesBecomeCandlesAcrossReconnects() {
    Harness h;
    const auto bucket = domain::align_down_ms(mdi::common::nowMs(), domain::kMillisPerMinute) - domain::kMillisPerMinute;
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("SOLUSDT", "1", bucket + 1'000, 20.0)),
                          StreamStep::deliver(h.adapter.trade("SOLUSDT", "2", bucket + 2'000, 25.0)),
                          StreamStep::disconnect()});
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("SOLUSDT", "3", bucket + 3'000, 22.0, 2.0))});

    auto options = fastOptions();
    options.worker.granularities = {domain::Interval{domain::kMillisPerMinute}};
    // Keep the wall clock from closing the bucket; only stop() flushes it.
    options.worker.watermarkGrace = std::chrono::minutes(10);
    auto pipeline = h.pipeline(options);
    pipeline->addStream("fake", "SOLUSDT", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return h.count("SELECT COUNT(*) FROM trades") == 3; }, kWait));
    CHECK(pipeline->stop(kStopTimeout));
    CHECK(h.adapter.sessionsOpened() >= 2);

    CHECK(h.count("SELECT COUNT(*) FROM candles WHERE symbol = 'SOLUSDT'") == 1);
    CHECK(h.count("SELECT CAST(volume AS BIGINT) FROM candles WHERE symbol = 'SOLUSDT'") == 4);
    CHECK(h.count("SELECT CAST(high AS BIGINT) FROM candles WHERE symbol = 'SOLUSDT'") == 25);
    CHECK(h.count("SELECT bucket_start FROM candles WHERE symbol = 'SOLUSDT'") == bucket);
    return 0;
}

// An earlier event time than the committed one is still new when its sequence is.
int lateTradeAfterCommitIsKept() {
    Harness h;
    const auto bucket = domain::align_down_ms(mdi::common::nowMs(), domain::kMillisPerMinute) - domain::kMillisPerMinute;
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("DOTUSDT", "1", bucket + 1'000, 5.0)),
                          StreamStep::deliver(h.adapter.trade("DOTUSDT", "2", bucket + 6'000, 6.0, 2.0)),
                          StreamStep::disconnect()});
    // The next session starts only after the first one's batch and offset are committed.
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("DOTUSDT", "3", bucket + 2'000, 4.0, 4.0))});

    auto options = fastOptions();
    options.worker.granularities = {domain::Interval{domain::kMillisPerMinute}};
    options.worker.watermarkGrace = std::chrono::minutes(10);
    const auto skippedBefore = counter("stream_records_skipped_total", "DOTUSDT");
    auto pipeline = h.pipeline(options);
    pipeline->addStream("fake", "DOTUSDT", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return h.count("SELECT COUNT(*) FROM trades") == 3; }, kWait));
    CHECK(pipeline->stop(kStopTimeout));

    CHECK(h.count("SELECT COUNT(*) FROM trades WHERE trade_id = '3'") == 1);
    CHECK(counter("stream_records_skipped_total", "DOTUSDT") == skippedBefore);
    CHECK(h.count("SELECT COUNT(*) FROM candles WHERE symbol = 'DOTUSDT'") == 1);
    CHECK(h.count("SELECT CAST(volume AS BIGINT) FROM candles WHERE symbol = 'DOTUSDT'") == 7);
    CHECK(h.count("SELECT CAST(low AS BIGINT) FROM candles WHERE symbol = 'DOTUSDT'") == 4);
    CHECK(h.count("SELECT CAST(close AS BIGINT) FROM candles WHERE symbol = 'DOTUSDT'") == 6);

    auto offset = h.writer.loadOffset(domain::StreamKey{"fake", "DOTUSDT", domain::StreamKind::Trades});
    CHECK(offset && offset->lastOffset == "3");
    CHECK(offset->lastEventTime == bucket + 6'000);
    return 0;
}

int lateTradeCorrectsClosedCandle() {
    Harness h;
    const auto bucket =
        domain::align_down_ms(mdi::common::nowMs(), domain::kMillisPerMinute) - 2 * domain::kMillisPerMinute;
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("LTCUSDT", "1", bucket + 1'000, 70.0)),
                          StreamStep::deliver(h.adapter.trade("LTCUSDT", "2", bucket + 2'000, 72.0)),
                          StreamStep::disconnect()});
    // Silent until the heartbeat trips; the wall-clock watermark closes the bucket meanwhile.
    h.adapter.addSession({});
    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("LTCUSDT", "3", bucket + 1'500, 75.0, 3.0))});

    auto options = fastOptions();
    options.worker.granularities = {domain::Interval{domain::kMillisPerMinute}};
    options.worker.latenessWindow = std::chrono::minutes(10);
    auto pipeline = h.pipeline(options);
    pipeline->addStream("fake", "LTCUSDT", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor(
        [&]() { return h.count("SELECT CAST(volume AS BIGINT) FROM candles WHERE symbol = 'LTCUSDT'") == 5; }, kWait));
    CHECK(pipeline->stop(kStopTimeout));

    CHECK(h.adapter.sessionsOpened() >= 3);
    CHECK(h.count("SELECT COUNT(*) FROM candles WHERE symbol = 'LTCUSDT'") == 1);
    CHECK(h.count("SELECT trade_count FROM candles WHERE symbol = 'LTCUSDT'") == 3);
    CHECK(h.count("SELECT CAST(open AS BIGINT) FROM candles WHERE symbol = 'LTCUSDT'") == 70);
    CHECK(h.count("SELECT CAST(high AS BIGINT) FROM candles WHERE symbol = 'LTCUSDT'") == 75);
    CHECK(h.count("SELECT CAST(close AS BIGINT) FROM candles WHERE symbol = 'LTCUSDT'") == 72);
    return 0;
}

// A stop gives up the open bucket; the next run adds to it rather than overwriting it.
int restartMidBucketKeepsVolume() {
    Harness h;
    const auto bucket = domain::align_down_ms(mdi::common::nowMs(), domain::kMillisPerMinute) - domain::kMillisPerMinute;
    auto options = fastOptions();
    options.worker.granularities = {domain::Interval{domain::kMillisPerMinute}};
    options.worker.watermarkGrace = std::chrono::minutes(10);

    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("AVAXUSDT", "1", bucket + 1'000, 30.0, 10.0))});
    {
        auto first = h.pipeline(options);
        first->addStream("fake", "AVAXUSDT", domain::StreamKind::Trades);
        first->start();
        CHECK(testing_support::waitFor([&]() { return h.count("SELECT COUNT(*) FROM trades") == 1; }, kWait));
        CHECK(first->stop(kStopTimeout));
    }
    CHECK(h.count("SELECT CAST(volume AS BIGINT) FROM candles WHERE symbol = 'AVAXUSDT'") == 10);

    h.adapter.addSession({StreamStep::deliver(h.adapter.trade("AVAXUSDT", "2", bucket + 2'000, 33.0, 20.0))});
    auto second = h.pipeline(options);
    second->addStream("fake", "AVAXUSDT", domain::StreamKind::Trades);
    second->start();
    CHECK(testing_support::waitFor([&]() { return h.count("SELECT COUNT(*) FROM trades") == 2; }, kWait));
    CHECK(second->stop(kStopTimeout));

    CHECK(h.count("SELECT COUNT(*) FROM candles WHERE symbol = 'AVAXUSDT'") == 1);
    CHECK(h.count("SELECT CAST(volume AS BIGINT) FROM candles WHERE symbol = 'AVAXUSDT'") == 30);
    CHECK(h.count("SELECT trade_count FROM candles WHERE symbol = 'AVAXUSDT'") == 2);
    CHECK(h.count("SELECT CAST(open AS BIGINT) FROM candles WHERE symbol = 'AVAXUSDT'") == 30);
    CHECK(h.count("SELECT CAST(close AS BIGINT) FROM candles WHERE symbol = 'AVAXUSDT'") == 33);
    return 0;
}

int staleOffsetRequestsCatchup() {
    Harness h;
    app::FetchJobManager::Options jobOptions;
    app::FetchJobManager jobs(h.writer, h.lookup(), core::Normalizer(), jobOptions);

    domain::StreamOffset committed;
    committed.key = domain::StreamKey{"fake", "ADAUSDT", domain::StreamKind::Trades};
    committed.lastOffset = "9";
    committed.lastEventTime = mdi::common::nowMs() - 10 * domain::kMillisPerMinute;
    CHECK(h.writer.commitOffset(committed));

    auto pipeline = h.pipeline(fastOptions(), &jobs);
    pipeline->addStream("fake", "ADAUSDT", domain::StreamKind::Trades);
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return !h.writer.listFetchJobs({}).empty(); }, kWait));
    CHECK(pipeline->stop(kStopTimeout));
    jobs.stop();

    auto queued = h.writer.listFetchJobs({});
    CHECK(queued.size() == 1);
    CHECK(queued.front().kind == domain::JobKind::RealtimeCatchup);
    CHECK(queued.front().granularity.ms == domain::kMillisPerMinute);
    CHECK(queued.front().startMs == domain::align_down_ms(committed.lastEventTime, domain::kMillisPerMinute));
    CHECK(queued.front().endMs % domain::kMillisPerMinute == 0);
    return 0;
}

int repeatedFailuresDegradeReadiness() {
    Harness h;
    for (int i = 0; i < 5; ++i) {
        h.adapter.addSession({StreamStep::disconnect()});
    }
    auto options = fastOptions();
    options.worker.degradedAfter = 2;
    auto pipeline = h.pipeline(options);
    pipeline->addStream("fake", "XRPUSDT", domain::StreamKind::Trades);
    CHECK(pipeline->anyHealthy());
    pipeline->start();

    CHECK(testing_support::waitFor([&]() { return !pipeline->anyHealthy(); }, kWait));
    CHECK(pipeline->status().front().degraded);
    CHECK(pipeline->status().front().consecutiveFailures >= 2);
    CHECK(pipeline->stop(kStopTimeout));
    return 0;
}

int streamsAreRegisteredBeforeStart() {
    Harness h;
    auto pipeline = h.pipeline();
    pipeline->addStream("fake", "BTCUSDT", domain::StreamKind::Trades);
    pipeline->addStream("fake", "BTCUSDT", domain::StreamKind::Trades);
    pipeline->addStream("fake", "BTCUSDT", domain::StreamKind::Quotes);
    CHECK(pipeline->streamCount() == 2);
    CHECK(h.count("SELECT COUNT(*) FROM instruments WHERE symbol = 'BTCUSDT'") == 1);

    bool unknown = false;
    try {
        pipeline->addStream("nowhere", "BTCUSDT", domain::StreamKind::Trades);
    }
    catch (const std::runtime_error&) {
        unknown = true;
    }
    CHECK(unknown);

    pipeline->start();
    const auto active = mdi::common::metrics::Registry::instance().gaugeValue("active_streams");
    CHECK(active && *active == 2.0);
    bool late = false;
    try {
        pipeline->addStream("fake", "ETHUSDT", domain::StreamKind::Trades);
    }
    catch (const std::logic_error&) {
        late = true;
    }
    CHECK(late);
    CHECK(pipeline->stop(kStopTimeout));
    CHECK(mdi::common::metrics::Registry::instance().gaugeValue("active_streams").value_or(-1.0) == 0.0);
    return 0;
}

}  // namespace

int main() {
    RUN(silentStreamReconnects);
    RUN(rejectedRecordIsDeadLetteredOnly);
    RUN(committedRecordsAreSkipped);
    RUN(tradesBecomeCandlesAcrossReconnects);
    RUN(lateTradeAfterCommitIsKept);
    RUN(lateTradeCorrectsClosedCandle);
    RUN(restartMidBucketKeepsVolume);
    RUN(staleOffsetRequestsCatchup);
    RUN(repeatedFailuresDegradeReadiness);
    RUN(streamsAreRegisteredBeforeStart);
    std::cout << "test_realtime_pipeline passed\n";
    return 0;
}
