#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <duckdb.hpp>

#include "TestSupport.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/duckdb/StorageWriter.hpp"
#include "common/Config.hpp"
#include "common/Metrics.hpp"

namespace {

using adapters::duckdb::DuckStore;
using adapters::duckdb::StorageWriter;
using adapters::duckdb::WriteOutcome;

constexpr domain::TimestampMs kT0 = 1'699'999'980'000LL;

struct Fixture {
    Fixture()
        : store(makeStoreOptions()),
          writer(store, makeWriterOptions()) {
        store.migrate();
    }

    static DuckStore::Options makeStoreOptions() {
        DuckStore::Options options;
        options.path = adapters::duckdb::kInMemoryPath;
        options.poolSize = 2;
        options.acquireTimeout = std::chrono::milliseconds(1000);
        return options;
    }

    static StorageWriter::Options makeWriterOptions() {
        StorageWriter::Options options;
        options.batchSize = 50;
        options.maxRetries = 1;
        options.retryBase = std::chrono::milliseconds(1);
        return options;
    }

    std::int64_t count(const std::string& query) {
        auto lease = store.acquire();
        auto result = lease.connection().Query(query);
        if (!result || result->HasError() || result->RowCount() == 0) {
            return -1;
        }
        return result->GetValue(0, 0).GetValue<std::int64_t>();
    }

    double number(const std::string& query) {
        auto lease = store.acquire();
        auto result = lease.connection().Query(query);
        if (!result || result->HasError() || result->RowCount() == 0) {
            return -1.0;
        }
        return result->GetValue(0, 0).GetValue<double>();
    }

    DuckStore store;
    StorageWriter writer;
};

std::int64_t scalar(DuckStore& store, const std::string& query) {
    auto lease = store.acquire();
    auto result = lease.connection().Query(query);
    if (!result || result->HasError() || result->RowCount() == 0) {
        return -1;
    }
    return result->GetValue(0, 0).GetValue<std::int64_t>();
}

domain::Trade trade(const std::string& id, domain::TimestampMs eventTime, double price, double size = 1.0) {
    domain::Trade t;
    t.provider = "binance";
    t.symbol = "BTCUSDT";
    t.tradeId = id;
    t.price = price;
    t.size = size;
    t.side = domain::TradeSide::Buy;
    t.eventTime = eventTime;
    t.receivedAt = eventTime + 5;
    t.correlationId = "corr-" + id;
    return t;
}

domain::Candle candle(domain::TimestampMs bucketStart, double open, double high, double low, double close, double volume) {
    domain::Candle c;
    c.provider = "binance";
    c.symbol = "BTCUSDT";
    c.granularity = domain::Interval{domain::kMillisPerMinute};
    c.bucketStart = bucketStart;
    c.open = open;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = volume;
    c.tradeCount = 1;
    c.lastEventTime = bucketStart + 30'000;
    return c;
}

int migrateIsRepeatable() {
    Fixture fx;
    fx.store.migrate();
    CHECK(fx.store.ping());
    CHECK(fx.count("SELECT COUNT(*) FROM trades") == 0);
    CHECK(fx.count("SELECT COUNT(*) FROM fetch_jobs") == 0);
    CHECK(fx.store.leasedConnections() == 0);
    return 0;
}

int tradesAreIdempotent() {
    Fixture fx;
    std::vector<domain::Trade> batch{trade("1", kT0, 100.0), trade("2", kT0 + 1, 101.0)};
    auto first = fx.writer.upsertTrades(batch);
    CHECK(first.inserted == 2);
    CHECK(first.duplicates == 0);
    CHECK(first.settled());

    auto replay = fx.writer.upsertTrades(batch);
    CHECK(replay.inserted == 0);
    CHECK(replay.duplicates == 2);
    CHECK(replay.outcomes.size() == 2);
    CHECK(replay.outcomes[0] == WriteOutcome::Duplicate);
    CHECK(fx.count("SELECT COUNT(*) FROM trades") == 2);
    return 0;
}

int badRecordIsDeadLetteredAlone() {
    Fixture fx;
    std::vector<domain::Trade> batch{trade("1", kT0, 100.0), trade("2", kT0 + 1, -5.0), trade("3", kT0 + 2, 102.0)};
    auto result = fx.writer.upsertTrades(batch);
    CHECK(result.outcomes.size() == 3);
    CHECK(result.inserted == 2);
    CHECK(result.failed == 1);
    CHECK(result.deadLettered == 1);
    CHECK(result.settled());
    CHECK(result.outcomes[1] == WriteOutcome::Failed);
    CHECK(fx.count("SELECT COUNT(*) FROM trades") == 2);
    CHECK(fx.count("SELECT COUNT(*) FROM dead_letter WHERE provider = 'binance' AND stream_kind = 'trades'") == 1);
    CHECK(fx.count("SELECT COUNT(*) FROM dead_letter WHERE payload LIKE '%\"trade_id\":\"2\"%'") == 1);
    return 0;
}

int explicitDeadLetterIsStored() {
    Fixture fx;
    domain::DeadLetterRecord record;
    record.provider = "polygon";
    record.payload = "{not json";
    record.reason = "decode_failed: unexpected token";
    CHECK(fx.writer.recordDeadLetter(record));
    CHECK(fx.count("SELECT COUNT(*) FROM dead_letter WHERE symbol IS NULL AND error_reason LIKE 'decode_failed%'") == 1);
    return 0;
}

int latestQuoteWins() {
    Fixture fx;
    domain::Quote newer;
    newer.provider = "binance";
    newer.symbol = "BTCUSDT";
    newer.bidPrice = 100.0;
    newer.askPrice = 101.0;
    newer.eventTime = kT0 + 2'000;
    newer.receivedAt = newer.eventTime;

    domain::Quote older = newer;
    older.bidPrice = 90.0;
    older.askPrice = 91.0;
    older.eventTime = kT0 + 1'000;

    CHECK(fx.writer.upsertQuotes({newer}).inserted == 1);
    auto stale = fx.writer.upsertQuotes({older});
    CHECK(stale.failed == 0);
    CHECK(fx.count("SELECT COUNT(*) FROM quotes") == 1);
    CHECK(fx.number("SELECT bid_price FROM quotes WHERE symbol = 'BTCUSDT'") == 100.0);
    return 0;
}

int historyModeKeepsEveryQuote() {
    Fixture fx;
    auto options = Fixture::makeWriterOptions();
    options.quoteMode = mdi::common::QuoteMode::History;
    StorageWriter history(fx.store, options);

    domain::Quote first;
    first.provider = "binance";
    first.symbol = "BTCUSDT";
    first.bidPrice = 100.0;
    first.askPrice = 101.0;
    first.eventTime = kT0 + 1'000;
    first.receivedAt = first.eventTime;

    domain::Quote second = first;
    second.bidPrice = 99.0;
    second.eventTime = kT0 + 2'000;

    domain::Quote replay = first;
    replay.bidPrice = 50.0;

    auto result = history.upsertQuotes({first, second});
    CHECK(result.inserted == 2);
    auto repeated = history.upsertQuotes({replay});
    CHECK(repeated.failed == 0);
    CHECK(repeated.duplicates == 1);

    CHECK(fx.count("SELECT COUNT(*) FROM quotes_history") == 2);
    CHECK(fx.count("SELECT COUNT(*) FROM quotes") == 0);
    CHECK(fx.number("SELECT bid_price FROM quotes_history WHERE event_ms = " + std::to_string(kT0 + 1'000))
          == 100.0);
    return 0;
}

DuckStore::Options singleConnection() {
    DuckStore::Options options;
    options.path = adapters::duckdb::kInMemoryPath;
    options.poolSize = 1;
    options.acquireTimeout = std::chrono::milliseconds(200);
    return options;
}

StorageWriter::Options noRetries() {
    StorageWriter::Options options;
    options.maxRetries = 0;
    options.retryBase = std::chrono::milliseconds(1);
    return options;
}

// The only connection is busy for the batch and freed for the dead-letter inserts.
int exhaustedPoolDeadLettersWholeBatch() {
    DuckStore store(singleConnection());
    store.migrate();
    StorageWriter writer(store, noRetries());
    auto& registry = mdi::common::metrics::Registry::instance();

    std::optional<DuckStore::Lease> held;
    held.emplace(store.acquire());
    const auto timeoutsBefore = registry.counterValue("storage_pool_timeouts_total");
    std::atomic<bool> released{false};
    std::thread releaser([&]() {
        testing_support::waitFor(
            [&]() { return registry.counterValue("storage_pool_timeouts_total") > timeoutsBefore; },
            std::chrono::milliseconds(5000));
        held.reset();
        released.store(true);
    });

    auto result = writer.upsertTrades({trade("1", kT0, 100.0), trade("2", kT0 + 1, 101.0), trade("3", kT0 + 2, 102.0)});
    releaser.join();
    CHECK(released.load());

    CHECK(result.failed == 3);
    CHECK(result.inserted == 0);
    CHECK(result.deadLettered == 3);
    CHECK(result.settled());
    CHECK(result.outcomes.size() == 3);
    CHECK(result.outcomes.front() == WriteOutcome::Failed);
    CHECK(scalar(store, "SELECT COUNT(*) FROM trades") == 0);
    CHECK(scalar(store, "SELECT COUNT(*) FROM dead_letter WHERE error_reason LIKE 'storage_unavailable:%'") == 3);
    return 0;
}

int unreachableStoreLeavesBatchUnsettled() {
    DuckStore store(singleConnection());
    store.migrate();
    StorageWriter writer(store, noRetries());

    std::optional<DuckStore::Lease> held;
    held.emplace(store.acquire());
    auto result = writer.upsertTrades({trade("1", kT0, 100.0), trade("2", kT0 + 1, 101.0)});
    held.reset();

    CHECK(result.failed == 2);
    CHECK(result.deadLettered == 0);
    CHECK(!result.settled());
    CHECK(scalar(store, "SELECT COUNT(*) FROM dead_letter") == 0);
    return 0;
}

int candleReplaceAndCorrectionMerge() {
    Fixture fx;
    CHECK(fx.writer.upsertCandles({candle(kT0, 100.0, 105.0, 99.0, 104.0, 3.0)}).inserted == 1);
    // A replay of the flush replaces the row.
    CHECK(fx.writer.upsertCandles({candle(kT0, 100.0, 105.0, 99.0, 104.0, 3.0)}).failed == 0);
    CHECK(fx.count("SELECT COUNT(*) FROM candles") == 1);

    auto delta = candle(kT0, 120.0, 120.0, 120.0, 120.0, 2.0);
    delta.lastEventTime = kT0 + 10'000;
    auto merged = fx.writer.applyCandleCorrections({delta});
    CHECK(merged.failed == 0);

    CHECK(fx.number("SELECT open FROM candles") == 100.0);
    CHECK(fx.number("SELECT high FROM candles") == 120.0);
    CHECK(fx.number("SELECT low FROM candles") == 99.0);
    // Earlier than the last event, so the close stays.
    CHECK(fx.number("SELECT close FROM candles") == 104.0);
    CHECK(fx.number("SELECT volume FROM candles") == 5.0);
    CHECK(fx.count("SELECT trade_count FROM candles") == 2);
    return 0;
}

int rawEnvelopesLandInView() {
    Fixture fx;
    fx.store.ensureRawPartitions(kT0, 1);
    domain::RawEnvelope envelope;
    envelope.provider = "binance";
    envelope.symbol = "BTCUSDT";
    envelope.eventTime = kT0;
    envelope.receivedAt = kT0 + 3;
    envelope.payload = R"({"e":"trade"})";
    envelope.correlationId = "c-1";
    CHECK(fx.writer.appendRawEnvelopes({envelope, envelope}).inserted == 2);
    CHECK(fx.count("SELECT COUNT(*) FROM trades_raw") == 2);
    CHECK(fx.store.rawPartitionFor(kT0) != fx.store.rawPartitionFor(kT0 + 400LL * domain::kMillisPerDay));
    return 0;
}

int offsetsRoundTrip() {
    Fixture fx;
    domain::StreamKey key{"binance", "BTCUSDT", domain::StreamKind::Trades};
    CHECK(!fx.writer.loadOffset(key).has_value());

    domain::StreamOffset offset;
    offset.key = key;
    offset.lastOffset = "42";
    offset.lastEventTime = kT0;
    CHECK(fx.writer.commitOffset(offset));
    offset.lastOffset = "43";
    offset.lastEventTime = kT0 + 1;
    CHECK(fx.writer.commitOffset(offset));

    auto loaded = fx.writer.loadOffset(key);
    CHECK(loaded.has_value());
    CHECK(loaded->lastOffset == "43");
    CHECK(loaded->lastEventTime == kT0 + 1);
    CHECK(!fx.writer.loadOffset(domain::StreamKey{"binance", "BTCUSDT", domain::StreamKind::Quotes}).has_value());
    return 0;
}

int fetchJobLifecycle() {
    Fixture fx;
    domain::FetchJob draft;
    draft.provider = "binance";
    draft.symbol = "BTCUSDT";
    draft.granularity = domain::Interval{domain::kMillisPerMinute};
    draft.startMs = kT0;
    draft.endMs = kT0 + domain::kMillisPerDay;

    auto job = fx.writer.createFetchJob(draft);
    CHECK(job.has_value());
    CHECK(job->status == domain::JobStatus::Pending);
    CHECK(job->attempts == 0);
    CHECK(!fx.writer.createFetchJob(draft).has_value());

    CHECK(fx.writer.transitionFetchJob(job->id, {domain::JobStatus::Pending}, domain::JobStatus::Running));
    CHECK(!fx.writer.transitionFetchJob(job->id, {domain::JobStatus::Pending}, domain::JobStatus::Running));

    CHECK(fx.writer.checkpointFetchJob(job->id, kT0 + domain::kMillisPerHour));
    CHECK(!fx.writer.checkpointFetchJob(job->id, kT0));

    auto running = fx.writer.loadFetchJob(job->id);
    CHECK(running && running->status == domain::JobStatus::Running);
    CHECK(running->attempts == 1);
    CHECK(running->lastProcessedMs && *running->lastProcessedMs == kT0 + domain::kMillisPerHour);
    CHECK(running->resumeFrom() == kT0 + domain::kMillisPerHour);

    CHECK(fx.writer.transitionFetchJob(job->id, {domain::JobStatus::Running}, domain::JobStatus::Failed, "boom"));
    auto failed = fx.writer.listFetchJobs({domain::JobStatus::Failed});
    CHECK(failed.size() == 1);
    CHECK(failed.front().errorMessage == "boom");
    CHECK(fx.writer.listFetchJobs({domain::JobStatus::Pending}).empty());
    CHECK(fx.writer.listFetchJobs({}).size() == 1);
    return 0;
}

int catalogUpserts() {
    Fixture fx;
    domain::Provider provider;
    provider.name = "binance";
    provider.rateLimitPerMinute = 1200.0;
    fx.writer.upsertProvider(provider);
    provider.rateLimitPerMinute = 600.0;
    fx.writer.upsertProvider(provider);

    domain::Instrument instrument;
    instrument.symbol = "BTCUSDT";
    instrument.provider = "binance";
    instrument.assetKind = domain::AssetKind::Crypto;
    fx.writer.upsertInstrument(instrument);
    fx.writer.upsertInstrument(instrument);

    CHECK(fx.count("SELECT COUNT(*) FROM providers") == 1);
    CHECK(fx.number("SELECT rate_limit_per_minute FROM providers") == 600.0);
    CHECK(fx.count("SELECT COUNT(*) FROM instruments") == 1);
    return 0;
}

}  // namespace

int main() {
    RUN(migrateIsRepeatable);
    RUN(tradesAreIdempotent);
    RUN(badRecordIsDeadLetteredAlone);
    RUN(explicitDeadLetterIsStored);
    RUN(latestQuoteWins);
    RUN(historyModeKeepsEveryQuote);
    RUN(exhaustedPoolDeadLettersWholeBatch);
    RUN(unreachableStoreLeavesBatchUnsettled);
    RUN(candleReplaceAndCorrectionMerge);
    RUN(rawEnvelopesLandInView);
    RUN(offsetsRoundTrip);
    RUN(fetchJobLifecycle);
    RUN(catalogUpserts);
    std::cout << "test_storage_writer passed\n";
    return 0;
}
