#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckStore.hpp"
#include "common/Backoff.hpp"
#include "common/Config.hpp"
#include "domain/Models.hpp"

namespace adapters::duckdb {

enum class WriteOutcome { Inserted, Duplicate, Failed };

const char* to_string(WriteOutcome outcome);

struct WriteResult {
    // One entry per input record, in input order.
    std::vector<WriteOutcome> outcomes;
    std::size_t inserted = 0;
    std::size_t duplicates = 0;
    std::size_t failed = 0;
    std::size_t deadLettered = 0;

    // Every failed record is durably recorded in the dead-letter table.
    bool settled() const noexcept { return failed == deadLettered; }
};

// The only component that mutates the store. Market-data writes are batched in one
// transaction; a record-level failure rolls the batch back and the records are replayed
// one at a time so only the offending ones are dead-lettered.
class StorageWriter {
public:
    struct Options {
        std::size_t batchSize = 500;
        std::size_t maxRetries = 3;
        std::chrono::milliseconds retryBase{200};
        mdi::common::QuoteMode quoteMode = mdi::common::QuoteMode::Latest;
    };

    StorageWriter(DuckStore& store, Options options);

    WriteResult upsertTrades(const std::vector<domain::Trade>& trades);
    WriteResult upsertQuotes(const std::vector<domain::Quote>& quotes);
    // Replaces whole candles (flushes and historical bars).
    WriteResult upsertCandles(const std::vector<domain::Candle>& candles);
    // Merges late-trade deltas: high/low widen, volume adds, close follows the latest
    // event time, open is kept.
    WriteResult applyCandleCorrections(const std::vector<domain::Candle>& deltas);
    WriteResult appendRawEnvelopes(const std::vector<domain::RawEnvelope>& envelopes);

    bool recordDeadLetter(const domain::DeadLetterRecord& record);

    bool commitOffset(const domain::StreamOffset& offset);
    std::optional<domain::StreamOffset> loadOffset(const domain::StreamKey& key);

    void upsertProvider(const domain::Provider& provider);
    void upsertInstrument(const domain::Instrument& instrument);

    // Fetch job persistence. These throw domain::StorageUnavailableError when the store
    // cannot be reached.
    std::optional<domain::FetchJob> createFetchJob(const domain::FetchJob& draft);
    std::optional<domain::FetchJob> findFetchJob(const std::string& provider,
                                                 const std::string& symbol,
                                                 domain::JobKind kind,
                                                 domain::TimestampMs startMs);
    std::optional<domain::FetchJob> loadFetchJob(std::int64_t id);
    std::vector<domain::FetchJob> listFetchJobs(const std::vector<domain::JobStatus>& statuses);
    // Applies `to` only when the job is currently in one of `from`. Entering Running
    // counts an attempt.
    bool transitionFetchJob(std::int64_t id,
                            const std::vector<domain::JobStatus>& from,
                            domain::JobStatus to,
                            const std::string& errorMessage = {});
    // Checkpoints only move forward.
    bool checkpointFetchJob(std::int64_t id, domain::TimestampMs lastProcessedMs);

    DuckStore& store() noexcept { return store_; }
    const Options& options() const noexcept { return options_; }

    // Canonical JSON kept in dead-letter rows so a record can be replayed offline.
    static std::string encode(const domain::Trade& trade);
    static std::string encode(const domain::Quote& quote);
    static std::string encode(const domain::Candle& candle);
    static std::string encode(const domain::RawEnvelope& envelope);

private:
    template <typename Record>
    struct WritePlan;

    template <typename Record>
    WriteResult write_(const std::vector<Record>& records, const WritePlan<Record>& plan);

    template <typename Record>
    void writePerRecord_(const std::vector<Record>& records,
                         std::size_t begin,
                         std::size_t end,
                         const WritePlan<Record>& plan,
                         WriteResult& result);

    template <typename Record>
    bool deadLetter_(const Record& record,
                     const WritePlan<Record>& plan,
                     const std::string& reason,
                     std::int32_t retryCount);

    DuckStore& store_;
    Options options_;
    mdi::common::Backoff backoff_;
};

}  // namespace adapters::duckdb
