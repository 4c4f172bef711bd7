#include "adapters/duckdb/StorageWriter.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/json.hpp>
#include <duckdb.hpp>

#include "adapters/duckdb/DuckSql.hpp"
#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace adapters::duckdb {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;

namespace json = boost::json;
using mdi::common::metrics::Registry;
using mdi::common::metrics::seriesKey;

enum class ChunkStatus { Committed, RecordFailed, Unavailable };

struct ChunkAttempt {
    ChunkStatus status = ChunkStatus::Committed;
    std::vector<WriteOutcome> outcomes;
    std::string error;
    // Constraint violations fail the same way on every retry.
    bool permanent = false;
};

void logRollbackFailure(const std::exception& ex) {
    LOG_WARN(kLogCategory, "StorageWriter rollback failed error=%s", ex.what());
}

// Runs records[begin, end) in one transaction. Nothing is committed unless every
// statement succeeds.
template <typename Record, typename Plan>
ChunkAttempt runChunk(::duckdb::Connection& connection,
                      const std::vector<Record>& records,
                      std::size_t begin,
                      std::size_t end,
                      const Plan& plan) {
    ChunkAttempt attempt;
    bool inTransaction = false;
    auto rollback = [&]() {
        if (!inTransaction) {
            return;
        }
        try {
            connection.Rollback();
        }
        catch (const std::exception& ex) {
            logRollbackFailure(ex);
        }
        inTransaction = false;
    };

    try {
        connection.BeginTransaction();
        inTransaction = true;
    }
    catch (const std::exception& ex) {
        attempt.status = ChunkStatus::Unavailable;
        attempt.error = ex.what();
        return attempt;
    }

    std::map<std::string, std::unique_ptr<::duckdb::PreparedStatement>> statements;
    sql::DuckdbValueVector parameters;
    attempt.outcomes.reserve(end - begin);

    try {
        for (std::size_t index = begin; index < end; ++index) {
            const auto& record = records[index];
            const std::string statementSql = plan.statementFor(record);
            auto it = statements.find(statementSql);
            if (it == statements.end()) {
                auto prepared = connection.Prepare(statementSql);
                if (!prepared || prepared->HasError()) {
                    attempt.status = ChunkStatus::Unavailable;
                    attempt.error = prepared ? prepared->GetError() : std::string{"failed to prepare statement"};
                    rollback();
                    return attempt;
                }
                it = statements.emplace(statementSql, std::move(prepared)).first;
            }

            parameters.clear();
            plan.bind(record, parameters);
            auto result = it->second->Execute(parameters);
            if (!result || result->HasError()) {
                attempt.status = ChunkStatus::RecordFailed;
                attempt.error = sql::errorOf(result.get(), "failed to execute statement");
                attempt.permanent = result && sql::isConstraintViolation(*result);
                rollback();
                return attempt;
            }
            attempt.outcomes.push_back(sql::changedRows(*result) > 0 ? WriteOutcome::Inserted
                                                                     : WriteOutcome::Duplicate);
        }

        connection.Commit();
        inTransaction = false;
    }
    catch (const std::exception& ex) {
        rollback();
        attempt.status = ChunkStatus::RecordFailed;
        attempt.error = ex.what();
        attempt.outcomes.clear();
    }
    return attempt;
}

void addOutcome(WriteResult& result, WriteOutcome outcome) {
    result.outcomes.push_back(outcome);
    switch (outcome) {
    case WriteOutcome::Inserted:
        ++result.inserted;
        break;
    case WriteOutcome::Duplicate:
        ++result.duplicates;
        break;
    case WriteOutcome::Failed:
        ++result.failed;
        break;
    }
}

void recordOutcomeMetrics(const char* operation, const WriteResult& result) {
    auto& registry = Registry::instance();
    registry.incrementCounter(seriesKey("storage_records_total", {{"op", operation}, {"outcome", "inserted"}}),
                              result.inserted);
    registry.incrementCounter(seriesKey("storage_records_total", {{"op", operation}, {"outcome", "duplicate"}}),
                              result.duplicates);
    registry.incrementCounter(seriesKey("storage_records_total", {{"op", operation}, {"outcome", "failed"}}),
                              result.failed);
}

std::string reasonStage(const std::string& reason) {
    const auto colon = reason.find(':');
    return colon == std::string::npos ? reason : reason.substr(0, colon);
}

json::value optionalNumber(const std::optional<double>& value) {
    return value ? json::value(*value) : json::value(nullptr);
}

constexpr const char* kTradeInsert = R"SQL(
    INSERT INTO trades (provider, symbol, trade_id, price, size, side, event_ms, received_ms, correlation_id)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT (provider, symbol, event_ms, trade_id) DO NOTHING
)SQL";

constexpr const char* kQuoteLatestUpsert = R"SQL(
    INSERT INTO quotes (provider, symbol, bid_price, bid_size, ask_price, ask_size, last_price, last_size,
                        event_ms, received_ms, correlation_id)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT (provider, symbol) DO UPDATE SET
        bid_price = excluded.bid_price,
        bid_size = excluded.bid_size,
        ask_price = excluded.ask_price,
        ask_size = excluded.ask_size,
        last_price = COALESCE(excluded.last_price, quotes.last_price),
        last_size = COALESCE(excluded.last_size, quotes.last_size),
        event_ms = excluded.event_ms,
        received_ms = excluded.received_ms,
        correlation_id = excluded.correlation_id
    WHERE excluded.event_ms > quotes.event_ms
)SQL";

constexpr const char* kQuoteHistoryInsert = R"SQL(
    INSERT INTO quotes_history (provider, symbol, bid_price, bid_size, ask_price, ask_size, last_price, last_size,
                                event_ms, received_ms, correlation_id)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT (provider, symbol, event_ms) DO NOTHING
)SQL";

constexpr const char* kCandleReplace = R"SQL(
    INSERT OR REPLACE INTO candles (provider, symbol, granularity_ms, bucket_start, open, high, low, close, volume,
                                    trade_count, last_event_ms, correlation_id, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)SQL";

constexpr const char* kCandleMerge = R"SQL(
    INSERT INTO candles (provider, symbol, granularity_ms, bucket_start, open, high, low, close, volume,
                         trade_count, last_event_ms, correlation_id, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT (provider, symbol, granularity_ms, bucket_start) DO UPDATE SET
        high = GREATEST(candles.high, excluded.high),
        low = LEAST(candles.low, excluded.low),
        close = CASE WHEN excluded.last_event_ms >= candles.last_event_ms THEN excluded.close ELSE candles.close END,
        volume = candles.volume + excluded.volume,
        trade_count = candles.trade_count + excluded.trade_count,
        last_event_ms = GREATEST(candles.last_event_ms, excluded.last_event_ms),
        updated_at = excluded.updated_at
)SQL";

void bindQuote(const domain::Quote& quote, sql::DuckdbValueVector& parameters) {
    parameters.emplace_back(quote.provider);
    parameters.emplace_back(quote.symbol);
    parameters.emplace_back(sql::doubleOrNull(quote.bidPrice));
    parameters.emplace_back(sql::doubleOrNull(quote.bidSize));
    parameters.emplace_back(sql::doubleOrNull(quote.askPrice));
    parameters.emplace_back(sql::doubleOrNull(quote.askSize));
    parameters.emplace_back(sql::doubleOrNull(quote.lastPrice));
    parameters.emplace_back(sql::doubleOrNull(quote.lastSize));
    parameters.emplace_back(sql::bigint(quote.eventTime));
    parameters.emplace_back(sql::bigint(quote.receivedAt));
    parameters.emplace_back(quote.correlationId);
}

void bindCandle(const domain::Candle& candle, sql::DuckdbValueVector& parameters) {
    parameters.emplace_back(candle.provider);
    parameters.emplace_back(candle.symbol);
    parameters.emplace_back(sql::bigint(candle.granularity.ms));
    parameters.emplace_back(sql::bigint(candle.bucketStart));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.open));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.high));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.low));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.close));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.volume));
    parameters.emplace_back(sql::bigint(candle.tradeCount));
    parameters.emplace_back(sql::bigint(candle.lastEventTime));
    parameters.emplace_back(candle.correlationId);
    parameters.emplace_back(sql::bigint(mdi::common::nowMs()));
}

}  // namespace

template <typename Record>
struct StorageWriter::WritePlan {
    const char* operation;
    std::function<std::string(const Record&)> statementFor;
    std::function<void(const Record&, sql::DuckdbValueVector&)> bind;
    std::function<std::string(const Record&)> encode;
    // Provider, symbol and stream kind for the dead-letter row.
    std::function<domain::DeadLetterRecord(const Record&)> origin;
};

const char* to_string(WriteOutcome outcome) {
    switch (outcome) {
    case WriteOutcome::Inserted:
        return "inserted";
    case WriteOutcome::Duplicate:
        return "duplicate";
    case WriteOutcome::Failed:
        return "failed";
    }
    return "failed";
}

StorageWriter::StorageWriter(DuckStore& store, Options options)
    : store_(store),
      options_(options),
      backoff_(mdi::common::BackoffPolicy{options.retryBase, options.retryBase * 16, 0.25}) {
    if (options_.batchSize == 0) {
        options_.batchSize = 1;
    }
}

template <typename Record>
WriteResult StorageWriter::write_(const std::vector<Record>& records, const WritePlan<Record>& plan) {
    WriteResult result;
    if (records.empty()) {
        return result;
    }
    result.outcomes.reserve(records.size());
    Registry::ScopedTimer timer(seriesKey("storage_op", {{"op", plan.operation}}));

    for (std::size_t begin = 0; begin < records.size(); begin += options_.batchSize) {
        const std::size_t end = std::min(begin + options_.batchSize, records.size());

        std::size_t attempt = 0;
        while (true) {
            ChunkAttempt chunk;
            try {
                auto lease = store_.acquire();
                chunk = runChunk(lease.connection(), records, begin, end, plan);
            }
            catch (const domain::StorageUnavailableError& ex) {
                chunk.status = ChunkStatus::Unavailable;
                chunk.error = ex.what();
            }

            if (chunk.status == ChunkStatus::Committed) {
                for (auto outcome : chunk.outcomes) {
                    addOutcome(result, outcome);
                }
                break;
            }

            if (chunk.status == ChunkStatus::RecordFailed) {
                LOG_WARN(kLogCategory,
                         "StorageWriter %s batch of %zu rolled back, retrying per record error=%s",
                         plan.operation,
                         end - begin,
                         chunk.error.c_str());
                Registry::instance().incrementCounter(
                    seriesKey("storage_batch_fallbacks_total", {{"op", plan.operation}}));
                writePerRecord_(records, begin, end, plan, result);
                break;
            }

            ++attempt;
            if (attempt > options_.maxRetries) {
                LOG_ERROR(kLogCategory,
                          "StorageWriter %s store unavailable after %zu attempts, dead-lettering %zu records error=%s",
                          plan.operation,
                          attempt,
                          end - begin,
                          chunk.error.c_str());
                const std::string reason = "storage_unavailable: " + chunk.error;
                for (std::size_t index = begin; index < end; ++index) {
                    addOutcome(result, WriteOutcome::Failed);
                    if (deadLetter_(records[index], plan, reason, static_cast<std::int32_t>(attempt - 1))) {
                        ++result.deadLettered;
                    }
                }
                break;
            }

            const auto delay = backoff_.delay(static_cast<std::uint32_t>(attempt));
            LOG_WARN(kLogCategory,
                     "StorageWriter %s store unavailable attempt=%zu retry_in=%lldms error=%s",
                     plan.operation,
                     attempt,
                     static_cast<long long>(delay.count()),
                     chunk.error.c_str());
            std::this_thread::sleep_for(delay);
        }
    }

    recordOutcomeMetrics(plan.operation, result);
    return result;
}

template <typename Record>
void StorageWriter::writePerRecord_(const std::vector<Record>& records,
                                    std::size_t begin,
                                    std::size_t end,
                                    const WritePlan<Record>& plan,
                                    WriteResult& result) {
    for (std::size_t index = begin; index < end; ++index) {
        std::size_t attempt = 0;
        while (true) {
            ++attempt;
            ChunkAttempt single;
            try {
                auto lease = store_.acquire();
                single = runChunk(lease.connection(), records, index, index + 1, plan);
            }
            catch (const domain::StorageUnavailableError& ex) {
                single.status = ChunkStatus::Unavailable;
                single.error = ex.what();
            }

            if (single.status == ChunkStatus::Committed) {
                addOutcome(result, single.outcomes.empty() ? WriteOutcome::Duplicate : single.outcomes.front());
                break;
            }

            if (single.permanent || attempt > options_.maxRetries) {
                const std::string reason = (single.status == ChunkStatus::Unavailable ? "storage_unavailable: "
                                                                                      : "write_failed: ")
                                           + single.error;
                LOG_WARN(kLogCategory,
                         "StorageWriter %s record %zu rejected after %zu attempts reason=%s",
                         plan.operation,
                         index,
                         attempt,
                         reason.c_str());
                addOutcome(result, WriteOutcome::Failed);
                if (deadLetter_(records[index], plan, reason, static_cast<std::int32_t>(attempt - 1))) {
                    ++result.deadLettered;
                }
                break;
            }

            std::this_thread::sleep_for(backoff_.delay(static_cast<std::uint32_t>(attempt)));
        }
    }
}

template <typename Record>
bool StorageWriter::deadLetter_(const Record& record,
                                const WritePlan<Record>& plan,
                                const std::string& reason,
                                std::int32_t retryCount) {
    auto entry = plan.origin(record);
    entry.payload = plan.encode(record);
    entry.reason = reason;
    entry.retryCount = retryCount;
    return recordDeadLetter(entry);
}

WriteResult StorageWriter::upsertTrades(const std::vector<domain::Trade>& trades) {
    WritePlan<domain::Trade> plan{
        "upsert_trades",
        [](const domain::Trade&) { return std::string(kTradeInsert); },
        [](const domain::Trade& trade, sql::DuckdbValueVector& parameters) {
            parameters.emplace_back(trade.provider);
            parameters.emplace_back(trade.symbol);
            parameters.emplace_back(sql::textOrNull(trade.tradeId));
            parameters.emplace_back(::duckdb::Value::DOUBLE(trade.price));
            parameters.emplace_back(::duckdb::Value::DOUBLE(trade.size));
            parameters.emplace_back(std::string(domain::to_string(trade.side)));
            parameters.emplace_back(sql::bigint(trade.eventTime));
            parameters.emplace_back(sql::bigint(trade.receivedAt));
            parameters.emplace_back(trade.correlationId);
        },
        [](const domain::Trade& trade) { return encode(trade); },
        [](const domain::Trade& trade) {
            domain::DeadLetterRecord entry;
            entry.provider = trade.provider;
            entry.symbol = trade.symbol;
            entry.streamKind = domain::StreamKind::Trades;
            return entry;
        }};
    return write_(trades, plan);
}

WriteResult StorageWriter::upsertQuotes(const std::vector<domain::Quote>& quotes) {
    const bool history = options_.quoteMode == mdi::common::QuoteMode::History;
    WritePlan<domain::Quote> plan{
        history ? "upsert_quotes_history" : "upsert_quotes",
        [history](const domain::Quote&) { return std::string(history ? kQuoteHistoryInsert : kQuoteLatestUpsert); },
        bindQuote,
        [](const domain::Quote& quote) { return encode(quote); },
        [](const domain::Quote& quote) {
            domain::DeadLetterRecord entry;
            entry.provider = quote.provider;
            entry.symbol = quote.symbol;
            entry.streamKind = domain::StreamKind::Quotes;
            return entry;
        }};
    return write_(quotes, plan);
}

WriteResult StorageWriter::upsertCandles(const std::vector<domain::Candle>& candles) {
    WritePlan<domain::Candle> plan{
        "upsert_candles",
        [](const domain::Candle&) { return std::string(kCandleReplace); },
        bindCandle,
        [](const domain::Candle& candle) { return encode(candle); },
        [](const domain::Candle& candle) {
            domain::DeadLetterRecord entry;
            entry.provider = candle.provider;
            entry.symbol = candle.symbol;
            return entry;
        }};
    return write_(candles, plan);
}

WriteResult StorageWriter::applyCandleCorrections(const std::vector<domain::Candle>& deltas) {
    WritePlan<domain::Candle> plan{
        "merge_candles",
        [](const domain::Candle&) { return std::string(kCandleMerge); },
        bindCandle,
        [](const domain::Candle& candle) { return encode(candle); },
        [](const domain::Candle& candle) {
            domain::DeadLetterRecord entry;
            entry.provider = candle.provider;
            entry.symbol = candle.symbol;
            return entry;
        }};
    return write_(deltas, plan);
}

WriteResult StorageWriter::appendRawEnvelopes(const std::vector<domain::RawEnvelope>& envelopes) {
    WritePlan<domain::RawEnvelope> plan{
        "append_raw",
        [this](const domain::RawEnvelope& envelope) {
            return "INSERT INTO " + store_.rawPartitionFor(envelope.eventTime)
                   + " (provider, symbol, stream_kind, event_ms, received_ms, payload, correlation_id)"
                     " VALUES (?, ?, ?, ?, ?, ?, ?)";
        },
        [](const domain::RawEnvelope& envelope, sql::DuckdbValueVector& parameters) {
            parameters.emplace_back(envelope.provider);
            parameters.emplace_back(envelope.symbol);
            parameters.emplace_back(std::string(domain::to_string(envelope.streamKind)));
            parameters.emplace_back(sql::bigint(envelope.eventTime));
            parameters.emplace_back(sql::bigint(envelope.receivedAt));
            parameters.emplace_back(envelope.payload);
            parameters.emplace_back(envelope.correlationId);
        },
        [](const domain::RawEnvelope& envelope) { return encode(envelope); },
        [](const domain::RawEnvelope& envelope) {
            domain::DeadLetterRecord entry;
            entry.provider = envelope.provider;
            entry.symbol = envelope.symbol;
            entry.streamKind = envelope.streamKind;
            return entry;
        }};
    return write_(envelopes, plan);
}

bool StorageWriter::recordDeadLetter(const domain::DeadLetterRecord& record) {
    try {
        auto lease = store_.acquire();
        auto statement = lease.connection().Prepare(R"SQL(
            INSERT INTO dead_letter (provider, symbol, stream_kind, payload, error_reason, retry_count, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )SQL");
        if (!statement || statement->HasError()) {
            LOG_ERROR(kLogCategory,
                      "StorageWriter dead-letter prepare failed error=%s",
                      statement ? statement->GetError().c_str() : "unknown");
            return false;
        }

        sql::DuckdbValueVector parameters;
        parameters.emplace_back(record.provider);
        parameters.emplace_back(sql::textOrNull(record.symbol));
        parameters.emplace_back(record.streamKind ? ::duckdb::Value(std::string(domain::to_string(*record.streamKind)))
                                                  : ::duckdb::Value());
        parameters.emplace_back(record.payload);
        parameters.emplace_back(record.reason);
        parameters.emplace_back(::duckdb::Value::INTEGER(record.retryCount));
        parameters.emplace_back(sql::bigint(record.createdAt > 0 ? record.createdAt : mdi::common::nowMs()));

        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            LOG_ERROR(kLogCategory,
                      "StorageWriter dead-letter insert failed error=%s",
                      sql::errorOf(result.get(), "unknown").c_str());
            return false;
        }
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "StorageWriter dead-letter write failed error=%s", ex.what());
        return false;
    }

    Registry::instance().incrementCounter(
        seriesKey("dead_letter_total", {{"provider", record.provider}, {"stage", reasonStage(record.reason)}}));
    return true;
}

std::string StorageWriter::encode(const domain::Trade& trade) {
    json::object obj;
    obj["type"] = "trade";
    obj["provider"] = trade.provider;
    obj["symbol"] = trade.symbol;
    obj["trade_id"] = trade.tradeId ? json::value(*trade.tradeId) : json::value(nullptr);
    obj["price"] = trade.price;
    obj["size"] = trade.size;
    obj["side"] = domain::to_string(trade.side);
    obj["event_time"] = trade.eventTime;
    obj["received_at"] = trade.receivedAt;
    obj["correlation_id"] = trade.correlationId;
    return json::serialize(obj);
}

std::string StorageWriter::encode(const domain::Quote& quote) {
    json::object obj;
    obj["type"] = "quote";
    obj["provider"] = quote.provider;
    obj["symbol"] = quote.symbol;
    obj["bid_price"] = optionalNumber(quote.bidPrice);
    obj["bid_size"] = optionalNumber(quote.bidSize);
    obj["ask_price"] = optionalNumber(quote.askPrice);
    obj["ask_size"] = optionalNumber(quote.askSize);
    obj["last_price"] = optionalNumber(quote.lastPrice);
    obj["last_size"] = optionalNumber(quote.lastSize);
    obj["event_time"] = quote.eventTime;
    obj["received_at"] = quote.receivedAt;
    obj["correlation_id"] = quote.correlationId;
    return json::serialize(obj);
}

std::string StorageWriter::encode(const domain::Candle& candle) {
    json::object obj;
    obj["type"] = "candle";
    obj["provider"] = candle.provider;
    obj["symbol"] = candle.symbol;
    obj["granularity_ms"] = candle.granularity.ms;
    obj["bucket_start"] = candle.bucketStart;
    obj["open"] = candle.open;
    obj["high"] = candle.high;
    obj["low"] = candle.low;
    obj["close"] = candle.close;
    obj["volume"] = candle.volume;
    obj["trade_count"] = candle.tradeCount;
    obj["last_event_time"] = candle.lastEventTime;
    obj["correlation_id"] = candle.correlationId;
    return json::serialize(obj);
}

std::string StorageWriter::encode(const domain::RawEnvelope& envelope) {
    json::object obj;
    obj["type"] = "raw";
    obj["provider"] = envelope.provider;
    obj["symbol"] = envelope.symbol;
    obj["stream_kind"] = domain::to_string(envelope.streamKind);
    obj["event_time"] = envelope.eventTime;
    obj["received_at"] = envelope.receivedAt;
    obj["payload"] = envelope.payload;
    obj["correlation_id"] = envelope.correlationId;
    return json::serialize(obj);
}

}  // namespace adapters::duckdb
