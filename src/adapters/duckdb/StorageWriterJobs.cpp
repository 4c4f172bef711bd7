#include "adapters/duckdb/StorageWriter.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckSql.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace adapters::duckdb {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;

constexpr const char* kFetchJobColumns =
    "id, provider, symbol, job_kind, granularity_ms, start_ms, end_ms, status, last_processed_ms, "
    "error_message, attempts, created_at, updated_at";

std::unique_ptr<::duckdb::PreparedStatement> prepareOrThrow(::duckdb::Connection& connection,
                                                            const std::string& statementSql,
                                                            const char* operation) {
    auto statement = connection.Prepare(statementSql);
    if (!statement || statement->HasError()) {
        throw domain::StorageUnavailableError(std::string(operation) + " prepare failed: "
                                              + (statement ? statement->GetError() : std::string{"unknown"}));
    }
    return statement;
}

std::unique_ptr<::duckdb::QueryResult> executeOrThrow(::duckdb::PreparedStatement& statement,
                                                      sql::DuckdbValueVector& parameters,
                                                      const char* operation) {
    auto result = statement.Execute(parameters);
    if (!result || result->HasError()) {
        throw domain::StorageUnavailableError(std::string(operation) + " failed: "
                                              + sql::errorOf(result.get(), "unknown"));
    }
    return result;
}

domain::FetchJob readFetchJob(::duckdb::DataChunk& chunk, ::duckdb::idx_t row) {
    domain::FetchJob job;
    job.id = chunk.GetValue(0, row).GetValue<std::int64_t>();
    job.provider = chunk.GetValue(1, row).ToString();
    job.symbol = chunk.GetValue(2, row).ToString();
    job.kind = domain::job_kind_from_string(chunk.GetValue(3, row).ToString()).value_or(domain::JobKind::Backfill);
    job.granularity = domain::Interval{chunk.GetValue(4, row).GetValue<std::int64_t>()};
    job.startMs = chunk.GetValue(5, row).GetValue<std::int64_t>();
    job.endMs = chunk.GetValue(6, row).GetValue<std::int64_t>();
    job.status = domain::job_status_from_string(chunk.GetValue(7, row).ToString()).value_or(domain::JobStatus::Failed);
    if (auto checkpoint = sql::optionalBigint(chunk.GetValue(8, row))) {
        job.lastProcessedMs = *checkpoint;
    }
    job.errorMessage = sql::optionalText(chunk.GetValue(9, row)).value_or(std::string{});
    job.attempts = chunk.GetValue(10, row).GetValue<std::int32_t>();
    job.createdAt = chunk.GetValue(11, row).GetValue<std::int64_t>();
    job.updatedAt = chunk.GetValue(12, row).GetValue<std::int64_t>();
    return job;
}

std::vector<domain::FetchJob> collectFetchJobs(::duckdb::QueryResult& result) {
    std::vector<domain::FetchJob> jobs;
    while (auto chunk = result.Fetch()) {
        if (chunk->size() == 0) {
            break;
        }
        for (::duckdb::idx_t row = 0; row < chunk->size(); ++row) {
            jobs.push_back(readFetchJob(*chunk, row));
        }
    }
    return jobs;
}

std::string statusList(const std::vector<domain::JobStatus>& statuses) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < statuses.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << '\'' << domain::to_string(statuses[i]) << '\'';
    }
    return oss.str();
}

}  // namespace

bool StorageWriter::commitOffset(const domain::StreamOffset& offset) {
    try {
        auto lease = store_.acquire();
        auto statement = prepareOrThrow(lease.connection(), R"SQL(
            INSERT INTO stream_offsets (provider, symbol, stream_kind, last_offset, last_event_ms, updated_at)
            VALUES (?, ?, ?, ?, ?, ?)
            ON CONFLICT (provider, symbol, stream_kind) DO UPDATE SET
                last_offset = excluded.last_offset,
                last_event_ms = excluded.last_event_ms,
                updated_at = excluded.updated_at
        )SQL", "commit_offset");

        sql::DuckdbValueVector parameters;
        parameters.emplace_back(offset.key.provider);
        parameters.emplace_back(offset.key.symbol);
        parameters.emplace_back(std::string(domain::to_string(offset.key.kind)));
        parameters.emplace_back(offset.lastOffset);
        parameters.emplace_back(sql::bigint(offset.lastEventTime));
        parameters.emplace_back(sql::bigint(offset.updatedAt > 0 ? offset.updatedAt : mdi::common::nowMs()));
        executeOrThrow(*statement, parameters, "commit_offset");
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory,
                 "StorageWriter offset commit failed stream=%s error=%s",
                 domain::describe(offset.key).c_str(),
                 ex.what());
        return false;
    }
    return true;
}

std::optional<domain::StreamOffset> StorageWriter::loadOffset(const domain::StreamKey& key) {
    auto lease = store_.acquire();
    auto statement = prepareOrThrow(lease.connection(), R"SQL(
        SELECT last_offset, last_event_ms, updated_at
        FROM stream_offsets
        WHERE provider = ? AND symbol = ? AND stream_kind = ?
    )SQL", "load_offset");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(key.provider);
    parameters.emplace_back(key.symbol);
    parameters.emplace_back(std::string(domain::to_string(key.kind)));
    auto result = executeOrThrow(*statement, parameters, "load_offset");

    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0) {
        return std::nullopt;
    }
    domain::StreamOffset offset;
    offset.key = key;
    offset.lastOffset = sql::optionalText(chunk->GetValue(0, 0)).value_or(std::string{});
    offset.lastEventTime = chunk->GetValue(1, 0).GetValue<std::int64_t>();
    offset.updatedAt = chunk->GetValue(2, 0).GetValue<std::int64_t>();
    return offset;
}

void StorageWriter::upsertProvider(const domain::Provider& provider) {
    auto lease = store_.acquire();
    auto statement = prepareOrThrow(lease.connection(), R"SQL(
        INSERT INTO providers (name, kind, base_endpoint, stream_endpoint, rate_limit_per_minute, active, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT (name) DO UPDATE SET
            kind = excluded.kind,
            base_endpoint = excluded.base_endpoint,
            stream_endpoint = excluded.stream_endpoint,
            rate_limit_per_minute = excluded.rate_limit_per_minute,
            active = excluded.active,
            updated_at = excluded.updated_at
    )SQL", "upsert_provider");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(provider.name);
    parameters.emplace_back(std::string(domain::to_string(provider.kind)));
    parameters.emplace_back(provider.baseEndpoint);
    parameters.emplace_back(provider.streamEndpoint);
    parameters.emplace_back(::duckdb::Value::DOUBLE(provider.rateLimitPerMinute));
    parameters.emplace_back(::duckdb::Value::BOOLEAN(provider.active));
    parameters.emplace_back(sql::bigint(mdi::common::nowMs()));
    executeOrThrow(*statement, parameters, "upsert_provider");
}

void StorageWriter::upsertInstrument(const domain::Instrument& instrument) {
    auto lease = store_.acquire();
    auto statement = prepareOrThrow(lease.connection(), R"SQL(
        INSERT INTO instruments (symbol, provider, asset_kind, base_currency, quote_currency, active, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT (symbol) DO UPDATE SET
            provider = excluded.provider,
            asset_kind = excluded.asset_kind,
            base_currency = excluded.base_currency,
            quote_currency = excluded.quote_currency,
            active = excluded.active,
            updated_at = excluded.updated_at
    )SQL", "upsert_instrument");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(instrument.symbol);
    parameters.emplace_back(instrument.provider);
    parameters.emplace_back(std::string(domain::to_string(instrument.assetKind)));
    parameters.emplace_back(instrument.baseCurrency);
    parameters.emplace_back(instrument.quoteCurrency);
    parameters.emplace_back(::duckdb::Value::BOOLEAN(instrument.active));
    parameters.emplace_back(sql::bigint(mdi::common::nowMs()));
    executeOrThrow(*statement, parameters, "upsert_instrument");
}

std::optional<domain::FetchJob> StorageWriter::createFetchJob(const domain::FetchJob& draft) {
    {
        auto lease = store_.acquire();
        auto statement = prepareOrThrow(lease.connection(), R"SQL(
            INSERT INTO fetch_jobs (provider, symbol, job_kind, granularity_ms, start_ms, end_ms, status,
                                    last_processed_ms, error_message, attempts, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, 'pending', NULL, NULL, 0, ?, ?)
            ON CONFLICT (provider, symbol, job_kind, start_ms) DO NOTHING
        )SQL", "create_fetch_job");

        const auto now = mdi::common::nowMs();
        sql::DuckdbValueVector parameters;
        parameters.emplace_back(draft.provider);
        parameters.emplace_back(draft.symbol);
        parameters.emplace_back(std::string(domain::to_string(draft.kind)));
        parameters.emplace_back(sql::bigint(draft.granularity.ms));
        parameters.emplace_back(sql::bigint(draft.startMs));
        parameters.emplace_back(sql::bigint(draft.endMs));
        parameters.emplace_back(sql::bigint(now));
        parameters.emplace_back(sql::bigint(now));
        auto result = executeOrThrow(*statement, parameters, "create_fetch_job");
        if (sql::changedRows(*result) == 0) {
            LOG_INFO(kLogCategory,
                     "StorageWriter fetch job already exists provider=%s symbol=%s kind=%s start=%lld",
                     draft.provider.c_str(),
                     draft.symbol.c_str(),
                     domain::to_string(draft.kind),
                     static_cast<long long>(draft.startMs));
            return std::nullopt;
        }
    }
    return findFetchJob(draft.provider, draft.symbol, draft.kind, draft.startMs);
}

std::optional<domain::FetchJob> StorageWriter::findFetchJob(const std::string& provider,
                                                            const std::string& symbol,
                                                            domain::JobKind kind,
                                                            domain::TimestampMs startMs) {
    auto lease = store_.acquire();
    auto statement = prepareOrThrow(
        lease.connection(),
        std::string("SELECT ") + kFetchJobColumns
            + " FROM fetch_jobs WHERE provider = ? AND symbol = ? AND job_kind = ? AND start_ms = ?",
        "find_fetch_job");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(provider);
    parameters.emplace_back(symbol);
    parameters.emplace_back(std::string(domain::to_string(kind)));
    parameters.emplace_back(sql::bigint(startMs));
    auto result = executeOrThrow(*statement, parameters, "find_fetch_job");
    auto jobs = collectFetchJobs(*result);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

std::optional<domain::FetchJob> StorageWriter::loadFetchJob(std::int64_t id) {
    auto lease = store_.acquire();
    auto statement = prepareOrThrow(lease.connection(),
                                    std::string("SELECT ") + kFetchJobColumns + " FROM fetch_jobs WHERE id = ?",
                                    "load_fetch_job");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(sql::bigint(id));
    auto result = executeOrThrow(*statement, parameters, "load_fetch_job");
    auto jobs = collectFetchJobs(*result);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

std::vector<domain::FetchJob> StorageWriter::listFetchJobs(const std::vector<domain::JobStatus>& statuses) {
    std::string query = std::string("SELECT ") + kFetchJobColumns + " FROM fetch_jobs";
    if (!statuses.empty()) {
        query += " WHERE status IN (" + statusList(statuses) + ")";
    }
    query += " ORDER BY id";

    auto lease = store_.acquire();
    auto result = lease.connection().Query(query);
    if (!result || result->HasError()) {
        throw domain::StorageUnavailableError("list_fetch_jobs failed: " + sql::errorOf(result.get(), "unknown"));
    }
    return collectFetchJobs(*result);
}

bool StorageWriter::transitionFetchJob(std::int64_t id,
                                       const std::vector<domain::JobStatus>& from,
                                       domain::JobStatus to,
                                       const std::string& errorMessage) {
    if (from.empty()) {
        return false;
    }

    const bool countsAttempt = to == domain::JobStatus::Running;
    std::string query = "UPDATE fetch_jobs SET status = ?, error_message = ?, updated_at = ?";
    if (countsAttempt) {
        query += ", attempts = attempts + 1";
    }
    query += " WHERE id = ? AND status IN (" + statusList(from) + ")";

    auto lease = store_.acquire();
    auto statement = prepareOrThrow(lease.connection(), query, "transition_fetch_job");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(std::string(domain::to_string(to)));
    parameters.emplace_back(errorMessage.empty() ? ::duckdb::Value() : ::duckdb::Value(errorMessage));
    parameters.emplace_back(sql::bigint(mdi::common::nowMs()));
    parameters.emplace_back(sql::bigint(id));
    auto result = executeOrThrow(*statement, parameters, "transition_fetch_job");
    const bool applied = sql::changedRows(*result) > 0;
    if (applied) {
        LOG_DEBUG(kLogCategory, "StorageWriter job %lld -> %s", static_cast<long long>(id), domain::to_string(to));
    }
    return applied;
}

bool StorageWriter::checkpointFetchJob(std::int64_t id, domain::TimestampMs lastProcessedMs) {
    auto lease = store_.acquire();
    auto statement = prepareOrThrow(lease.connection(), R"SQL(
        UPDATE fetch_jobs SET last_processed_ms = ?, updated_at = ?
        WHERE id = ? AND (last_processed_ms IS NULL OR last_processed_ms < ?)
    )SQL", "checkpoint_fetch_job");

    sql::DuckdbValueVector parameters;
    parameters.emplace_back(sql::bigint(lastProcessedMs));
    parameters.emplace_back(sql::bigint(mdi::common::nowMs()));
    parameters.emplace_back(sql::bigint(id));
    parameters.emplace_back(sql::bigint(lastProcessedMs));
    auto result = executeOrThrow(*statement, parameters, "checkpoint_fetch_job");
    return sql::changedRows(*result) > 0;
}

}  // namespace adapters::duckdb
