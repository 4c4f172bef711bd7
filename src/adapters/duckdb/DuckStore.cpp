#include "adapters/duckdb/DuckStore.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckSql.hpp"
#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;
constexpr const char* kRawPartitionPrefix = "trades_raw_p";
constexpr const char* kRawDefaultTable = "trades_raw_default";

constexpr const char* kSchemaStatements[] = {
    R"SQL(
        CREATE TABLE IF NOT EXISTS providers (
            name TEXT PRIMARY KEY,
            kind TEXT NOT NULL,
            base_endpoint TEXT,
            stream_endpoint TEXT,
            rate_limit_per_minute DOUBLE,
            active BOOLEAN NOT NULL DEFAULT TRUE,
            updated_at BIGINT NOT NULL
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS instruments (
            symbol TEXT PRIMARY KEY,
            provider TEXT NOT NULL,
            asset_kind TEXT NOT NULL,
            base_currency TEXT,
            quote_currency TEXT,
            active BOOLEAN NOT NULL DEFAULT TRUE,
            updated_at BIGINT NOT NULL
        )
    )SQL",
    "CREATE SEQUENCE IF NOT EXISTS fetch_jobs_id_seq START 1",
    R"SQL(
        CREATE TABLE IF NOT EXISTS fetch_jobs (
            id BIGINT PRIMARY KEY DEFAULT nextval('fetch_jobs_id_seq'),
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            job_kind TEXT NOT NULL,
            granularity_ms BIGINT NOT NULL,
            start_ms BIGINT NOT NULL,
            end_ms BIGINT NOT NULL,
            status TEXT NOT NULL,
            last_processed_ms BIGINT,
            error_message TEXT,
            attempts INTEGER NOT NULL DEFAULT 0,
            created_at BIGINT NOT NULL,
            updated_at BIGINT NOT NULL,
            UNIQUE (provider, symbol, job_kind, start_ms)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS stream_offsets (
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            stream_kind TEXT NOT NULL,
            last_offset TEXT,
            last_event_ms BIGINT NOT NULL,
            updated_at BIGINT NOT NULL,
            PRIMARY KEY (provider, symbol, stream_kind)
        )
    )SQL",
    "CREATE SEQUENCE IF NOT EXISTS dead_letter_id_seq START 1",
    R"SQL(
        CREATE TABLE IF NOT EXISTS dead_letter (
            id BIGINT PRIMARY KEY DEFAULT nextval('dead_letter_id_seq'),
            provider TEXT NOT NULL,
            symbol TEXT,
            stream_kind TEXT,
            payload TEXT NOT NULL,
            error_reason TEXT NOT NULL,
            retry_count INTEGER NOT NULL DEFAULT 0,
            created_at BIGINT NOT NULL
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS trades (
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            trade_id TEXT,
            price DOUBLE NOT NULL CHECK (price >= 0),
            size DOUBLE NOT NULL CHECK (size >= 0),
            side TEXT NOT NULL,
            event_ms BIGINT NOT NULL,
            received_ms BIGINT NOT NULL,
            correlation_id TEXT,
            UNIQUE (provider, symbol, event_ms, trade_id)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS quotes (
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            bid_price DOUBLE,
            bid_size DOUBLE,
            ask_price DOUBLE,
            ask_size DOUBLE,
            last_price DOUBLE,
            last_size DOUBLE,
            event_ms BIGINT NOT NULL,
            received_ms BIGINT NOT NULL,
            correlation_id TEXT,
            PRIMARY KEY (provider, symbol)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS quotes_history (
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            bid_price DOUBLE,
            bid_size DOUBLE,
            ask_price DOUBLE,
            ask_size DOUBLE,
            last_price DOUBLE,
            last_size DOUBLE,
            event_ms BIGINT NOT NULL,
            received_ms BIGINT NOT NULL,
            correlation_id TEXT,
            UNIQUE (provider, symbol, event_ms)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS candles (
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            granularity_ms BIGINT NOT NULL,
            bucket_start BIGINT NOT NULL,
            open DOUBLE NOT NULL,
            high DOUBLE NOT NULL,
            low DOUBLE NOT NULL,
            close DOUBLE NOT NULL,
            volume DOUBLE NOT NULL CHECK (volume >= 0),
            trade_count BIGINT NOT NULL DEFAULT 0,
            last_event_ms BIGINT NOT NULL,
            correlation_id TEXT,
            updated_at BIGINT NOT NULL,
            PRIMARY KEY (provider, symbol, granularity_ms, bucket_start),
            CHECK (high >= low)
        )
    )SQL",
};

std::string rawTableDdl(const std::string& table) {
    return "CREATE TABLE IF NOT EXISTS " + table + R"SQL( (
            provider TEXT NOT NULL,
            symbol TEXT NOT NULL,
            stream_kind TEXT NOT NULL,
            event_ms BIGINT NOT NULL,
            received_ms BIGINT NOT NULL,
            payload TEXT NOT NULL,
            correlation_id TEXT
        )
    )SQL";
}

void execOrThrow(::duckdb::Connection& connection, const std::string& statement, const char* context) {
    auto result = connection.Query(statement);
    if (!result || result->HasError()) {
        const std::string errorMessage = sql::errorOf(result.get(), "unknown error");
        throw std::runtime_error(std::string("DuckStore: ") + context + " failed: " + errorMessage);
    }
}

std::string partitionName(const mdi::common::YearMonth& ym) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s%04d%02d", kRawPartitionPrefix, ym.year, ym.month);
    return buffer;
}

}  // namespace

DuckStore::Lease::Lease(DuckStore* store, std::unique_ptr<::duckdb::Connection> connection)
    : store_(store), connection_(std::move(connection)) {}

DuckStore::Lease::Lease(Lease&& other) noexcept
    : store_(other.store_), connection_(std::move(other.connection_)) {
    other.store_ = nullptr;
}

DuckStore::Lease::~Lease() {
    if (store_ != nullptr && connection_) {
        store_->release_(std::move(connection_));
    }
}

DuckStore::DuckStore(Options options) : options_(std::move(options)) {
    if (options_.poolSize == 0) {
        options_.poolSize = 1;
    }

    const bool inMemory = options_.path.empty() || options_.path == kInMemoryPath;
    if (!inMemory) {
        const fs::path dbPath{options_.path};
        if (dbPath.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(dbPath.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("DuckStore: unable to create directory '" +
                                         dbPath.parent_path().string() + "': " + ec.message());
            }
        }
    }

    try {
        database_ = inMemory ? std::make_unique<::duckdb::DuckDB>(nullptr)
                             : std::make_unique<::duckdb::DuckDB>(options_.path);
        idle_.reserve(options_.poolSize);
        for (std::size_t i = 0; i < options_.poolSize; ++i) {
            idle_.push_back(std::make_unique<::duckdb::Connection>(*database_));
        }
    }
    catch (const std::exception& ex) {
        throw domain::StorageUnavailableError("DuckStore: cannot open '" + options_.path + "': " + ex.what());
    }

    LOG_INFO(kLogCategory,
             "DuckStore opened path=%s pool=%zu",
             inMemory ? kInMemoryPath : options_.path.c_str(),
             options_.poolSize);
}

DuckStore::~DuckStore() {
    std::unique_lock<std::mutex> lock(poolMutex_);
    if (leased_ > 0) {
        // Leases must not outlive the store; wait briefly for in-flight writers.
        poolCv_.wait_for(lock, std::chrono::seconds(5), [&] { return leased_ == 0; });
    }
    idle_.clear();
}

void DuckStore::migrate() {
    mdi::common::metrics::Registry::ScopedTimer timer("storage_op{op=\"migrate\"}");
    {
        auto lease = acquire();
        auto& connection = lease.connection();
        for (const char* statement : kSchemaStatements) {
            execOrThrow(connection, statement, "migration");
        }
        execOrThrow(connection, rawTableDdl(kRawDefaultTable), "migration");
        loadRawPartitions_(connection);
    }

    ensureRawPartitions(mdi::common::nowMs(), options_.rawPartitionsAhead);
    LOG_INFO(kLogCategory, "DuckStore migration finished for %s", options_.path.c_str());
}

DuckStore::Lease DuckStore::acquire() {
    std::unique_lock<std::mutex> lock(poolMutex_);
    if (!poolCv_.wait_for(lock, options_.acquireTimeout, [&] { return !idle_.empty(); })) {
        mdi::common::metrics::Registry::instance().incrementCounter("storage_pool_timeouts_total");
        throw domain::StorageUnavailableError("DuckStore: no connection available within " +
                                              std::to_string(options_.acquireTimeout.count()) + "ms");
    }
    auto connection = std::move(idle_.back());
    idle_.pop_back();
    ++leased_;
    mdi::common::metrics::Registry::instance().setGauge("storage_pool_in_use", static_cast<double>(leased_));
    return Lease(this, std::move(connection));
}

void DuckStore::release_(std::unique_ptr<::duckdb::Connection> connection) {
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        idle_.push_back(std::move(connection));
        --leased_;
        mdi::common::metrics::Registry::instance().setGauge("storage_pool_in_use", static_cast<double>(leased_));
    }
    poolCv_.notify_all();
}

std::size_t DuckStore::leasedConnections() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return leased_;
}

bool DuckStore::ping() {
    try {
        auto lease = acquire();
        auto result = lease.connection().Query("SELECT 1");
        if (!result || result->HasError()) {
            LOG_WARN(kLogCategory, "DuckStore ping failed: %s", sql::errorOf(result.get(), "no result").c_str());
            return false;
        }
        return true;
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "DuckStore ping failed: %s", ex.what());
        return false;
    }
}

void DuckStore::loadRawPartitions_(::duckdb::Connection& connection) {
    auto result = connection.Query(
        "SELECT table_name FROM duckdb_tables() WHERE table_name LIKE 'trades_raw_p%' ORDER BY table_name");
    if (!result || result->HasError()) {
        throw std::runtime_error("DuckStore: partition discovery failed: " +
                                 sql::errorOf(result.get(), "unknown error"));
    }

    std::set<std::string> found;
    while (auto chunk = result->Fetch()) {
        for (::duckdb::idx_t row = 0; row < chunk->size(); ++row) {
            const auto value = chunk->GetValue(0, row);
            if (!value.IsNull()) {
                found.insert(value.ToString());
            }
        }
    }

    std::lock_guard<std::mutex> lock(partitionsMutex_);
    rawPartitions_ = std::move(found);
}

void DuckStore::refreshRawView_(::duckdb::Connection& connection) {
    std::string view = std::string("CREATE OR REPLACE VIEW trades_raw AS SELECT * FROM ") + kRawDefaultTable;
    {
        std::lock_guard<std::mutex> lock(partitionsMutex_);
        for (const auto& table : rawPartitions_) {
            view += " UNION ALL SELECT * FROM " + table;
        }
    }
    execOrThrow(connection, view, "trades_raw view refresh");
}

void DuckStore::ensureRawPartitions(domain::TimestampMs fromMs, std::size_t monthsAhead) {
    auto lease = acquire();
    auto& connection = lease.connection();

    const auto first = mdi::common::yearMonthOf(fromMs);
    for (std::size_t offset = 0; offset <= monthsAhead; ++offset) {
        const auto table = partitionName(mdi::common::addMonths(first, static_cast<int>(offset)));
        {
            std::lock_guard<std::mutex> lock(partitionsMutex_);
            if (rawPartitions_.count(table) != 0) {
                continue;
            }
        }
        execOrThrow(connection, rawTableDdl(table), "raw partition create");
        {
            std::lock_guard<std::mutex> lock(partitionsMutex_);
            rawPartitions_.insert(table);
        }
        LOG_INFO(kLogCategory, "DuckStore created raw partition %s", table.c_str());
    }

    refreshRawView_(connection);
}

std::string DuckStore::rawPartitionFor(domain::TimestampMs eventTime) const {
    const auto table = partitionName(mdi::common::yearMonthOf(eventTime));
    std::lock_guard<std::mutex> lock(partitionsMutex_);
    return rawPartitions_.count(table) != 0 ? table : std::string(kRawDefaultTable);
}

}  // namespace adapters::duckdb
