#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

inline constexpr const char* kInMemoryPath = ":memory:";

// Owns the database instance and a bounded pool of connections. Callers that find the
// pool empty block until a connection is returned or the acquire timeout expires.
class DuckStore {
public:
    struct Options {
        std::string path = "data/market.duckdb";
        std::size_t poolSize = 4;
        std::chrono::milliseconds acquireTimeout{5000};
        std::size_t rawPartitionsAhead = 2;
    };

    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        ::duckdb::Connection& connection() { return *connection_; }

    private:
        friend class DuckStore;
        Lease(DuckStore* store, std::unique_ptr<::duckdb::Connection> connection);

        DuckStore* store_;
        std::unique_ptr<::duckdb::Connection> connection_;
    };

    explicit DuckStore(Options options);
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates every table, sequence and view. Safe to run repeatedly.
    void migrate();

    // Throws domain::StorageUnavailableError when no connection frees up in time.
    Lease acquire();

    // SELECT 1 through the pool.
    bool ping();

    // Creates monthly raw partitions from the month of `fromMs` through `monthsAhead`
    // months later and refreshes the trades_raw view.
    void ensureRawPartitions(domain::TimestampMs fromMs, std::size_t monthsAhead);

    // Partition table for an event time; the default table when the month has none.
    std::string rawPartitionFor(domain::TimestampMs eventTime) const;

    const std::string& path() const noexcept { return options_.path; }
    std::size_t leasedConnections() const;

private:
    void release_(std::unique_ptr<::duckdb::Connection> connection);
    void loadRawPartitions_(::duckdb::Connection& connection);
    void refreshRawView_(::duckdb::Connection& connection);

    Options options_;
    std::unique_ptr<::duckdb::DuckDB> database_;

    mutable std::mutex poolMutex_;
    std::condition_variable poolCv_;
    std::vector<std::unique_ptr<::duckdb::Connection>> idle_;
    std::size_t leased_ = 0;

    mutable std::mutex partitionsMutex_;
    std::set<std::string> rawPartitions_;
};

}  // namespace adapters::duckdb
