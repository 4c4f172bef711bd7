#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/Backoff.hpp"
#include "common/BoundedQueue.hpp"
#include "core/Normalizer.hpp"
#include "domain/Models.hpp"
#include "domain/exchange/IProviderAdapter.hpp"

namespace adapters::duckdb {
class StorageWriter;
}

namespace app {

// Drives historical fetches chunk by chunk: pending -> running -> completed | failed.
// Progress is checkpointed after every chunk so an interrupted job resumes where it
// stopped instead of re-fetching finished chunks.
class FetchJobManager {
public:
    using AdapterLookup = std::function<domain::IProviderAdapter&(const std::string& provider)>;
    // Called after a chunk has been written and checkpointed.
    using ChunkObserver = std::function<void(const domain::FetchJob& job, const domain::TimeRange& chunk)>;

    struct Options {
        domain::TimestampMs chunkMs{domain::kMillisPerDay};
        std::size_t parallelism{2};
        std::size_t maxChunkAttempts{5};
        std::chrono::milliseconds retryBase{1000};
        std::chrono::milliseconds retryCap{30000};
        std::size_t queueCapacity{1024};
    };

    struct SubmitResult {
        domain::FetchJob job;
        bool duplicate{false};
    };

    struct JobOutcome {
        std::int64_t id{0};
        domain::JobStatus status{domain::JobStatus::Pending};
        std::size_t chunks{0};
        std::size_t records{0};
        std::size_t deadLettered{0};
        std::string error;
    };

    FetchJobManager(adapters::duckdb::StorageWriter& writer,
                    AdapterLookup adapters,
                    core::Normalizer normalizer,
                    Options options);
    ~FetchJobManager();

    FetchJobManager(const FetchJobManager&) = delete;
    FetchJobManager& operator=(const FetchJobManager&) = delete;

    // A second submission of the same (provider, symbol, kind, start) returns the stored
    // job flagged as duplicate.
    SubmitResult submit(const domain::FetchJob& draft);

    // Starts a backfill run in this process: jobs a crash left running go back to pending,
    // then every draft is submitted. A duplicate keeps its stored job; a failed one is
    // re-queued. Results follow draft order.
    std::vector<SubmitResult> submitAll(const std::vector<domain::FetchJob>& drafts);

    // Jobs a crash left running go back to pending. Returns how many were reset.
    std::size_t recoverInterrupted();

    bool retry(std::int64_t id);
    std::size_t retryFailed();

    // Runs the jobs on up to `parallelism` threads and waits for all of them.
    std::vector<JobOutcome> run(const std::vector<std::int64_t>& ids);

    void startBackground();
    bool enqueue(std::int64_t id);

    // Cooperative: in-flight chunks finish and are checkpointed, no new chunk starts and
    // interrupted jobs return to pending.
    void requestStop();
    void stop();
    bool stopRequested() const noexcept { return stopRequested_.load(); }

    void setChunkObserver(ChunkObserver observer);

    static std::vector<domain::TimeRange> planChunks(domain::TimestampMs from,
                                                     domain::TimestampMs end,
                                                     domain::TimestampMs chunkMs);

    const Options& options() const noexcept { return options_; }

private:
    JobOutcome execute_(std::int64_t id);
    // Fetches, normalizes and writes one chunk. Throws provider and storage errors.
    void runChunk_(const domain::FetchJob& job,
                   domain::IProviderAdapter& adapter,
                   const domain::Instrument& instrument,
                   const domain::TimeRange& chunk,
                   JobOutcome& outcome);
    void finish_(JobOutcome& outcome, domain::JobStatus to, const std::string& error);
    void backgroundLoop_();

    adapters::duckdb::StorageWriter& writer_;
    AdapterLookup adapters_;
    core::Normalizer normalizer_;
    Options options_;
    mdi::common::Backoff backoff_;

    std::atomic<bool> stopRequested_{false};
    std::mutex observerMutex_;
    ChunkObserver observer_;

    mdi::common::BoundedQueue<std::int64_t> queue_;
    std::vector<std::thread> background_;
};

}  // namespace app
