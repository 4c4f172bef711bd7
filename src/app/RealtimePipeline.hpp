#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "app/FetchJobManager.hpp"
#include "app/StreamOffsetTracker.hpp"
#include "app/StreamWorker.hpp"
#include "core/Normalizer.hpp"

namespace adapters::duckdb {
class StorageWriter;
}

namespace app {

// One StreamWorker per (provider, instrument, stream kind), sharing the storage writer and
// the offset tracker.
class RealtimePipeline {
public:
    struct Options {
        StreamWorker::Options worker{};
        // Granularity of the candles fetched to fill a gap after a long disconnect.
        domain::Interval catchupGranularity{domain::kMillisPerMinute};
    };

    struct StreamStatus {
        domain::StreamKey key;
        StreamState state{StreamState::Connecting};
        bool degraded{false};
        std::size_t consecutiveFailures{0};
        std::uint64_t reconnects{0};
        std::uint64_t ingested{0};
        std::uint64_t deadLettered{0};
    };

    // `catchup` may be null, in which case stale offsets are only logged.
    RealtimePipeline(FetchJobManager::AdapterLookup adapters,
                     adapters::duckdb::StorageWriter& writer,
                     core::Normalizer normalizer,
                     Options options,
                     FetchJobManager* catchup = nullptr);
    ~RealtimePipeline();

    RealtimePipeline(const RealtimePipeline&) = delete;
    RealtimePipeline& operator=(const RealtimePipeline&) = delete;

    // Describes the instrument through the provider's adapter and seeds the catalog.
    // Throws std::runtime_error for an unknown provider.
    void addStream(const std::string& provider, const domain::Symbol& symbol, domain::StreamKind kind);

    void start();
    void requestStop();
    // True when every worker flushed and stopped before `timeout`.
    bool stop(std::chrono::milliseconds timeout);

    // Readiness: at least one stream that is running and not degraded.
    bool anyHealthy() const;
    std::vector<StreamStatus> status() const;
    std::size_t streamCount() const noexcept { return workers_.size(); }

    StreamOffsetTracker& offsets() noexcept { return offsets_; }

private:
    void requestCatchup_(const std::string& provider,
                         const domain::Instrument& instrument,
                         domain::TimestampMs from,
                         domain::TimestampMs to);

    FetchJobManager::AdapterLookup adapters_;
    adapters::duckdb::StorageWriter& writer_;
    core::Normalizer normalizer_;
    Options options_;
    FetchJobManager* catchup_;
    StreamOffsetTracker offsets_;
    std::vector<std::unique_ptr<StreamWorker>> workers_;
    bool started_{false};
};

}  // namespace app
