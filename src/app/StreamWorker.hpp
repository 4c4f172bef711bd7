#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
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
#include "core/Aggregator.hpp"
#include "core/LogUtils.h"
#include "core/Normalizer.hpp"
#include "domain/Models.hpp"
#include "domain/exchange/IProviderAdapter.hpp"

namespace adapters::duckdb {
class StorageWriter;
struct WriteResult;
}

namespace app {

class StreamOffsetTracker;

enum class StreamState { Connecting, Streaming, Disconnected, Stopped };

const char* to_string(StreamState state);

// Supervises one live stream (provider, instrument, kind) on its own thread:
// connecting -> streaming -> {disconnected -> connecting | stopped}.
class StreamWorker {
public:
    struct Options {
        std::size_t batchSize{100};
        std::chrono::milliseconds flushInterval{1000};
        std::chrono::milliseconds heartbeatTimeout{30000};
        mdi::common::BackoffPolicy reconnect{};
        std::size_t degradedAfter{5};
        std::chrono::milliseconds catchupThreshold{60000};
        std::chrono::milliseconds watermarkGrace{2000};
        std::vector<domain::Interval> granularities;
        std::chrono::milliseconds latenessWindow{10000};
        std::chrono::milliseconds pollInterval{200};
    };

    // Asked to backfill [from, to) after a reconnect found the committed offset stale.
    using CatchupRequest = std::function<void(const domain::Instrument& instrument,
                                              domain::TimestampMs from,
                                              domain::TimestampMs to)>;

    StreamWorker(domain::IProviderAdapter& adapter,
                 domain::Instrument instrument,
                 domain::StreamKind kind,
                 adapters::duckdb::StorageWriter& writer,
                 StreamOffsetTracker& offsets,
                 core::Normalizer normalizer,
                 Options options,
                 CatchupRequest catchup = {});
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    void start();
    void requestStop();
    // Waits for the thread to finish until `deadline`; joins it when it did.
    bool waitStopped(std::chrono::steady_clock::time_point deadline);

    const domain::StreamKey& key() const noexcept { return key_; }
    StreamState state() const noexcept { return state_.load(); }
    bool degraded() const noexcept { return degraded_.load(); }
    std::size_t consecutiveFailures() const noexcept { return failures_.load(); }
    std::uint64_t reconnects() const noexcept { return reconnects_.load(); }
    // Rows this worker inserted (trades, quotes, provider bars) and records it dead-lettered.
    std::uint64_t ingested() const noexcept { return ingested_.load(); }
    std::uint64_t deadLettered() const noexcept { return deadLettered_.load(); }

private:
    struct Batch {
        std::vector<domain::RawEnvelope> envelopes;
        std::vector<domain::Trade> trades;
        std::vector<domain::Quote> quotes;
        std::vector<domain::Candle> bars;
        core::Aggregator::Output aggregated;
        std::optional<domain::StreamOffset> offset;
        std::size_t records{0};

        bool empty() const noexcept {
            return envelopes.empty() && trades.empty() && quotes.empty() && bars.empty() && aggregated.flushed.empty()
                   && aggregated.corrections.empty() && !offset;
        }
    };

    void run_();
    void session_();
    void consume_(domain::ILiveStream& stream);
    void handle_(const domain::RawRecord& record);
    void deadLetter_(const domain::RawRecord& record, const std::string& reason);
    // Writes the batch stage by stage and commits the offset last. A stage that cannot
    // be settled throws domain::StorageUnavailableError and stays queued for the next try.
    void flush_();
    // Counts dead-lettered records; throws domain::StorageUnavailableError when a failed
    // record has no dead-letter entry.
    void settle_(const adapters::duckdb::WriteResult& result, const char* stage);
    void maybeCatchup_(const std::optional<domain::StreamOffset>& offset);
    void onFailure_(const std::string& reason);
    void setState_(StreamState state);
    std::string labels_() const;
    void warnRejected_(const char* what, const std::string& detail);

    domain::IProviderAdapter& adapter_;
    domain::Instrument instrument_;
    domain::StreamKey key_;
    adapters::duckdb::StorageWriter& writer_;
    StreamOffsetTracker& offsets_;
    core::Normalizer normalizer_;
    Options options_;
    CatchupRequest catchup_;
    mdi::common::Backoff backoff_;
    std::unique_ptr<core::Aggregator> aggregator_;

    core::RateLogger rejectLog_;
    Batch batch_;
    std::chrono::steady_clock::time_point lastFlush_{};
    bool receivedSinceConnect_{false};

    std::atomic<StreamState> state_{StreamState::Connecting};
    std::atomic<bool> degraded_{false};
    std::atomic<std::size_t> failures_{0};
    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<std::uint64_t> ingested_{0};
    std::atomic<std::uint64_t> deadLettered_{0};
    std::atomic<bool> stopRequested_{false};

    std::mutex doneMutex_;
    std::condition_variable doneCv_;
    bool done_{false};
    std::thread thread_;
};

}  // namespace app
