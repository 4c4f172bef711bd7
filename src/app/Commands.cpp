#include "app/Commands.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "adapters/AdapterRegistry.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/duckdb/StorageWriter.hpp"
#include "api/HealthServer.hpp"
#include "app/FetchJobManager.hpp"
#include "app/RealtimePipeline.hpp"
#include "common/TimeUtils.hpp"
#include "core/Normalizer.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::JOBS;
constexpr auto kSignalPoll = std::chrono::milliseconds(200);
constexpr auto kPartitionRefresh = std::chrono::hours(1);

using mdi::common::Config;

[[noreturn]] void forceExit(const char* why) {
    LOG_ERROR(kLogCategory, "Forced shutdown: %s", why);
    logging::Log::flush();
    std::_Exit(kExitForced);
}

adapters::duckdb::DuckStore::Options storeOptions(const Config& config) {
    adapters::duckdb::DuckStore::Options options;
    options.path = config.duckdbPath;
    options.poolSize = config.storagePoolSize;
    options.acquireTimeout = std::chrono::milliseconds(config.storageAcquireTimeoutMs);
    options.rawPartitionsAhead = config.rawPartitionsAhead;
    return options;
}

adapters::duckdb::StorageWriter::Options writerOptions(const Config& config) {
    adapters::duckdb::StorageWriter::Options options;
    options.batchSize = config.storageBatchSize;
    options.maxRetries = config.storageMaxRetries;
    options.retryBase = std::chrono::milliseconds(config.storageRetryBaseMs);
    options.quoteMode = config.quoteMode;
    return options;
}

core::Normalizer::Settings normalizerSettings(const Config& config) {
    core::Normalizer::Settings settings;
    settings.maxClockSkew = std::chrono::milliseconds(config.maxClockSkewMs);
    return settings;
}

FetchJobManager::Options jobOptions(const Config& config) {
    FetchJobManager::Options options;
    options.chunkMs = config.backfillChunkMs;
    options.parallelism = config.backfillParallelism;
    options.maxChunkAttempts = config.backfillMaxAttempts;
    options.retryBase = std::chrono::milliseconds(config.backfillRetryBaseMs);
    options.retryCap = std::max(options.retryBase, std::chrono::milliseconds(config.reconnectMaxMs));
    return options;
}

// Store, writer, adapters and the job manager wired the same way for every command.
struct Runtime {
    explicit Runtime(const Config& config)
        : store(storeOptions(config)),
          writer(store, writerOptions(config)),
          adapters(adapters::AdapterRegistry::fromConfig(config)),
          jobs(writer,
               [this](const std::string& provider) -> domain::IProviderAdapter& { return adapters->get(provider); },
               core::Normalizer(normalizerSettings(config)),
               jobOptions(config)) {
        store.migrate();
        store.ensureRawPartitions(mdi::common::nowMs(), config.rawPartitionsAhead);
    }

    ~Runtime() {
        adapters->shutdown();
        jobs.stop();
    }

    adapters::duckdb::DuckStore store;
    adapters::duckdb::StorageWriter writer;
    std::unique_ptr<adapters::AdapterRegistry> adapters;
    FetchJobManager jobs;
};

// Turns the first signal into a cooperative stop and a second one into a forced exit.
class SignalWatch {
public:
    SignalWatch(const std::atomic<int>& signals, std::function<void()> onFirst)
        : signals_(signals), onFirst_(std::move(onFirst)) {
        thread_ = std::thread([this]() { loop_(); });
    }

    ~SignalWatch() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SignalWatch(const SignalWatch&) = delete;
    SignalWatch& operator=(const SignalWatch&) = delete;

private:
    void loop_() {
        bool fired = false;
        while (!done_.load()) {
            const int count = signals_.load();
            if (count >= 2) {
                forceExit("second signal");
            }
            if (count == 1 && !fired) {
                fired = true;
                LOG_INFO(kLogCategory, "Signal received, finishing in-flight work");
                onFirst_();
            }
            std::this_thread::sleep_for(kSignalPoll);
        }
    }

    const std::atomic<int>& signals_;
    std::function<void()> onFirst_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int summarize(const std::vector<FetchJobManager::JobOutcome>& outcomes) {
    std::size_t records = 0;
    std::size_t deadLettered = 0;
    std::size_t completed = 0;
    std::printf("%-8s %-10s %8s %10s %8s  %s\n", "job", "status", "chunks", "records", "dead", "error");
    for (const auto& outcome : outcomes) {
        records += outcome.records;
        deadLettered += outcome.deadLettered;
        if (outcome.status == domain::JobStatus::Completed) {
            ++completed;
        }
        std::printf("%-8lld %-10s %8zu %10zu %8zu  %s\n",
                    static_cast<long long>(outcome.id),
                    domain::to_string(outcome.status),
                    outcome.chunks,
                    outcome.records,
                    outcome.deadLettered,
                    outcome.error.c_str());
    }
    std::printf("jobs=%zu completed=%zu records=%zu dead_lettered=%zu\n",
                outcomes.size(),
                completed,
                records,
                deadLettered);
    std::fflush(stdout);
    return completed == outcomes.size() ? kExitOk : kExitFailed;
}

struct BackfillRange {
    domain::TimestampMs start{0};
    domain::TimestampMs end{0};
};

std::optional<BackfillRange> backfillRange(const Config& config, domain::Interval granularity) {
    const auto to = mdi::common::parseDateArgument(config.to, true);
    if (!to) {
        LOG_ERROR(kLogCategory, "Invalid --to value: %s", config.to.c_str());
        return std::nullopt;
    }
    domain::TimestampMs from = 0;
    if (!config.from.empty()) {
        const auto parsed = mdi::common::parseDateArgument(config.from, false);
        if (!parsed) {
            LOG_ERROR(kLogCategory, "Invalid --from value: %s", config.from.c_str());
            return std::nullopt;
        }
        from = *parsed;
    } else {
        const auto period = domain::interval_from_label(config.period);
        if (!period.valid()) {
            LOG_ERROR(kLogCategory, "Invalid --period value: %s", config.period.c_str());
            return std::nullopt;
        }
        from = *to - period.ms;
    }

    // The bucket still open at `to` is left to the live path.
    BackfillRange range{domain::align_down_ms(from, granularity.ms), domain::align_down_ms(*to, granularity.ms)};
    if (range.end <= range.start) {
        LOG_ERROR(kLogCategory,
                  "Backfill range [%s, %s) holds no complete %s bucket",
                  mdi::common::formatIsoMs(from).c_str(),
                  mdi::common::formatIsoMs(*to).c_str(),
                  config.interval.c_str());
        return std::nullopt;
    }
    return range;
}

void summarizeRealtime(const std::vector<RealtimePipeline::StreamStatus>& streams,
                       const std::vector<domain::FetchJob>& catchups) {
    std::uint64_t records = 0;
    std::uint64_t deadLettered = 0;
    std::printf("%-32s %-12s %10s %10s %8s\n", "stream", "state", "reconnects", "records", "dead");
    for (const auto& stream : streams) {
        records += stream.ingested;
        deadLettered += stream.deadLettered;
        std::printf("%-32s %-12s %10llu %10llu %8llu%s\n",
                    domain::describe(stream.key).c_str(),
                    to_string(stream.state),
                    static_cast<unsigned long long>(stream.reconnects),
                    static_cast<unsigned long long>(stream.ingested),
                    static_cast<unsigned long long>(stream.deadLettered),
                    stream.degraded ? " degraded" : "");
    }

    std::size_t byStatus[4] = {0, 0, 0, 0};
    for (const auto& job : catchups) {
        ++byStatus[static_cast<std::size_t>(job.status)];
    }
    std::printf("streams=%zu records=%llu dead_lettered=%llu catchup_jobs=%zu pending=%zu running=%zu completed=%zu "
                "failed=%zu\n",
                streams.size(),
                static_cast<unsigned long long>(records),
                static_cast<unsigned long long>(deadLettered),
                catchups.size(),
                byStatus[static_cast<std::size_t>(domain::JobStatus::Pending)],
                byStatus[static_cast<std::size_t>(domain::JobStatus::Running)],
                byStatus[static_cast<std::size_t>(domain::JobStatus::Completed)],
                byStatus[static_cast<std::size_t>(domain::JobStatus::Failed)]);
    std::fflush(stdout);
}

std::vector<domain::Interval> aggregateGranularities(const Config& config) {
    std::vector<domain::Interval> granularities;
    for (const auto& label : config.aggregateIntervals) {
        const auto interval = domain::interval_from_label(label);
        if (interval.valid()) {
            granularities.push_back(interval);
        } else {
            LOG_WARN(kLogCategory, "Ignoring aggregate interval %s", label.c_str());
        }
    }
    return granularities;
}

}  // namespace

int runMigrate(const Config& config) {
    adapters::duckdb::DuckStore store(storeOptions(config));
    store.migrate();
    store.ensureRawPartitions(mdi::common::nowMs(), config.rawPartitionsAhead);
    LOG_INFO(kLogCategory, "Schema ready at %s", store.path().c_str());
    std::printf("migrated %s\n", store.path().c_str());
    return kExitOk;
}

int runBackfill(const Config& config, const std::atomic<int>& signals) {
    const auto granularity = domain::interval_from_label(config.interval);
    if (!granularity.valid()) {
        LOG_ERROR(kLogCategory, "Invalid --interval value: %s", config.interval.c_str());
        return kExitUsage;
    }
    const auto range = backfillRange(config, granularity);
    if (!range) {
        return kExitUsage;
    }

    Runtime runtime(config);
    auto& adapter = runtime.adapters->get(config.provider);
    runtime.writer.upsertProvider(adapter.provider());

    std::vector<domain::FetchJob> drafts;
    for (const auto& symbol : config.symbols) {
        const auto instrument = adapter.describeInstrument(symbol);
        runtime.writer.upsertInstrument(instrument);

        domain::FetchJob draft;
        draft.provider = adapter.provider().name;
        draft.symbol = instrument.symbol;
        draft.kind = domain::JobKind::Backfill;
        draft.granularity = granularity;
        draft.startMs = range->start;
        draft.endMs = range->end;
        drafts.push_back(std::move(draft));
    }

    std::vector<std::int64_t> ids;
    for (const auto& submitted : runtime.jobs.submitAll(drafts)) {
        if (submitted.duplicate) {
            std::printf("duplicate: %s already has job %lld (%s), driving it\n",
                        submitted.job.symbol.c_str(),
                        static_cast<long long>(submitted.job.id),
                        domain::to_string(submitted.job.status));
        }
        ids.push_back(submitted.job.id);
    }

    std::vector<FetchJobManager::JobOutcome> outcomes;
    {
        SignalWatch watch(signals, [&runtime]() {
            runtime.jobs.requestStop();
            runtime.adapters->shutdown();
        });
        outcomes = runtime.jobs.run(ids);
    }
    return summarize(outcomes);
}

int runResume(const Config& config, const std::atomic<int>& signals) {
    Runtime runtime(config);
    const auto reset = runtime.jobs.recoverInterrupted();
    const auto requeued = config.retryFailed ? runtime.jobs.retryFailed() : 0;
    LOG_INFO(kLogCategory, "Resume: interrupted=%zu failed_requeued=%zu", reset, requeued);

    std::vector<std::int64_t> ids;
    for (const auto& job : runtime.writer.listFetchJobs({domain::JobStatus::Pending})) {
        ids.push_back(job.id);
    }
    if (ids.empty()) {
        std::printf("no pending jobs\n");
        return kExitOk;
    }

    std::vector<FetchJobManager::JobOutcome> outcomes;
    {
        SignalWatch watch(signals, [&runtime]() {
            runtime.jobs.requestStop();
            runtime.adapters->shutdown();
        });
        outcomes = runtime.jobs.run(ids);
    }
    return summarize(outcomes);
}

int runRealtime(const Config& config, const std::atomic<int>& signals) {
    Runtime runtime(config);
    const auto startedAt = mdi::common::nowMs();

    RealtimePipeline::Options options;
    auto& worker = options.worker;
    worker.batchSize = config.streamBatchSize;
    worker.flushInterval = std::chrono::milliseconds(config.streamFlushIntervalMs);
    worker.heartbeatTimeout = std::chrono::milliseconds(config.heartbeatTimeoutMs);
    worker.reconnect = mdi::common::BackoffPolicy{std::chrono::milliseconds(config.reconnectBaseMs),
                                                  std::chrono::milliseconds(config.reconnectMaxMs),
                                                  config.reconnectJitter};
    worker.degradedAfter = config.degradedAfter;
    worker.catchupThreshold = std::chrono::milliseconds(config.catchupThresholdMs);
    worker.watermarkGrace = std::chrono::milliseconds(config.watermarkGraceMs);
    worker.latenessWindow = std::chrono::milliseconds(config.latenessWindowMs);
    worker.granularities = aggregateGranularities(config);
    if (!worker.granularities.empty()) {
        options.catchupGranularity = *std::max_element(worker.granularities.begin(), worker.granularities.end());
    }

    RealtimePipeline pipeline([&runtime](const std::string& provider) -> domain::IProviderAdapter& {
                                  return runtime.adapters->get(provider);
                              },
                              runtime.writer,
                              core::Normalizer(normalizerSettings(config)),
                              options,
                              &runtime.jobs);
    for (const auto& symbol : config.symbols) {
        for (const auto kind : config.streams) {
            pipeline.addStream(config.provider, symbol, kind);
        }
    }

    std::unique_ptr<mdi::api::HealthServer> health;
    if (config.healthPort != 0) {
        health = std::make_unique<mdi::api::HealthServer>(
            mdi::api::Endpoint{"0.0.0.0", config.healthPort},
            [&runtime, &pipeline](std::string& reason) {
                if (!runtime.store.ping()) {
                    reason = "storage unreachable";
                    return false;
                }
                if (!pipeline.anyHealthy()) {
                    reason = "no healthy stream";
                    return false;
                }
                return true;
            });
        health->start();
    }

    runtime.jobs.startBackground();
    pipeline.start();

    auto nextPartitionRefresh = std::chrono::steady_clock::now() + kPartitionRefresh;
    while (signals.load() == 0) {
        std::this_thread::sleep_for(kSignalPoll);
        if (std::chrono::steady_clock::now() >= nextPartitionRefresh) {
            nextPartitionRefresh += kPartitionRefresh;
            try {
                runtime.store.ensureRawPartitions(mdi::common::nowMs(), config.rawPartitionsAhead);
            }
            catch (const std::exception& ex) {
                LOG_WARN(kLogCategory, "Raw partition refresh failed: %s", ex.what());
            }
        }
    }

    LOG_INFO(kLogCategory, "Starting graceful shutdown");
    runtime.jobs.requestStop();
    const auto timeout = std::chrono::milliseconds(config.shutdownTimeoutMs);
    auto stopped = std::async(std::launch::async, [&pipeline, timeout]() { return pipeline.stop(timeout); });
    while (stopped.wait_for(kSignalPoll) != std::future_status::ready) {
        if (signals.load() >= 2) {
            forceExit("second signal");
        }
    }
    if (!stopped.get()) {
        forceExit("shutdown timeout");
    }

    runtime.jobs.stop();
    if (health) {
        health->stop();
    }

    std::vector<domain::FetchJob> catchups;
    try {
        for (auto& job : runtime.writer.listFetchJobs({})) {
            if (job.kind == domain::JobKind::RealtimeCatchup && job.updatedAt >= startedAt) {
                catchups.push_back(std::move(job));
            }
        }
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "Catch-up job listing failed: %s", ex.what());
    }
    summarizeRealtime(pipeline.status(), catchups);
    LOG_INFO(kLogCategory, "Shutdown complete");
    return kExitOk;
}

int dispatch(const Config& config, const std::atomic<int>& signals) {
    switch (config.command) {
    case mdi::common::Command::Help:
        std::printf("%s", Config::usage().c_str());
        return kExitOk;
    case mdi::common::Command::Migrate:
        return runMigrate(config);
    case mdi::common::Command::Backfill:
        return runBackfill(config, signals);
    case mdi::common::Command::Resume:
        return runResume(config, signals);
    case mdi::common::Command::Realtime:
        return runRealtime(config, signals);
    }
    return kExitUsage;
}

}  // namespace app
