#include "app/FetchJobManager.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "adapters/duckdb/StorageWriter.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::JOBS;
constexpr auto kQueuePoll = std::chrono::milliseconds(200);

using mdi::common::metrics::Registry;
using mdi::common::metrics::seriesKey;

// Thrown inside a chunk when the store could not settle every record.
class UnsettledWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void countChunk(const std::string& provider, const char* outcome) {
    Registry::instance().incrementCounter(
        seriesKey("backfill_chunks_total", {{"provider", provider}, {"outcome", outcome}}));
}

}  // namespace

FetchJobManager::FetchJobManager(adapters::duckdb::StorageWriter& writer,
                                 AdapterLookup adapters,
                                 core::Normalizer normalizer,
                                 Options options)
    : writer_(writer),
      adapters_(std::move(adapters)),
      normalizer_(std::move(normalizer)),
      options_(options),
      backoff_(mdi::common::BackoffPolicy{options.retryBase, options.retryCap, 0.25}),
      queue_(options.queueCapacity) {
    if (options_.chunkMs <= 0) {
        options_.chunkMs = domain::kMillisPerDay;
    }
    options_.parallelism = std::max<std::size_t>(1, options_.parallelism);
    options_.maxChunkAttempts = std::max<std::size_t>(1, options_.maxChunkAttempts);
}

FetchJobManager::~FetchJobManager() {
    stop();
}

std::vector<domain::TimeRange> FetchJobManager::planChunks(domain::TimestampMs from,
                                                           domain::TimestampMs end,
                                                           domain::TimestampMs chunkMs) {
    std::vector<domain::TimeRange> chunks;
    if (chunkMs <= 0 || end <= from) {
        return chunks;
    }
    for (auto start = from; start < end; start += chunkMs) {
        chunks.push_back(domain::TimeRange{start, std::min(start + chunkMs, end)});
    }
    return chunks;
}

FetchJobManager::SubmitResult FetchJobManager::submit(const domain::FetchJob& draft) {
    if (draft.endMs <= draft.startMs) {
        throw std::invalid_argument("fetch job range is empty for " + draft.symbol);
    }
    if (!draft.granularity.valid()) {
        throw std::invalid_argument("fetch job granularity is invalid for " + draft.symbol);
    }

    if (auto created = writer_.createFetchJob(draft)) {
        LOG_INFO(kLogCategory,
                 "FetchJobManager submitted job=%lld provider=%s symbol=%s kind=%s range=[%lld, %lld)",
                 static_cast<long long>(created->id),
                 created->provider.c_str(),
                 created->symbol.c_str(),
                 domain::to_string(created->kind),
                 created->startMs,
                 created->endMs);
        return SubmitResult{*created, false};
    }

    auto existing = writer_.findFetchJob(draft.provider, draft.symbol, draft.kind, draft.startMs);
    if (!existing) {
        throw domain::StorageUnavailableError("fetch job vanished after duplicate insert for " + draft.symbol);
    }
    LOG_WARN(kLogCategory,
             "FetchJobManager duplicate submission job=%lld provider=%s symbol=%s status=%s",
             static_cast<long long>(existing->id),
             existing->provider.c_str(),
             existing->symbol.c_str(),
             domain::to_string(existing->status));
    return SubmitResult{*existing, true};
}

std::vector<FetchJobManager::SubmitResult> FetchJobManager::submitAll(const std::vector<domain::FetchJob>& drafts) {
    const auto reset = recoverInterrupted();
    if (reset > 0) {
        LOG_INFO(kLogCategory, "FetchJobManager recovered %zu interrupted jobs before submitting", reset);
    }

    std::vector<SubmitResult> results;
    results.reserve(drafts.size());
    for (const auto& draft : drafts) {
        auto submitted = submit(draft);
        if (submitted.duplicate && submitted.job.status == domain::JobStatus::Failed && retry(submitted.job.id)) {
            submitted.job.status = domain::JobStatus::Pending;
        }
        results.push_back(std::move(submitted));
    }
    return results;
}

std::size_t FetchJobManager::recoverInterrupted() {
    std::size_t reset = 0;
    for (const auto& job : writer_.listFetchJobs({domain::JobStatus::Running})) {
        if (writer_.transitionFetchJob(job.id, {domain::JobStatus::Running}, domain::JobStatus::Pending,
                                       "interrupted")) {
            ++reset;
            LOG_INFO(kLogCategory,
                     "FetchJobManager reset interrupted job=%lld checkpoint=%lld",
                     static_cast<long long>(job.id),
                     job.resumeFrom());
        }
    }
    return reset;
}

bool FetchJobManager::retry(std::int64_t id) {
    return writer_.transitionFetchJob(id, {domain::JobStatus::Failed}, domain::JobStatus::Pending);
}

std::size_t FetchJobManager::retryFailed() {
    std::size_t requeued = 0;
    for (const auto& job : writer_.listFetchJobs({domain::JobStatus::Failed})) {
        if (retry(job.id)) {
            ++requeued;
        }
    }
    return requeued;
}

void FetchJobManager::setChunkObserver(ChunkObserver observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observer_ = std::move(observer);
}

std::vector<FetchJobManager::JobOutcome> FetchJobManager::run(const std::vector<std::int64_t>& ids) {
    std::vector<JobOutcome> outcomes(ids.size());
    if (ids.empty()) {
        return outcomes;
    }

    std::mutex nextMutex;
    std::size_t next = 0;
    auto worker = [&]() {
        while (true) {
            std::size_t index = 0;
            {
                std::lock_guard<std::mutex> lock(nextMutex);
                if (next >= ids.size()) {
                    return;
                }
                index = next++;
            }
            try {
                outcomes[index] = execute_(ids[index]);
            }
            catch (const std::exception& ex) {
                outcomes[index].id = ids[index];
                outcomes[index].error = ex.what();
                LOG_ERROR(kLogCategory,
                          "FetchJobManager job=%lld aborted error=%s",
                          static_cast<long long>(ids[index]),
                          ex.what());
            }
        }
    };

    const auto threads = std::min(options_.parallelism, ids.size());
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }
    return outcomes;
}

void FetchJobManager::startBackground() {
    if (!background_.empty()) {
        return;
    }
    for (std::size_t i = 0; i < options_.parallelism; ++i) {
        background_.emplace_back([this]() { backgroundLoop_(); });
    }
    LOG_DEBUG(kLogCategory, "FetchJobManager background pool started threads=%zu", options_.parallelism);
}

bool FetchJobManager::enqueue(std::int64_t id) {
    if (stopRequested_.load()) {
        return false;
    }
    if (!queue_.tryPush(id)) {
        LOG_WARN(kLogCategory, "FetchJobManager queue full, job=%lld stays pending", static_cast<long long>(id));
        return false;
    }
    return true;
}

void FetchJobManager::backgroundLoop_() {
    while (!stopRequested_.load()) {
        auto id = queue_.popFor(kQueuePoll);
        if (!id) {
            if (queue_.closed()) {
                return;
            }
            continue;
        }
        try {
            execute_(*id);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory,
                      "FetchJobManager background job=%lld aborted error=%s",
                      static_cast<long long>(*id),
                      ex.what());
        }
    }
}

void FetchJobManager::requestStop() {
    stopRequested_.store(true);
}

void FetchJobManager::stop() {
    requestStop();
    queue_.close();
    for (auto& thread : background_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    background_.clear();
}

void FetchJobManager::finish_(JobOutcome& outcome, domain::JobStatus to, const std::string& error) {
    try {
        writer_.transitionFetchJob(outcome.id, {domain::JobStatus::Running}, to, error);
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory,
                  "FetchJobManager could not record job=%lld as %s error=%s",
                  static_cast<long long>(outcome.id),
                  domain::to_string(to),
                  ex.what());
    }
    outcome.status = to;
    outcome.error = error;
    Registry::instance().incrementCounter(seriesKey("fetch_jobs_total", {{"status", domain::to_string(to)}}));
}

FetchJobManager::JobOutcome FetchJobManager::execute_(std::int64_t id) {
    JobOutcome outcome;
    outcome.id = id;

    std::optional<domain::FetchJob> loaded;
    try {
        loaded = writer_.loadFetchJob(id);
    }
    catch (const std::exception& ex) {
        outcome.error = ex.what();
        LOG_ERROR(kLogCategory, "FetchJobManager cannot load job=%lld error=%s", static_cast<long long>(id), ex.what());
        return outcome;
    }
    if (!loaded) {
        outcome.status = domain::JobStatus::Failed;
        outcome.error = "unknown job";
        return outcome;
    }
    auto job = *loaded;
    outcome.status = job.status;

    if (stopRequested_.load()) {
        return outcome;
    }
    if (!writer_.transitionFetchJob(id, {domain::JobStatus::Pending}, domain::JobStatus::Running)) {
        LOG_INFO(kLogCategory,
                 "FetchJobManager job=%lld not pending (status=%s), skipping",
                 static_cast<long long>(id),
                 domain::to_string(job.status));
        return outcome;
    }
    outcome.status = domain::JobStatus::Running;

    domain::IProviderAdapter* adapter = nullptr;
    domain::Instrument instrument;
    try {
        adapter = &adapters_(job.provider);
        instrument = adapter->describeInstrument(job.symbol);
    }
    catch (const std::exception& ex) {
        finish_(outcome, domain::JobStatus::Failed, ex.what());
        return outcome;
    }

    const auto chunks = planChunks(job.resumeFrom(), job.endMs, options_.chunkMs);
    LOG_INFO(kLogCategory,
             "FetchJobManager running job=%lld symbol=%s granularity=%s chunks=%zu resume_from=%lld",
             static_cast<long long>(id),
             job.symbol.c_str(),
             domain::interval_label(job.granularity).c_str(),
             chunks.size(),
             job.resumeFrom());

    for (const auto& chunk : chunks) {
        if (stopRequested_.load()) {
            finish_(outcome, domain::JobStatus::Pending, "stopped");
            LOG_INFO(kLogCategory, "FetchJobManager job=%lld paused at %lld", static_cast<long long>(id), chunk.start);
            return outcome;
        }

        std::size_t attempt = 0;
        while (true) {
            ++attempt;
            std::chrono::milliseconds wait{0};
            std::string failure;
            try {
                runChunk_(job, *adapter, instrument, chunk, outcome);
                break;
            }
            catch (const domain::RateLimitedError& ex) {
                wait = std::max(backoff_.delay(static_cast<std::uint32_t>(attempt)), ex.retryAfter());
                failure = ex.what();
            }
            catch (const domain::TransientProviderError& ex) {
                wait = backoff_.delay(static_cast<std::uint32_t>(attempt));
                failure = ex.what();
            }
            catch (const domain::StorageUnavailableError& ex) {
                wait = backoff_.delay(static_cast<std::uint32_t>(attempt));
                failure = ex.what();
            }
            catch (const UnsettledWriteError& ex) {
                wait = backoff_.delay(static_cast<std::uint32_t>(attempt));
                failure = ex.what();
            }
            catch (const domain::ProviderError& ex) {
                countChunk(job.provider, "failed");
                finish_(outcome, domain::JobStatus::Failed, ex.what());
                LOG_ERROR(kLogCategory, "FetchJobManager job=%lld failed error=%s", static_cast<long long>(id), ex.what());
                return outcome;
            }
            catch (const std::exception& ex) {
                countChunk(job.provider, "failed");
                finish_(outcome, domain::JobStatus::Failed, ex.what());
                LOG_ERROR(kLogCategory, "FetchJobManager job=%lld failed error=%s", static_cast<long long>(id), ex.what());
                return outcome;
            }

            countChunk(job.provider, "retried");
            if (attempt >= options_.maxChunkAttempts) {
                const auto message = "chunk [" + std::to_string(chunk.start) + ", " + std::to_string(chunk.end)
                                     + ") failed after " + std::to_string(attempt) + " attempts: " + failure;
                finish_(outcome, domain::JobStatus::Failed, message);
                LOG_ERROR(kLogCategory, "FetchJobManager job=%lld %s", static_cast<long long>(id), message.c_str());
                return outcome;
            }

            LOG_WARN(kLogCategory,
                     "FetchJobManager job=%lld chunk attempt %zu failed, retry in %lldms error=%s",
                     static_cast<long long>(id),
                     attempt,
                     static_cast<long long>(wait.count()),
                     failure.c_str());
            if (!mdi::common::sleepUnlessStopped(wait, stopRequested_)) {
                finish_(outcome, domain::JobStatus::Pending, "stopped");
                return outcome;
            }
        }

        writer_.checkpointFetchJob(id, chunk.end);
        job.lastProcessedMs = chunk.end;
        ++outcome.chunks;
        countChunk(job.provider, "completed");

        ChunkObserver observer;
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            observer = observer_;
        }
        if (observer) {
            observer(job, chunk);
        }
    }

    finish_(outcome, domain::JobStatus::Completed, {});
    LOG_INFO(kLogCategory,
             "FetchJobManager job=%lld completed chunks=%zu records=%zu dead_lettered=%zu",
             static_cast<long long>(id),
             outcome.chunks,
             outcome.records,
             outcome.deadLettered);
    return outcome;
}

void FetchJobManager::runChunk_(const domain::FetchJob& job,
                                domain::IProviderAdapter& adapter,
                                const domain::Instrument& instrument,
                                const domain::TimeRange& chunk,
                                JobOutcome& outcome) {
    auto records = adapter.fetchHistorical(instrument, chunk.start, chunk.end, job.granularity);

    std::vector<domain::Candle> candles;
    std::vector<domain::Trade> trades;
    candles.reserve(records.size());
    std::size_t rejected = 0;

    for (const auto& record : records) {
        if (record.isKeepalive()) {
            continue;
        }
        auto normalized = normalizer_.normalize(record, adapter.provider(), instrument);
        if (auto* candle = std::get_if<domain::Candle>(&normalized)) {
            // Pages may overrun the requested window.
            if (candle->bucketStart >= chunk.start && candle->bucketStart < chunk.end) {
                candles.push_back(std::move(*candle));
            }
        }
        else if (auto* trade = std::get_if<domain::Trade>(&normalized)) {
            trades.push_back(std::move(*trade));
        }
        else if (auto* failure = std::get_if<core::ValidationFailure>(&normalized)) {
            domain::DeadLetterRecord entry;
            entry.provider = job.provider;
            entry.symbol = job.symbol;
            entry.payload = record.raw;
            entry.reason = "normalize_failed: " + failure->describe();
            if (!writer_.recordDeadLetter(entry)) {
                throw domain::StorageUnavailableError("dead-letter write failed for job " + std::to_string(job.id));
            }
            ++rejected;
        }
    }

    auto candleResult = writer_.upsertCandles(candles);
    auto tradeResult = writer_.upsertTrades(trades);
    if (!candleResult.settled() || !tradeResult.settled()) {
        throw UnsettledWriteError("records failed without a dead-letter entry");
    }

    outcome.records += candleResult.inserted + candleResult.duplicates + tradeResult.inserted + tradeResult.duplicates;
    outcome.deadLettered += rejected + candleResult.deadLettered + tradeResult.deadLettered;
    Registry::instance().incrementCounter(
        seriesKey("ingested_records_total", {{"provider", job.provider}, {"kind", "candle"}}),
        candleResult.inserted + candleResult.duplicates);

    LOG_DEBUG(kLogCategory,
              "FetchJobManager job=%lld chunk [%lld, %lld) candles=%zu rejected=%zu",
              static_cast<long long>(job.id),
              chunk.start,
              chunk.end,
              candles.size(),
              rejected);
}

}  // namespace app
