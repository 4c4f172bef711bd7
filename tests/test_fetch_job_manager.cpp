#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <duckdb.hpp>

#include "FakeAdapter.hpp"
#include "TestSupport.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/duckdb/StorageWriter.hpp"
#include "app/FetchJobManager.hpp"

namespace {

using adapters::duckdb::DuckStore;
using adapters::duckdb::StorageWriter;
using app::FetchJobManager;
using testing_support::FakeAdapter;

// 2023-11-14T00:00:00Z
constexpr domain::TimestampMs kDay0 = 1'699'920'000'000LL;
constexpr domain::Interval kHourly{domain::kMillisPerHour};

DuckStore::Options memoryStore() {
    DuckStore::Options options;
    options.path = adapters::duckdb::kInMemoryPath;
    options.poolSize = 4;
    return options;
}

StorageWriter::Options quickWriter() {
    StorageWriter::Options options;
    options.retryBase = std::chrono::milliseconds(1);
    options.maxRetries = 1;
    return options;
}

struct Harness {
    Harness() : store(memoryStore()), writer(store, quickWriter()) { store.migrate(); }

    FetchJobManager::AdapterLookup lookup() {
        return [this](const std::string& provider) -> domain::IProviderAdapter& {
            if (provider != adapter.provider().name) {
                throw std::runtime_error("unknown provider: " + provider);
            }
            return adapter;
        };
    }

    std::unique_ptr<FetchJobManager> manager(domain::TimestampMs chunkMs = 2 * domain::kMillisPerDay) {
        FetchJobManager::Options options;
        options.chunkMs = chunkMs;
        options.parallelism = 2;
        options.maxChunkAttempts = 3;
        options.retryBase = std::chrono::milliseconds(1);
        options.retryCap = std::chrono::milliseconds(10);
        return std::make_unique<FetchJobManager>(writer, lookup(), core::Normalizer(), options);
    }

    domain::FetchJob tenDayJob(const std::string& symbol = "BTCUSDT") {
        domain::FetchJob draft;
        draft.provider = adapter.provider().name;
        draft.symbol = symbol;
        draft.granularity = kHourly;
        draft.startMs = kDay0;
        draft.endMs = kDay0 + 10 * domain::kMillisPerDay;
        return draft;
    }

    std::int64_t candleCount() {
        auto lease = store.acquire();
        auto result = lease.connection().Query("SELECT COUNT(*) FROM candles");
        return result->GetValue(0, 0).GetValue<std::int64_t>();
    }

    DuckStore store;
    StorageWriter writer;
    FakeAdapter adapter;
};

int plansHalfOpenChunks() {
    auto chunks = FetchJobManager::planChunks(0, 10, 4);
    CHECK(chunks.size() == 3);
    CHECK(chunks[0].start == 0 && chunks[0].end == 4);
    CHECK(chunks[2].start == 8 && chunks[2].end == 10);
    CHECK(FetchJobManager::planChunks(5, 5, 4).empty());
    return 0;
}

// Stopping after `stopAfter` chunks leaves exactly the rest for the next run.
int resumeAfterStop(std::size_t stopAfter) {
    Harness h;
    auto first = h.manager();
    auto job = first->submit(h.tenDayJob()).job;

    std::atomic<std::size_t> seen{0};
    first->setChunkObserver([&](const domain::FetchJob&, const domain::TimeRange&) {
        if (seen.fetch_add(1) + 1 == stopAfter) {
            first->requestStop();
        }
    });
    auto paused = first->run({job.id});
    CHECK(paused.size() == 1);
    CHECK(paused[0].status == domain::JobStatus::Pending);
    CHECK(paused[0].chunks == stopAfter);

    auto stored = h.writer.loadFetchJob(job.id);
    CHECK(stored && stored->status == domain::JobStatus::Pending);
    CHECK(stored->resumeFrom() == kDay0 + static_cast<domain::TimestampMs>(stopAfter) * 2 * domain::kMillisPerDay);

    auto second = h.manager();
    std::vector<domain::TimeRange> resumed;
    second->setChunkObserver([&](const domain::FetchJob&, const domain::TimeRange& chunk) { resumed.push_back(chunk); });
    auto done = second->run({job.id});
    CHECK(done[0].status == domain::JobStatus::Completed);
    CHECK(resumed.size() == 5 - stopAfter);
    CHECK(resumed.front().start == stored->resumeFrom());
    CHECK(resumed.back().end == kDay0 + 10 * domain::kMillisPerDay);
    CHECK(h.candleCount() == 240);

    auto fetched = h.adapter.fetched();
    CHECK(fetched.size() == 5);
    return 0;
}

int resumeAfterOneChunk() { return resumeAfterStop(1); }
int resumeAfterThreeChunks() { return resumeAfterStop(3); }

int interruptedJobsResumeFromCheckpoint() {
    Harness h;
    auto manager = h.manager();
    auto job = manager->submit(h.tenDayJob()).job;
    // What a crash mid-run leaves behind.
    CHECK(h.writer.transitionFetchJob(job.id, {domain::JobStatus::Pending}, domain::JobStatus::Running));
    CHECK(h.writer.checkpointFetchJob(job.id, kDay0 + 4 * domain::kMillisPerDay));

    CHECK(manager->run({job.id})[0].chunks == 0);
    CHECK(manager->recoverInterrupted() == 1);
    CHECK(manager->recoverInterrupted() == 0);

    auto outcome = manager->run({job.id});
    CHECK(outcome[0].status == domain::JobStatus::Completed);
    CHECK(outcome[0].chunks == 3);
    CHECK(h.adapter.fetched().front().start == kDay0 + 4 * domain::kMillisPerDay);
    auto stored = h.writer.loadFetchJob(job.id);
    CHECK(stored->attempts == 2);
    return 0;
}

int rerunBackfillResumesInterruptedJob() {
    Harness h;
    std::int64_t id = 0;
    {
        auto crashed = h.manager();
        id = crashed->submit(h.tenDayJob()).job.id;
        CHECK(h.writer.transitionFetchJob(id, {domain::JobStatus::Pending}, domain::JobStatus::Running));
        CHECK(h.writer.checkpointFetchJob(id, kDay0 + 4 * domain::kMillisPerDay));
    }

    auto manager = h.manager();
    auto submitted = manager->submitAll({h.tenDayJob()});
    CHECK(submitted.size() == 1);
    CHECK(submitted[0].duplicate);
    CHECK(submitted[0].job.id == id);
    CHECK(submitted[0].job.status == domain::JobStatus::Pending);

    auto outcome = manager->run({id});
    CHECK(outcome[0].status == domain::JobStatus::Completed);
    CHECK(outcome[0].chunks == 3);
    auto fetched = h.adapter.fetched();
    CHECK(fetched.size() == 3);
    CHECK(fetched.front().start == kDay0 + 4 * domain::kMillisPerDay);
    CHECK(fetched.back().end == kDay0 + 10 * domain::kMillisPerDay);
    return 0;
}

int duplicateSubmissionReturnsExistingJob() {
    Harness h;
    auto manager = h.manager();
    auto first = manager->submit(h.tenDayJob());
    auto second = manager->submit(h.tenDayJob());
    CHECK(!first.duplicate);
    CHECK(second.duplicate);
    CHECK(second.job.id == first.job.id);
    CHECK(h.writer.listFetchJobs({}).size() == 1);

    bool rejected = false;
    try {
        auto empty = h.tenDayJob();
        empty.endMs = empty.startMs;
        manager->submit(empty);
    }
    catch (const std::invalid_argument&) {
        rejected = true;
    }
    CHECK(rejected);
    return 0;
}

int rateLimitedChunkIsRetried() {
    Harness h;
    h.adapter.failNextFetch(std::make_exception_ptr(
        domain::RateLimitedError("fake", "HTTP 429", std::chrono::milliseconds(20))));
    auto manager = h.manager(10 * domain::kMillisPerDay);
    auto job = manager->submit(h.tenDayJob()).job;

    const auto started = std::chrono::steady_clock::now();
    auto outcome = manager->run({job.id});
    CHECK(outcome[0].status == domain::JobStatus::Completed);
    CHECK(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(20));
    CHECK(h.adapter.fetched().size() == 2);
    CHECK(outcome[0].records == 240);
    return 0;
}

int requestErrorFailsJobUntilRetried() {
    Harness h;
    h.adapter.failNextFetch(std::make_exception_ptr(domain::ProviderRequestError("fake", "HTTP 400 bad symbol", 400)));
    auto manager = h.manager();
    auto job = manager->submit(h.tenDayJob()).job;

    auto failed = manager->run({job.id});
    CHECK(failed[0].status == domain::JobStatus::Failed);
    CHECK(failed[0].error.find("bad symbol") != std::string::npos);
    CHECK(h.adapter.fetched().size() == 1);

    // Failed jobs are not picked up again on their own.
    CHECK(manager->run({job.id})[0].status == domain::JobStatus::Failed);
    CHECK(manager->retryFailed() == 1);
    CHECK(manager->run({job.id})[0].status == domain::JobStatus::Completed);
    return 0;
}

int badBarsAreDeadLettered() {
    Harness h;
    h.adapter.setHistorical([&](const domain::Instrument& instrument,
                                domain::TimestampMs start,
                                domain::TimestampMs,
                                domain::Interval granularity) {
        auto good = h.adapter.bar(instrument.symbol, start, granularity, 100.0);
        auto bad = h.adapter.bar(instrument.symbol, start + granularity.ms, granularity, 100.0);
        std::get<domain::Bar>(bad.payload).high = 50.0;
        return std::vector<domain::RawRecord>{good, bad};
    });
    auto manager = h.manager(10 * domain::kMillisPerDay);
    auto outcome = manager->run({manager->submit(h.tenDayJob()).job.id});
    CHECK(outcome[0].status == domain::JobStatus::Completed);
    CHECK(outcome[0].deadLettered == 1);
    CHECK(h.candleCount() == 1);

    auto lease = h.store.acquire();
    auto letters = lease.connection().Query("SELECT error_reason FROM dead_letter");
    CHECK(letters->RowCount() == 1);
    CHECK(letters->GetValue(0, 0).ToString().rfind("normalize_failed: OutOfRange(high)", 0) == 0);
    return 0;
}

int backgroundQueueRunsJobs() {
    Harness h;
    auto manager = h.manager();
    auto btc = manager->submit(h.tenDayJob("BTCUSDT")).job;
    auto eth = manager->submit(h.tenDayJob("ETHUSDT")).job;
    manager->startBackground();
    CHECK(manager->enqueue(btc.id));
    CHECK(manager->enqueue(eth.id));

    const bool finished = testing_support::waitFor(
        [&]() {
            return h.writer.listFetchJobs({domain::JobStatus::Completed}).size() == 2;
        },
        std::chrono::milliseconds(10000));
    CHECK(finished);
    manager->stop();
    CHECK(!manager->enqueue(btc.id));
    return 0;
}

}  // namespace

int main() {
    RUN(plansHalfOpenChunks);
    RUN(resumeAfterOneChunk);
    RUN(resumeAfterThreeChunks);
    RUN(interruptedJobsResumeFromCheckpoint);
    RUN(rerunBackfillResumesInterruptedJob);
    RUN(duplicateSubmissionReturnsExistingJob);
    RUN(rateLimitedChunkIsRetried);
    RUN(requestErrorFailsJobUntilRetried);
    RUN(badBarsAreDeadLettered);
    RUN(backgroundQueueRunsJobs);
    std::cout << "test_fetch_job_manager passed\n";
    return 0;
}
