#include "app/RealtimePipeline.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "adapters/duckdb/StorageWriter.hpp"
#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

void publishActiveStreams(std::size_t count) {
    mdi::common::metrics::Registry::instance().setGauge("active_streams", static_cast<double>(count));
}

}  // namespace

RealtimePipeline::RealtimePipeline(FetchJobManager::AdapterLookup adapters,
                                   adapters::duckdb::StorageWriter& writer,
                                   core::Normalizer normalizer,
                                   Options options,
                                   FetchJobManager* catchup)
    : adapters_(std::move(adapters)),
      writer_(writer),
      normalizer_(std::move(normalizer)),
      options_(std::move(options)),
      catchup_(catchup),
      offsets_(writer) {
    if (!adapters_) {
        throw std::invalid_argument("RealtimePipeline requires an adapter lookup");
    }
}

RealtimePipeline::~RealtimePipeline() {
    requestStop();
    workers_.clear();
    publishActiveStreams(0);
}

void RealtimePipeline::addStream(const std::string& provider, const domain::Symbol& symbol, domain::StreamKind kind) {
    if (started_) {
        throw std::logic_error("streams must be added before start()");
    }
    auto& adapter = adapters_(provider);
    auto instrument = adapter.describeInstrument(symbol);

    for (const auto& worker : workers_) {
        if (worker->key().provider == provider && worker->key().symbol == instrument.symbol
            && worker->key().kind == kind) {
            LOG_WARN(kLogCategory, "Stream %s already registered", domain::describe(worker->key()).c_str());
            return;
        }
    }

    writer_.upsertProvider(adapter.provider());
    writer_.upsertInstrument(instrument);

    StreamWorker::CatchupRequest request = [this, provider](const domain::Instrument& target,
                                                            domain::TimestampMs from,
                                                            domain::TimestampMs to) {
        requestCatchup_(provider, target, from, to);
    };
    workers_.push_back(std::make_unique<StreamWorker>(adapter,
                                                      std::move(instrument),
                                                      kind,
                                                      writer_,
                                                      offsets_,
                                                      normalizer_,
                                                      options_.worker,
                                                      std::move(request)));
}

void RealtimePipeline::start() {
    if (started_) {
        return;
    }
    started_ = true;
    for (auto& worker : workers_) {
        worker->start();
    }
    publishActiveStreams(workers_.size());
    LOG_INFO(kLogCategory, "Realtime pipeline started streams=%zu", workers_.size());
}

void RealtimePipeline::requestStop() {
    for (auto& worker : workers_) {
        worker->requestStop();
    }
}

bool RealtimePipeline::stop(std::chrono::milliseconds timeout) {
    requestStop();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool clean = true;
    for (auto& worker : workers_) {
        if (!worker->waitStopped(deadline)) {
            LOG_ERROR(kLogCategory, "Stream %s did not stop in time", domain::describe(worker->key()).c_str());
            clean = false;
        }
    }
    if (clean) {
        publishActiveStreams(0);
        LOG_INFO(kLogCategory, "Realtime pipeline stopped");
    }
    return clean;
}

bool RealtimePipeline::anyHealthy() const {
    return std::any_of(workers_.begin(), workers_.end(), [](const std::unique_ptr<StreamWorker>& worker) {
        return !worker->degraded() && worker->state() != StreamState::Stopped;
    });
}

std::vector<RealtimePipeline::StreamStatus> RealtimePipeline::status() const {
    std::vector<StreamStatus> statuses;
    statuses.reserve(workers_.size());
    for (const auto& worker : workers_) {
        StreamStatus status;
        status.key = worker->key();
        status.state = worker->state();
        status.degraded = worker->degraded();
        status.consecutiveFailures = worker->consecutiveFailures();
        status.reconnects = worker->reconnects();
        status.ingested = worker->ingested();
        status.deadLettered = worker->deadLettered();
        statuses.push_back(std::move(status));
    }
    return statuses;
}

void RealtimePipeline::requestCatchup_(const std::string& provider,
                                       const domain::Instrument& instrument,
                                       domain::TimestampMs from,
                                       domain::TimestampMs to) {
    if (catchup_ == nullptr) {
        LOG_WARN(kLogCategory,
                 "Gap [%s, %s) for %s %s left unfilled, no job manager attached",
                 mdi::common::formatIsoMs(from).c_str(),
                 mdi::common::formatIsoMs(to).c_str(),
                 provider.c_str(),
                 instrument.symbol.c_str());
        return;
    }

    const auto granularity = options_.catchupGranularity;
    domain::FetchJob draft;
    draft.provider = provider;
    draft.symbol = instrument.symbol;
    draft.kind = domain::JobKind::RealtimeCatchup;
    draft.granularity = granularity;
    draft.startMs = domain::align_down_ms(from, granularity.ms);
    // Only closed buckets; the open one is being built live.
    draft.endMs = domain::align_down_ms(to, granularity.ms);
    if (draft.endMs <= draft.startMs) {
        return;
    }

    const auto submitted = catchup_->submit(draft);
    if (submitted.duplicate && submitted.job.status != domain::JobStatus::Pending) {
        LOG_DEBUG(kLogCategory,
                  "Catch-up job=%lld already %s",
                  static_cast<long long>(submitted.job.id),
                  domain::to_string(submitted.job.status));
        return;
    }
    if (!catchup_->enqueue(submitted.job.id)) {
        LOG_WARN(kLogCategory, "Catch-up job=%lld not queued", static_cast<long long>(submitted.job.id));
    }
}

}  // namespace app
