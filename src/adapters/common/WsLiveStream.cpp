#include "adapters/common/WsLiveStream.hpp"

#include <exception>
#include <utility>

#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace adapters {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

}  // namespace

WsLiveStream::WsLiveStream(std::unique_ptr<infra::net::WsConnection> connection,
                           Decoder decoder,
                           std::string provider,
                           domain::Symbol symbol,
                           std::size_t queueCapacity)
    : connection_(std::move(connection)),
      decoder_(std::move(decoder)),
      provider_(std::move(provider)),
      symbol_(std::move(symbol)),
      queue_(queueCapacity) {}

WsLiveStream::~WsLiveStream() {
    close();
}

void WsLiveStream::start() {
    connection_->start([this](std::string&& payload) { return onFrame_(std::move(payload)); },
                       [this]() { onControl_(); },
                       [this](const std::string& reason) { onClosed_(reason); });
}

bool WsLiveStream::onFrame_(std::string&& payload) {
    const auto receivedAt = mdi::common::nowMs();
    std::vector<domain::RawRecord> records;
    try {
        records = decoder_(payload, receivedAt);
    }
    catch (const std::exception& ex) {
        domain::RawRecord record;
        record.provider = provider_;
        record.symbol = symbol_;
        record.receivedAt = receivedAt;
        record.raw = payload;
        record.correlationId = domain::newCorrelationId();
        record.payload = domain::DecodeError{ex.what()};
        records.push_back(std::move(record));
    }

    for (auto& record : records) {
        if (!queue_.push(std::move(record))) {
            return false;
        }
    }
    mdi::common::metrics::Registry::instance().setGauge(
        mdi::common::metrics::seriesKey("stream_queue_size", {{"provider", provider_}, {"symbol", symbol_}}),
        static_cast<double>(queue_.size()));
    return true;
}

void WsLiveStream::onControl_() {
    domain::RawRecord record;
    record.provider = provider_;
    record.symbol = symbol_;
    record.receivedAt = mdi::common::nowMs();
    record.payload = domain::Keepalive{};
    // Never block the reader for a keepalive.
    queue_.tryPush(std::move(record));
}

void WsLiveStream::onClosed_(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(reasonMutex_);
        dropReason_ = reason;
    }
    dropped_.store(true);
    // Remaining records drain before next() reports the drop.
    queue_.close();
    if (!closing_.load()) {
        LOG_WARN(kLogCategory, "%s stream for %s dropped: %s", provider_.c_str(), symbol_.c_str(), reason.c_str());
    }
}

std::optional<domain::RawRecord> WsLiveStream::next(std::chrono::milliseconds timeout) {
    auto record = queue_.popFor(timeout);
    if (record) {
        return record;
    }
    if (dropped_.load() || closing_.load()) {
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(reasonMutex_);
            reason = dropReason_.empty() ? std::string{"closed"} : dropReason_;
        }
        throw domain::TransientProviderError(provider_, provider_ + " stream for " + symbol_ + " lost: " + reason);
    }
    return std::nullopt;
}

void WsLiveStream::close() {
    if (closing_.exchange(true)) {
        return;
    }
    // Unblocks a reader stuck on a full queue before the session is torn down.
    queue_.close();
    if (connection_) {
        connection_->close();
    }
}

}  // namespace adapters
