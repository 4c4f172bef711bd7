#include "domain/Models.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <functional>

namespace domain {
namespace {

std::string lowered(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace

std::size_t StreamKeyHash::operator()(const StreamKey& key) const noexcept {
    std::size_t seed = std::hash<std::string>{}(key.provider);
    seed ^= std::hash<std::string>{}(key.symbol) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= std::hash<int>{}(static_cast<int>(key.kind)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

const char* to_string(ProviderKind kind) {
    switch (kind) {
    case ProviderKind::Exchange:
        return "exchange";
    case ProviderKind::Broker:
        return "broker";
    case ProviderKind::Vendor:
        return "vendor";
    }
    return "exchange";
}

const char* to_string(AssetKind kind) {
    switch (kind) {
    case AssetKind::Crypto:
        return "crypto";
    case AssetKind::Equity:
        return "equity";
    case AssetKind::Fx:
        return "fx";
    case AssetKind::Other:
        return "other";
    }
    return "other";
}

const char* to_string(TradeSide side) {
    switch (side) {
    case TradeSide::Buy:
        return "buy";
    case TradeSide::Sell:
        return "sell";
    case TradeSide::Unknown:
        return "unknown";
    }
    return "unknown";
}

const char* to_string(StreamKind kind) {
    switch (kind) {
    case StreamKind::Trades:
        return "trades";
    case StreamKind::Quotes:
        return "quotes";
    }
    return "trades";
}

const char* to_string(JobKind kind) {
    switch (kind) {
    case JobKind::Backfill:
        return "backfill";
    case JobKind::RealtimeCatchup:
        return "realtime_catchup";
    }
    return "backfill";
}

const char* to_string(JobStatus status) {
    switch (status) {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::Running:
        return "running";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    }
    return "pending";
}

std::optional<ProviderKind> provider_kind_from_string(std::string_view value) {
    const auto v = lowered(value);
    if (v == "exchange") {
        return ProviderKind::Exchange;
    }
    if (v == "broker") {
        return ProviderKind::Broker;
    }
    if (v == "vendor") {
        return ProviderKind::Vendor;
    }
    return std::nullopt;
}

std::optional<AssetKind> asset_kind_from_string(std::string_view value) {
    const auto v = lowered(value);
    if (v == "crypto") {
        return AssetKind::Crypto;
    }
    if (v == "equity" || v == "stock") {
        return AssetKind::Equity;
    }
    if (v == "fx" || v == "forex") {
        return AssetKind::Fx;
    }
    if (v == "other") {
        return AssetKind::Other;
    }
    return std::nullopt;
}

std::optional<TradeSide> trade_side_from_string(std::string_view value) {
    const auto v = lowered(value);
    if (v == "buy" || v == "b") {
        return TradeSide::Buy;
    }
    if (v == "sell" || v == "s") {
        return TradeSide::Sell;
    }
    if (v == "unknown" || v.empty()) {
        return TradeSide::Unknown;
    }
    return std::nullopt;
}

std::optional<StreamKind> stream_kind_from_string(std::string_view value) {
    const auto v = lowered(value);
    if (v == "trades" || v == "trade") {
        return StreamKind::Trades;
    }
    if (v == "quotes" || v == "quote") {
        return StreamKind::Quotes;
    }
    return std::nullopt;
}

std::optional<JobKind> job_kind_from_string(std::string_view value) {
    const auto v = lowered(value);
    if (v == "backfill") {
        return JobKind::Backfill;
    }
    if (v == "realtime_catchup") {
        return JobKind::RealtimeCatchup;
    }
    return std::nullopt;
}

std::optional<JobStatus> job_status_from_string(std::string_view value) {
    const auto v = lowered(value);
    if (v == "pending") {
        return JobStatus::Pending;
    }
    if (v == "running") {
        return JobStatus::Running;
    }
    if (v == "completed") {
        return JobStatus::Completed;
    }
    if (v == "failed") {
        return JobStatus::Failed;
    }
    return std::nullopt;
}

std::string describe(const StreamKey& key) {
    return key.provider + ":" + key.symbol + ":" + to_string(key.kind);
}

std::string newCorrelationId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace domain
