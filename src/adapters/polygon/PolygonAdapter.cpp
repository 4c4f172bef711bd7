#include "adapters/polygon/PolygonAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "adapters/common/WsLiveStream.hpp"
#include "adapters/polygon/PolygonDecoders.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "infra/net/WsConnection.hpp"
#include "logging/Log.h"

namespace adapters::polygon {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
constexpr auto kDefaultRetryAfter = std::chrono::seconds(60);
constexpr const char* kStocksCluster = "/stocks";

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string actionMessage(const char* action, const std::string& params) {
    boost::json::object message;
    message["action"] = action;
    message["params"] = params;
    return boost::json::serialize(message);
}

}  // namespace

PolygonAdapter::PolygonAdapter(const mdi::common::ProviderSettings& settings,
                               std::shared_ptr<mdi::common::RateLimiter> limiter,
                               HttpGet httpGet,
                               Options options)
    : settings_(settings),
      limiter_(std::move(limiter)),
      httpGet_(httpGet ? std::move(httpGet) : default_http_get()),
      options_(options) {
    if (!limiter_) {
        throw std::invalid_argument("PolygonAdapter requires a rate limiter");
    }
    provider_.name = settings_.name.empty() ? std::string{kProviderName} : settings_.name;
    provider_.kind = settings_.kind;
    provider_.baseEndpoint = "https://" + settings_.restHost;
    provider_.streamEndpoint = "wss://" + settings_.wsHost + ":" + settings_.wsPort + kStocksCluster;
    provider_.rateLimitPerMinute = settings_.rateLimitPerMinute;
    provider_.active = settings_.active;
}

domain::Instrument PolygonAdapter::describeInstrument(const domain::Symbol& symbol) const {
    domain::Instrument instrument;
    instrument.symbol = toUpper(symbol);
    instrument.provider = provider_.name;
    instrument.assetKind = domain::AssetKind::Equity;
    instrument.baseCurrency = instrument.symbol;
    instrument.quoteCurrency = "USD";
    return instrument;
}

std::vector<domain::RawRecord> PolygonAdapter::fetchHistorical(const domain::Instrument& instrument,
                                                               domain::TimestampMs start,
                                                               domain::TimestampMs end,
                                                               domain::Interval granularity) {
    std::vector<domain::RawRecord> records;
    if (end <= start) {
        return records;
    }
    if (settings_.apiKey.empty()) {
        throw domain::AuthenticationError(provider_.name, "POLYGON_API_KEY is not configured");
    }

    const auto span = timespan_for(granularity);
    if (span.unit.empty()) {
        throw domain::ProviderRequestError(provider_.name,
                                           "granularity " + domain::interval_label(granularity) + " not supported",
                                           400);
    }

    std::ostringstream target;
    target << "/v2/aggs/ticker/" << instrument.symbol << "/range/" << span.multiplier << "/" << span.unit << "/"
           << start << "/" << (end - 1) << "?adjusted=true&sort=asc&limit=" << kPageLimit;

    infra::http::HttpsRequest request;
    request.host = settings_.restHost;
    request.port = settings_.restPort;
    request.target = target.str();
    request.timeoutSec = options_.requestTimeoutSec;
    request.headers.emplace_back("Authorization", "Bearer " + settings_.apiKey);

    for (std::size_t pageIndex = 0; pageIndex < options_.maxPages; ++pageIndex) {
        LOG_DEBUG(kLogCategory, "Polygon REST %s", request.target.c_str());
        auto response = limited_get(provider_.name, httpGet_, *limiter_, request);
        raise_for_status(provider_.name, response, *limiter_, kDefaultRetryAfter);

        auto page = decode_aggs(response.body, granularity, instrument.symbol, mdi::common::nowMs());
        for (auto& record : page.records) {
            if (const auto* bar = std::get_if<domain::Bar>(&record.payload); bar != nullptr && bar->bucketStart) {
                const auto openMs = std::stoll(*bar->bucketStart);
                if (openMs < start || openMs >= end) {
                    continue;
                }
            }
            records.push_back(std::move(record));
        }

        if (page.nextUrl.empty()) {
            break;
        }
        auto next = infra::http::split_https_url(page.nextUrl);
        if (!next) {
            LOG_WARN(kLogCategory, "Polygon next_url is not an https URL, stopping pagination");
            break;
        }
        request.host = next->host;
        request.port = next->port;
        request.target = next->target;
    }

    LOG_DEBUG(kLogCategory,
              "Polygon aggregates symbol=%s span=%lld %s rows=%zu",
              instrument.symbol.c_str(),
              span.multiplier,
              span.unit.c_str(),
              records.size());
    return records;
}

void PolygonAdapter::authenticate_(infra::net::WsConnection& connection) {
    connection.send(actionMessage("auth", settings_.apiKey));
    const auto deadline = std::chrono::steady_clock::now() + options_.authTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        const auto frame = connection.readText(std::max(remaining, std::chrono::milliseconds(1)));
        for (const auto& status : decode_statuses(frame)) {
            if (status.status == "auth_success") {
                LOG_INFO(kLogCategory, "Polygon socket authenticated");
                return;
            }
            if (status.status == "auth_failed") {
                throw domain::AuthenticationError(provider_.name, "Polygon socket auth failed: " + status.message);
            }
        }
    }
    throw domain::TransientProviderError(provider_.name, "Polygon socket auth timed out");
}

std::unique_ptr<domain::ILiveStream> PolygonAdapter::streamLive(const domain::Instrument& instrument,
                                                                domain::StreamKind kind) {
    if (settings_.apiKey.empty()) {
        throw domain::AuthenticationError(provider_.name, "POLYGON_API_KEY is not configured");
    }

    infra::net::WsConnection::Endpoint endpoint;
    endpoint.host = settings_.wsHost;
    endpoint.port = settings_.wsPort;
    endpoint.target = kStocksCluster;

    if (!limiter_->acquire()) {
        throw domain::TransientProviderError(provider_.name, "stream connect cancelled");
    }

    auto connection = std::make_unique<infra::net::WsConnection>(endpoint);
    try {
        connection->connect();
        authenticate_(*connection);
        connection->send(actionMessage("subscribe", subscription_param(kind, instrument.symbol)));
    } catch (const domain::ProviderError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::TransientProviderError(provider_.name, ex.what());
    }

    const auto symbol = instrument.symbol;
    auto decoder = [symbol](const std::string& payload, domain::TimestampMs receivedAt) {
        return decode_socket_message(payload, symbol, receivedAt);
    };
    auto stream = std::make_unique<WsLiveStream>(std::move(connection),
                                                 std::move(decoder),
                                                 provider_.name,
                                                 instrument.symbol,
                                                 options_.queueCapacity);
    stream->start();
    return stream;
}

}  // namespace adapters::polygon
