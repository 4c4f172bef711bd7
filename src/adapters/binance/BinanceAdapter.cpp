#include "adapters/binance/BinanceAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "adapters/binance/BinanceDecoders.hpp"
#include "adapters/binance/IntervalMap.hpp"
#include "adapters/common/WsLiveStream.hpp"
#include "common/TimeUtils.hpp"
#include "domain/Errors.hpp"
#include "infra/net/WsConnection.hpp"
#include "logging/Log.h"

namespace adapters::binance {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
constexpr double kWeightThreshold = 0.9;
constexpr auto kWeightCooldown = std::chrono::milliseconds(1000);
constexpr auto kDefaultRetryAfter = std::chrono::seconds(60);

constexpr const char* kQuoteAssets[] = {"FDUSD", "USDT", "USDC", "BUSD", "TUSD", "EUR", "TRY", "BTC", "ETH", "BNB"};

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

}  // namespace

BinanceAdapter::BinanceAdapter(const mdi::common::ProviderSettings& settings,
                               std::shared_ptr<mdi::common::RateLimiter> limiter,
                               HttpGet httpGet,
                               Options options)
    : settings_(settings),
      limiter_(std::move(limiter)),
      httpGet_(httpGet ? std::move(httpGet) : default_http_get()),
      options_(options) {
    if (!limiter_) {
        throw std::invalid_argument("BinanceAdapter requires a rate limiter");
    }
    provider_.name = settings_.name.empty() ? std::string{kProviderName} : settings_.name;
    provider_.kind = settings_.kind;
    provider_.baseEndpoint = "https://" + settings_.restHost;
    provider_.streamEndpoint = "wss://" + settings_.wsHost + ":" + settings_.wsPort;
    provider_.rateLimitPerMinute = settings_.rateLimitPerMinute;
    provider_.active = settings_.active;
}

domain::Instrument BinanceAdapter::describeInstrument(const domain::Symbol& symbol) const {
    domain::Instrument instrument;
    instrument.symbol = toUpper(symbol);
    instrument.provider = provider_.name;
    instrument.assetKind = domain::AssetKind::Crypto;
    for (const char* quote : kQuoteAssets) {
        const std::string suffix{quote};
        if (instrument.symbol.size() > suffix.size()
            && instrument.symbol.compare(instrument.symbol.size() - suffix.size(), suffix.size(), suffix) == 0) {
            instrument.baseCurrency = instrument.symbol.substr(0, instrument.symbol.size() - suffix.size());
            instrument.quoteCurrency = suffix;
            break;
        }
    }
    return instrument;
}

void BinanceAdapter::throttleOnWeight_(const std::string& usedWeightHeader) {
    if (usedWeightHeader.empty()) {
        return;
    }
    try {
        const int usedWeight = std::stoi(usedWeightHeader);
        if (static_cast<double>(usedWeight) > kWeightBudgetPerMinute * kWeightThreshold) {
            LOG_INFO(kLogCategory, "Binance used weight %d near budget, cooling down", usedWeight);
            limiter_->penalize(kWeightCooldown);
        }
    } catch (const std::exception&) {
        LOG_DEBUG(kLogCategory, "Binance used weight header unparsable: %s", usedWeightHeader.c_str());
    }
}

std::vector<domain::RawRecord> BinanceAdapter::fetchHistorical(const domain::Instrument& instrument,
                                                               domain::TimestampMs start,
                                                               domain::TimestampMs end,
                                                               domain::Interval granularity) {
    std::vector<domain::RawRecord> records;
    if (end <= start) {
        return records;
    }

    std::string intervalLiteral;
    try {
        intervalLiteral = binance_interval(granularity);
    } catch (const std::invalid_argument& ex) {
        throw domain::ProviderRequestError(provider_.name,
                                           "granularity " + domain::interval_label(granularity) + ": " + ex.what(),
                                           400);
    }

    domain::TimestampMs cursor = start;
    while (cursor < end) {
        std::ostringstream target;
        target << "/api/v3/klines?symbol=" << instrument.symbol << "&interval=" << intervalLiteral
               << "&startTime=" << cursor << "&endTime=" << (end - 1) << "&limit=" << kPageLimit;

        infra::http::HttpsRequest request;
        request.host = settings_.restHost;
        request.port = settings_.restPort;
        request.target = target.str();
        request.timeoutSec = options_.requestTimeoutSec;
        if (!settings_.apiKey.empty()) {
            request.headers.emplace_back("X-MBX-APIKEY", settings_.apiKey);
        }

        LOG_DEBUG(kLogCategory, "Binance REST %s", request.target.c_str());
        auto response = limited_get(provider_.name, httpGet_, *limiter_, request);
        raise_for_status(provider_.name, response, *limiter_, kDefaultRetryAfter);
        throttleOnWeight_(response.usedWeightHeader);

        auto page = decode_klines(response.body, granularity, instrument.symbol, mdi::common::nowMs());
        const std::size_t rows = page.size();
        domain::TimestampMs lastOpen = -1;
        for (auto& record : page) {
            if (const auto* bar = std::get_if<domain::Bar>(&record.payload); bar != nullptr && bar->bucketStart) {
                const auto openMs = std::stoll(*bar->bucketStart);
                lastOpen = std::max(lastOpen, openMs);
                if (openMs < start || openMs >= end) {
                    continue;
                }
            }
            records.push_back(std::move(record));
        }

        if (rows < kPageLimit || lastOpen < cursor) {
            break;
        }
        cursor = lastOpen + granularity.ms;
    }

    LOG_DEBUG(kLogCategory,
              "Binance klines symbol=%s interval=%s rows=%zu",
              instrument.symbol.c_str(),
              intervalLiteral.c_str(),
              records.size());
    return records;
}

std::unique_ptr<domain::ILiveStream> BinanceAdapter::streamLive(const domain::Instrument& instrument,
                                                                domain::StreamKind kind) {
    infra::net::WsConnection::Endpoint endpoint;
    endpoint.host = settings_.wsHost;
    endpoint.port = settings_.wsPort;
    endpoint.target = "/ws/" + stream_symbol(instrument.symbol)
                      + (kind == domain::StreamKind::Trades ? "@trade" : "@bookTicker");

    if (!limiter_->acquire()) {
        throw domain::TransientProviderError(provider_.name, "stream connect cancelled");
    }

    auto connection = std::make_unique<infra::net::WsConnection>(endpoint);
    try {
        connection->connect();
    } catch (const std::exception& ex) {
        throw domain::TransientProviderError(provider_.name, ex.what());
    }

    const auto symbol = instrument.symbol;
    auto decoder = [kind, symbol](const std::string& payload, domain::TimestampMs receivedAt) {
        return std::vector<domain::RawRecord>{decode_stream_message(payload, kind, symbol, receivedAt)};
    };
    auto stream = std::make_unique<WsLiveStream>(std::move(connection),
                                                 std::move(decoder),
                                                 provider_.name,
                                                 instrument.symbol,
                                                 options_.queueCapacity);
    stream->start();
    return stream;
}

}  // namespace adapters::binance
