#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "TestSupport.hpp"
#include "adapters/binance/BinanceAdapter.hpp"
#include "adapters/binance/BinanceDecoders.hpp"
#include "adapters/binance/IntervalMap.hpp"
#include "adapters/common/ProviderHttp.hpp"
#include "adapters/polygon/PolygonAdapter.hpp"
#include "adapters/polygon/PolygonDecoders.hpp"
#include "domain/Errors.hpp"

namespace {

constexpr domain::TimestampMs kReceived = 1'700'000'000'500LL;
constexpr domain::Interval kMinute{domain::kMillisPerMinute};

std::shared_ptr<mdi::common::RateLimiter> generousLimiter() {
    return std::make_shared<mdi::common::RateLimiter>(mdi::common::RateLimiter::fromBudget(600000.0, 1000.0));
}

// Replays canned responses and records every request it was given.
struct ScriptedHttp {
    std::vector<infra::http::JsonResponse> responses;
    std::vector<infra::http::HttpsRequest> requests;

    adapters::HttpGet get() {
        return [this](const infra::http::HttpsRequest& request) {
            requests.push_back(request);
            if (requests.size() > responses.size()) {
                throw std::runtime_error("no scripted response left");
            }
            return responses[requests.size() - 1];
        };
    }
};

infra::http::JsonResponse ok(std::string body) {
    infra::http::JsonResponse response;
    response.status = 200;
    response.body = std::move(body);
    return response;
}

std::string klineRows(domain::TimestampMs first, int count) {
    std::string body = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            body += ",";
        }
        const auto open = first + i * kMinute.ms;
        body += "[" + std::to_string(open) + ",\"10.0\",\"12.0\",\"9.5\",\"11.0\",\"3.25\"," + std::to_string(open + kMinute.ms - 1)
                + ",\"35.0\",7]";
    }
    return body + "]";
}

int binanceTradeFrames() {
    const std::string frame =
        R"({"e":"trade","E":1700000000100,"s":"BTCUSDT","t":12345,"p":"37000.50","q":"0.010","T":1700000000099,"m":true})";
    auto record = adapters::binance::decode_stream_message(frame, domain::StreamKind::Trades, "BTCUSDT", kReceived);
    const auto* print = std::get_if<domain::TradePrint>(&record.payload);
    CHECK(print != nullptr);
    CHECK(print->tradeId == std::optional<std::string>("12345"));
    CHECK(print->price == std::optional<double>(37000.5));
    CHECK(print->size == std::optional<double>(0.01));
    CHECK(print->eventTime == std::optional<std::string>("1700000000099"));
    CHECK(print->side == std::optional<std::string>("sell"));
    CHECK(record.sequence == "12345");
    CHECK(record.raw == frame);
    CHECK(!record.correlationId.empty());
    CHECK(record.provider == "binance");

    const std::string combined =
        R"({"stream":"btcusdt@trade","data":{"e":"trade","E":1700000000100,"t":7,"p":"1","q":"2","m":false}})";
    auto wrapped = adapters::binance::decode_stream_message(combined, domain::StreamKind::Trades, "BTCUSDT", kReceived);
    const auto* inner = std::get_if<domain::TradePrint>(&wrapped.payload);
    CHECK(inner != nullptr);
    CHECK(inner->eventTime == std::optional<std::string>("1700000000100"));
    CHECK(inner->side == std::optional<std::string>("buy"));
    return 0;
}

int binanceControlAndBrokenFrames() {
    auto reply = adapters::binance::decode_stream_message(R"({"result":null,"id":1})", domain::StreamKind::Trades, "BTCUSDT", kReceived);
    CHECK(reply.isKeepalive());

    auto garbage = adapters::binance::decode_stream_message("{oops", domain::StreamKind::Trades, "BTCUSDT", kReceived);
    CHECK(garbage.isDecodeError());
    CHECK(garbage.raw == "{oops");

    auto wrongType = adapters::binance::decode_stream_message(R"({"e":"kline","k":{}})", domain::StreamKind::Trades, "BTCUSDT", kReceived);
    CHECK(wrongType.isDecodeError());
    CHECK(std::get<domain::DecodeError>(wrongType.payload).reason.find("kline") != std::string::npos);

    auto book = adapters::binance::decode_stream_message(R"({"u":400900217,"s":"BNBUSDT","b":"25.35","B":"31.21","a":"25.36","A":"40.66"})",
                                                         domain::StreamKind::Quotes,
                                                         "BNBUSDT",
                                                         kReceived);
    const auto* top = std::get_if<domain::BookTop>(&book.payload);
    CHECK(top != nullptr);
    CHECK(top->bidPrice == std::optional<double>(25.35));
    CHECK(top->askSize == std::optional<double>(40.66));
    CHECK(top->eventTime == std::optional<std::string>(std::to_string(kReceived)));
    CHECK(book.sequence == "400900217");
    CHECK(adapters::binance::stream_symbol("BTCUSDT") == "btcusdt");
    return 0;
}

int binanceKlines() {
    auto records = adapters::binance::decode_klines(klineRows(1'700'000'040'000LL, 2), kMinute, "BTCUSDT", kReceived);
    CHECK(records.size() == 2);
    const auto* bar = std::get_if<domain::Bar>(&records[1].payload);
    CHECK(bar != nullptr);
    CHECK(bar->bucketStart == std::optional<std::string>("1700000100000"));
    CHECK(bar->high == std::optional<double>(12.0));
    CHECK(bar->volume == std::optional<double>(3.25));
    CHECK(bar->tradeCount == std::optional<std::int64_t>(7));
    CHECK(bar->granularity == kMinute);

    auto partial = adapters::binance::decode_klines(R"([[1700000040000,"1","2"]])", kMinute, "BTCUSDT", kReceived);
    CHECK(partial.size() == 1 && partial[0].isDecodeError());
    auto notArray = adapters::binance::decode_klines(R"({"code":-1121,"msg":"Invalid symbol."})", kMinute, "BTCUSDT", kReceived);
    CHECK(notArray.size() == 1 && notArray[0].isDecodeError());

    CHECK(adapters::binance::binance_interval(domain::Interval{4 * domain::kMillisPerHour}) == "4h");
    CHECK(adapters::binance::from_binance_interval("1w").ms == domain::kMillisPerWeek);
    return 0;
}

int binanceHistoricalPages() {
    ScriptedHttp http;
    const domain::TimestampMs start = 1'700'000'040'000LL;
    http.responses.push_back(ok(klineRows(start, 1000)));
    http.responses.push_back(ok(klineRows(start + 1000 * kMinute.ms, 200)));

    mdi::common::ProviderSettings settings;
    settings.name = "binance";
    settings.restHost = "api.binance.com";
    settings.apiKey = "k";
    adapters::binance::BinanceAdapter adapter(settings, generousLimiter(), http.get(), {});
    const auto instrument = adapter.describeInstrument("btcusdt");
    CHECK(instrument.symbol == "BTCUSDT");

    auto records = adapter.fetchHistorical(instrument, start, start + 1100 * kMinute.ms, kMinute);
    CHECK(http.requests.size() == 2);
    CHECK(records.size() == 1100);
    CHECK(http.requests[0].target.find("interval=1m") != std::string::npos);
    CHECK(http.requests[1].target.find("startTime=" + std::to_string(start + 1000 * kMinute.ms)) != std::string::npos);
    CHECK(http.requests[0].headers.size() == 1 && http.requests[0].headers[0].first == "X-MBX-APIKEY");

    bool badGranularity = false;
    try {
        adapter.fetchHistorical(instrument, start, start + kMinute.ms, domain::Interval{7 * kMinute.ms});
    }
    catch (const domain::ProviderRequestError& ex) {
        badGranularity = ex.status() == 400;
    }
    CHECK(badGranularity);
    return 0;
}

int binanceRateLimitIsTyped() {
    ScriptedHttp http;
    infra::http::JsonResponse limited;
    limited.status = 429;
    limited.retryAfterHeader = "2";
    limited.body = R"({"code":-1003,"msg":"Too many requests"})";
    http.responses.push_back(limited);

    mdi::common::ProviderSettings settings;
    settings.name = "binance";
    settings.restHost = "api.binance.com";
    auto limiter = generousLimiter();
    adapters::binance::BinanceAdapter adapter(settings, limiter, http.get(), {});

    bool rateLimited = false;
    try {
        adapter.fetchHistorical(adapter.describeInstrument("BTCUSDT"), 0, kMinute.ms, kMinute);
    }
    catch (const domain::RateLimitedError& ex) {
        rateLimited = ex.retryAfter() == std::chrono::milliseconds(2000);
    }
    CHECK(rateLimited);
    CHECK(limiter->timeUntilAvailable(mdi::common::RateLimiter::Clock::now()) > std::chrono::milliseconds(1500));

    CHECK(adapters::parse_retry_after("", std::chrono::milliseconds(60000)) == std::chrono::milliseconds(60000));
    CHECK(adapters::parse_retry_after("junk", std::chrono::milliseconds(5)) == std::chrono::milliseconds(5));
    return 0;
}

int polygonSocketFrames() {
    const std::string frame = R"([
        {"ev":"status","status":"auth_success","message":"authenticated"},
        {"ev":"T","sym":"AAPL","i":"52983525029461","x":4,"p":189.91,"s":100,"t":1700000000000,"q":1063},
        {"ev":"Q","sym":"AAPL","bp":189.9,"bs":2,"ap":189.92,"as":3,"t":1700000000001,"q":1064},
        {"ev":"XA","sym":"AAPL"}
    ])";
    auto records = adapters::polygon::decode_socket_message(frame, "AAPL", kReceived);
    CHECK(records.size() == 4);
    CHECK(records[0].isKeepalive());

    const auto* print = std::get_if<domain::TradePrint>(&records[1].payload);
    CHECK(print != nullptr);
    CHECK(print->tradeId == std::optional<std::string>("52983525029461"));
    CHECK(print->price == std::optional<double>(189.91));
    CHECK(print->eventTime == std::optional<std::string>("1700000000000"));
    CHECK(records[1].sequence == "1063");
    CHECK(records[1].provider == "polygon");

    const auto* quote = std::get_if<domain::BookTop>(&records[2].payload);
    CHECK(quote != nullptr);
    CHECK(quote->askPrice == std::optional<double>(189.92));
    CHECK(records[3].isDecodeError());

    auto statuses = adapters::polygon::decode_statuses(frame);
    CHECK(statuses.size() == 1);
    CHECK(statuses[0].status == "auth_success");

    auto broken = adapters::polygon::decode_socket_message("not json", "AAPL", kReceived);
    CHECK(broken.size() == 1 && broken[0].isDecodeError());
    CHECK(adapters::polygon::subscription_param(domain::StreamKind::Quotes, "AAPL") == "Q.AAPL");
    return 0;
}

int polygonTimespans() {
    auto fiveMinutes = adapters::polygon::timespan_for(domain::Interval{5 * domain::kMillisPerMinute});
    CHECK(fiveMinutes.multiplier == 5 && fiveMinutes.unit == "minute");
    auto day = adapters::polygon::timespan_for(domain::Interval{domain::kMillisPerDay});
    CHECK(day.multiplier == 1 && day.unit == "day");
    auto ninetyMinutes = adapters::polygon::timespan_for(domain::Interval{90 * domain::kMillisPerMinute});
    CHECK(ninetyMinutes.multiplier == 90 && ninetyMinutes.unit == "minute");
    CHECK(adapters::polygon::timespan_for(domain::Interval{250}).unit.empty());
    return 0;
}

int polygonHistoricalFollowsNextUrl() {
    const domain::TimestampMs start = 1'700'000'040'000LL;
    ScriptedHttp http;
    http.responses.push_back(ok(R"({"status":"OK","results":[
        {"t":1700000040000,"o":1,"h":2,"l":0.5,"c":1.5,"v":100,"n":3},
        {"t":1700000100000,"o":1.5,"h":2,"l":1,"c":1.8,"v":50,"n":2}],
        "next_url":"https://api.polygon.io/v2/aggs/ticker/AAPL/range/1/minute/1700000160000/1700000219999?cursor=abc"})"));
    http.responses.push_back(ok(R"({"status":"OK","results":[
        {"t":1700000160000,"o":1.8,"h":1.9,"l":1.7,"c":1.75,"v":10,"n":1},
        {"t":1700000220000,"o":9,"h":9,"l":9,"c":9,"v":1,"n":1}]})"));

    mdi::common::ProviderSettings settings;
    settings.name = "polygon";
    settings.restHost = "api.polygon.io";
    settings.apiKey = "secret";
    adapters::polygon::PolygonAdapter adapter(settings, generousLimiter(), http.get(), {});
    const auto instrument = adapter.describeInstrument("aapl");
    CHECK(instrument.symbol == "AAPL");
    CHECK(instrument.assetKind == domain::AssetKind::Equity);

    auto records = adapter.fetchHistorical(instrument, start, start + 3 * kMinute.ms, kMinute);
    CHECK(http.requests.size() == 2);
    // The row past the window is dropped.
    CHECK(records.size() == 3);
    CHECK(http.requests[0].target.rfind("/v2/aggs/ticker/AAPL/range/1/minute/1700000040000/1700000219999", 0) == 0);
    CHECK(http.requests[0].headers[0].second == "Bearer secret");
    CHECK(http.requests[1].host == "api.polygon.io");
    CHECK(http.requests[1].target.find("cursor=abc") != std::string::npos);
    return 0;
}

int polygonNeedsApiKey() {
    mdi::common::ProviderSettings settings;
    settings.name = "polygon";
    settings.restHost = "api.polygon.io";
    ScriptedHttp http;
    adapters::polygon::PolygonAdapter adapter(settings, generousLimiter(), http.get(), {});
    bool rejected = false;
    try {
        adapter.fetchHistorical(adapter.describeInstrument("AAPL"), 0, kMinute.ms, kMinute);
    }
    catch (const domain::AuthenticationError&) {
        rejected = true;
    }
    CHECK(rejected);
    CHECK(http.requests.empty());
    return 0;
}

}  // namespace

int main() {
    RUN(binanceTradeFrames);
    RUN(binanceControlAndBrokenFrames);
    RUN(binanceKlines);
    RUN(binanceHistoricalPages);
    RUN(binanceRateLimitIsTyped);
    RUN(polygonSocketFrames);
    RUN(polygonTimespans);
    RUN(polygonHistoricalFollowsNextUrl);
    RUN(polygonNeedsApiKey);
    std::cout << "test_adapter_decode passed\n";
    return 0;
}
