#include "adapters/polygon/PolygonDecoders.hpp"

#include <boost/json.hpp>

#include "adapters/common/JsonFields.hpp"

namespace adapters::polygon {
namespace {

namespace json = boost::json;
namespace fields = adapters::json_fields;

domain::RawRecord makeRecord(const domain::Symbol& symbol, domain::TimestampMs receivedAt, std::string raw) {
    domain::RawRecord record;
    record.provider = kProviderName;
    record.symbol = symbol;
    record.receivedAt = receivedAt;
    record.timeUnit = domain::TimeUnit::Milliseconds;
    record.raw = std::move(raw);
    record.correlationId = domain::newCorrelationId();
    return record;
}

domain::TradePrint decodeTrade(const json::object& event) {
    domain::TradePrint print;
    print.tradeId = fields::token(event, "i");
    print.price = fields::number(event, "p");
    print.size = fields::number(event, "s");
    print.eventTime = fields::token(event, "t");
    return print;
}

domain::BookTop decodeQuote(const json::object& event) {
    domain::BookTop top;
    top.bidPrice = fields::number(event, "bp");
    top.bidSize = fields::number(event, "bs");
    top.askPrice = fields::number(event, "ap");
    top.askSize = fields::number(event, "as");
    top.eventTime = fields::token(event, "t");
    return top;
}

}  // namespace

Timespan timespan_for(domain::Interval granularity) {
    struct Unit {
        domain::TimestampMs ms;
        const char* name;
    };
    static constexpr Unit kUnits[] = {{domain::kMillisPerWeek, "week"},
                                      {domain::kMillisPerDay, "day"},
                                      {domain::kMillisPerHour, "hour"},
                                      {domain::kMillisPerMinute, "minute"},
                                      {domain::kMillisPerSecond, "second"}};
    for (const auto& unit : kUnits) {
        if (granularity.ms >= unit.ms && granularity.ms % unit.ms == 0) {
            return Timespan{granularity.ms / unit.ms, unit.name};
        }
    }
    return Timespan{};
}

std::string subscription_param(domain::StreamKind kind, const domain::Symbol& symbol) {
    return std::string(kind == domain::StreamKind::Trades ? "T." : "Q.") + symbol;
}

std::vector<StatusEvent> decode_statuses(const std::string& payload) {
    std::vector<StatusEvent> statuses;
    json::error_code ec;
    auto parsed = json::parse(payload, ec);
    if (ec || !parsed.is_array()) {
        return statuses;
    }
    for (const auto& value : parsed.as_array()) {
        if (!value.is_object()) {
            continue;
        }
        const auto& event = value.as_object();
        if (fields::text(event, "ev").value_or("") != "status") {
            continue;
        }
        statuses.push_back(StatusEvent{fields::text(event, "status").value_or(""),
                                       fields::text(event, "message").value_or("")});
    }
    return statuses;
}

std::vector<domain::RawRecord> decode_socket_message(const std::string& payload,
                                                     const domain::Symbol& symbol,
                                                     domain::TimestampMs receivedAt) {
    std::vector<domain::RawRecord> records;

    json::error_code ec;
    auto parsed = json::parse(payload, ec);
    if (ec || !parsed.is_array()) {
        auto record = makeRecord(symbol, receivedAt, payload);
        record.payload = domain::DecodeError{"socket frame is not a JSON array"};
        records.push_back(std::move(record));
        return records;
    }

    const auto& events = parsed.as_array();
    records.reserve(events.size());
    for (const auto& value : events) {
        auto record = makeRecord(symbol, receivedAt, json::serialize(value));
        if (!value.is_object()) {
            record.payload = domain::DecodeError{"event is not an object"};
            records.push_back(std::move(record));
            continue;
        }
        const auto& event = value.as_object();
        if (auto sym = fields::text(event, "sym")) {
            record.symbol = *sym;
        }
        if (auto sequence = fields::token(event, "q")) {
            record.sequence = *sequence;
        }

        const auto type = fields::text(event, "ev").value_or("");
        if (type == "T") {
            record.payload = decodeTrade(event);
        }
        else if (type == "Q") {
            record.payload = decodeQuote(event);
        }
        else if (type == "status") {
            record.payload = domain::Keepalive{};
        }
        else {
            record.payload = domain::DecodeError{"unexpected event type '" + type + "'"};
        }
        records.push_back(std::move(record));
    }
    return records;
}

AggsPage decode_aggs(const std::string& body,
                     domain::Interval granularity,
                     const domain::Symbol& symbol,
                     domain::TimestampMs receivedAt) {
    AggsPage page;

    json::error_code ec;
    auto parsed = json::parse(body, ec);
    if (ec || !parsed.is_object()) {
        auto record = makeRecord(symbol, receivedAt, body);
        record.payload = domain::DecodeError{"aggregates body is not a JSON object"};
        page.records.push_back(std::move(record));
        return page;
    }

    const auto& root = parsed.as_object();
    page.nextUrl = fields::text(root, "next_url").value_or("");

    const auto* results = root.if_contains("results");
    if (results == nullptr || !results->is_array()) {
        return page;
    }

    for (const auto& value : results->as_array()) {
        auto record = makeRecord(symbol, receivedAt, json::serialize(value));
        if (!value.is_object()) {
            record.payload = domain::DecodeError{"aggregate is not an object"};
            page.records.push_back(std::move(record));
            continue;
        }
        const auto& agg = value.as_object();

        domain::Bar bar;
        bar.granularity = granularity;
        bar.bucketStart = fields::token(agg, "t");
        bar.open = fields::number(agg, "o");
        bar.high = fields::number(agg, "h");
        bar.low = fields::number(agg, "l");
        bar.close = fields::number(agg, "c");
        bar.volume = fields::number(agg, "v");
        bar.tradeCount = fields::integer(agg, "n");
        if (bar.bucketStart) {
            record.sequence = *bar.bucketStart;
        }
        record.payload = std::move(bar);
        page.records.push_back(std::move(record));
    }
    return page;
}

}  // namespace adapters::polygon
