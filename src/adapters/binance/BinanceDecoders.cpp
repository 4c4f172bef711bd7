#include "adapters/binance/BinanceDecoders.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <boost/json.hpp>

#include "adapters/common/JsonFields.hpp"

namespace adapters::binance {
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

domain::RawRecord decodeError(domain::RawRecord record, std::string reason) {
    record.payload = domain::DecodeError{std::move(reason)};
    return record;
}

void decodeTrade(const json::object& data, domain::RawRecord& record) {
    domain::TradePrint print;
    print.tradeId = fields::token(data, "t");
    print.price = fields::number(data, "p");
    print.size = fields::number(data, "q");
    // Trade time; the event time "E" is when Binance emitted the message.
    print.eventTime = fields::token(data, "T");
    if (!print.eventTime) {
        print.eventTime = fields::token(data, "E");
    }
    if (auto buyerIsMaker = fields::boolean(data, "m")) {
        print.side = *buyerIsMaker ? std::string{"sell"} : std::string{"buy"};
    }
    if (print.tradeId) {
        record.sequence = *print.tradeId;
    }
    record.payload = std::move(print);
}

void decodeBookTicker(const json::object& data, domain::RawRecord& record) {
    domain::BookTop top;
    top.bidPrice = fields::number(data, "b");
    top.bidSize = fields::number(data, "B");
    top.askPrice = fields::number(data, "a");
    top.askSize = fields::number(data, "A");
    // Spot bookTicker frames carry no timestamp; futures frames carry "T"/"E".
    top.eventTime = fields::token(data, "T");
    if (!top.eventTime) {
        top.eventTime = fields::token(data, "E");
    }
    if (!top.eventTime) {
        top.eventTime = std::to_string(record.receivedAt);
    }
    if (auto updateId = fields::token(data, "u")) {
        record.sequence = *updateId;
    }
    record.payload = std::move(top);
}

}  // namespace

std::string stream_symbol(const std::string& symbol) {
    std::string lower;
    lower.reserve(symbol.size());
    for (unsigned char ch : symbol) {
        if (!std::isspace(ch)) {
            lower.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return lower;
}

domain::RawRecord decode_stream_message(const std::string& payload,
                                        domain::StreamKind kind,
                                        const domain::Symbol& symbol,
                                        domain::TimestampMs receivedAt) {
    auto record = makeRecord(symbol, receivedAt, payload);

    json::error_code ec;
    auto parsed = json::parse(payload, ec);
    if (ec || !parsed.is_object()) {
        return decodeError(std::move(record), "invalid JSON payload");
    }

    const json::object* data = &parsed.as_object();
    if (const auto* wrapped = data->if_contains("data"); wrapped != nullptr && wrapped->is_object()) {
        data = &wrapped->as_object();
    }

    // Replies to subscription requests: {"result":null,"id":1}.
    if (data->contains("result") && data->contains("id")) {
        record.payload = domain::Keepalive{};
        return record;
    }

    const auto eventType = fields::text(*data, "e");
    if (kind == domain::StreamKind::Trades) {
        if (eventType && *eventType != "trade" && *eventType != "aggTrade") {
            return decodeError(std::move(record), "unexpected event type " + *eventType);
        }
        decodeTrade(*data, record);
        return record;
    }

    if (eventType && *eventType != "bookTicker") {
        return decodeError(std::move(record), "unexpected event type " + *eventType);
    }
    decodeBookTicker(*data, record);
    return record;
}

std::vector<domain::RawRecord> decode_klines(const std::string& body,
                                             domain::Interval granularity,
                                             const domain::Symbol& symbol,
                                             domain::TimestampMs receivedAt) {
    std::vector<domain::RawRecord> records;

    json::error_code ec;
    auto parsed = json::parse(body, ec);
    if (ec || !parsed.is_array()) {
        records.push_back(decodeError(makeRecord(symbol, receivedAt, body), "klines body is not a JSON array"));
        return records;
    }

    const auto& rows = parsed.as_array();
    records.reserve(rows.size());
    for (const auto& rowValue : rows) {
        auto record = makeRecord(symbol, receivedAt, json::serialize(rowValue));
        if (!rowValue.is_array() || rowValue.as_array().size() < 6) {
            records.push_back(decodeError(std::move(record), "incomplete kline row"));
            continue;
        }
        const auto& row = rowValue.as_array();

        domain::Bar bar;
        bar.granularity = granularity;
        if (auto openMs = fields::to_int64(row.at(0))) {
            bar.bucketStart = std::to_string(*openMs);
            record.sequence = *bar.bucketStart;
        }
        bar.open = fields::to_double(row.at(1));
        bar.high = fields::to_double(row.at(2));
        bar.low = fields::to_double(row.at(3));
        bar.close = fields::to_double(row.at(4));
        bar.volume = fields::to_double(row.at(5));
        if (row.size() > 8) {
            bar.tradeCount = fields::to_int64(row.at(8));
        }
        record.payload = std::move(bar);
        records.push_back(std::move(record));
    }
    return records;
}

}  // namespace adapters::binance
