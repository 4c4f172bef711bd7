#pragma once

#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/RawRecords.hpp"

namespace adapters::binance {

inline constexpr const char* kProviderName = "binance";

// Stream symbol as Binance expects it in stream names ("btcusdt").
std::string stream_symbol(const std::string& symbol);

// Decodes one frame from a `<symbol>@trade` or `<symbol>@bookTicker` stream. Both raw and
// combined-stream (`{"stream":..., "data":...}`) envelopes are accepted.
domain::RawRecord decode_stream_message(const std::string& payload,
                                        domain::StreamKind kind,
                                        const domain::Symbol& symbol,
                                        domain::TimestampMs receivedAt);

// Decodes a /api/v3/klines body into one Bar record per row.
std::vector<domain::RawRecord> decode_klines(const std::string& body,
                                             domain::Interval granularity,
                                             const domain::Symbol& symbol,
                                             domain::TimestampMs receivedAt);

}  // namespace adapters::binance
