#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/Models.hpp"
#include "domain/RawRecords.hpp"

namespace adapters::polygon {

inline constexpr const char* kProviderName = "polygon";

struct StatusEvent {
    std::string status;
    std::string message;
};

struct AggsPage {
    std::vector<domain::RawRecord> records;
    std::string nextUrl;
};

struct Timespan {
    long long multiplier{1};
    std::string unit;
};

// Largest whole unit dividing the granularity ("5 minute", "1 day", ...).
Timespan timespan_for(domain::Interval granularity);

std::string subscription_param(domain::StreamKind kind, const domain::Symbol& symbol);

// Status events ("connected", "auth_success", "auth_failed", ...) in a socket frame.
std::vector<StatusEvent> decode_statuses(const std::string& payload);

// A socket frame is an array of events; each becomes one record. Status events become
// keepalives.
std::vector<domain::RawRecord> decode_socket_message(const std::string& payload,
                                                     const domain::Symbol& symbol,
                                                     domain::TimestampMs receivedAt);

AggsPage decode_aggs(const std::string& body,
                     domain::Interval granularity,
                     const domain::Symbol& symbol,
                     domain::TimestampMs receivedAt);

}  // namespace adapters::polygon
