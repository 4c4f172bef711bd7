#pragma once

#include "domain/Types.h"

#include <optional>
#include <string>
#include <string_view>

namespace mdi::common {

domain::TimestampMs nowMs();

// "2024-03-01T12:30:05.250Z", "2024-03-01T12:30:05+00:00", "2024-03-01 12:30:05" or
// "2024-03-01". Offsets other than UTC are applied. Returns nullopt on anything else.
std::optional<domain::TimestampMs> parseIsoTimestampMs(std::string_view value);

// CLI date argument: an ISO date/timestamp or "now". A bare date taken as an end bound
// covers the whole day.
std::optional<domain::TimestampMs> parseDateArgument(const std::string& value, bool endOfDay);

std::string formatIsoMs(domain::TimestampMs ms);

// UTC year and month of an instant, and the first instant of a month.
struct YearMonth {
    int year{1970};
    int month{1};
};

YearMonth yearMonthOf(domain::TimestampMs ms);
YearMonth addMonths(YearMonth ym, int months);
domain::TimestampMs monthStartMs(YearMonth ym);

}  // namespace mdi::common
