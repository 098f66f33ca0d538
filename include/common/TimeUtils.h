#pragma once

#include <string>
#include "common/Types.h"

namespace adaptiverisk {
namespace utils {

constexpr TimestampMs MS_PER_DAY = 24LL * 60LL * 60LL * 1000LL;

TimestampMs nowMs();

// "YYYY-MM-DD" (UTC) for an epoch-ms timestamp.
std::string formatDate(TimestampMs ts);

// Parses "YYYY-MM-DD" as UTC midnight. Returns false on malformed input.
bool parseDate(const std::string& date, TimestampMs& out);

// UTC midnight of the day containing ts.
TimestampMs startOfDay(TimestampMs ts);

// Accepts seconds or milliseconds since epoch and returns milliseconds.
TimestampMs toMsTimestamp(long long ts);

} // namespace utils
} // namespace adaptiverisk
