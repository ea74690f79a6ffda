#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace spreadarb {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);

/**
 * Parse ISO 8601 string to timestamp.
 */
WallClock from_iso8601(const std::string& s);

std::string now_iso8601();

int64_t to_epoch_ms(WallClock t);
WallClock from_epoch_ms(int64_t ms);

/**
 * Format duration for display.
 */
std::string format_duration(Duration d);
std::string format_duration_ms(int64_t ms);

/**
 * First instant of the next UTC calendar day after t.
 * Daily risk counters roll over at this boundary.
 */
WallClock next_utc_midnight(WallClock t);

// "YYYY-MM-DD" for the UTC day containing t
std::string utc_date(WallClock t);

} // namespace time_utils
} // namespace spreadarb
