#pragma once

#include <string>
#include <cstdint>
#include "common/types.hpp"

namespace lumen {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.mmm][Z]" to epoch milliseconds.
 * Throws ValidationError on malformed input.
 */
int64_t parse_iso8601_ms(const std::string& s);

/**
 * Candle interval ("1m", "15m", "1h", "1d") to milliseconds.
 * Returns 0 for an unknown interval.
 */
int64_t interval_to_ms(const std::string& interval);

/**
 * Format duration for display.
 */
std::string format_duration_ms(int64_t ms);

} // namespace time_utils
} // namespace lumen
