#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace weft {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * Current time truncated to millisecond precision, so that
 * formatIsoTimestamp / parseIsoTimestamp round-trip exactly
 */
TimePoint nowMillis();

/**
 * Format as UTC ISO 8601 with milliseconds: 2024-05-01T10:00:00.123Z
 */
std::string formatIsoTimestamp(TimePoint tp);

/**
 * Parse the format produced by formatIsoTimestamp.
 * Accepts an optional fractional part and an optional trailing 'Z'.
 * Throws std::runtime_error on malformed input.
 */
TimePoint parseIsoTimestamp(const std::string& text);

int64_t toUnixMillis(TimePoint tp);

} // namespace weft
