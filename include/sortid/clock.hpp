#pragma once

#include <sortid/result.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace sortid::clock {

using TimePoint = std::chrono::system_clock::time_point;
// Millisecond-resolution point; covers the whole 48-bit timestamp range,
// unlike the nanosecond system_clock on most platforms
using MillisTimePoint = std::chrono::time_point<std::chrono::system_clock,
                                                std::chrono::milliseconds>;

// Largest timestamp an identifier can carry: 2^48 - 1 ms (year 10889)
constexpr uint64_t MAX_TIMESTAMP_MS = (uint64_t(1) << 48) - 1;

// Milliseconds since the Unix epoch, truncated. Times before the epoch clamp
// to 0. Clock error if the result needs more than 48 bits.
Result<uint64_t> to_unix_ms(MillisTimePoint tp);
Result<uint64_t> to_unix_ms(TimePoint tp);

// Current wall-clock time via to_unix_ms
Result<uint64_t> now_ms();

MillisTimePoint from_unix_ms(uint64_t ms);

// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_iso8601(uint64_t ms);

} // namespace sortid::clock
