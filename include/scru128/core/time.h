#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace scru128::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// format_unix_millis_iso8601 renders a millisecond Unix timestamp as
// "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
std::string format_unix_millis_iso8601(std::uint64_t unix_millis);

}  // namespace scru128::core
