#include "scru128/core/clock.h"

#include "scru128/core/time.h"

namespace scru128::core {

std::uint64_t SystemClock::now_unix_millis() {
  return static_cast<std::uint64_t>(to_unix_millis(now_utc()));
}

std::uint64_t FixedClock::now_unix_millis() {
  return fixed_millis_.load(std::memory_order_acquire);
}

void FixedClock::set(const std::uint64_t millis) {
  fixed_millis_.store(millis, std::memory_order_release);
}

void FixedClock::advance(const std::int64_t delta_millis) {
  // Two's-complement wrap makes a negative delta subtract.
  fixed_millis_.fetch_add(static_cast<std::uint64_t>(delta_millis), std::memory_order_acq_rel);
}

}  // namespace scru128::core
