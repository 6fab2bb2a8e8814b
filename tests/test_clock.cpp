#include "scru128/core/clock.h"
#include "scru128/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace scru128;

TEST_CASE("FixedClock: returns the configured time until changed", "[core][clock]") {
  core::FixedClock clock(1'700'000'000'000ull);
  CHECK(clock.now_unix_millis() == 1'700'000'000'000ull);
  CHECK(clock.now_unix_millis() == 1'700'000'000'000ull);

  clock.set(42);
  CHECK(clock.now_unix_millis() == 42);
}

TEST_CASE("FixedClock: advance moves forward and backward", "[core][clock]") {
  core::FixedClock clock(100'000);

  clock.advance(250);
  CHECK(clock.now_unix_millis() == 100'250);

  clock.advance(-10'250);
  CHECK(clock.now_unix_millis() == 90'000);
}

TEST_CASE("SystemClock: tracks wall-clock time", "[core][clock]") {
  core::SystemClock clock;
  const auto before = static_cast<std::uint64_t>(core::to_unix_millis(core::now_utc()));
  const auto reading = clock.now_unix_millis();
  const auto after = static_cast<std::uint64_t>(core::to_unix_millis(core::now_utc()));

  CHECK(reading >= before);
  CHECK(reading <= after);
  // Well past 2020-01-01 and far below the 48-bit limit.
  CHECK(reading > 1'577'836'800'000ull);
  CHECK(reading < 0xffff'ffff'ffffull);
}

TEST_CASE("format_unix_millis_iso8601: renders UTC with milliseconds", "[core][time]") {
  CHECK(core::format_unix_millis_iso8601(0) == "1970-01-01T00:00:00.000Z");
  CHECK(core::format_unix_millis_iso8601(1'700'000'000'123ull) == "2023-11-14T22:13:20.123Z");
  CHECK(core::format_unix_millis_iso8601(1'000'000'000'007ull) == "2001-09-09T01:46:40.007Z");
}
