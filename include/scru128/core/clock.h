#pragma once

#include <atomic>
#include <cstdint>

namespace scru128::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as milliseconds since the Unix epoch.
  // Contract: non-blocking; the value may move backward (wall-clock adjustments).
  virtual std::uint64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_millis() override;
};

// Fixed clock: returns a caller-controlled timestamp for deterministic tests/demos.
// set() and advance() may be called while other threads read the clock.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains atomic)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::uint64_t now_unix_millis() override;

  void set(std::uint64_t millis);
  // Moves the clock by delta_millis, which may be negative to simulate a rollback.
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::uint64_t> fixed_millis_;
};

}  // namespace scru128::core
