#pragma once

#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"
#include "scru128/generator/generator_config.h"
#include "scru128/id/scru128_id.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace scru128::generator {

// GenerateStatus records which transition of the state machine produced an identifier.
enum class GenerateStatus {
  kNewTimestamp,   // clock moved forward; counter_lo re-seeded
  kCounterLoInc,   // same (or slightly earlier) millisecond; counter_lo incremented
  kCounterHiInc,   // counter_lo overflowed; counter_hi incremented
  kTimestampInc,   // both counters overflowed; timestamp advanced by one tick
  kClockRollback,  // clock moved back beyond the allowance; state was reset
};

[[nodiscard]] std::string_view to_string(GenerateStatus status);

struct GenerateResult {
  id::Scru128Id id;       // NOLINT(readability-identifier-naming)
  GenerateStatus status;  // NOLINT(readability-identifier-naming)
};

// Scru128Generator produces monotonically increasing SCRU128 identifiers from an injected
// clock and an exclusively owned random source.
//
// Thread-safety:
// - generate(), generate_or_abort() and generate_string() lock an internal mutex and may be
//   called concurrently.
// - generate_or_reset_core() and generate_or_abort_core() take an explicit timestamp and do
//   NOT lock; callers that share an instance across threads must synchronize externally.
//
// Rollback policies, applied when the timestamp is rollback_allowance or more behind the
// last one used:
// - reset: discard the state and resume from the new timestamp. The returned identifier is
//   typically smaller than the previous one; ordering resumes from there.
// - abort: leave the state untouched and return std::nullopt.
class Scru128Generator {
 public:
  // System clock and OS-backed random source with the default configuration.
  Scru128Generator();

  // Throws std::invalid_argument if clock or random is null, or if config is invalid.
  Scru128Generator(std::shared_ptr<core::IClock> clock,
                   std::unique_ptr<core::IRandomSource> random, GeneratorConfig config = {});

  ~Scru128Generator() = default;

  // Not copyable or movable (owns mutex and monotonic state)
  Scru128Generator(const Scru128Generator&) = delete;
  Scru128Generator& operator=(const Scru128Generator&) = delete;
  Scru128Generator(Scru128Generator&&) = delete;
  Scru128Generator& operator=(Scru128Generator&&) = delete;

  // Reset-and-resume on significant rollback. Thread-safe.
  [[nodiscard]] id::Scru128Id generate();

  // Same as generate(), additionally reporting the transition taken. Thread-safe.
  [[nodiscard]] GenerateResult generate_with_status();

  // Abort on significant rollback. Thread-safe.
  [[nodiscard]] std::optional<id::Scru128Id> generate_or_abort();

  // generate().to_string(). Thread-safe.
  [[nodiscard]] std::string generate_string();

  // Low-level reset-and-resume entry point. Not thread-safe.
  // Throws std::invalid_argument if timestamp or rollback_allowance exceeds 2^48 - 1.
  [[nodiscard]] GenerateResult generate_or_reset_core(
      std::uint64_t timestamp, std::uint64_t rollback_allowance = kDefaultRollbackAllowanceMs);

  // Low-level abort entry point. Not thread-safe.
  // Throws std::invalid_argument if timestamp or rollback_allowance exceeds 2^48 - 1.
  [[nodiscard]] std::optional<GenerateResult> generate_or_abort_core(
      std::uint64_t timestamp, std::uint64_t rollback_allowance = kDefaultRollbackAllowanceMs);

  [[nodiscard]] const GeneratorConfig& config() const noexcept { return config_; }

 private:
  // Steps the timestamp and counters for the incoming timestamp. Returns std::nullopt,
  // leaving the state untouched, when the timestamp rolled back beyond the allowance.
  std::optional<GenerateStatus> resolve_counters(std::uint64_t timestamp,
                                                 std::uint64_t rollback_allowance);

  // Renews counter_hi when due, draws entropy and packs the identifier.
  GenerateResult finish(GenerateStatus status);

  void reset_state() noexcept;

  [[nodiscard]] std::uint64_t random_counter();

  std::shared_ptr<core::IClock> clock_;
  std::unique_ptr<core::IRandomSource> random_;
  GeneratorConfig config_;

  std::mutex mutex_;

  std::uint64_t timestamp_{0};
  std::uint64_t counter_hi_{0};
  std::uint64_t counter_lo_{0};
  // Timestamp at the last renewal of counter_hi_.
  std::uint64_t ts_counter_hi_{0};
};

}  // namespace scru128::generator
