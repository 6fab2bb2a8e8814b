#include "scru128/generator/scru128_generator.h"

#include <stdexcept>
#include <utility>

namespace scru128::generator {

namespace {

// random_counter() serves both counter fields.
static_assert(id::kMaxCounterHi == id::kMaxCounterLo);

void require_48bit(const char* name, const std::uint64_t value) {
  if (value > id::kMaxTimestamp) {
    throw std::invalid_argument(std::string(name) + " = " + std::to_string(value) +
                                " exceeds 2^48 - 1");
  }
}

}  // namespace

std::string_view to_string(const GenerateStatus status) {
  switch (status) {
    case GenerateStatus::kNewTimestamp:
      return "new_timestamp";
    case GenerateStatus::kCounterLoInc:
      return "counter_lo_inc";
    case GenerateStatus::kCounterHiInc:
      return "counter_hi_inc";
    case GenerateStatus::kTimestampInc:
      return "timestamp_inc";
    case GenerateStatus::kClockRollback:
      return "clock_rollback";
  }
  return "unknown";
}

std::string validate_generator_config(const GeneratorConfig& config) {
  if (config.rollback_allowance_ms > id::kMaxTimestamp) {
    return "rollback_allowance_ms = " + std::to_string(config.rollback_allowance_ms) +
           " exceeds 2^48 - 1";
  }
  return {};
}

Scru128Generator::Scru128Generator()
    : Scru128Generator(std::make_shared<core::SystemClock>(),
                       std::make_unique<core::SystemRandomSource>()) {}

Scru128Generator::Scru128Generator(std::shared_ptr<core::IClock> clock,
                                   std::unique_ptr<core::IRandomSource> random,
                                   GeneratorConfig config)
    : clock_(std::move(clock)), random_(std::move(random)), config_(config) {
  if (!clock_) {
    throw std::invalid_argument("Scru128Generator: clock must not be null");
  }
  if (!random_) {
    throw std::invalid_argument("Scru128Generator: random source must not be null");
  }
  const std::string config_error = validate_generator_config(config_);
  if (!config_error.empty()) {
    throw std::invalid_argument("Scru128Generator: " + config_error);
  }
}

id::Scru128Id Scru128Generator::generate() { return generate_with_status().id; }

GenerateResult Scru128Generator::generate_with_status() {
  std::lock_guard<std::mutex> lock(mutex_);
  return generate_or_reset_core(clock_->now_unix_millis(), config_.rollback_allowance_ms);
}

std::optional<id::Scru128Id> Scru128Generator::generate_or_abort() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = generate_or_abort_core(clock_->now_unix_millis(), config_.rollback_allowance_ms);
  if (!result.has_value()) {
    return std::nullopt;
  }
  return result->id;
}

std::string Scru128Generator::generate_string() { return generate().to_string(); }

GenerateResult Scru128Generator::generate_or_reset_core(const std::uint64_t timestamp,
                                                        const std::uint64_t rollback_allowance) {
  require_48bit("timestamp", timestamp);
  require_48bit("rollback_allowance", rollback_allowance);

  const auto status = resolve_counters(timestamp, rollback_allowance);
  if (status.has_value()) {
    return finish(status.value());
  }

  // Trust the clock that jumped backward: start over from the new timestamp.
  reset_state();
  timestamp_ = timestamp;
  counter_lo_ = random_counter();
  return finish(GenerateStatus::kClockRollback);
}

std::optional<GenerateResult> Scru128Generator::generate_or_abort_core(
    const std::uint64_t timestamp, const std::uint64_t rollback_allowance) {
  require_48bit("timestamp", timestamp);
  require_48bit("rollback_allowance", rollback_allowance);

  const auto status = resolve_counters(timestamp, rollback_allowance);
  if (!status.has_value()) {
    return std::nullopt;
  }
  return finish(status.value());
}

std::optional<GenerateStatus> Scru128Generator::resolve_counters(
    const std::uint64_t timestamp, const std::uint64_t rollback_allowance) {
  if (timestamp > timestamp_) {
    timestamp_ = timestamp;
    counter_lo_ = random_counter();
    return GenerateStatus::kNewTimestamp;
  }

  // Both operands are at most 2^48 - 1, so the sum cannot wrap.
  const bool within_allowance =
      timestamp == timestamp_ || timestamp + rollback_allowance > timestamp_;
  if (!within_allowance) {
    return std::nullopt;
  }

  if (counter_lo_ < id::kMaxCounterLo) {
    ++counter_lo_;
    return GenerateStatus::kCounterLoInc;
  }
  if (counter_hi_ < id::kMaxCounterHi) {
    counter_lo_ = random_counter();
    ++counter_hi_;
    return GenerateStatus::kCounterHiInc;
  }
  if (timestamp_ == id::kMaxTimestamp) {
    throw std::overflow_error("Scru128Generator: counters exhausted at the maximum timestamp");
  }
  // Borrow the next millisecond instead of waiting for the clock.
  ++timestamp_;
  counter_hi_ = random_counter();
  counter_lo_ = random_counter();
  return GenerateStatus::kTimestampInc;
}

GenerateResult Scru128Generator::finish(const GenerateStatus status) {
  if (timestamp_ - ts_counter_hi_ >= kCounterHiRenewalIntervalMs) {
    ts_counter_hi_ = timestamp_;
    counter_hi_ = random_counter();
  }

  const std::uint64_t entropy = random_->next_uint32();
  return GenerateResult{
      .id = id::Scru128Id::from_fields(timestamp_, counter_hi_, counter_lo_, entropy),
      .status = status,
  };
}

void Scru128Generator::reset_state() noexcept {
  timestamp_ = 0;
  counter_hi_ = 0;
  counter_lo_ = 0;
  ts_counter_hi_ = 0;
}

std::uint64_t Scru128Generator::random_counter() {
  return random_->next_uint32() & id::kMaxCounterLo;
}

}  // namespace scru128::generator
