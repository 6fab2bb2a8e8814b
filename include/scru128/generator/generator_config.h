#pragma once

#include <cstdint>
#include <string>

namespace scru128::generator {

// Default tolerance for a clock that moves backward before the generator treats it as a
// significant rollback.
constexpr std::uint64_t kDefaultRollbackAllowanceMs = 10'000;

// Counter_hi is re-randomized once this many milliseconds have passed since its last renewal.
constexpr std::uint64_t kCounterHiRenewalIntervalMs = 1'000;

// GeneratorConfig holds the tunables of a Scru128Generator.
// Every field has an explicit default.
struct GeneratorConfig {
  // Backward clock movement (ms) tolerated by generate() / generate_or_abort().
  std::uint64_t rollback_allowance_ms{  // NOLINT(readability-identifier-naming)
      kDefaultRollbackAllowanceMs};
};

// validate_generator_config returns an empty string when the config is usable, or a
// human-readable error otherwise.
[[nodiscard]] std::string validate_generator_config(const GeneratorConfig& config);

}  // namespace scru128::generator
