#pragma once

#include "scru128/generator/generator_config.h"
#include "scru128/generator/scru128_generator.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

// RollbackPolicy selects what `generate` does when the clock moves back beyond the
// configured allowance.
enum class RollbackPolicy {
  kReset,  // NOLINT(readability-identifier-naming)
  kAbort,  // NOLINT(readability-identifier-naming)
};

// GenerateCliConfig holds all parsed flags of the `generate` subcommand.
struct GenerateCliConfig {
  std::size_t count{1};                                // NOLINT(readability-identifier-naming)
  scru128::generator::GeneratorConfig generator;       // NOLINT(readability-identifier-naming)
  RollbackPolicy on_rollback{RollbackPolicy::kReset};  // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> seed;                   // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> fixed_time_ms;          // NOLINT(readability-identifier-naming)
  bool json{false};                                    // NOLINT(readability-identifier-naming)
};

// execute_generate draws config.count identifiers from generator and writes them to out,
// one per line or as a JSON array. Rollback warnings and errors go to err.
// Returns the process exit status.
int execute_generate(scru128::generator::Scru128Generator& generator,
                     const GenerateCliConfig& config, std::ostream& out, std::ostream& err);
