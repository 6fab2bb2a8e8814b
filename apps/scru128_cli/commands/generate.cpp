#include "generate.h"

#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"
#include "scru128/generator/scru128_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using scru128::apps::Option;
using scru128::apps::parse_uint64;

constexpr std::uint64_t kMaxCount = 10'000'000;

std::vector<Option<GenerateCliConfig>> build_generate_options() {
  return {
      {"--count", true, "Number of identifiers to generate (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto n = parse_uint64(v);
         if (!n.has_value() || n.value() == 0 || n.value() > kMaxCount) {
           std::cerr << "Invalid --count: " << v << " (expected 1.." << kMaxCount << ")\n";
           return false;
         }
         c.count = static_cast<std::size_t>(n.value());
         return true;
       }},
      {"--rollback-allowance", true,
       "Backward clock movement tolerated before a rollback, in ms (default 10000)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto ms = parse_uint64(v);
         if (!ms.has_value()) {
           std::cerr << "Invalid --rollback-allowance: " << v << "\n";
           return false;
         }
         c.generator.rollback_allowance_ms = ms.value();
         return true;
       }},
      {"--on-rollback", true, "Rollback policy (reset|abort)",
       [](GenerateCliConfig& c, const std::string& v) {
         if (v == "reset") {
           c.on_rollback = RollbackPolicy::kReset;
           return true;
         }
         if (v == "abort") {
           c.on_rollback = RollbackPolicy::kAbort;
           return true;
         }
         std::cerr << "Invalid --on-rollback: " << v << " (valid: reset, abort)\n";
         return false;
       }},
      {"--seed", true, "Use a deterministic seeded random source (NOT for production IDs)",
       [](GenerateCliConfig& c, const std::string& v) {
         c.seed = parse_uint64(v);
         if (!c.seed.has_value()) {
           std::cerr << "Invalid --seed: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--fixed-time", true, "Use a fixed clock at this Unix time in ms",
       [](GenerateCliConfig& c, const std::string& v) {
         c.fixed_time_ms = parse_uint64(v);
         if (!c.fixed_time_ms.has_value()) {
           std::cerr << "Invalid --fixed-time: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--json", false, "Print decoded fields as a JSON array",
       [](GenerateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_generate_options();
  const auto config = scru128::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    std::cerr << "Usage: scru128 generate [options]\n";
    scru128::apps::print_options(std::cerr, options);
    return 1;
  }

  // Inject deterministic clock / random source only when explicitly requested.
  std::shared_ptr<scru128::core::IClock> clock;
  if (config->fixed_time_ms.has_value()) {
    clock = std::make_shared<scru128::core::FixedClock>(config->fixed_time_ms.value());
  } else {
    clock = std::make_shared<scru128::core::SystemClock>();
  }

  std::unique_ptr<scru128::core::IRandomSource> random;
  if (config->seed.has_value()) {
    random = std::make_unique<scru128::core::SeededRandomSource>(config->seed.value());
  } else {
    random = std::make_unique<scru128::core::SystemRandomSource>();
  }

  try {
    scru128::generator::Scru128Generator generator(std::move(clock), std::move(random),
                                                   config->generator);
    return execute_generate(generator, config.value(), std::cout, std::cerr);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::overflow_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
