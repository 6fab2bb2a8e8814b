#include "generate_logic.h"

#include "id_json.h"

#include <nlohmann/json.hpp>

#include <vector>

int execute_generate(scru128::generator::Scru128Generator& generator,
                     const GenerateCliConfig& config, std::ostream& out, std::ostream& err) {
  std::vector<scru128::id::Scru128Id> ids;
  ids.reserve(config.count);

  for (std::size_t i = 0; i < config.count; ++i) {
    if (config.on_rollback == RollbackPolicy::kAbort) {
      auto id = generator.generate_or_abort();
      if (!id.has_value()) {
        err << "Error: clock moved back more than " << config.generator.rollback_allowance_ms
            << " ms; aborting after " << ids.size() << " identifier(s)\n";
        return 1;
      }
      ids.push_back(id.value());
      continue;
    }

    const auto result = generator.generate_with_status();
    if (result.status == scru128::generator::GenerateStatus::kClockRollback) {
      err << "WARNING: clock moved back more than " << config.generator.rollback_allowance_ms
          << " ms; generator state was reset and ordering restarts at " << result.id << "\n";
    }
    ids.push_back(result.id);
  }

  if (config.json) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& id : ids) {
      array.push_back(id_to_json(id));
    }
    out << array.dump(2) << "\n";
    return 0;
  }

  for (const auto& id : ids) {
    out << id << "\n";
  }
  return 0;
}
