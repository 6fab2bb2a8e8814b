#include "inspect_logic.h"

#include "scru128/id/scru128_id.h"

#include "id_json.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

int execute_inspect(const std::vector<std::string>& ids, std::ostream& out, std::ostream& err) {
  if (ids.empty()) {
    err << "Error: at least one identifier is required\n";
    return 1;
  }

  nlohmann::json decoded = nlohmann::json::array();
  bool failed = false;
  for (const auto& text : ids) {
    try {
      decoded.push_back(id_to_json(scru128::id::Scru128Id::from_string(text)));
    } catch (const std::invalid_argument& e) {
      err << "Error: cannot decode \"" << text << "\": " << e.what() << "\n";
      failed = true;
    }
  }

  if (failed) {
    return 1;
  }

  out << (decoded.size() == 1 ? decoded.front() : decoded).dump(2) << "\n";
  return 0;
}
