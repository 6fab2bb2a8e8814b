#include "id_json.h"

#include "scru128/core/time.h"

#include <iomanip>
#include <sstream>

nlohmann::json id_to_json(const scru128::id::Scru128Id& id) {
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (const auto b : id.bytes()) {
    hex << std::setw(2) << static_cast<unsigned>(b);
  }

  nlohmann::json out;
  out["id"] = id.to_string();
  out["timestamp"] = id.timestamp();
  out["time"] = scru128::core::format_unix_millis_iso8601(id.timestamp());
  out["counter_hi"] = id.counter_hi();
  out["counter_lo"] = id.counter_lo();
  out["entropy"] = id.entropy();
  out["hex"] = hex.str();
  return out;
}
