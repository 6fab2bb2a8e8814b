#include "scru128/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace scru128::core {

std::string format_unix_millis_iso8601(const std::uint64_t unix_millis) {
  const auto seconds = static_cast<std::time_t>(unix_millis / 1000u);
  const auto millis = static_cast<unsigned>(unix_millis % 1000u);

  std::tm utc{};
  if (gmtime_r(&seconds, &utc) == nullptr) {
    throw std::runtime_error("cannot convert " + std::to_string(unix_millis) + " ms to UTC");
  }

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace scru128::core
