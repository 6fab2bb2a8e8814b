#include "scru128/core/random_source.h"

#include <limits>

namespace scru128::core {

std::uint32_t SystemRandomSource::next_uint32() {
  static_assert(std::numeric_limits<std::random_device::result_type>::digits >= 32,
                "std::random_device must yield at least 32 bits per call");
  return static_cast<std::uint32_t>(device_());
}

std::uint32_t SeededRandomSource::next_uint32() {
  // Keep the upper 32 bits of the 64-bit output.
  return static_cast<std::uint32_t>(engine_() >> 32u);
}

}  // namespace scru128::core
