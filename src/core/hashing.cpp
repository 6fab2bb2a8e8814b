#include "scru128/core/hashing.h"

namespace scru128::core {

std::uint64_t stable_hash64(const std::uint8_t* data, const std::size_t size) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (std::size_t i = 0; i < size; ++i) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    hash ^= static_cast<std::uint64_t>(data[i]);
    hash *= kPrime;
  }
  return hash;
}

}  // namespace scru128::core
