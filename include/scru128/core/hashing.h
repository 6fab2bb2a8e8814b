#pragma once

#include <cstddef>
#include <cstdint>

namespace scru128::core {

// FNV-1a 64-bit over a raw byte range. Deterministic across platforms and runs;
// not a cryptographic digest.
std::uint64_t stable_hash64(const std::uint8_t* data, std::size_t size);

}  // namespace scru128::core
