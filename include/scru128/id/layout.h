#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace scru128::id {

// Binary layout of a SCRU128 identifier, most significant field first:
//
//   bytes  0..5   timestamp   48 bits  milliseconds since the Unix epoch
//   bytes  6..8   counter_hi  24 bits
//   bytes  9..11  counter_lo  24 bits
//   bytes 12..15  entropy     32 bits
//
// Every field is byte aligned, so the big-endian byte array, the unsigned 128-bit integer
// and the base-36 text all sort identically.

using Bytes = std::array<std::uint8_t, 16>;

constexpr std::size_t kByteLength = 16;
constexpr std::size_t kStringLength = 25;

constexpr std::uint64_t kMaxTimestamp = 0xffff'ffff'ffffull;
constexpr std::uint64_t kMaxCounterHi = 0xff'ffffull;
constexpr std::uint64_t kMaxCounterLo = 0xff'ffffull;
constexpr std::uint64_t kMaxEntropy = 0xffff'ffffull;

}  // namespace scru128::id
