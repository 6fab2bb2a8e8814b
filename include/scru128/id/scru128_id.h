#pragma once

#include "scru128/core/result.h"
#include "scru128/id/layout.h"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace scru128::id {

// Scru128Id is an immutable 128-bit identifier: a value type following C.11 (make concrete
// types regular). Ordering, equality and hashing are defined over the 16 big-endian bytes,
// which agrees with the numeric order of the 128-bit integer and with the lexicographic
// order of the canonical text.
//
// All constructors that take external input validate it and throw std::invalid_argument;
// parse() is the non-throwing alternative for text.
class Scru128Id {
 public:
  // The all-zero identifier (the minimum value).
  constexpr Scru128Id() = default;

  explicit constexpr Scru128Id(const Bytes& bytes) noexcept : bytes_(bytes) {}

  // Packs the four fields most-significant-first.
  // Throws std::invalid_argument if any field exceeds its bit width.
  [[nodiscard]] static Scru128Id from_fields(std::uint64_t timestamp, std::uint64_t counter_hi,
                                             std::uint64_t counter_lo, std::uint64_t entropy);

  // Interprets a big-endian buffer as an unsigned integer. Shorter buffers are left-padded
  // with zeros; longer buffers are accepted only if every extra leading byte is zero.
  // Throws std::invalid_argument if the value exceeds 128 bits.
  [[nodiscard]] static Scru128Id from_byte_array(const std::vector<std::uint8_t>& bytes);

  // Decodes the 25-digit base-36 representation (case-insensitive).
  // Throws std::invalid_argument describing the rejected input.
  [[nodiscard]] static Scru128Id from_string(std::string_view text);

  // Non-throwing variant of from_string().
  [[nodiscard]] static core::Result<Scru128Id, core::ParseError> parse(std::string_view text);

  // Builds the identifier from the 128-bit integer split into two 64-bit halves.
  [[nodiscard]] static Scru128Id from_u64_pair(std::uint64_t high, std::uint64_t low) noexcept;

  [[nodiscard]] std::uint64_t timestamp() const noexcept;
  [[nodiscard]] std::uint32_t counter_hi() const noexcept;
  [[nodiscard]] std::uint32_t counter_lo() const noexcept;
  [[nodiscard]] std::uint32_t entropy() const noexcept;

  [[nodiscard]] std::uint64_t high64() const noexcept;
  [[nodiscard]] std::uint64_t low64() const noexcept;

  [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

  // 25-digit canonical (lowercase) representation.
  [[nodiscard]] std::string to_string() const;

  auto operator<=>(const Scru128Id&) const = default;

 private:
  // Reads bytes_[begin, end) as a big-endian unsigned integer (at most 8 bytes).
  [[nodiscard]] std::uint64_t read_be(std::size_t begin, std::size_t end) const noexcept;

  Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const Scru128Id& id);

}  // namespace scru128::id

namespace std {
template <>
struct hash<scru128::id::Scru128Id> {
  std::size_t operator()(const scru128::id::Scru128Id& id) const noexcept;
};
}  // namespace std
