#pragma once

#include "scru128/core/result.h"
#include "scru128/id/layout.h"

#include <string>
#include <string_view>

namespace scru128::id {

// DecodeFailure carries both the machine-readable reason and a message that names the
// offending input (length, character and position) for diagnostics.
struct DecodeFailure {
  core::ParseError kind;  // NOLINT(readability-identifier-naming)
  std::string message;    // NOLINT(readability-identifier-naming)
};

// encode_base36 renders a 128-bit big-endian value as exactly kStringLength lowercase
// base-36 digits, zero-padded on the left.
//
// The conversion works on 56-bit words (7 bytes; the first word is 2 bytes) taken from the
// most significant end and accumulated into a fixed 25-digit scratch array, so no
// arbitrary-precision arithmetic is involved.
[[nodiscard]] std::string encode_base36(const Bytes& bytes);

// decode_base36 parses exactly kStringLength digits from 0-9A-Za-z (case-insensitive).
//
// The digits are consumed as 10-digit words (the first word is 5 digits), each multiplied
// into the 16-byte buffer right-to-left with carry propagation.
//
// Errors:
//   kInvalidLength  input is not exactly kStringLength characters
//   kInvalidDigit   a character outside the base-36 alphabet
//   kOutOfRange     value is 2^128 or larger
[[nodiscard]] core::Result<Bytes, DecodeFailure> decode_base36(std::string_view text);

}  // namespace scru128::id
