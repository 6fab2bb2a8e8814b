#include "scru128/id/base36.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace scru128::id {

namespace {

constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

// 36^10, the multiplier for one 10-digit decode word.
constexpr std::uint64_t kDecodeWordBase = 3'656'158'440'062'976ull;

constexpr int kEncodeWordBytes = 7;
constexpr int kDecodeWordDigits = 10;

// Maps an ASCII byte to its digit value; 0xff marks bytes outside the alphabet.
constexpr std::array<std::uint8_t, 256> make_decode_map() {
  std::array<std::uint8_t, 256> map{};
  map.fill(0xffu);
  for (std::uint8_t i = 0; i < 10u; ++i) {
    map[static_cast<std::size_t>('0' + i)] = i;
  }
  for (std::uint8_t i = 0; i < 26u; ++i) {
    map[static_cast<std::size_t>('a' + i)] = static_cast<std::uint8_t>(10u + i);
    map[static_cast<std::size_t>('A' + i)] = static_cast<std::uint8_t>(10u + i);
  }
  return map;
}

constexpr std::array<std::uint8_t, 256> kDecodeMap = make_decode_map();

std::string describe_char(const char ch) {
  const auto code = static_cast<unsigned char>(ch);
  std::ostringstream oss;
  if (code >= 0x20u && code < 0x7fu) {
    oss << '\'' << ch << '\'';
  } else {
    oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(code);
  }
  return oss.str();
}

}  // namespace

std::string encode_base36(const Bytes& bytes) {
  std::array<std::uint8_t, kStringLength> digits{};

  // Positions right of min_index already hold digits of the partial result.
  int min_index = static_cast<int>(kStringLength);
  for (int i = -5; i < static_cast<int>(kByteLength); i += kEncodeWordBytes) {
    std::uint64_t carry = 0;
    for (int k = std::max(i, 0); k < i + kEncodeWordBytes; ++k) {
      carry = (carry << 8u) | bytes[static_cast<std::size_t>(k)];
    }

    // digits = digits * 2^56 + carry, right to left
    int j = static_cast<int>(kStringLength) - 1;
    while (carry > 0 || j > min_index) {
      const auto pos = static_cast<std::size_t>(j);
      carry += static_cast<std::uint64_t>(digits[pos]) << 56u;
      digits[pos] = static_cast<std::uint8_t>(carry % 36u);
      carry /= 36u;
      --j;
    }
    min_index = j;
  }

  std::string text(kStringLength, '0');
  std::transform(digits.begin(), digits.end(), text.begin(),
                 [](const std::uint8_t d) { return kDigits[d]; });
  return text;
}

core::Result<Bytes, DecodeFailure> decode_base36(const std::string_view text) {
  using DecodeResult = core::Result<Bytes, DecodeFailure>;

  if (text.size() != kStringLength) {
    return DecodeResult::err(DecodeFailure{
        core::ParseError::kInvalidLength,
        "invalid length: expected " + std::to_string(kStringLength) + " digits, got " +
            std::to_string(text.size()),
    });
  }

  std::array<std::uint8_t, kStringLength> digits{};
  for (std::size_t i = 0; i < kStringLength; ++i) {
    const std::uint8_t value = kDecodeMap[static_cast<unsigned char>(text[i])];
    if (value == 0xffu) {
      return DecodeResult::err(DecodeFailure{
          core::ParseError::kInvalidDigit,
          "invalid digit " + describe_char(text[i]) + " at position " + std::to_string(i),
      });
    }
    digits[i] = value;
  }

  Bytes bytes{};

  // Positions right of min_index already hold bytes of the partial result.
  int min_index = static_cast<int>(kByteLength);
  for (int i = -5; i < static_cast<int>(kStringLength); i += kDecodeWordDigits) {
    std::uint64_t carry = 0;
    for (int k = std::max(i, 0); k < i + kDecodeWordDigits; ++k) {
      carry = carry * 36u + digits[static_cast<std::size_t>(k)];
    }

    // bytes = bytes * 36^10 + carry, right to left
    int j = static_cast<int>(kByteLength) - 1;
    while (carry > 0 || j > min_index) {
      if (j < 0) {
        return DecodeResult::err(DecodeFailure{
            core::ParseError::kOutOfRange,
            "out of 128-bit value range: " + std::string(text),
        });
      }
      const auto pos = static_cast<std::size_t>(j);
      carry += static_cast<std::uint64_t>(bytes[pos]) * kDecodeWordBase;
      bytes[pos] = static_cast<std::uint8_t>(carry & 0xffu);
      carry >>= 8u;
      --j;
    }
    min_index = j;
  }

  return DecodeResult::ok(bytes);
}

}  // namespace scru128::id
