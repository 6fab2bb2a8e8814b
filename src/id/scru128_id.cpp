#include "scru128/id/scru128_id.h"

#include "scru128/core/hashing.h"
#include "scru128/id/base36.h"

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace scru128::id {

namespace {

// Writes the low `width` bytes of value big-endian into bytes[offset, offset + width).
void write_be(Bytes& bytes, const std::size_t offset, const std::size_t width,
              std::uint64_t value) {
  for (std::size_t i = width; i > 0; --i) {
    bytes[offset + i - 1] = static_cast<std::uint8_t>(value & 0xffu);
    value >>= 8u;
  }
}

void require_field(const char* name, const std::uint64_t value, const std::uint64_t max) {
  if (value > max) {
    throw std::invalid_argument(std::string("invalid field value: ") + name + " = " +
                                std::to_string(value) + " exceeds " + std::to_string(max));
  }
}

}  // namespace

Scru128Id Scru128Id::from_fields(const std::uint64_t timestamp, const std::uint64_t counter_hi,
                                 const std::uint64_t counter_lo, const std::uint64_t entropy) {
  require_field("timestamp", timestamp, kMaxTimestamp);
  require_field("counter_hi", counter_hi, kMaxCounterHi);
  require_field("counter_lo", counter_lo, kMaxCounterLo);
  require_field("entropy", entropy, kMaxEntropy);

  Bytes bytes{};
  write_be(bytes, 0, 6, timestamp);
  write_be(bytes, 6, 3, counter_hi);
  write_be(bytes, 9, 3, counter_lo);
  write_be(bytes, 12, 4, entropy);
  return Scru128Id(bytes);
}

Scru128Id Scru128Id::from_byte_array(const std::vector<std::uint8_t>& bytes) {
  Bytes out{};
  if (bytes.size() <= kByteLength) {
    std::copy(bytes.begin(), bytes.end(),
              out.begin() + static_cast<std::ptrdiff_t>(kByteLength - bytes.size()));
    return Scru128Id(out);
  }

  const auto extra = static_cast<std::ptrdiff_t>(bytes.size() - kByteLength);
  const bool high_bytes_zero = std::all_of(bytes.begin(), bytes.begin() + extra,
                                           [](const std::uint8_t b) { return b == 0u; });
  if (!high_bytes_zero) {
    throw std::invalid_argument("value exceeds 128 bits: non-zero byte in the leading " +
                                std::to_string(extra) + " of " + std::to_string(bytes.size()) +
                                " bytes");
  }
  std::copy(bytes.begin() + extra, bytes.end(), out.begin());
  return Scru128Id(out);
}

Scru128Id Scru128Id::from_string(const std::string_view text) {
  auto decoded = decode_base36(text);
  if (!decoded.has_value()) {
    throw std::invalid_argument(decoded.error().message);
  }
  return Scru128Id(decoded.value());
}

core::Result<Scru128Id, core::ParseError> Scru128Id::parse(const std::string_view text) {
  using ParseResult = core::Result<Scru128Id, core::ParseError>;

  auto decoded = decode_base36(text);
  if (!decoded.has_value()) {
    return ParseResult::err(decoded.error().kind);
  }
  return ParseResult::ok(Scru128Id(decoded.value()));
}

Scru128Id Scru128Id::from_u64_pair(const std::uint64_t high, const std::uint64_t low) noexcept {
  Bytes bytes{};
  write_be(bytes, 0, 8, high);
  write_be(bytes, 8, 8, low);
  return Scru128Id(bytes);
}

std::uint64_t Scru128Id::timestamp() const noexcept { return read_be(0, 6); }

std::uint32_t Scru128Id::counter_hi() const noexcept {
  return static_cast<std::uint32_t>(read_be(6, 9));
}

std::uint32_t Scru128Id::counter_lo() const noexcept {
  return static_cast<std::uint32_t>(read_be(9, 12));
}

std::uint32_t Scru128Id::entropy() const noexcept {
  return static_cast<std::uint32_t>(read_be(12, 16));
}

std::uint64_t Scru128Id::high64() const noexcept { return read_be(0, 8); }

std::uint64_t Scru128Id::low64() const noexcept { return read_be(8, 16); }

std::string Scru128Id::to_string() const { return encode_base36(bytes_); }

std::uint64_t Scru128Id::read_be(std::size_t begin, const std::size_t end) const noexcept {
  std::uint64_t value = 0;
  for (; begin < end; ++begin) {
    value = (value << 8u) | bytes_[begin];
  }
  return value;
}

std::ostream& operator<<(std::ostream& os, const Scru128Id& id) { return os << id.to_string(); }

}  // namespace scru128::id

std::size_t std::hash<scru128::id::Scru128Id>::operator()(
    const scru128::id::Scru128Id& id) const noexcept {
  const auto& bytes = id.bytes();
  return static_cast<std::size_t>(scru128::core::stable_hash64(bytes.data(), bytes.size()));
}
