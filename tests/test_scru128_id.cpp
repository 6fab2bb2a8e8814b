#include "scru128/id/scru128_id.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using scru128::id::Scru128Id;

namespace {

constexpr std::uint64_t kMax48 = 0xffff'ffff'ffffull;
constexpr std::uint64_t kMax24 = 0xff'ffffull;
constexpr std::uint64_t kMax32 = 0xffff'ffffull;

struct FieldCase {
  std::uint64_t timestamp;
  std::uint64_t counter_hi;
  std::uint64_t counter_lo;
  std::uint64_t entropy;
  std::string text;
};

std::string to_upper_ascii(std::string s) {
  for (char& ch : s) {
    if (ch >= 'a' && ch <= 'z') {
      ch = static_cast<char>(ch - 'a' + 'A');
    }
  }
  return s;
}

}  // namespace

// ── Field packing and canonical text ────────────────────────────────────────

TEST_CASE("Scru128Id: encodes and decodes prepared field cases", "[id]") {
  const std::vector<FieldCase> cases = {
      {0, 0, 0, 0, "0000000000000000000000000"},
      {kMax48, 0, 0, 0, "f5lxx1zz5k6tp71geeh2db7k0"},
      {0, kMax24, 0, 0, "0000000005gv2r2kjwr7n8xs0"},
      {0, 0, kMax24, 0, "00000000000000jpia7ql4hs0"},
      {0, 0, 0, kMax32, "0000000000000000001z141z3"},
      {kMax48, kMax24, kMax24, kMax32, "f5lxx1zz5pnorynqglhzmsp33"},
  };

  for (const auto& c : cases) {
    const auto from_fields =
        Scru128Id::from_fields(c.timestamp, c.counter_hi, c.counter_lo, c.entropy);
    const auto from_lower = Scru128Id::from_string(c.text);
    const auto from_upper = Scru128Id::from_string(to_upper_ascii(c.text));

    CHECK(from_fields == from_lower);
    CHECK(from_fields == from_upper);
    CHECK(from_fields.to_string() == c.text);
    CHECK(from_upper.to_string() == c.text);

    CHECK(from_lower.timestamp() == c.timestamp);
    CHECK(from_lower.counter_hi() == c.counter_hi);
    CHECK(from_lower.counter_lo() == c.counter_lo);
    CHECK(from_lower.entropy() == c.entropy);
  }
}

TEST_CASE("Scru128Id: packs fields big-endian in 6/3/3/4 bytes", "[id]") {
  const auto id = Scru128Id::from_fields(0x0123'4567'89abull, 0xcdef01, 0x234567, 0x89abcdef);
  const scru128::id::Bytes expected = {0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef,
                                       0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef};
  CHECK(id.bytes() == expected);
  CHECK(id.high64() == 0x0123'4567'89ab'cdefull);
  CHECK(id.low64() == 0x0123'4567'89ab'cdefull);
}

TEST_CASE("Scru128Id: default value is the all-zero identifier", "[id]") {
  const Scru128Id zero;
  CHECK(zero == Scru128Id::from_fields(0, 0, 0, 0));
  CHECK(zero.to_string() == std::string(25, '0'));
}

TEST_CASE("Scru128Id: from_fields rejects values wider than their field", "[id]") {
  CHECK_THROWS_AS(Scru128Id::from_fields(kMax48 + 1, 0, 0, 0), std::invalid_argument);
  CHECK_THROWS_AS(Scru128Id::from_fields(0, kMax24 + 1, 0, 0), std::invalid_argument);
  CHECK_THROWS_AS(Scru128Id::from_fields(0, 0, kMax24 + 1, 0), std::invalid_argument);
  CHECK_THROWS_AS(Scru128Id::from_fields(0, 0, 0, kMax32 + 1), std::invalid_argument);
  CHECK_NOTHROW(Scru128Id::from_fields(kMax48, kMax24, kMax24, kMax32));
}

// ── Byte buffers ────────────────────────────────────────────────────────────

TEST_CASE("Scru128Id: from_byte_array left-pads short buffers", "[id][bytes]") {
  const auto id = Scru128Id::from_byte_array({0x01, 0x02, 0x03});
  scru128::id::Bytes expected{};
  expected[13] = 0x01;
  expected[14] = 0x02;
  expected[15] = 0x03;
  CHECK(id.bytes() == expected);
  CHECK(id.entropy() == 0x010203u);

  CHECK(Scru128Id::from_byte_array({}) == Scru128Id{});
}

TEST_CASE("Scru128Id: from_byte_array round-trips 16 bytes", "[id][bytes]") {
  const auto original = Scru128Id::from_fields(1'700'000'000'000ull, 42, 4242, 0xdeadbeef);
  const auto& raw = original.bytes();
  const auto copy = Scru128Id::from_byte_array(std::vector<std::uint8_t>(raw.begin(), raw.end()));
  CHECK(copy == original);
}

TEST_CASE("Scru128Id: from_byte_array accepts longer buffers with zero high bytes",
          "[id][bytes]") {
  std::vector<std::uint8_t> buffer(20, 0);
  buffer[4] = 0xff;
  buffer[19] = 0x01;
  const auto id = Scru128Id::from_byte_array(buffer);
  CHECK(id.bytes()[0] == 0xff);
  CHECK(id.bytes()[15] == 0x01);
}

TEST_CASE("Scru128Id: from_byte_array rejects values wider than 128 bits", "[id][bytes]") {
  std::vector<std::uint8_t> buffer(17, 0);
  buffer[0] = 0x01;
  CHECK_THROWS_AS(Scru128Id::from_byte_array(buffer), std::invalid_argument);
}

TEST_CASE("Scru128Id: from_u64_pair matches from_byte_array", "[id][bytes]") {
  const auto id = Scru128Id::from_u64_pair(0x0102'0304'0506'0708ull, 0x090a'0b0c'0d0e'0f10ull);
  const auto expected = Scru128Id::from_byte_array(
      {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16});
  CHECK(id == expected);
  CHECK(id.high64() == 0x0102'0304'0506'0708ull);
  CHECK(id.low64() == 0x090a'0b0c'0d0e'0f10ull);
}

// ── Ordering, equality, hashing ─────────────────────────────────────────────

TEST_CASE("Scru128Id: comparison follows field significance", "[id][order]") {
  const std::vector<Scru128Id> ordered = {
      Scru128Id::from_fields(0, 0, 0, 0),
      Scru128Id::from_fields(0, 0, 0, 1),
      Scru128Id::from_fields(0, 0, 0, kMax32),
      Scru128Id::from_fields(0, 0, 1, 0),
      Scru128Id::from_fields(0, 0, kMax24, 0),
      Scru128Id::from_fields(0, 1, 0, 0),
      Scru128Id::from_fields(0, kMax24, 0, 0),
      Scru128Id::from_fields(1, 0, 0, 0),
      Scru128Id::from_fields(2, 0, 0, 0),
      Scru128Id::from_fields(kMax48, kMax24, kMax24, kMax32),
  };

  for (std::size_t i = 1; i < ordered.size(); ++i) {
    const auto& prev = ordered[i - 1];
    const auto& curr = ordered[i];
    CHECK(prev < curr);
    CHECK(curr > prev);
    CHECK(prev != curr);
    CHECK(prev.to_string() < curr.to_string());
    CHECK(prev.bytes() < curr.bytes());

    const auto clone = Scru128Id::from_string(curr.to_string());
    CHECK(clone == curr);
    CHECK((clone <=> curr) == 0);
    CHECK(std::hash<Scru128Id>{}(clone) == std::hash<Scru128Id>{}(curr));
  }

  CHECK(ordered.front().to_string() == "0000000000000000000000000");
  CHECK(ordered.back().to_string() == "f5lxx1zz5pnorynqglhzmsp33");
}

TEST_CASE("Scru128Id: usable as an unordered_set key", "[id]") {
  std::unordered_set<Scru128Id> set;
  set.insert(Scru128Id::from_fields(1, 2, 3, 4));
  set.insert(Scru128Id::from_string("0000000000000000000000000"));
  set.insert(Scru128Id::from_fields(1, 2, 3, 4));
  CHECK(set.size() == 2);
  CHECK(set.count(Scru128Id{}) == 1);
}

TEST_CASE("Scru128Id: operator<< writes the canonical text", "[id]") {
  const auto id = Scru128Id::from_fields(kMax48, 0, 0, 0);
  std::ostringstream oss;
  oss << id;
  CHECK(oss.str() == "f5lxx1zz5k6tp71geeh2db7k0");
}
