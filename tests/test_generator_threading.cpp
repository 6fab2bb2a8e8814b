#include "scru128/generator/scru128_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

using scru128::generator::Scru128Generator;
using scru128::id::Scru128Id;

namespace {

bool is_base36_lower(const std::string& text) {
  for (const char ch : text) {
    const bool digit = ch >= '0' && ch <= '9';
    const bool letter = ch >= 'a' && ch <= 'z';
    if (!digit && !letter) {
      return false;
    }
  }
  return true;
}

}  // namespace

TEST_CASE("Scru128Generator: concurrent callers never share a counter slot",
          "[generator][threading]") {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 10'000;

  Scru128Generator gen;
  std::vector<std::vector<Scru128Id>> produced(kThreads);

  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&gen, &out = produced[static_cast<std::size_t>(t)]] {
      out.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        out.push_back(gen.generate());
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }

  std::set<std::tuple<std::uint64_t, std::uint32_t, std::uint32_t>> slots;
  for (const auto& ids : produced) {
    REQUIRE(ids.size() == static_cast<std::size_t>(kPerThread));
    // Each thread observes its own calls in order.
    for (std::size_t i = 1; i < ids.size(); ++i) {
      CHECK(ids[i - 1] < ids[i]);
    }
    for (const auto& id : ids) {
      slots.emplace(id.timestamp(), id.counter_hi(), id.counter_lo());
    }
  }
  CHECK(slots.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("Scru128Generator: strings from one instance are sorted and unique",
          "[generator][threading]") {
  constexpr int kCount = 100'000;

  Scru128Generator gen;
  std::vector<std::string> texts;
  texts.reserve(kCount);
  for (int i = 0; i < kCount; ++i) {
    texts.push_back(gen.generate_string());
  }

  for (const auto& text : texts) {
    REQUIRE(text.size() == 25);
    REQUIRE(is_base36_lower(text));
  }
  for (std::size_t i = 1; i < texts.size(); ++i) {
    REQUIRE(texts[i - 1] < texts[i]);
  }

  const std::set<std::string> unique(texts.begin(), texts.end());
  CHECK(unique.size() == texts.size());
}
