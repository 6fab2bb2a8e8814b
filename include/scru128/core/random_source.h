#pragma once

#include <cstdint>
#include <random>

namespace scru128::core {

// Abstract random source for dependency injection.
// Allows production code to draw from the operating system CSPRNG while tests/demos use
// seeded, reproducible sequences.
// Not required to be thread-safe: each generator owns its source exclusively.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Return the next uniformly distributed 32-bit unsigned value.
  virtual std::uint32_t next_uint32() = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production random source: every value is read from std::random_device, which on Linux
// is backed by the kernel CSPRNG (getrandom / /dev/urandom). No user-space PRNG is layered
// on top, so outputs are not predictable from earlier outputs.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  // Not copyable or movable (std::random_device is neither)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  std::uint32_t next_uint32() override;

 private:
  std::random_device device_;
};

// Deterministic random source: 64-bit Mersenne Twister with a caller-supplied seed.
// NOT cryptographically strong. For tests and demos where reproducible output is required.
class SeededRandomSource final : public IRandomSource {
 public:
  explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {}
  ~SeededRandomSource() override = default;

  SeededRandomSource(const SeededRandomSource&) = default;
  SeededRandomSource& operator=(const SeededRandomSource&) = default;
  SeededRandomSource(SeededRandomSource&&) = default;
  SeededRandomSource& operator=(SeededRandomSource&&) = default;

  std::uint32_t next_uint32() override;

 private:
  std::mt19937_64 engine_;
};

}  // namespace scru128::core
