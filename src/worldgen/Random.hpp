// src/worldgen/Random.hpp
#pragma once
#include <cstdint>

namespace planetmap::worldgen {

// Minimal PCG32 RNG (O'Neill). 32-bit outputs, 64-bit state/stream.
// A run owns exactly one of these; nothing reads or writes global random state.
struct Pcg32 {
  using result_type = std::uint32_t;

  std::uint64_t state = 0x853c49e6748fea9bULL;
  std::uint64_t inc   = 0xda3e39cb94b95bdbULL; // must be odd

  Pcg32() = default;
  explicit Pcg32(std::uint64_t seed, std::uint64_t seq = 1u) noexcept { seed_rng(seed, seq); }

  // `seq` selects the stream; inc is forced odd.
  void seed_rng(std::uint64_t seed, std::uint64_t seq = 1u) noexcept;

  result_type next() noexcept;

  // Uniform in [0, bound) without modulo bias.
  std::uint32_t next_bounded(std::uint32_t bound) noexcept;

  // [0,1)
  float  next_float01() noexcept;
  double next_double01() noexcept;

  // True with probability p (p <= 0 never, p >= 1 always; one draw either way).
  bool next_bernoulli(double p) noexcept;

  friend bool operator==(const Pcg32&, const Pcg32&) = default;
};

inline float randf(Pcg32& rng, float lo, float hi) noexcept {
  return lo + (hi - lo) * rng.next_float01();
}

// SplitMix64 scrambler (good bit-mixer for seeds)
constexpr inline std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// Seed for runs that were not given one explicitly.
std::uint64_t seedFromClock() noexcept;

// Stream id shared by every generation run.
inline constexpr std::uint64_t kWorldStream = 0x574F524C444D4150ull; // "WORLDMAP"

} // namespace planetmap::worldgen
