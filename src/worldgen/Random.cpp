// src/worldgen/Random.cpp
#include "worldgen/Random.hpp"

#include <chrono>

namespace planetmap::worldgen {

void Pcg32::seed_rng(std::uint64_t seed, std::uint64_t seq) noexcept {
  state = 0u;
  inc   = (seq << 1u) | 1u;    // force odd
  next();                      // transition once
  state += seed;
  next();
}

Pcg32::result_type Pcg32::next() noexcept {
  const std::uint64_t old = state;
  state = old * 6364136223846793005ULL + inc;
  const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
  const std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
  return (xorshifted >> rot) | (xorshifted << ((-static_cast<std::int32_t>(rot)) & 31));
}

std::uint32_t Pcg32::next_bounded(std::uint32_t bound) noexcept {
  if (bound == 0u) return 0u;
  const std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
  for (;;) {
    const std::uint32_t r = next();
    if (r >= threshold) return r % bound;
  }
}

float Pcg32::next_float01() noexcept {
  // High 24 bits -> [0,1).
  return static_cast<float>(next() >> 8) * (1.0f / 16777216.0f);
}

double Pcg32::next_double01() noexcept {
  // 53-bit mantissa -> [0,1)
  const std::uint64_t u = (static_cast<std::uint64_t>(next()) << 32) | next();
  return static_cast<double>(u >> 11) * (1.0 / static_cast<double>(UINT64_C(1) << 53));
}

bool Pcg32::next_bernoulli(double p) noexcept {
  return next_double01() < p;
}

std::uint64_t seedFromClock() noexcept {
  const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
  return splitmix64(static_cast<std::uint64_t>(ticks));
}

} // namespace planetmap::worldgen
