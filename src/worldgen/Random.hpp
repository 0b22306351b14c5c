// src/worldgen/Random.hpp
#pragma once
#include <cstdint>

namespace orbis::worldgen {

// Minimal PCG32 RNG (O'Neill). 32-bit outputs, 64-bit state/stream.
struct Pcg32 {
  using result_type = std::uint32_t;

  std::uint64_t state = 0x853c49e6748fea9bULL;
  std::uint64_t inc   = 0xda3e39cb94b95bdbULL; // must be odd

  Pcg32() = default;
  explicit Pcg32(std::uint64_t seed, std::uint64_t seq = 1u) noexcept { seed_rng(seed, seq); }

  static constexpr result_type min() noexcept { return 0u; }
  static constexpr result_type max() noexcept { return 0xFFFFFFFFu; }

  // `seq` selects the stream; inc = (seq << 1) | 1 keeps it odd as PCG requires.
  inline void seed_rng(std::uint64_t seed, std::uint64_t seq = 1u) noexcept {
    state = 0u;
    inc   = (seq << 1u) | 1u;
    next();
    state += seed;
    next();
  }

  inline result_type next() noexcept {
    const std::uint64_t old = state;
    state = old * 6364136223846793005ULL + inc;
    const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
    const std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-static_cast<std::int32_t>(rot)) & 31));
  }

  inline result_type operator()() noexcept { return next(); }

  // 53 random bits -> [0,1)
  inline double next_double01() noexcept {
    const std::uint64_t hi = next();
    const std::uint64_t lo = next();
    const std::uint64_t v = (hi << 32) | lo;
    constexpr double INV_2_53 = 1.0 / 9007199254740992.0;
    return static_cast<double>(v >> 11) * INV_2_53;
  }

  // Uniform in [-1, 1).
  inline double next_signed() noexcept { return next_double01() * 2.0 - 1.0; }
};

// SplitMix64 scrambler (good bit-mixer for seeds)
inline constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// Stream keyed by (seed, level, tile). Every tile draws from its own stream so
// results do not depend on iteration order or thread count.
inline Pcg32 tile_rng(std::uint64_t seed, int level, int tile) noexcept {
  const std::uint64_t a = splitmix64(seed ^ 0x6a09e667f3bcc909ull);
  const std::uint64_t b = splitmix64(static_cast<std::uint64_t>(static_cast<std::uint32_t>(tile)) ^ 0xbb67ae8584caa73bull);
  const std::uint64_t c = splitmix64(static_cast<std::uint64_t>(static_cast<std::uint32_t>(level)) ^ 0x3c6ef372fe94f82bull);
  return Pcg32(splitmix64(a ^ (b << 1) ^ (c << 7)), splitmix64(c ^ (a << 17) ^ (b << 9)));
}

} // namespace orbis::worldgen
