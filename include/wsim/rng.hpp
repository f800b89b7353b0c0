#pragma once
#include <cstdint>

#include "wsim/types.hpp"

namespace wsim {

// splitmix64 step; advances `x`.
inline uint64_t splitmix64(uint64_t& x) noexcept {
  uint64_t z = (x += 0x9e3779b97f4a7c15ull);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

// Deterministic generator for gameplay randomness. The stream depends only on
// (world seed, tick); no std:: distributions, so results do not vary between
// standard library implementations.
class Rng {
public:
  explicit Rng(uint64_t seed) noexcept : state_(seed) {}

  static Rng for_tick(uint64_t world_seed, Tick tick) noexcept {
    uint64_t s = world_seed ^ (static_cast<uint64_t>(tick) * 0xd1b54a32d192ed03ull);
    return Rng(splitmix64(s));
  }

  uint64_t next_u64() noexcept { return splitmix64(state_); }

  // [0, 1) with 53 bits of precision
  double uniform01() noexcept {
    return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
  }

  // [lo, hi], requires lo <= hi
  int64_t uniform_int(int64_t lo, int64_t hi) noexcept {
    const uint64_t span = static_cast<uint64_t>(hi - lo) + 1ull;
    if (span == 0) return static_cast<int64_t>(next_u64());
    return lo + static_cast<int64_t>(next_u64() % span);
  }

  bool chance(double p) noexcept { return uniform01() < p; }

private:
  uint64_t state_;
};

} // namespace wsim
