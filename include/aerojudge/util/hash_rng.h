#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace aerojudge::util {

// splitmix64 mixer (Sebastiano Vigna).
//
// Every random draw in challenge generation and participant sampling goes
// through this function, so two processes given the same seed walk the same
// stream on every platform. Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11;
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

// Combine a base seed with a salt into an independent sub-stream seed.
// Used to give each resample attempt (and each round) its own stream.
inline std::uint64_t derive_seed(std::uint64_t base, std::uint64_t salt) {
  return splitmix64(base ^ splitmix64(salt + 0x632be59bd9b4e019ULL));
}

struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() {
    s = splitmix64(s);
    return s;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Unbiased integer in [0, bound_exclusive) via rejection sampling.
  std::uint64_t bounded(std::uint64_t bound_exclusive) {
    if (bound_exclusive <= 1) return 0;
    const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return r % bound_exclusive;
    }
  }

  // Inclusive integer range.
  int range_int(int lo_incl, int hi_incl) {
    int lo = lo_incl;
    int hi = hi_incl;
    if (hi < lo) std::swap(lo, hi);
    const std::uint64_t span = static_cast<std::uint64_t>(hi - lo) + 1ULL;
    return lo + static_cast<int>(bounded(span));
  }

  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded(static_cast<std::uint64_t>(n)));
  }

  double range(double lo_incl, double hi_incl) {
    double lo = lo_incl;
    double hi = hi_incl;
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * next_u01();
  }

  bool chance(double p) { return next_u01() < p; }
};

} // namespace aerojudge::util
