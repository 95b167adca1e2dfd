#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace gradostroi::util {

// splitmix64 finalizer (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t mix64(std::uint64_t x) {
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits mapped to [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

// Seeded engine RNG. The whole generator is one 64-bit word so it can be
// stored in a save and resumed exactly.
class HashRng {
 public:
  explicit HashRng(std::uint64_t seed = 0) : s_(seed) {}

  std::uint64_t state() const { return s_; }
  void set_state(std::uint64_t s) { s_ = s; }

  std::uint64_t next_u64() {
    s_ += 0x9e3779b97f4a7c15ULL;
    return mix64(s_);
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // True with probability p (p <= 0 never, p >= 1 always; both still consume a draw).
  bool chance(double p) { return next_u01() < p; }

  // Unbiased integer in [0, bound) via rejection sampling.
  std::uint64_t bounded(std::uint64_t bound) {
    if (bound <= 1) return 0;
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return r % bound;
    }
  }

  // Inclusive integer range.
  int range_int(int lo_incl, int hi_incl) {
    if (hi_incl < lo_incl) std::swap(lo_incl, hi_incl);
    const std::uint64_t span = static_cast<std::uint64_t>(static_cast<std::int64_t>(hi_incl) - lo_incl) + 1ULL;
    return lo_incl + static_cast<int>(bounded(span));
  }

  std::size_t index(std::size_t n) { return static_cast<std::size_t>(bounded(static_cast<std::uint64_t>(n))); }

  double range(double lo_incl, double hi_incl) {
    if (hi_incl < lo_incl) std::swap(lo_incl, hi_incl);
    return lo_incl + (hi_incl - lo_incl) * next_u01();
  }

 private:
  std::uint64_t s_{0};
};

} // namespace gradostroi::util
