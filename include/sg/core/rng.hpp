#ifndef SG_RNG_HPP
#define SG_RNG_HPP

#include <cstdint>

#include "sg/core/config.hpp"

namespace sg {

// Tiny xorshift64* RNG for portability (not cryptographic)
struct RNG {
  uint64_t state;
  explicit RNG(uint64_t seed = config::kDefaultSeed) : state(seed?seed:config::kDefaultSeed) {}
  inline uint64_t next_u64() {
    uint64_t x = state;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    state = x;
    return x * 2685821657736338717ull;
  }
  inline double next_uniform01() {
    // 53-bit mantissa -> [0,1)
    return (next_u64() >> 11) * (1.0/9007199254740992.0);
  }
  // [lo, hi)
  inline double uniform(double lo, double hi) {
    return lo + (hi - lo) * next_uniform01();
  }
};

// Generator used by parameter initialization unless a caller passes its own.
// Seeded once per thread from SG_SEED.
inline RNG& global_rng() {
  static thread_local RNG rng(config::default_seed());
  return rng;
}

inline void manual_seed(uint64_t seed) { global_rng() = RNG(seed); }

} // namespace sg

#endif // SG_RNG_HPP
