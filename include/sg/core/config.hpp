#pragma once
#include <cstdint>
#include <cstdlib>

namespace sg { namespace config {

// Default seed of the global initialization RNG when SG_SEED is not set.
inline constexpr std::uint64_t kDefaultSeed = 0xC0FFEEull;

// Parse an unsigned decimal environment variable; `def` on absence or garbage.
inline std::uint64_t env_u64(const char* name, std::uint64_t def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  std::uint64_t v = 0;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return def;
    v = v * 10 + std::uint64_t(*p - '0');
  }
  return v;
}

// SG_SEED=<n> seeds parameter initialization.
inline std::uint64_t default_seed() {
  return env_u64("SG_SEED", kDefaultSeed);
}

}} // namespace sg::config
