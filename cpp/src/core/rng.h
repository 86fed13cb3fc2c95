#ifndef FRONTLINE_RNG_H
#define FRONTLINE_RNG_H

#include <cstdint>

namespace frontline {

// Stateless hash rolls: every draw is a pure function of
// (seed, tick, key, salt), so results never depend on iteration order.
// No <random> engine to carry between ticks.

enum RollSalt : uint64_t {
  SALT_MOVE_CD = 0x11,
  SALT_WAVER = 0x22,
  SALT_SPAWN_ROLE = 0x33,
  SALT_SPAWN_TILE = 0x44,
  SALT_WALL = 0x55,
  SALT_WEATHER = 0x66,
};

// splitmix64 finalizer
inline uint64_t mix64(uint64_t z) {
  z += 0x9e3779b97f4a7c15ULL;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

inline uint64_t roll(uint64_t seed, uint64_t tick, uint64_t key,
                     uint64_t salt) {
  uint64_t h = mix64(seed ^ mix64(salt));
  h = mix64(h ^ tick);
  return mix64(h ^ key);
}

// Inclusive [lo, hi]
inline int roll_range(uint64_t seed, uint64_t tick, uint64_t key,
                      uint64_t salt, int lo, int hi) {
  if (hi <= lo)
    return lo;
  uint64_t span = (uint64_t)(hi - lo) + 1;
  return lo + (int)(roll(seed, tick, key, salt) % span);
}

inline bool roll_percent(uint64_t seed, uint64_t tick, uint64_t key,
                         uint64_t salt, int pct) {
  return (int)(roll(seed, tick, key, salt) % 100) < pct;
}

} // namespace frontline

#endif // FRONTLINE_RNG_H
