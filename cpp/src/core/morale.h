#ifndef FRONTLINE_MORALE_H
#define FRONTLINE_MORALE_H

#include "grid.h"

namespace frontline {

constexpr int MORALE_MIN = 0;
constexpr int MORALE_MAX = 100;

// +w_ally per adjacent ally, -w_enemy per adjacent enemy. Cut-off units can
// hold or lose morale, never gain.
inline int morale_delta(int allies, int enemies, bool supplied, int w_ally,
                        int w_enemy) {
  int delta = w_ally * allies - w_enemy * enemies;
  if (!supplied && delta > 0)
    delta = 0;
  return delta;
}

inline int clamp_morale(int value) {
  if (value < MORALE_MIN)
    return MORALE_MIN;
  if (value > MORALE_MAX)
    return MORALE_MAX;
  return value;
}

// Counts occupied 4-neighbours of `at` by side relative to `team`.
void count_adjacent(const TerrainGrid &grid, const OccupancyGrid &occ, Tile at,
                    uint8_t team, int &allies, int &enemies);

} // namespace frontline

#endif // FRONTLINE_MORALE_H
