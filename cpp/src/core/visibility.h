#ifndef FRONTLINE_VISIBILITY_H
#define FRONTLINE_VISIBILITY_H

#include "grid.h"
#include <algorithm>
#include <vector>

namespace frontline {

struct VisionSource {
  Tile origin;
  uint8_t team;
  int radius;
};

// Full recompute: out[team] = union of manhattan diamonds of that team's
// sources. Walls do not occlude.
void compute_visibility(const TerrainGrid &grid,
                        const std::vector<VisionSource> &sources,
                        TileMask out[TEAM_COUNT]);

inline int vision_radius(int base, int bonus, int penalty, int floor) {
  return std::max(floor, base + bonus - penalty);
}

} // namespace frontline

#endif // FRONTLINE_VISIBILITY_H
