#include "visibility.h"

namespace frontline {

void compute_visibility(const TerrainGrid &grid,
                        const std::vector<VisionSource> &sources,
                        TileMask out[TEAM_COUNT]) {
  for (int t = 0; t < TEAM_COUNT; t++)
    out[t].reset();

  for (const VisionSource &src : sources) {
    if (src.team >= TEAM_COUNT)
      continue;
    TileMask &mask = out[src.team];
    for_each_in_radius(grid, src.origin, src.radius,
                       [&](Tile t) { mask.set(grid.index(t)); });
  }
}

} // namespace frontline
