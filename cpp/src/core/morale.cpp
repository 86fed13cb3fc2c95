#include "morale.h"

namespace frontline {

void count_adjacent(const TerrainGrid &grid, const OccupancyGrid &occ, Tile at,
                    uint8_t team, int &allies, int &enemies) {
  allies = 0;
  enemies = 0;
  Tile nbrs[4];
  int n = neighbors4(grid, at, nbrs);
  for (int i = 0; i < n; i++) {
    int ni = grid.index(nbrs[i]);
    if (occ.occupant[ni] == 0)
      continue;
    if (occ.team[ni] == team)
      allies++;
    else
      enemies++;
  }
}

} // namespace frontline
