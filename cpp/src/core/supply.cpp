#include "supply.h"

namespace frontline {

void compute_supply(const TerrainGrid &grid, const TerritoryMap &territory,
                    const OccupancyGrid &occ, uint8_t team,
                    const Tile *hq_tiles, int hq_tile_count, TileMask &out) {
  out.reset();

  int16_t queue[MAX_TILES];
  int head = 0, tail = 0;
  for (int i = 0; i < hq_tile_count; i++) {
    if (!in_bounds(grid, hq_tiles[i]))
      continue;
    int idx = grid.index(hq_tiles[i]);
    if (out[idx])
      continue;
    out.set(idx);
    queue[tail++] = (int16_t)idx;
  }

  while (head < tail) {
    int cur = queue[head++];
    Tile nbrs[4];
    int n = neighbors4(grid, grid.tile_at(cur), nbrs);
    for (int i = 0; i < n; i++) {
      int ni = grid.index(nbrs[i]);
      if (out[ni] || !walkable(grid, nbrs[i]))
        continue;
      bool held = territory.cells[ni].owner == team ||
                  (occ.occupant[ni] != 0 && occ.team[ni] == team);
      if (!held)
        continue;
      out.set(ni);
      queue[tail++] = (int16_t)ni;
    }
  }
}

} // namespace frontline
