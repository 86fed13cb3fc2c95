#include "pathfinder.h"

namespace frontline {

bool next_step(const TerrainGrid &grid, Tile from, const TileMask &goals,
               const TileMask &blocked_start, Tile &step) {
  const int start = grid.index(from);
  if (goals[start])
    return false;

  // Fixed arrays, no heap: 64x64 fits int16.
  int16_t came[MAX_TILES];
  int16_t queue[MAX_TILES];
  const int count = grid.tile_count();
  for (int i = 0; i < count; i++)
    came[i] = -1;

  int head = 0, tail = 0;
  came[start] = (int16_t)start;
  queue[tail++] = (int16_t)start;

  while (head < tail) {
    int cur = queue[head++];
    if (cur != start && goals[cur]) {
      // Walk back to the tile whose parent is the start
      while (came[cur] != start)
        cur = came[cur];
      step = grid.tile_at(cur);
      return true;
    }

    Tile nbrs[4];
    int n = neighbors4(grid, grid.tile_at(cur), nbrs);
    for (int i = 0; i < n; i++) {
      int ni = grid.index(nbrs[i]);
      if (came[ni] != -1 || !walkable(grid, nbrs[i]))
        continue;
      if (cur == start && blocked_start[ni])
        continue;
      came[ni] = (int16_t)cur;
      queue[tail++] = (int16_t)ni;
    }
  }

  step = from; // unreachable: caller stalls
  return true;
}

TileMask occupied_neighbors(const TerrainGrid &grid, const OccupancyGrid &occ,
                            Tile from, uint64_t self) {
  TileMask blocked;
  Tile nbrs[4];
  int n = neighbors4(grid, from, nbrs);
  for (int i = 0; i < n; i++) {
    int ni = grid.index(nbrs[i]);
    if (occ.occupant[ni] != 0 && occ.occupant[ni] != self)
      blocked.set(ni);
  }
  return blocked;
}

} // namespace frontline
