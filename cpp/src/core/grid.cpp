#include "grid.h"
#include <cstring>
#include <stdexcept>

namespace frontline {

void OccupancyGrid::clear() {
  std::memset(occupant, 0, sizeof(occupant));
  std::memset(team, NO_TEAM, sizeof(team));
}

bool in_bounds(const TerrainGrid &grid, Tile t) {
  return t.x >= 0 && t.y >= 0 && t.x < grid.width && t.y < grid.height;
}

TerrainKind terrain_kind(const TerrainGrid &grid, Tile t) {
  if (!in_bounds(grid, t))
    return TERRAIN_WALL;
  return (TerrainKind)grid.kind[grid.index(t)];
}

bool walkable(const TerrainGrid &grid, Tile t) {
  return TERRAIN_TRAITS[terrain_kind(grid, t)].walkable;
}

int entry_penalty(const TerrainGrid &grid, Tile t) {
  return TERRAIN_TRAITS[terrain_kind(grid, t)].entry_penalty;
}

int neighbors4(const TerrainGrid &grid, Tile t, Tile out[4]) {
  static constexpr int DX[4] = {1, -1, 0, 0};
  static constexpr int DY[4] = {0, 0, 1, -1};
  int n = 0;
  for (int i = 0; i < 4; i++) {
    Tile nb = {t.x + DX[i], t.y + DY[i]};
    if (in_bounds(grid, nb))
      out[n++] = nb;
  }
  return n;
}

TerrainGrid terrain_from_rows(const std::vector<std::string> &rows) {
  if (rows.empty() || rows[0].empty())
    throw std::invalid_argument("terrain map is empty");
  if ((int)rows.size() > MAX_GRID_H || (int)rows[0].size() > MAX_GRID_W)
    throw std::invalid_argument("terrain map exceeds 64x64");

  TerrainGrid grid;
  grid.width = (int)rows[0].size();
  grid.height = (int)rows.size();

  for (int y = 0; y < grid.height; y++) {
    const std::string &row = rows[y];
    if ((int)row.size() != grid.width)
      throw std::invalid_argument("terrain row " + std::to_string(y) +
                                  " has width " + std::to_string(row.size()) +
                                  ", expected " + std::to_string(grid.width));
    for (int x = 0; x < grid.width; x++) {
      int kind = -1;
      for (int k = 0; k < TERRAIN_COUNT; k++) {
        if (TERRAIN_TRAITS[k].glyph == row[x]) {
          kind = k;
          break;
        }
      }
      if (kind < 0)
        throw std::invalid_argument(std::string("unknown terrain glyph '") +
                                    row[x] + "' at row " + std::to_string(y));
      grid.kind[grid.index({x, y})] = (uint8_t)kind;
    }
  }
  return grid;
}

bool tiles_connected(const TerrainGrid &grid, Tile a, Tile b) {
  if (!walkable(grid, a) || !walkable(grid, b))
    return false;

  TileMask seen;
  int16_t queue[MAX_TILES];
  int head = 0, tail = 0;
  queue[tail++] = (int16_t)grid.index(a);
  seen.set(grid.index(a));

  const int goal = grid.index(b);
  while (head < tail) {
    int cur = queue[head++];
    if (cur == goal)
      return true;
    Tile nbrs[4];
    int n = neighbors4(grid, grid.tile_at(cur), nbrs);
    for (int i = 0; i < n; i++) {
      int ni = grid.index(nbrs[i]);
      if (seen[ni] || !walkable(grid, nbrs[i]))
        continue;
      seen.set(ni);
      queue[tail++] = (int16_t)ni;
    }
  }
  return false;
}

} // namespace frontline
