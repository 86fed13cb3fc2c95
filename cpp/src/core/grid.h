#ifndef FRONTLINE_GRID_H
#define FRONTLINE_GRID_H

#include <bitset>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

/**
 * Frontline Engine - Tile Grid & Terrain Queries
 *
 * Flat fixed-capacity arrays, row-major (index = y * width + x).
 * Nothing here touches the ECS; the singletons in frontline_components.h
 * wrap these structs.
 */

namespace frontline {

constexpr int MAX_GRID_W = 64;
constexpr int MAX_GRID_H = 64;
constexpr int MAX_TILES = MAX_GRID_W * MAX_GRID_H;

constexpr int TEAM_COUNT = 2;
constexpr uint8_t TEAM_BLUE = 0;
constexpr uint8_t TEAM_RED = 1;
constexpr uint8_t NO_TEAM = 255;

inline uint8_t enemy_of(uint8_t team) { return team == TEAM_BLUE ? TEAM_RED : TEAM_BLUE; }

// ─── Tile coordinate (also the unit position component) ───
struct Tile {
  int x, y;
}; // 8 bytes

inline bool operator==(Tile a, Tile b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Tile a, Tile b) { return !(a == b); }

inline int manhattan(Tile a, Tile b) {
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// ─── Terrain ──────────────────────────────────────────────
enum TerrainKind : uint8_t {
  TERRAIN_OPEN = 0,
  TERRAIN_WALL = 1,
  TERRAIN_FOREST = 2, // +1 idle tick after entry
  TERRAIN_COUNT
};

struct TerrainTraits {
  bool walkable;
  uint8_t entry_penalty;
  char glyph;
};

inline constexpr TerrainTraits TERRAIN_TRAITS[TERRAIN_COUNT] = {
    {true, 0, '.'},  // OPEN
    {false, 0, '#'}, // WALL
    {true, 1, 'f'},  // FOREST
};

using TileMask = std::bitset<MAX_TILES>;

struct TerrainGrid {
  int width = 0;
  int height = 0;
  uint8_t kind[MAX_TILES] = {}; // TerrainKind per tile

  int index(Tile t) const { return t.y * width + t.x; }
  Tile tile_at(int idx) const { return {idx % width, idx / width}; }
  int tile_count() const { return width * height; }
};

// ─── Occupancy index (rebuilt each tick, kept current on move/death) ──
// occupant holds a flecs entity id; 0 = empty.
struct OccupancyGrid {
  uint64_t occupant[MAX_TILES];
  uint8_t team[MAX_TILES];

  void clear();
  void place(int idx, uint64_t id, uint8_t t) {
    occupant[idx] = id;
    team[idx] = t;
  }
  void vacate(int idx) {
    occupant[idx] = 0;
    team[idx] = NO_TEAM;
  }
};

// ─── Queries (pure, no failure modes) ─────────────────────
bool in_bounds(const TerrainGrid &grid, Tile t);
TerrainKind terrain_kind(const TerrainGrid &grid, Tile t); // OOB reports WALL
bool walkable(const TerrainGrid &grid, Tile t);
int entry_penalty(const TerrainGrid &grid, Tile t);

// Writes up to 4 in-bounds neighbours in +x, -x, +y, -y order.
int neighbors4(const TerrainGrid &grid, Tile t, Tile out[4]);

// Visits every in-bounds tile with manhattan(center, tile) <= radius,
// row by row.
template <typename Func>
void for_each_in_radius(const TerrainGrid &grid, Tile center, int radius,
                        Func &&func) {
  for (int dy = -radius; dy <= radius; dy++) {
    int y = center.y + dy;
    if (y < 0 || y >= grid.height)
      continue;
    int span = radius - std::abs(dy);
    for (int dx = -span; dx <= span; dx++) {
      int x = center.x + dx;
      if (x < 0 || x >= grid.width)
        continue;
      func(Tile{x, y});
    }
  }
}

// ─── Construction ─────────────────────────────────────────
// '.' open, '#' wall, 'f' forest. Throws std::invalid_argument on
// empty/ragged/oversized input or an unknown glyph.
TerrainGrid terrain_from_rows(const std::vector<std::string> &rows);

// Walkable 4-connected path between a and b.
bool tiles_connected(const TerrainGrid &grid, Tile a, Tile b);

} // namespace frontline

#endif // FRONTLINE_GRID_H
