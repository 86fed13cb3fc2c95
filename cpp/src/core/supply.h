#ifndef FRONTLINE_SUPPLY_H
#define FRONTLINE_SUPPLY_H

#include "grid.h"
#include "territory.h"

namespace frontline {

// Tiles reachable from the team's HQ footprint, crossing only walkable tiles
// the team owns or currently occupies. HQ tiles seed the search.
void compute_supply(const TerrainGrid &grid, const TerritoryMap &territory,
                    const OccupancyGrid &occ, uint8_t team,
                    const Tile *hq_tiles, int hq_tile_count, TileMask &out);

} // namespace frontline

#endif // FRONTLINE_SUPPLY_H
