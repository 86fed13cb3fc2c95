#ifndef FRONTLINE_PATHFINDER_H
#define FRONTLINE_PATHFINDER_H

#include "grid.h"

namespace frontline {

/**
 * Breadth-first shortest-step resolver.
 *
 * Returns false when `from` is already a goal (nothing to do).
 * Returns true otherwise; `step` is the first tile of a shortest path, or
 * `from` itself when no goal is reachable.
 *
 * `blocked_start` is honoured for the immediate first step only. Interior
 * tiles are not re-checked for occupancy; callers re-plan every tick.
 * Neighbour expansion order is +x, -x, +y, -y.
 */
bool next_step(const TerrainGrid &grid, Tile from, const TileMask &goals,
               const TileMask &blocked_start, Tile &step);

// Neighbours of `from` held by any occupant other than `self`.
TileMask occupied_neighbors(const TerrainGrid &grid, const OccupancyGrid &occ,
                            Tile from, uint64_t self);

} // namespace frontline

#endif // FRONTLINE_PATHFINDER_H
