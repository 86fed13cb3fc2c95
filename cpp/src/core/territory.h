#ifndef FRONTLINE_TERRITORY_H
#define FRONTLINE_TERRITORY_H

#include "grid.h"
#include <vector>

namespace frontline {

// ─── Capture automaton (tiles and buildings share it) ─────
// Neutral:   owner == NO_TEAM, capture_team == NO_TEAM
// Contested: capture_team set, progress counting up
// Owned:     owner set; vacate counts ticks with nobody on the tile
struct CaptureState {
  uint8_t owner = NO_TEAM;
  uint8_t capture_team = NO_TEAM;
  uint16_t progress = 0;
  uint16_t vacate = 0;
}; // 6 bytes

enum CaptureResult : uint8_t {
  CAPTURE_NONE = 0,
  CAPTURE_TAKEN, // owner became the occupant
  CAPTURE_LOST   // owner reverted to neutral after vacate
};

// One tick of the automaton. occupant_team == NO_TEAM means empty.
CaptureResult step_capture(CaptureState &state, uint8_t occupant_team,
                           int capture_ticks, int vacate_ticks);

struct OwnershipChange {
  Tile tile;
  uint8_t previous;
  uint8_t owner;
};

struct TerritoryMap {
  CaptureState cells[MAX_TILES];
  TileMask locked; // HQ footprints: permanently owned, skipped by the automaton
};

// Runs step_capture on every unlocked tile of the grid. Changes are appended
// to `changes` when non-null.
void update_territory(TerritoryMap &map, const TerrainGrid &grid,
                      const OccupancyGrid &occ, int capture_ticks,
                      int vacate_ticks, std::vector<OwnershipChange> *changes);

// Unlocked tiles owned by `team`.
int count_owned(const TerritoryMap &map, const TerrainGrid &grid, uint8_t team);

} // namespace frontline

#endif // FRONTLINE_TERRITORY_H
