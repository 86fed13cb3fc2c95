#include "territory.h"

namespace frontline {

CaptureResult step_capture(CaptureState &state, uint8_t occupant_team,
                           int capture_ticks, int vacate_ticks) {
  if (occupant_team != NO_TEAM) {
    state.vacate = 0;
    if (state.capture_team == occupant_team) {
      if (state.progress < capture_ticks)
        state.progress++;
    } else {
      state.capture_team = occupant_team;
      state.progress = 1;
    }
    if (state.progress >= capture_ticks && state.owner != occupant_team) {
      state.owner = occupant_team;
      return CAPTURE_TAKEN;
    }
    return CAPTURE_NONE;
  }

  state.progress = 0;
  state.capture_team = NO_TEAM;
  if (state.owner == NO_TEAM)
    return CAPTURE_NONE;

  state.vacate++;
  if (state.vacate >= vacate_ticks) {
    state.owner = NO_TEAM;
    state.vacate = 0;
    return CAPTURE_LOST;
  }
  return CAPTURE_NONE;
}

void update_territory(TerritoryMap &map, const TerrainGrid &grid,
                      const OccupancyGrid &occ, int capture_ticks,
                      int vacate_ticks, std::vector<OwnershipChange> *changes) {
  const int count = grid.tile_count();
  for (int i = 0; i < count; i++) {
    if (map.locked[i])
      continue;
    CaptureState &cell = map.cells[i];
    uint8_t before = cell.owner;
    uint8_t occupant = occ.occupant[i] != 0 ? occ.team[i] : NO_TEAM;
    if (step_capture(cell, occupant, capture_ticks, vacate_ticks) !=
            CAPTURE_NONE &&
        changes)
      changes->push_back({grid.tile_at(i), before, cell.owner});
  }
}

int count_owned(const TerritoryMap &map, const TerrainGrid &grid,
                uint8_t team) {
  int owned = 0;
  const int count = grid.tile_count();
  for (int i = 0; i < count; i++) {
    if (!map.locked[i] && map.cells[i].owner == team)
      owned++;
  }
  return owned;
}

} // namespace frontline
