#ifndef FRONTLINE_ECONOMY_H
#define FRONTLINE_ECONOMY_H

#include "frontline_components.h"
#include <flecs.h>

namespace frontline {

// Creates a unit on a free walkable tile. Returns a null entity when the tile
// is out of bounds, blocked or occupied. Does not charge resources.
flecs::entity spawn_unit(flecs::world &w, uint8_t team, Role role, Tile tile);

// Periodic income, territory income, depot income, then economy spawns.
void collect_income(flecs::world &w);

// Random affordable role on a random free tile of the spawn box. Resources
// are only spent when a tile was found.
bool try_economy_spawn(flecs::world &w, uint8_t team);

// Free initial deployment (BattleConfig::initial_units per side).
void deploy_initial_units(flecs::world &w);

} // namespace frontline

#endif // FRONTLINE_ECONOMY_H
