#ifndef FRONTLINE_UNIT_BEHAVIOR_H
#define FRONTLINE_UNIT_BEHAVIOR_H

#include "frontline_components.h"
#include <flecs.h>
#include <vector>

namespace frontline {

enum GoalKind : uint8_t {
  GOAL_ENGAGE = 0, // tiles next to the nearest visible enemy
  GOAL_DEFEND,     // tiles next to the enemy closest to our HQ
  GOAL_REGROUP,    // tiles next to the nearest ally
  GOAL_ADVANCE,    // enemy HQ footprint
  GOAL_HOLD        // tiles around our own HQ
};

// Fixed-priority target policy. Fills `goals` for the pathfinder.
GoalKind select_target(flecs::world &w, flecs::entity unit, TileMask &goals);

// Alive units sorted by UnitId.
std::vector<flecs::entity> collect_roster(flecs::world &w);

// Zeroes Auras on the roster, then lets every aura role re-apply its buff.
void apply_auras(flecs::world &w, const std::vector<flecs::entity> &roster);

// One unit's tick: cooldowns, move/attack, siege, periodic ability.
void update_unit(flecs::world &w, flecs::entity unit);

} // namespace frontline

#endif // FRONTLINE_UNIT_BEHAVIOR_H
