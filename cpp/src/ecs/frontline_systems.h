#ifndef FRONTLINE_SYSTEMS_H
#define FRONTLINE_SYSTEMS_H

#include <flecs.h>

namespace frontline {

// Registration order is tick order. Every phase is immediate: spawns, deaths
// and occupancy writes are visible to the next unit in the same pass.

// Phase 1: tick counter + occupancy rebuild
void register_clock_systems(flecs::world &ecs);

// Phase 2: income and economy spawns
void register_economy_systems(flecs::world &ecs);

// Phase 3: per-team fog of war
void register_visibility_systems(flecs::world &ecs);

// Phase 4: auras, then every unit in id order; phase 5: dead entity sweep
void register_unit_systems(flecs::world &ecs);

// Phase 6: tile and building capture
void register_territory_systems(flecs::world &ecs);

// Phase 7: weather, supply network, attrition, morale drift
void register_morale_systems(flecs::world &ecs);

// Phase 8: HQ destruction / elimination
void register_victory_systems(flecs::world &ecs);

// Occupancy cleanup, faction counters and morale shock when IsAlive goes.
// Returned so the owner can tear it down before the world.
flecs::observer register_death_observer(flecs::world &ecs);

} // namespace frontline

#endif // FRONTLINE_SYSTEMS_H
