#ifndef FRONTLINE_COMBAT_H
#define FRONTLINE_COMBAT_H

#include "frontline_components.h"
#include <flecs.h>

namespace frontline {

// Strikes the first enemy in +x, -x, +y, -y order when attack_cd <= 0.
// Lethal hits credit the kill (and promotion) before the target is removed.
// Returns true when a strike landed.
bool try_attack(flecs::world &w, flecs::entity attacker);

// Per-tick HQ siege counter. Resets off the enemy footprint.
void besiege(flecs::world &w, flecs::entity unit);

// Lowers hp, clamped at 0. Returns true when the hit is lethal; the caller
// owns the removal.
bool apply_damage(flecs::entity target, int amount);

// Idempotent. Removing IsAlive fires the death observer synchronously.
bool remove_unit(flecs::entity unit);

// Death bookkeeping, run from the OnRemove(IsAlive) observer: occupancy,
// faction counters, morale shock, DEATH event.
void handle_unit_death(flecs::world &w, flecs::entity unit, const Tile &tile,
                       const TeamId &team);

} // namespace frontline

#endif // FRONTLINE_COMBAT_H
