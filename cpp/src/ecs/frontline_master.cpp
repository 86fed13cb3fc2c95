// ═════════════════════════════════════════════════════════════════════════════
// FRONTLINE ENGINE: UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// Compile ONLY this file into frontline_core. One translation unit means one
// set of flecs::type_id<T> statics, so w.each<T>() and w.get<T>() resolve the
// same component ids in every included file.
//
// File-local helpers are `static`; their names must stay unique across the
// files below.
//
// ORDER MATTERS: pure grid code first, then ECS layers bottom-up.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Core (grid, pathfinding, fog, capture, supply, morale math)
#include "../core/grid.cpp"
#include "../core/morale.cpp"
#include "../core/pathfinder.cpp"
#include "../core/supply.cpp"
#include "../core/territory.cpp"
#include "../core/visibility.cpp"

// 2. Data (JSON rules, text terrain)
#include "rules_loader.cpp"

// 3. Unit rules (events, combat, decisions, economy)
#include "battle_events.cpp"
#include "combat.cpp"
#include "unit_behavior.cpp"
#include "economy.cpp"

// 4. Systems (phase registration, death observer)
#include "frontline_systems.cpp"

// 5. Facade (component registration, singletons, tick driver)
#include "battle.cpp"
