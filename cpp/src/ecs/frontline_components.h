#ifndef FRONTLINE_COMPONENTS_H
#define FRONTLINE_COMPONENTS_H

#include "../core/grid.h"
#include "../core/territory.h"
#include "frontline_rules.h"
#include <cstdint>

/**
 * Frontline Engine - ECS Component Definitions
 *
 * Per-unit components are PODs. No pointers, no std::vector.
 * Grid-wide state lives in singletons (ecs.set<T>() / w.get<T>()).
 * Tile (core/grid.h) doubles as the unit position component.
 */

namespace frontline {

class EventSink;

// ─── Unit: Identity ───────────────────────────────────────
struct UnitId {
  uint32_t id;
}; // 4 bytes - monotonically assigned, defines roster order
struct TeamId {
  uint8_t team;
}; // 1 byte - 0=blue, 1=red
struct RoleId {
  uint8_t role;
}; // 1 byte - Role enum

struct IsAlive {}; // Tag - removed the instant hp hits 0
struct Veteran {}; // Tag - promoted after veteran_kills

// ─── Unit: Combat ─────────────────────────────────────────
struct Health {
  int hp;
  int max_hp;
}; // 8 bytes

struct Weapon {
  int damage;
  int attack_cd; // ticks until the next adjacent strike
  int kills;
}; // 12 bytes

struct Siege {
  int counter; // consecutive ticks on the enemy footprint
}; // 4 bytes

// Zeroed at the start of every unit pass, re-applied by support auras.
struct Auras {
  float damage_reduction;
  float damage_bonus;
  bool hasted; // commander cadence: re-rolled move cd at 75%
}; // 12 bytes

// ─── Unit: Movement / Condition ───────────────────────────
struct Mobility {
  int move_cd;    // re-rolled after every move attempt
  int terrain_cd; // forest stall
  int steps;      // path steps per move
}; // 12 bytes

struct Morale {
  int value; // 0..100
}; // 4 bytes

struct Supply {
  bool supplied;
  int starve_timer; // attrition countdown while cut off
}; // 8 bytes

struct AbilityTimer {
  int ticks;
}; // 4 bytes

// ─── Singletons ───────────────────────────────────────────
struct BattleClock {
  uint64_t tick;
  uint32_t next_unit_id;
};

struct Rules {
  RoleTable roles;
  BattleConfig config;
};

struct VisibilityMap {
  TileMask visible[TEAM_COUNT];
};

struct SupplyMap {
  TileMask supplied[TEAM_COUNT];
};

struct FactionState {
  int resources;
  int alive;
  int kills;
  int losses;
  int spawned;
};

struct Factions {
  FactionState side[TEAM_COUNT];
};

// ─── Headquarters ─────────────────────────────────────────
constexpr int HQ_SIZE = 2;
constexpr int HQ_TILES = HQ_SIZE * HQ_SIZE;

struct Headquarters {
  Tile anchor; // top-left of the footprint
  int hp;
  int max_hp;

  bool covers(Tile t) const {
    return t.x >= anchor.x && t.x < anchor.x + HQ_SIZE && t.y >= anchor.y &&
           t.y < anchor.y + HQ_SIZE;
  }
  void footprint(Tile out[HQ_TILES]) const {
    for (int i = 0; i < HQ_TILES; i++)
      out[i] = {anchor.x + i % HQ_SIZE, anchor.y + i / HQ_SIZE};
  }
  // Manhattan distance to the nearest footprint tile
  int distance_to(Tile t) const {
    int dx = t.x < anchor.x ? anchor.x - t.x
             : t.x > anchor.x + HQ_SIZE - 1 ? t.x - (anchor.x + HQ_SIZE - 1)
                                            : 0;
    int dy = t.y < anchor.y ? anchor.y - t.y
             : t.y > anchor.y + HQ_SIZE - 1 ? t.y - (anchor.y + HQ_SIZE - 1)
                                            : 0;
    return dx + dy;
  }
};

struct HQs {
  Headquarters hq[TEAM_COUNT];
  uint8_t first_fallen; // first HQ to reach 0 decides the battle
};

// ─── Buildings (captured like tiles, independent state) ───
struct Building {
  Tile tile;
  BuildingKind kind;
  CaptureState capture;
};

struct Buildings {
  int count;
  Building items[MAX_BUILDINGS];

  int find(Tile t) const {
    for (int i = 0; i < count; i++) {
      if (items[i].tile == t)
        return i;
    }
    return -1;
  }
  int owned(uint8_t team, BuildingKind kind) const {
    int n = 0;
    for (int i = 0; i < count; i++) {
      if (items[i].kind == kind && items[i].capture.owner == team)
        n++;
    }
    return n;
  }
};

struct WeatherState {
  Weather current;
};

enum OutcomeReason : uint8_t {
  OUTCOME_NONE = 0,
  OUTCOME_HQ_DESTROYED,
  OUTCOME_ELIMINATED,
  OUTCOME_STOPPED
};

struct BattleOutcome {
  bool over;
  uint8_t winner; // NO_TEAM for a draw or an external stop
  OutcomeReason reason;
};

// Optional, non-owning.
struct EventHub {
  EventSink *sink;
};

} // namespace frontline

#endif // FRONTLINE_COMPONENTS_H
