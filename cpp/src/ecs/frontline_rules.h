#ifndef FRONTLINE_RULES_H
#define FRONTLINE_RULES_H

#include "../core/grid.h"
#include <cstdint>
#include <string>

/**
 * Frontline Engine - Session Rules
 *
 * RoleTable: per-role stats + ability descriptor (read-only for a battle).
 * BattleConfig: every tunable the phases read. Defaults reproduce the
 * 40x30 reference battle; data/rules.json overrides them.
 */

namespace frontline {

// ─── Roles ────────────────────────────────────────────────
enum Role : uint8_t {
  ROLE_INFANTRY = 0,
  ROLE_TANK,
  ROLE_SCOUT,
  ROLE_SHIELDBEARER,
  ROLE_MEDIC,
  ROLE_BARRIER_ENGINEER,
  ROLE_REPAIR_BOT,
  ROLE_SPOTTER,
  ROLE_COMMANDER,
  ROLE_COUNT
};

enum AbilityKind : uint8_t {
  ABILITY_NONE = 0,
  ABILITY_SHIELD,  // aura: damage reduction on allies in radius
  ABILITY_HEAL,    // periodic +hp to damaged allies in radius
  ABILITY_WALL,    // periodic wall on a free adjacent tile
  ABILITY_REPAIR,  // periodic +hp to own HQ when close
  ABILITY_VISION,  // passive, read by the fog pass only
  ABILITY_COMMAND, // aura: damage bonus + hasted cadence
  ABILITY_COUNT
};

struct AbilitySpec {
  AbilityKind kind;
  int period; // ticks between activations (auras: 1)
  int radius;
  float magnitude; // fraction for auras, points for heal/repair, tiles for vision
};

struct RoleStats {
  int max_hp;
  int damage;
  int steps; // path steps per move
  int cost;
  bool spawnable; // eligible for economy spawns
  AbilitySpec ability;
};

struct RoleTable {
  RoleStats roles[ROLE_COUNT];

  const RoleStats &operator[](Role r) const { return roles[r]; }
  RoleStats &operator[](Role r) { return roles[r]; }
};

inline RoleTable default_role_table() {
  RoleTable t = {};
  //                    hp  dmg steps cost spawn  ability
  t.roles[ROLE_INFANTRY] = {100, 10, 1, 3, true, {ABILITY_NONE, 0, 0, 0.0f}};
  t.roles[ROLE_TANK] = {200, 20, 1, 5, true, {ABILITY_NONE, 0, 0, 0.0f}};
  t.roles[ROLE_SCOUT] = {60, 5, 2, 2, true, {ABILITY_NONE, 0, 0, 0.0f}};
  t.roles[ROLE_SHIELDBEARER] = {120, 6, 1, 4, true,
                                {ABILITY_SHIELD, 1, 2, 0.5f}};
  t.roles[ROLE_MEDIC] = {80, 3, 1, 4, true, {ABILITY_HEAL, 60, 2, 1.0f}};
  t.roles[ROLE_BARRIER_ENGINEER] = {90, 4, 1, 5, true,
                                    {ABILITY_WALL, 300, 1, 0.0f}};
  t.roles[ROLE_REPAIR_BOT] = {70, 2, 1, 4, true, {ABILITY_REPAIR, 60, 2, 2.0f}};
  t.roles[ROLE_SPOTTER] = {60, 4, 1, 3, true, {ABILITY_VISION, 0, 0, 2.0f}};
  t.roles[ROLE_COMMANDER] = {150, 8, 1, 7, true,
                             {ABILITY_COMMAND, 1, 2, 0.25f}};
  return t;
}

inline const char *role_name(Role r) {
  static const char *NAMES[ROLE_COUNT] = {
      "infantry", "tank",      "scout",   "shieldbearer", "medic",
      "barrier_engineer", "repair_bot", "spotter", "commander"};
  return r < ROLE_COUNT ? NAMES[r] : "unknown";
}

inline bool role_from_name(const std::string &name, Role &out) {
  for (int i = 0; i < ROLE_COUNT; i++) {
    if (name == role_name((Role)i)) {
      out = (Role)i;
      return true;
    }
  }
  return false;
}

inline const char *ability_name(AbilityKind k) {
  static const char *NAMES[ABILITY_COUNT] = {
      "none", "shield", "heal", "wall", "repair", "vision", "command"};
  return k < ABILITY_COUNT ? NAMES[k] : "unknown";
}

inline bool ability_from_name(const std::string &name, AbilityKind &out) {
  for (int i = 0; i < ABILITY_COUNT; i++) {
    if (name == ability_name((AbilityKind)i)) {
      out = (AbilityKind)i;
      return true;
    }
  }
  return false;
}

// ─── Weather ──────────────────────────────────────────────
enum Weather : uint8_t {
  WEATHER_CLEAR = 0,
  WEATHER_RAIN,
  WEATHER_FOG,
  WEATHER_STORM,
  WEATHER_COUNT
};

struct WeatherTraits {
  const char *name;
  int vision_penalty;
  int move_cd_pct; // applied to every re-rolled move cooldown
  int attack_cd_bonus;
};

inline constexpr WeatherTraits WEATHER_TRAITS[WEATHER_COUNT] = {
    {"clear", 0, 100, 0},
    {"rain", 0, 150, 0},
    {"fog", 2, 100, 0},
    {"storm", 2, 150, 1},
};

inline bool weather_from_name(const std::string &name, Weather &out) {
  for (int i = 0; i < WEATHER_COUNT; i++) {
    if (name == WEATHER_TRAITS[i].name) {
      out = (Weather)i;
      return true;
    }
  }
  return false;
}

// ─── Buildings ────────────────────────────────────────────
enum BuildingKind : uint8_t {
  BUILDING_WATCHTOWER = 0, // vision source for its owner
  BUILDING_DEPOT,          // extra income for its owner
  BUILDING_KIND_COUNT
};

inline const char *building_name(BuildingKind k) {
  static const char *NAMES[BUILDING_KIND_COUNT] = {"watchtower", "depot"};
  return k < BUILDING_KIND_COUNT ? NAMES[k] : "unknown";
}

inline bool building_from_name(const std::string &name, BuildingKind &out) {
  for (int i = 0; i < BUILDING_KIND_COUNT; i++) {
    if (name == building_name((BuildingKind)i)) {
      out = (BuildingKind)i;
      return true;
    }
  }
  return false;
}

constexpr int MAX_BUILDINGS = 16;

struct BuildingSpec {
  Tile tile;
  BuildingKind kind;
};

// ─── Battle configuration ─────────────────────────────────
struct BattleConfig {
  uint64_t seed = 1;

  // Headquarters. Anchor is the top-left of the 2x2 footprint; (-1,-1)
  // places blue at (1, rows/2-1) and red at (cols-3, rows/2-1).
  int hq_max_hp = 500;
  Tile hq_anchor[TEAM_COUNT] = {{-1, -1}, {-1, -1}};

  // Economy
  int starting_resources = 10;
  int initial_units = 3; // free deployment per side at construction
  bool auto_spawn = true;
  int spawn_margin = 2; // spawn box = footprint grown by this many tiles
  int income_interval = 60;
  int income_amount = 1;
  int territory_income_interval = 50;
  int tiles_per_resource = 5;
  int depot_income = 2;

  // Movement & decision policy
  int move_cd_min = 10;
  int move_cd_max = 20;
  int engage_radius = 5;
  int defend_radius = 4;
  int safety_roster = 3;
  int regroup_distance = 4;
  int offense_roster = 5;
  int hold_radius = 2;

  // Combat & siege
  int attack_cooldown = 5;
  int siege_threshold = 3;
  int veteran_kills = 3;
  int veteran_hp_bonus = 50;
  int veteran_damage_bonus = 5;

  // Vision
  int vision_radius = 5;
  int min_vision_radius = 2;
  int watchtower_vision = 3;

  // Territory
  int capture_ticks = 30;
  int vacate_ticks = 100;

  // Morale & supply
  int morale_start = 75;
  int morale_ally_weight = 1;
  int morale_enemy_weight = 2;
  int retreat_morale = 20;
  int waver_morale = 40;
  int waver_skip_pct = 25;
  int death_shock = 10;
  int commander_shock = 25;
  int attrition_interval = 10;
  int attrition_damage = 1;

  // Weather: fixed unless weather_period > 0
  Weather weather = WEATHER_CLEAR;
  int weather_period = 0;

  int building_count = 0;
  BuildingSpec buildings[MAX_BUILDINGS] = {};
};

} // namespace frontline

#endif // FRONTLINE_RULES_H
