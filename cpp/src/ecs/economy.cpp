#include "economy.h"
#include "../core/rng.h"
#include "battle_events.h"
#include <spdlog/spdlog.h>
#include <vector>

namespace frontline {

flecs::entity spawn_unit(flecs::world &w, uint8_t team, Role role, Tile tile) {
  if (team >= TEAM_COUNT || role >= ROLE_COUNT)
    return flecs::entity::null();

  const TerrainGrid &grid = w.get<TerrainGrid>();
  OccupancyGrid &occ = w.ensure<OccupancyGrid>();
  if (!walkable(grid, tile))
    return flecs::entity::null();
  const int idx = grid.index(tile);
  if (occ.occupant[idx] != 0)
    return flecs::entity::null();

  const Rules &rules = w.get<Rules>();
  const RoleStats &stats = rules.roles[role];
  const uint32_t id = ++w.ensure<BattleClock>().next_unit_id;

  flecs::entity e =
      w.entity()
          .set<UnitId>({id})
          .set<TeamId>({team})
          .set<RoleId>({(uint8_t)role})
          .set<Tile>(tile)
          .set<Health>({stats.max_hp, stats.max_hp})
          .set<Weapon>({stats.damage, 0, 0})
          .set<Mobility>({0, 0, stats.steps})
          .set<Morale>({rules.config.morale_start})
          .set<Supply>({true, rules.config.attrition_interval})
          .set<Siege>({0})
          .set<Auras>({0.0f, 0.0f, false})
          .set<AbilityTimer>({0})
          .add<IsAlive>();

  occ.place(idx, e.id(), team);
  FactionState &side = w.ensure<Factions>().side[team];
  side.alive++;
  side.spawned++;

  emit(w, unit_event(w, EVENT_SPAWN, e));
  return e;
}

// Free walkable tiles in the footprint grown by spawn_margin, HQ excluded.
static std::vector<Tile> spawn_candidates(flecs::world &w, uint8_t team) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const HQs &hqs = w.get<HQs>();
  const Headquarters &home = hqs.hq[team];
  const int margin = w.get<Rules>().config.spawn_margin;

  std::vector<Tile> out;
  for (int y = home.anchor.y - margin; y <= home.anchor.y + HQ_SIZE - 1 + margin;
       y++) {
    for (int x = home.anchor.x - margin;
         x <= home.anchor.x + HQ_SIZE - 1 + margin; x++) {
      Tile t = {x, y};
      if (!walkable(grid, t) || occ.occupant[grid.index(t)] != 0)
        continue;
      if (hqs.hq[TEAM_BLUE].covers(t) || hqs.hq[TEAM_RED].covers(t))
        continue;
      out.push_back(t);
    }
  }
  return out;
}

// Rolls are keyed by (team, units spawned so far).
static uint64_t spawn_key(flecs::world &w, uint8_t team) {
  return ((uint64_t)team << 32) |
         (uint32_t)w.get<Factions>().side[team].spawned;
}

bool try_economy_spawn(flecs::world &w, uint8_t team) {
  const Rules &rules = w.get<Rules>();
  const uint64_t tick = w.get<BattleClock>().tick;
  const int resources = w.get<Factions>().side[team].resources;

  Role affordable[ROLE_COUNT];
  int count = 0;
  for (int r = 0; r < ROLE_COUNT; r++) {
    const RoleStats &stats = rules.roles.roles[r];
    if (stats.spawnable && stats.cost <= resources)
      affordable[count++] = (Role)r;
  }
  if (count == 0)
    return false;

  std::vector<Tile> tiles = spawn_candidates(w, team);
  if (tiles.empty()) {
    spdlog::debug("[Frontline] t={} team {} spawn skipped: no free tile", tick,
                  (int)team);
    return false;
  }

  const uint64_t key = spawn_key(w, team);
  Role role = affordable[roll_range(rules.config.seed, tick, key,
                                    SALT_SPAWN_ROLE, 0, count - 1)];
  Tile tile = tiles[roll_range(rules.config.seed, tick, key, SALT_SPAWN_TILE,
                               0, (int)tiles.size() - 1)];

  if (!spawn_unit(w, team, role, tile))
    return false;
  w.ensure<Factions>().side[team].resources -= rules.roles[role].cost;
  return true;
}

void collect_income(flecs::world &w) {
  const BattleConfig &cfg = w.get<Rules>().config;
  const uint64_t tick = w.get<BattleClock>().tick;
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const TerritoryMap &territory = w.get<TerritoryMap>();
  const Buildings &buildings = w.get<Buildings>();
  Factions &factions = w.ensure<Factions>();

  const bool income_tick =
      cfg.income_interval > 0 && tick % (uint64_t)cfg.income_interval == 0;
  const bool territory_tick = cfg.territory_income_interval > 0 &&
                              tick % (uint64_t)cfg.territory_income_interval ==
                                  0;

  for (uint8_t t = 0; t < TEAM_COUNT; t++) {
    FactionState &side = factions.side[t];
    if (income_tick)
      side.resources += cfg.income_amount +
                        cfg.depot_income * buildings.owned(t, BUILDING_DEPOT);
    if (territory_tick)
      side.resources +=
          count_owned(territory, grid, t) / cfg.tiles_per_resource;
  }

  if (!cfg.auto_spawn || !income_tick)
    return;
  for (uint8_t t = 0; t < TEAM_COUNT; t++)
    try_economy_spawn(w, t);
}

void deploy_initial_units(flecs::world &w) {
  const Rules &rules = w.get<Rules>();

  Role pool[ROLE_COUNT];
  int count = 0;
  for (int r = 0; r < ROLE_COUNT; r++) {
    if (rules.roles.roles[r].spawnable)
      pool[count++] = (Role)r;
  }
  if (count == 0)
    return;

  for (uint8_t t = 0; t < TEAM_COUNT; t++) {
    for (int i = 0; i < rules.config.initial_units; i++) {
      std::vector<Tile> tiles = spawn_candidates(w, t);
      if (tiles.empty()) {
        spdlog::warn("[Frontline] team {} deployed {} of {} initial units: "
                     "spawn box full",
                     (int)t, i, rules.config.initial_units);
        break;
      }
      const uint64_t key = spawn_key(w, t);
      Role role = pool[roll_range(rules.config.seed, 0, key, SALT_SPAWN_ROLE,
                                  0, count - 1)];
      Tile tile = tiles[roll_range(rules.config.seed, 0, key, SALT_SPAWN_TILE,
                                   0, (int)tiles.size() - 1)];
      spawn_unit(w, t, role, tile);
    }
  }
}

} // namespace frontline
