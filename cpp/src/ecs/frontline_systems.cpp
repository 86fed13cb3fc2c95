#include "frontline_systems.h"
#include "../core/morale.h"
#include "../core/rng.h"
#include "../core/supply.h"
#include "../core/visibility.h"
#include "battle_events.h"
#include "combat.h"
#include "economy.h"
#include "frontline_components.h"
#include "unit_behavior.h"
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

// Every system below is a singleton system on BattleClock: it runs exactly
// once per progress() and walks the roster itself, so the processing order is
// UnitId order instead of flecs table order.

namespace frontline {

static void rebuild_occupancy(flecs::world &w) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  OccupancyGrid &occ = w.ensure<OccupancyGrid>();
  occ.clear();
  w.each([&](flecs::entity e, const Tile &t, const TeamId &team) {
    if (!e.has<IsAlive>())
      return;
    occ.place(grid.index(t), e.id(), team.team);
  });
}

void register_clock_systems(flecs::world &ecs) {
  // ═════════════════════════════════════════════════════════════
  // SYSTEM 1: Battle Clock
  //
  // Occupancy is rebuilt from scratch so any drift left by an
  // external remove/spawn between ticks is healed before units act.
  // ═════════════════════════════════════════════════════════════
  ecs.system<BattleClock>("BattleClockSystem")
      .immediate()
      .each([](flecs::entity e, BattleClock &clock) {
        clock.tick++;
        flecs::world w = e.world();
        rebuild_occupancy(w);
      });
}

void register_economy_systems(flecs::world &ecs) {
  ecs.system<const BattleClock>("EconomySystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        collect_income(w);
      });
}

// ── System 3: Fog of War ──────────────────────────────────
// Sources: every alive unit, every HQ footprint tile, owned watchtowers.
static void refresh_visibility(flecs::world &w) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const Rules &rules = w.get<Rules>();
  const BattleConfig &cfg = rules.config;
  const HQs &hqs = w.get<HQs>();
  const Buildings &buildings = w.get<Buildings>();
  const int penalty = WEATHER_TRAITS[w.get<WeatherState>().current].vision_penalty;

  std::vector<VisionSource> sources;

  const int hq_radius =
      vision_radius(cfg.vision_radius, 0, penalty, cfg.min_vision_radius);
  for (uint8_t t = 0; t < TEAM_COUNT; t++) {
    Tile fp[HQ_TILES];
    hqs.hq[t].footprint(fp);
    for (int i = 0; i < HQ_TILES; i++)
      sources.push_back({fp[i], t, hq_radius});
  }

  const int tower_radius = vision_radius(cfg.vision_radius, cfg.watchtower_vision,
                                         penalty, cfg.min_vision_radius);
  for (int i = 0; i < buildings.count; i++) {
    const Building &b = buildings.items[i];
    if (b.kind == BUILDING_WATCHTOWER && b.capture.owner != NO_TEAM)
      sources.push_back({b.tile, b.capture.owner, tower_radius});
  }

  w.each([&](flecs::entity e, const Tile &t, const TeamId &team,
             const RoleId &role) {
    if (!e.has<IsAlive>())
      return;
    const AbilitySpec &ability = rules.roles[(Role)role.role].ability;
    int bonus = ability.kind == ABILITY_VISION ? (int)ability.magnitude : 0;
    sources.push_back(
        {t, team.team,
         vision_radius(cfg.vision_radius, bonus, penalty, cfg.min_vision_radius)});
  });

  compute_visibility(grid, sources, w.ensure<VisibilityMap>().visible);
}

void register_visibility_systems(flecs::world &ecs) {
  ecs.system<const BattleClock>("VisibilitySystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        refresh_visibility(w);
      });
}

void register_unit_systems(flecs::world &ecs) {
  // ═════════════════════════════════════════════════════════════
  // SYSTEM 4: Unit Update
  //
  // Roster is snapshotted before anyone acts. A unit killed earlier
  // in the pass keeps its entity (until the sweep) but has lost
  // IsAlive, so it is skipped.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BattleClock>("UnitUpdateSystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        std::vector<flecs::entity> roster = collect_roster(w);
        apply_auras(w, roster);
        for (flecs::entity unit : roster) {
          if (!unit.has<IsAlive>())
            continue;
          update_unit(w, unit);
        }
      });

  // ── System 5: Roster Sweep ──────────────────────────────────
  // Destructs units that lost IsAlive. The death observer already ran
  // when the tag was removed; destruct does not fire it again.
  ecs.system<const BattleClock>("RosterSweepSystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        std::vector<flecs::entity> dead;
        w.each([&](flecs::entity unit, const UnitId &) {
          if (!unit.has<IsAlive>())
            dead.push_back(unit);
        });
        for (flecs::entity unit : dead)
          unit.destruct();
      });
}

// ── System 6: Territory ───────────────────────────────────
static void update_capture(flecs::world &w) {
  const BattleConfig &cfg = w.get<Rules>().config;
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const uint64_t tick = w.get<BattleClock>().tick;

  std::vector<OwnershipChange> changes;
  update_territory(w.ensure<TerritoryMap>(), grid, occ, cfg.capture_ticks,
                   cfg.vacate_ticks, &changes);
  for (const OwnershipChange &c : changes)
    emit(w, {EVENT_CAPTURE, tick, 0, c.owner, ROLE_COUNT, c.tile, -1});

  Buildings &buildings = w.ensure<Buildings>();
  for (int i = 0; i < buildings.count; i++) {
    Building &b = buildings.items[i];
    int idx = grid.index(b.tile);
    uint8_t occupant = occ.occupant[idx] != 0 ? occ.team[idx] : NO_TEAM;
    CaptureResult result =
        step_capture(b.capture, occupant, cfg.capture_ticks, cfg.vacate_ticks);
    if (result == CAPTURE_NONE)
      continue;
    spdlog::info("[Frontline] t={} {} at ({},{}) {}", tick,
                 building_name(b.kind), b.tile.x, b.tile.y,
                 result == CAPTURE_TAKEN
                     ? (b.capture.owner == TEAM_BLUE ? "taken by Blue"
                                                     : "taken by Red")
                     : "lost");
    emit(w, {EVENT_CAPTURE, tick, 0, b.capture.owner, ROLE_COUNT, b.tile, i});
  }
}

void register_territory_systems(flecs::world &ecs) {
  ecs.system<const BattleClock>("TerritorySystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        update_capture(w);
      });
}

// ── System 7: Weather, Supply & Morale ────────────────────
static void roll_weather(flecs::world &w) {
  const BattleConfig &cfg = w.get<Rules>().config;
  if (cfg.weather_period <= 0)
    return;
  const uint64_t tick = w.get<BattleClock>().tick;
  if (tick % (uint64_t)cfg.weather_period != 0)
    return;

  WeatherState &ws = w.ensure<WeatherState>();
  Weather next = (Weather)roll_range(cfg.seed, tick, 0, SALT_WEATHER, 0,
                                     WEATHER_COUNT - 1);
  if (next != ws.current)
    spdlog::info("[Frontline] t={} weather {} -> {}", tick,
                 WEATHER_TRAITS[ws.current].name, WEATHER_TRAITS[next].name);
  ws.current = next;
}

static void refresh_supply(flecs::world &w) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const TerritoryMap &territory = w.get<TerritoryMap>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const HQs &hqs = w.get<HQs>();
  SupplyMap &supply = w.ensure<SupplyMap>();

  for (uint8_t t = 0; t < TEAM_COUNT; t++) {
    Tile fp[HQ_TILES];
    hqs.hq[t].footprint(fp);
    compute_supply(grid, territory, occ, t, fp, HQ_TILES, supply.supplied[t]);
  }
}

static void update_morale(flecs::world &w) {
  const BattleConfig &cfg = w.get<Rules>().config;
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const SupplyMap &supply = w.get<SupplyMap>();

  // Neighbourhoods are read before anyone starves: an attrition death
  // later in the pass must not change what earlier-listed units saw.
  std::vector<flecs::entity> roster = collect_roster(w);
  std::vector<std::pair<int, int>> adjacent(roster.size());
  {
    const OccupancyGrid &occ = w.get<OccupancyGrid>();
    for (size_t i = 0; i < roster.size(); i++)
      count_adjacent(grid, occ, roster[i].get<Tile>(),
                     roster[i].get<TeamId>().team, adjacent[i].first,
                     adjacent[i].second);
  }

  for (size_t i = 0; i < roster.size(); i++) {
    flecs::entity unit = roster[i];
    if (!unit.has<IsAlive>())
      continue;
    const uint8_t team = unit.get<TeamId>().team;
    const bool supplied =
        supply.supplied[team][grid.index(unit.get<Tile>())];

    Supply &s = unit.ensure<Supply>();
    s.supplied = supplied;
    if (supplied) {
      s.starve_timer = cfg.attrition_interval;
    } else if (--s.starve_timer <= 0) {
      s.starve_timer = cfg.attrition_interval;
      if (apply_damage(unit, cfg.attrition_damage)) {
        remove_unit(unit);
        continue;
      }
    }

    Morale &m = unit.ensure<Morale>();
    m.value = clamp_morale(
        m.value + morale_delta(adjacent[i].first, adjacent[i].second, supplied,
                               cfg.morale_ally_weight,
                               cfg.morale_enemy_weight));
  }
}

void register_morale_systems(flecs::world &ecs) {
  ecs.system<const BattleClock>("MoraleSupplySystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        roll_weather(w);
        refresh_supply(w);
        update_morale(w);
      });
}

// ── System 8: Victory ─────────────────────────────────────
static const char *team_label(uint8_t team) {
  return team == TEAM_BLUE ? "Blue" : team == TEAM_RED ? "Red" : "nobody";
}

static void check_victory(flecs::world &w) {
  const HQs &hqs = w.get<HQs>();
  const Factions &factions = w.get<Factions>();
  const uint64_t tick = w.get<BattleClock>().tick;
  BattleOutcome &out = w.ensure<BattleOutcome>();
  if (out.over)
    return;

  if (hqs.first_fallen != NO_TEAM) {
    out = {true, enemy_of(hqs.first_fallen), OUTCOME_HQ_DESTROYED};
    spdlog::info("[Frontline] Battle over at tick {}: {} wins (HQ destroyed)",
                 tick, team_label(out.winner));
    return;
  }

  // Eliminated: a side that has fielded units and has none left
  bool eliminated[TEAM_COUNT];
  for (int t = 0; t < TEAM_COUNT; t++) {
    const FactionState &side = factions.side[t];
    eliminated[t] = side.alive == 0 && side.spawned > 0;
  }

  if (eliminated[TEAM_BLUE] && eliminated[TEAM_RED])
    out = {true, NO_TEAM, OUTCOME_ELIMINATED};
  else if (eliminated[TEAM_BLUE])
    out = {true, TEAM_RED, OUTCOME_ELIMINATED};
  else if (eliminated[TEAM_RED])
    out = {true, TEAM_BLUE, OUTCOME_ELIMINATED};

  if (out.over)
    spdlog::info("[Frontline] Battle over at tick {}: {} wins (elimination)",
                 tick, team_label(out.winner));
}

void register_victory_systems(flecs::world &ecs) {
  ecs.system<const BattleClock>("VictorySystem")
      .immediate()
      .each([](flecs::entity e, const BattleClock &) {
        flecs::world w = e.world();
        check_victory(w);
      });
}

flecs::observer register_death_observer(flecs::world &ecs) {
  return ecs.observer<const Tile, const TeamId>("UnitDeathHandler")
      .event(flecs::OnRemove)
      .with<IsAlive>()
      .each([](flecs::entity e, const Tile &tile, const TeamId &team) {
        flecs::world w = e.world();
        handle_unit_death(w, e, tile, team);
      });
}

} // namespace frontline
