#include "battle.h"
#include "combat.h"
#include "economy.h"
#include "frontline_systems.h"
#include "rules_loader.h"
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace frontline {

static bool footprints_overlap(Tile a, Tile b) {
  return std::abs(a.x - b.x) < HQ_SIZE && std::abs(a.y - b.y) < HQ_SIZE;
}

static bool footprint_fits(const TerrainGrid &grid, Tile anchor) {
  return anchor.x >= 0 && anchor.y >= 0 && anchor.x + HQ_SIZE <= grid.width &&
         anchor.y + HQ_SIZE <= grid.height;
}

Battle::Battle(const TerrainGrid &terrain, const RoleTable &roles,
               const BattleConfig &config) {
  std::string problem = validate_rules(roles, config);
  if (!problem.empty())
    throw std::invalid_argument(problem);
  if (terrain.width < 2 * HQ_SIZE || terrain.height < HQ_SIZE ||
      terrain.width > MAX_GRID_W || terrain.height > MAX_GRID_H)
    throw std::invalid_argument("terrain size out of range");

  init_ecs(terrain, roles, config);
}

Battle::~Battle() {
  // World teardown strips IsAlive from every unit; nothing may react to it
  if (death_observer.is_alive())
    death_observer.destruct();
}

void Battle::init_ecs(const TerrainGrid &terrain, const RoleTable &roles,
                      const BattleConfig &config) {
  TerrainGrid grid = terrain;

  // ── Headquarters placement ──
  const Tile defaults[TEAM_COUNT] = {{1, grid.height / 2 - 1},
                                     {grid.width - 3, grid.height / 2 - 1}};
  Tile anchors[TEAM_COUNT];
  for (int t = 0; t < TEAM_COUNT; t++) {
    const Tile a = config.hq_anchor[t];
    anchors[t] = (a.x == -1 && a.y == -1) ? defaults[t] : a;
    if (!footprint_fits(grid, anchors[t]))
      throw std::invalid_argument("HQ footprint out of bounds");
  }
  if (footprints_overlap(anchors[TEAM_BLUE], anchors[TEAM_RED]))
    throw std::invalid_argument("HQ footprints overlap");

  HQs hqs = {};
  hqs.first_fallen = NO_TEAM;
  for (int t = 0; t < TEAM_COUNT; t++) {
    hqs.hq[t] = {anchors[t], config.hq_max_hp, config.hq_max_hp};
    Tile fp[HQ_TILES];
    hqs.hq[t].footprint(fp);
    for (int i = 0; i < HQ_TILES; i++)
      grid.kind[grid.index(fp[i])] = TERRAIN_OPEN;
  }

  if (!tiles_connected(grid, anchors[TEAM_BLUE], anchors[TEAM_RED]))
    throw std::runtime_error("no walkable path between the two HQs");

  // ── Buildings ──
  Buildings buildings = {};
  for (int i = 0; i < config.building_count; i++) {
    const BuildingSpec &spec = config.buildings[i];
    if (!walkable(grid, spec.tile))
      throw std::invalid_argument("building on a blocked or out-of-bounds tile");
    if (hqs.hq[TEAM_BLUE].covers(spec.tile) ||
        hqs.hq[TEAM_RED].covers(spec.tile))
      throw std::invalid_argument("building on an HQ footprint");
    if (buildings.find(spec.tile) >= 0)
      throw std::invalid_argument("two buildings on one tile");
    buildings.items[buildings.count++] = {spec.tile, spec.kind, CaptureState{}};
  }

  spdlog::info("[Frontline] Initializing battle {}x{} (seed {})", grid.width,
               grid.height, config.seed);

  // ── Components ──
  ecs.component<UnitId>("UnitId");
  ecs.component<TeamId>("TeamId");
  ecs.component<RoleId>("RoleId");
  ecs.component<Tile>("Tile");
  ecs.component<IsAlive>("IsAlive");
  ecs.component<Veteran>("Veteran");
  ecs.component<Health>("Health");
  ecs.component<Weapon>("Weapon");
  ecs.component<Siege>("Siege");
  ecs.component<Auras>("Auras");
  ecs.component<Mobility>("Mobility");
  ecs.component<Morale>("Morale");
  ecs.component<Supply>("Supply");
  ecs.component<AbilityTimer>("AbilityTimer");

  // ── Singletons ──
  ecs.set<TerrainGrid>(grid);
  {
    OccupancyGrid occ;
    occ.clear();
    ecs.set<OccupancyGrid>(occ);
  }
  ecs.set<BattleClock>({0, 0});
  ecs.set<Rules>({roles, config});
  ecs.set<VisibilityMap>({});
  ecs.set<SupplyMap>({});

  Factions factions = {};
  for (int t = 0; t < TEAM_COUNT; t++)
    factions.side[t].resources = config.starting_resources;
  ecs.set<Factions>(factions);
  ecs.set<HQs>(hqs);

  // HQ tiles are owned from tick 0 and never change hands (~25KB: heap)
  {
    auto territory = std::make_unique<TerritoryMap>();
    for (uint8_t t = 0; t < TEAM_COUNT; t++) {
      Tile fp[HQ_TILES];
      hqs.hq[t].footprint(fp);
      for (int i = 0; i < HQ_TILES; i++) {
        int idx = grid.index(fp[i]);
        territory->cells[idx].owner = t;
        territory->locked.set(idx);
      }
    }
    ecs.set<TerritoryMap>(*territory);
  }

  ecs.set<Buildings>(buildings);
  ecs.set<WeatherState>({config.weather});
  ecs.set<BattleOutcome>({false, NO_TEAM, OUTCOME_NONE});
  ecs.set<EventHub>({nullptr});

  // ── Systems (registration order = tick order) ──
  register_clock_systems(ecs);
  register_economy_systems(ecs);
  register_visibility_systems(ecs);
  register_unit_systems(ecs);
  register_territory_systems(ecs);
  register_morale_systems(ecs);
  register_victory_systems(ecs);
  death_observer = register_death_observer(ecs);

  deploy_initial_units(ecs);

  spdlog::info("[Frontline] Battle ready: Blue HQ ({},{}), Red HQ ({},{}), "
               "{} units per side",
               anchors[TEAM_BLUE].x, anchors[TEAM_BLUE].y, anchors[TEAM_RED].x,
               anchors[TEAM_RED].y, get_alive_count(TEAM_BLUE));
}

// ─── Lifecycle ───────────────────────────────────────────

void Battle::advance_tick() {
  if (is_game_over())
    return;
  ecs.progress(1.0f);
}

bool Battle::is_game_over() const { return ecs.get<BattleOutcome>().over; }

bool Battle::is_game_over(uint8_t &winner) const {
  const BattleOutcome &out = ecs.get<BattleOutcome>();
  winner = out.winner;
  return out.over;
}

OutcomeReason Battle::outcome_reason() const {
  return ecs.get<BattleOutcome>().reason;
}

void Battle::stop() {
  BattleOutcome &out = ecs.ensure<BattleOutcome>();
  if (out.over)
    return;
  out = {true, NO_TEAM, OUTCOME_STOPPED};
  spdlog::info("[Frontline] Battle stopped at tick {}", tick());
}

// ─── Units ───────────────────────────────────────────────

flecs::entity Battle::spawn_unit(uint8_t team, Role role, Tile tile) {
  return frontline::spawn_unit(ecs, team, role, tile);
}

bool Battle::remove_unit(flecs::entity unit) {
  if (!unit.is_alive() || !unit.has<UnitId>())
    return false;
  return frontline::remove_unit(unit);
}

std::vector<UnitSnapshot> Battle::snapshot() const {
  std::vector<UnitSnapshot> out;
  ecs.each([&](flecs::entity e, const UnitId &id, const TeamId &team,
               const RoleId &role, const Tile &tile, const Health &hp,
               const Morale &morale, const Supply &supply) {
    if (!e.has<IsAlive>())
      return;
    out.push_back({id.id, team.team, (Role)role.role, tile, hp.hp, hp.max_hp,
                   morale.value, supply.supplied, e.has<Veteran>()});
  });
  std::sort(out.begin(), out.end(),
            [](const UnitSnapshot &a, const UnitSnapshot &b) {
              return a.id < b.id;
            });
  return out;
}

void Battle::attach_event_sink(EventSink *sink) {
  ecs.ensure<EventHub>().sink = sink;
}

// ─── Queries ─────────────────────────────────────────────

uint64_t Battle::tick() const { return ecs.get<BattleClock>().tick; }

int Battle::get_alive_count(uint8_t team) const {
  if (team >= TEAM_COUNT)
    return 0;
  return ecs.get<Factions>().side[team].alive;
}

int Battle::get_resources(uint8_t team) const {
  if (team >= TEAM_COUNT)
    return 0;
  return ecs.get<Factions>().side[team].resources;
}

int Battle::get_hq_health(uint8_t team) const {
  if (team >= TEAM_COUNT)
    return 0;
  return ecs.get<HQs>().hq[team].hp;
}

Tile Battle::get_hq_anchor(uint8_t team) const {
  if (team >= TEAM_COUNT)
    return {-1, -1};
  return ecs.get<HQs>().hq[team].anchor;
}

uint8_t Battle::tile_owner(Tile t) const {
  const TerrainGrid &grid = ecs.get<TerrainGrid>();
  if (!in_bounds(grid, t))
    return NO_TEAM;
  return ecs.get<TerritoryMap>().cells[grid.index(t)].owner;
}

uint8_t Battle::building_owner(int index) const {
  const Buildings &buildings = ecs.get<Buildings>();
  if (index < 0 || index >= buildings.count)
    return NO_TEAM;
  return buildings.items[index].capture.owner;
}

bool Battle::is_visible(uint8_t team, Tile t) const {
  const TerrainGrid &grid = ecs.get<TerrainGrid>();
  if (team >= TEAM_COUNT || !in_bounds(grid, t))
    return false;
  return ecs.get<VisibilityMap>().visible[team][grid.index(t)];
}

bool Battle::is_supplied(uint8_t team, Tile t) const {
  const TerrainGrid &grid = ecs.get<TerrainGrid>();
  if (team >= TEAM_COUNT || !in_bounds(grid, t))
    return false;
  return ecs.get<SupplyMap>().supplied[team][grid.index(t)];
}

Weather Battle::weather() const { return ecs.get<WeatherState>().current; }

const TerrainGrid &Battle::terrain() const { return ecs.get<TerrainGrid>(); }

} // namespace frontline
