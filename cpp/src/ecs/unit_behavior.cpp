#include "unit_behavior.h"
#include "../core/pathfinder.h"
#include "../core/rng.h"
#include "battle_events.h"
#include "combat.h"
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <utility>

namespace frontline {

// ═════════════════════════════════════════════════════════════
// Spatial helpers
// ═════════════════════════════════════════════════════════════

static void mark_adjacent_goals(const TerrainGrid &grid, Tile center,
                                TileMask &goals) {
  Tile nbrs[4];
  int n = neighbors4(grid, center, nbrs);
  for (int i = 0; i < n; i++) {
    if (walkable(grid, nbrs[i]))
      goals.set(grid.index(nbrs[i]));
  }
}

// Tiles within `radius` of the footprint, row-major. func(tile, distance).
template <typename Func>
static void for_each_near_hq(const TerrainGrid &grid, const Headquarters &hq,
                             int radius, Func &&func) {
  for (int y = hq.anchor.y - radius; y <= hq.anchor.y + HQ_SIZE - 1 + radius;
       y++) {
    for (int x = hq.anchor.x - radius;
         x <= hq.anchor.x + HQ_SIZE - 1 + radius; x++) {
      Tile t = {x, y};
      if (!in_bounds(grid, t))
        continue;
      int d = hq.distance_to(t);
      if (d <= radius)
        func(t, d);
    }
  }
}

template <typename Func>
static void for_each_ally_in_radius(flecs::world &w, Tile center, uint8_t team,
                                    int radius, Func &&func) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  for_each_in_radius(grid, center, radius, [&](Tile t) {
    int idx = grid.index(t);
    if (occ.occupant[idx] == 0 || occ.team[idx] != team)
      return;
    func(w.entity(occ.occupant[idx]));
  });
}

// ═════════════════════════════════════════════════════════════
// Target selection (fixed priority)
// ═════════════════════════════════════════════════════════════

GoalKind select_target(flecs::world &w, flecs::entity unit, TileMask &goals) {
  goals.reset();

  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const BattleConfig &cfg = w.get<Rules>().config;
  const HQs &hqs = w.get<HQs>();
  const Tile pos = unit.get<Tile>();
  const uint8_t team = unit.get<TeamId>().team;
  const TileMask &visible = w.get<VisibilityMap>().visible[team];

  auto is_enemy = [&](int idx) {
    return occ.occupant[idx] != 0 && occ.team[idx] != team;
  };

  // ── 1. Engage: nearest visible enemy, manhattan rings outward ──
  for (int r = 1; r <= cfg.engage_radius; r++) {
    for (int dx = -r; dx <= r; dx++) {
      int dy = r - std::abs(dx);
      Tile ring[2] = {{pos.x + dx, pos.y + dy}, {pos.x + dx, pos.y - dy}};
      int count = dy == 0 ? 1 : 2;
      for (int c = 0; c < count; c++) {
        if (!in_bounds(grid, ring[c]))
          continue;
        int idx = grid.index(ring[c]);
        if (!visible[idx] || !is_enemy(idx))
          continue;
        mark_adjacent_goals(grid, ring[c], goals);
        if (goals.any())
          return GOAL_ENGAGE;
      }
    }
  }

  // ── 2. Defend: visible enemy closest to our HQ ──
  {
    int best = INT_MAX;
    Tile threat = {-1, -1};
    for_each_near_hq(grid, hqs.hq[team], cfg.defend_radius,
                     [&](Tile t, int d) {
                       int idx = grid.index(t);
                       if (d < best && visible[idx] && is_enemy(idx)) {
                         best = d;
                         threat = t;
                       }
                     });
    if (best != INT_MAX) {
      mark_adjacent_goals(grid, threat, goals);
      if (goals.any())
        return GOAL_DEFEND;
    }
  }

  const FactionState &side = w.get<Factions>().side[team];

  // ── 3. Regroup: short-handed and far from the nearest ally ──
  if (side.alive < cfg.safety_roster) {
    int best_d = INT_MAX;
    uint32_t best_id = UINT32_MAX;
    Tile ally_at = pos;
    w.each([&](flecs::entity other, const UnitId &id, const TeamId &t,
               const Tile &at) {
      if (other == unit || t.team != team || !other.has<IsAlive>())
        return;
      int d = manhattan(pos, at);
      if (d < best_d || (d == best_d && id.id < best_id)) {
        best_d = d;
        best_id = id.id;
        ally_at = at;
      }
    });
    if (best_id != UINT32_MAX && best_d > cfg.regroup_distance) {
      mark_adjacent_goals(grid, ally_at, goals);
      if (goals.any())
        return GOAL_REGROUP;
    }
  }

  // ── 4. Advance on the enemy HQ ──
  if (side.alive >= cfg.offense_roster) {
    Tile fp[HQ_TILES];
    hqs.hq[enemy_of(team)].footprint(fp);
    for (int i = 0; i < HQ_TILES; i++)
      goals.set(grid.index(fp[i]));
    return GOAL_ADVANCE;
  }

  // ── 5. Hold near home ──
  for_each_near_hq(grid, hqs.hq[team], cfg.hold_radius, [&](Tile t, int) {
    if (walkable(grid, t))
      goals.set(grid.index(t));
  });
  return GOAL_HOLD;
}

// ═════════════════════════════════════════════════════════════
// Movement
// ═════════════════════════════════════════════════════════════

// false: already at a goal, or boxed in.
static bool plan_step(flecs::world &w, flecs::entity unit,
                      const TileMask &goals, Tile &next) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const Tile pos = unit.get<Tile>();

  TileMask blocked = occupied_neighbors(grid, occ, pos, unit.id());
  if (!next_step(grid, pos, goals, blocked, next))
    return false;
  return next != pos;
}

// No shove/swap: refuses occupied or unwalkable tiles.
static bool move_unit(flecs::world &w, flecs::entity unit, Tile to) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  OccupancyGrid &occ = w.ensure<OccupancyGrid>();
  if (!walkable(grid, to))
    return false;
  int to_idx = grid.index(to);
  if (occ.occupant[to_idx] != 0)
    return false;

  Tile &pos = unit.ensure<Tile>();
  int from_idx = grid.index(pos);
  if (occ.occupant[from_idx] == unit.id())
    occ.vacate(from_idx);
  occ.place(to_idx, unit.id(), unit.get<TeamId>().team);
  pos = to;

  unit.ensure<Mobility>().terrain_cd = entry_penalty(grid, to);
  emit(w, unit_event(w, EVENT_MOVE, unit));
  return true;
}

// Free neighbour that strictly increases distance to the enemy HQ.
static bool retreat_target(flecs::world &w, flecs::entity unit, Tile &out) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const Headquarters &enemy_hq =
      w.get<HQs>().hq[enemy_of(unit.get<TeamId>().team)];
  const Tile pos = unit.get<Tile>();

  int best = enemy_hq.distance_to(pos);
  bool found = false;
  Tile nbrs[4];
  int n = neighbors4(grid, pos, nbrs);
  for (int i = 0; i < n; i++) {
    if (!walkable(grid, nbrs[i]) || occ.occupant[grid.index(nbrs[i])] != 0)
      continue;
    int d = enemy_hq.distance_to(nbrs[i]);
    if (d > best) {
      best = d;
      out = nbrs[i];
      found = true;
    }
  }
  return found;
}

static void reroll_move_cd(flecs::world &w, flecs::entity unit) {
  const BattleConfig &cfg = w.get<Rules>().config;
  const uint64_t tick = w.get<BattleClock>().tick;

  int cd = roll_range(cfg.seed, tick, unit.get<UnitId>().id, SALT_MOVE_CD,
                      cfg.move_cd_min, cfg.move_cd_max);
  cd = cd * WEATHER_TRAITS[w.get<WeatherState>().current].move_cd_pct / 100;
  if (unit.get<Auras>().hasted)
    cd = cd * 75 / 100;
  if (unit.has<Veteran>())
    cd -= 1;
  unit.ensure<Mobility>().move_cd = std::max(1, cd);
}

// Cooldown expired: pick a goal and walk, or fall back / waver.
static void act(flecs::world &w, flecs::entity unit) {
  const BattleConfig &cfg = w.get<Rules>().config;
  const uint64_t tick = w.get<BattleClock>().tick;
  const int morale = unit.get<Morale>().value;

  if (morale < cfg.retreat_morale) {
    Tile away;
    if (retreat_target(w, unit, away))
      move_unit(w, unit, away);
    try_attack(w, unit);
    reroll_move_cd(w, unit);
    return;
  }

  if (morale < cfg.waver_morale &&
      roll_percent(cfg.seed, tick, unit.get<UnitId>().id, SALT_WAVER,
                   cfg.waver_skip_pct)) {
    try_attack(w, unit);
    return;
  }

  TileMask goals;
  select_target(w, unit, goals);

  bool moved = false;
  bool struck = false;
  const int steps = unit.get<Mobility>().steps;
  for (int s = 0; s < steps; s++) {
    Tile next;
    if (!plan_step(w, unit, goals, next))
      break;
    if (!move_unit(w, unit, next))
      break;
    moved = true;
    if (try_attack(w, unit)) {
      struck = true;
      break;
    }
    if (unit.get<Mobility>().terrain_cd > 0)
      break; // forest swallows the remaining steps
  }
  if (!moved && !struck)
    try_attack(w, unit);

  reroll_move_cd(w, unit);
}

// ═════════════════════════════════════════════════════════════
// Abilities - one handler per AbilityKind
// ═════════════════════════════════════════════════════════════

static void shield_aura(flecs::world &w, flecs::entity unit,
                        const AbilitySpec &spec) {
  for_each_ally_in_radius(w, unit.get<Tile>(), unit.get<TeamId>().team,
                          spec.radius, [&](flecs::entity ally) {
                            if (ally == unit)
                              return;
                            Auras &a = ally.ensure<Auras>();
                            a.damage_reduction =
                                std::max(a.damage_reduction, spec.magnitude);
                          });
}

static void command_aura(flecs::world &w, flecs::entity unit,
                         const AbilitySpec &spec) {
  for_each_ally_in_radius(w, unit.get<Tile>(), unit.get<TeamId>().team,
                          spec.radius, [&](flecs::entity ally) {
                            if (ally == unit)
                              return;
                            Auras &a = ally.ensure<Auras>();
                            a.damage_bonus =
                                std::max(a.damage_bonus, spec.magnitude);
                            a.hasted = true;
                          });
}

static void heal_allies(flecs::world &w, flecs::entity unit,
                        const AbilitySpec &spec) {
  for_each_ally_in_radius(w, unit.get<Tile>(), unit.get<TeamId>().team,
                          spec.radius, [&](flecs::entity ally) {
                            Health &h = ally.ensure<Health>();
                            if (h.hp < h.max_hp)
                              h.hp = std::min(h.max_hp,
                                              h.hp + (int)spec.magnitude);
                          });
}

static void repair_hq(flecs::world &w, flecs::entity unit,
                      const AbilitySpec &spec) {
  Headquarters &home = w.ensure<HQs>().hq[unit.get<TeamId>().team];
  if (home.hp <= 0 || home.distance_to(unit.get<Tile>()) > spec.radius)
    return;
  home.hp = std::min(home.max_hp, home.hp + (int)spec.magnitude);
}

static void place_wall(flecs::world &w, flecs::entity unit,
                       const AbilitySpec &) {
  TerrainGrid &grid = w.ensure<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const HQs &hqs = w.get<HQs>();
  const Buildings &buildings = w.get<Buildings>();

  Tile nbrs[4];
  Tile open_tiles[4];
  int n = neighbors4(grid, unit.get<Tile>(), nbrs);
  int nfree = 0;
  for (int i = 0; i < n; i++) {
    int idx = grid.index(nbrs[i]);
    if (grid.kind[idx] != TERRAIN_OPEN || occ.occupant[idx] != 0)
      continue;
    if (hqs.hq[TEAM_BLUE].covers(nbrs[i]) || hqs.hq[TEAM_RED].covers(nbrs[i]))
      continue;
    if (buildings.find(nbrs[i]) >= 0)
      continue;
    open_tiles[nfree++] = nbrs[i];
  }
  if (nfree == 0)
    return;

  const BattleConfig &cfg = w.get<Rules>().config;
  Tile pick = open_tiles[roll_range(cfg.seed, w.get<BattleClock>().tick,
                              unit.get<UnitId>().id, SALT_WALL, 0, nfree - 1)];
  grid.kind[grid.index(pick)] = TERRAIN_WALL;

  BattleEvent ev = unit_event(w, EVENT_WALL, unit);
  ev.tile = pick;
  emit(w, ev);
}

using AbilityFn = void (*)(flecs::world &, flecs::entity, const AbilitySpec &);

struct AbilityHandler {
  bool aura; // applied in the pre-pass every tick, not on the timer
  AbilityFn fn;
};

static const AbilityHandler ABILITY_HANDLERS[ABILITY_COUNT] = {
    {false, nullptr},     // NONE
    {true, shield_aura},  // SHIELD
    {false, heal_allies}, // HEAL
    {false, place_wall},  // WALL
    {false, repair_hq},   // REPAIR
    {false, nullptr},     // VISION (fog pass reads the role table)
    {true, command_aura}, // COMMAND
};

static const AbilitySpec &ability_of(flecs::world &w, flecs::entity unit) {
  return w.get<Rules>().roles.roles[unit.get<RoleId>().role].ability;
}

static void run_ability(flecs::world &w, flecs::entity unit) {
  const AbilitySpec &spec = ability_of(w, unit);
  const AbilityHandler &handler = ABILITY_HANDLERS[spec.kind];
  if (handler.aura || !handler.fn)
    return;

  AbilityTimer &timer = unit.ensure<AbilityTimer>();
  if (++timer.ticks < spec.period)
    return;
  timer.ticks = 0;
  handler.fn(w, unit, spec);
}

// ═════════════════════════════════════════════════════════════
// Roster pass
// ═════════════════════════════════════════════════════════════

std::vector<flecs::entity> collect_roster(flecs::world &w) {
  std::vector<std::pair<uint32_t, flecs::entity>> keyed;
  w.each([&](flecs::entity e, const UnitId &id) {
    if (e.has<IsAlive>())
      keyed.emplace_back(id.id, e);
  });
  std::sort(keyed.begin(), keyed.end(),
            [](const std::pair<uint32_t, flecs::entity> &a,
               const std::pair<uint32_t, flecs::entity> &b) {
              return a.first < b.first;
            });

  std::vector<flecs::entity> roster;
  roster.reserve(keyed.size());
  for (const auto &k : keyed)
    roster.push_back(k.second);
  return roster;
}

void apply_auras(flecs::world &w, const std::vector<flecs::entity> &roster) {
  for (flecs::entity u : roster)
    u.ensure<Auras>() = Auras{0.0f, 0.0f, false};

  for (flecs::entity u : roster) {
    const AbilitySpec &spec = ability_of(w, u);
    const AbilityHandler &handler = ABILITY_HANDLERS[spec.kind];
    if (handler.aura && handler.fn)
      handler.fn(w, u, spec);
  }
}

void update_unit(flecs::world &w, flecs::entity unit) {
  {
    Weapon &wpn = unit.ensure<Weapon>();
    if (wpn.attack_cd > 0)
      wpn.attack_cd--;
  }

  // Waiting units still retaliate
  Mobility &mob = unit.ensure<Mobility>();
  if (mob.move_cd > 0) {
    mob.move_cd--;
    try_attack(w, unit);
  } else if (mob.terrain_cd > 0) {
    mob.terrain_cd--;
    try_attack(w, unit);
  } else {
    act(w, unit);
  }

  besiege(w, unit);
  run_ability(w, unit);
}

} // namespace frontline
