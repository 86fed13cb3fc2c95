#include "combat.h"
#include "../core/morale.h"
#include "battle_events.h"
#include <spdlog/spdlog.h>

namespace frontline {

static void promote_veteran(flecs::world &w, flecs::entity unit) {
  const BattleConfig &cfg = w.get<Rules>().config;
  Health &hp = unit.ensure<Health>();
  hp.max_hp += cfg.veteran_hp_bonus;
  hp.hp += cfg.veteran_hp_bonus;
  unit.ensure<Weapon>().damage += cfg.veteran_damage_bonus;
  // Structural change last: refs above are dead after this
  unit.add<Veteran>();
  emit(w, unit_event(w, EVENT_PROMOTE, unit, unit.get<Weapon>().kills));
}

static void credit_kill(flecs::world &w, flecs::entity killer) {
  Weapon &wpn = killer.ensure<Weapon>();
  wpn.kills++;
  const int kills = wpn.kills;
  w.ensure<Factions>().side[killer.get<TeamId>().team].kills++;

  if (kills >= w.get<Rules>().config.veteran_kills && !killer.has<Veteran>())
    promote_veteran(w, killer);
}

bool apply_damage(flecs::entity target, int amount) {
  Health &h = target.ensure<Health>();
  h.hp -= amount;
  if (h.hp > 0)
    return false;
  h.hp = 0;
  return true;
}

bool try_attack(flecs::world &w, flecs::entity attacker) {
  if (attacker.get<Weapon>().attack_cd > 0)
    return false;

  const TerrainGrid &grid = w.get<TerrainGrid>();
  const OccupancyGrid &occ = w.get<OccupancyGrid>();
  const Tile pos = attacker.get<Tile>();
  const uint8_t team = attacker.get<TeamId>().team;

  Tile nbrs[4];
  int n = neighbors4(grid, pos, nbrs);
  for (int i = 0; i < n; i++) {
    int ni = grid.index(nbrs[i]);
    if (occ.occupant[ni] == 0 || occ.team[ni] == team)
      continue;
    flecs::entity target = w.entity(occ.occupant[ni]);
    if (!target.is_alive() || !target.has<IsAlive>())
      continue;

    float bonus = attacker.get<Auras>().damage_bonus;
    float reduction = target.get<Auras>().damage_reduction;
    int dmg = (int)((float)attacker.get<Weapon>().damage * (1.0f + bonus) *
                    (1.0f - reduction));

    const int weather = w.get<WeatherState>().current;
    attacker.ensure<Weapon>().attack_cd =
        w.get<Rules>().config.attack_cooldown +
        WEATHER_TRAITS[weather].attack_cd_bonus;

    bool lethal = apply_damage(target, dmg);
    emit(w, unit_event(w, EVENT_ATTACK, attacker, dmg));
    if (lethal) {
      credit_kill(w, attacker);
      remove_unit(target);
    }
    return true;
  }
  return false;
}

void besiege(flecs::world &w, flecs::entity unit) {
  const uint8_t enemy = enemy_of(unit.get<TeamId>().team);
  const Tile pos = unit.get<Tile>();
  HQs &hqs = w.ensure<HQs>();
  Siege &siege = unit.ensure<Siege>();

  if (!hqs.hq[enemy].covers(pos)) {
    siege.counter = 0;
    return;
  }

  siege.counter++;
  if (siege.counter < w.get<Rules>().config.siege_threshold)
    return;
  siege.counter = 0;

  // Battle already decided: the first fallen HQ stays the loser
  if (hqs.first_fallen != NO_TEAM)
    return;

  Headquarters &hq = hqs.hq[enemy];
  int dmg = (int)((float)unit.get<Weapon>().damage *
                  (1.0f + unit.get<Auras>().damage_bonus));
  hq.hp -= dmg;
  if (hq.hp <= 0) {
    hq.hp = 0;
    hqs.first_fallen = enemy;
    spdlog::info("[Frontline] {} HQ destroyed at tick {}",
                 enemy == TEAM_BLUE ? "Blue" : "Red",
                 w.get<BattleClock>().tick);
  }
  emit(w, unit_event(w, EVENT_ATTACK_HQ, unit, hq.hp));
}

bool remove_unit(flecs::entity unit) {
  if (!unit.is_alive() || !unit.has<IsAlive>())
    return false;
  unit.remove<IsAlive>();
  return true;
}

void handle_unit_death(flecs::world &w, flecs::entity unit, const Tile &tile,
                       const TeamId &team) {
  const TerrainGrid &grid = w.get<TerrainGrid>();
  const BattleConfig &cfg = w.get<Rules>().config;
  OccupancyGrid &occ = w.ensure<OccupancyGrid>();

  int idx = grid.index(tile);
  if (occ.occupant[idx] == unit.id())
    occ.vacate(idx);

  FactionState &side = w.ensure<Factions>().side[team.team];
  side.alive--;
  side.losses++;

  if (unit.get<RoleId>().role == ROLE_COMMANDER) {
    // Whole roster feels it
    w.each([&](flecs::entity ally, const TeamId &t, Morale &m) {
      if (ally == unit || t.team != team.team || !ally.has<IsAlive>())
        return;
      m.value = clamp_morale(m.value - cfg.commander_shock);
    });
  } else {
    Tile nbrs[4];
    int n = neighbors4(grid, tile, nbrs);
    for (int i = 0; i < n; i++) {
      int ni = grid.index(nbrs[i]);
      if (occ.occupant[ni] == 0 || occ.team[ni] != team.team)
        continue;
      Morale &m = w.entity(occ.occupant[ni]).ensure<Morale>();
      m.value = clamp_morale(m.value - cfg.death_shock);
    }
  }

  emit(w, unit_event(w, EVENT_DEATH, unit));
}

} // namespace frontline
