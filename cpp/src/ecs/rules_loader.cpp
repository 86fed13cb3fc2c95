#include "rules_loader.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace frontline {

static bool read_tile(const json &j, Tile &out) {
  if (!j.is_array() || j.size() != 2)
    return false;
  out = {j[0].get<int>(), j[1].get<int>()};
  return true;
}

static bool parse_battle(const json &b, BattleConfig &cfg) {
  cfg.seed = b.value("seed", cfg.seed);
  cfg.hq_max_hp = b.value("hq_max_hp", cfg.hq_max_hp);

  if (b.contains("hq_anchor")) {
    const json &anchors = b["hq_anchor"];
    if (anchors.contains("blue") &&
        !read_tile(anchors["blue"], cfg.hq_anchor[TEAM_BLUE])) {
      spdlog::error("[Frontline] hq_anchor.blue must be [x, y]");
      return false;
    }
    if (anchors.contains("red") &&
        !read_tile(anchors["red"], cfg.hq_anchor[TEAM_RED])) {
      spdlog::error("[Frontline] hq_anchor.red must be [x, y]");
      return false;
    }
  }

  cfg.starting_resources = b.value("starting_resources", cfg.starting_resources);
  cfg.initial_units = b.value("initial_units", cfg.initial_units);
  cfg.auto_spawn = b.value("auto_spawn", cfg.auto_spawn);
  cfg.spawn_margin = b.value("spawn_margin", cfg.spawn_margin);
  cfg.income_interval = b.value("income_interval", cfg.income_interval);
  cfg.income_amount = b.value("income_amount", cfg.income_amount);
  cfg.territory_income_interval =
      b.value("territory_income_interval", cfg.territory_income_interval);
  cfg.tiles_per_resource = b.value("tiles_per_resource", cfg.tiles_per_resource);
  cfg.depot_income = b.value("depot_income", cfg.depot_income);

  cfg.move_cd_min = b.value("move_cd_min", cfg.move_cd_min);
  cfg.move_cd_max = b.value("move_cd_max", cfg.move_cd_max);
  cfg.engage_radius = b.value("engage_radius", cfg.engage_radius);
  cfg.defend_radius = b.value("defend_radius", cfg.defend_radius);
  cfg.safety_roster = b.value("safety_roster", cfg.safety_roster);
  cfg.regroup_distance = b.value("regroup_distance", cfg.regroup_distance);
  cfg.offense_roster = b.value("offense_roster", cfg.offense_roster);
  cfg.hold_radius = b.value("hold_radius", cfg.hold_radius);

  cfg.attack_cooldown = b.value("attack_cooldown", cfg.attack_cooldown);
  cfg.siege_threshold = b.value("siege_threshold", cfg.siege_threshold);
  cfg.veteran_kills = b.value("veteran_kills", cfg.veteran_kills);
  cfg.veteran_hp_bonus = b.value("veteran_hp_bonus", cfg.veteran_hp_bonus);
  cfg.veteran_damage_bonus =
      b.value("veteran_damage_bonus", cfg.veteran_damage_bonus);

  cfg.vision_radius = b.value("vision_radius", cfg.vision_radius);
  cfg.min_vision_radius = b.value("min_vision_radius", cfg.min_vision_radius);
  cfg.watchtower_vision = b.value("watchtower_vision", cfg.watchtower_vision);

  cfg.capture_ticks = b.value("capture_ticks", cfg.capture_ticks);
  cfg.vacate_ticks = b.value("vacate_ticks", cfg.vacate_ticks);

  cfg.morale_start = b.value("morale_start", cfg.morale_start);
  cfg.morale_ally_weight = b.value("morale_ally_weight", cfg.morale_ally_weight);
  cfg.morale_enemy_weight =
      b.value("morale_enemy_weight", cfg.morale_enemy_weight);
  cfg.retreat_morale = b.value("retreat_morale", cfg.retreat_morale);
  cfg.waver_morale = b.value("waver_morale", cfg.waver_morale);
  cfg.waver_skip_pct = b.value("waver_skip_pct", cfg.waver_skip_pct);
  cfg.death_shock = b.value("death_shock", cfg.death_shock);
  cfg.commander_shock = b.value("commander_shock", cfg.commander_shock);
  cfg.attrition_interval = b.value("attrition_interval", cfg.attrition_interval);
  cfg.attrition_damage = b.value("attrition_damage", cfg.attrition_damage);

  if (b.contains("weather")) {
    std::string name = b["weather"].get<std::string>();
    if (!weather_from_name(name, cfg.weather)) {
      spdlog::error("[Frontline] Unknown weather '{}'", name);
      return false;
    }
  }
  cfg.weather_period = b.value("weather_period", cfg.weather_period);

  if (b.contains("buildings")) {
    const json &list = b["buildings"];
    if (!list.is_array()) {
      spdlog::error("[Frontline] buildings must be an array");
      return false;
    }
    if (list.size() > (size_t)MAX_BUILDINGS) {
      spdlog::error("[Frontline] At most {} buildings", MAX_BUILDINGS);
      return false;
    }
    cfg.building_count = 0;
    for (auto &bld : list) {
      std::string kind = bld.at("kind").get<std::string>();
      BuildingSpec &spec = cfg.buildings[cfg.building_count];
      if (!building_from_name(kind, spec.kind)) {
        spdlog::error("[Frontline] Unknown building kind '{}'", kind);
        return false;
      }
      spec.tile = {bld.at("x").get<int>(), bld.at("y").get<int>()};
      cfg.building_count++;
    }
  }
  return true;
}

static bool parse_role(const json &r, RoleTable &roles) {
  std::string name = r.at("role").get<std::string>();
  Role role;
  if (!role_from_name(name, role)) {
    spdlog::error("[Frontline] Unknown role '{}'", name);
    return false;
  }

  RoleStats &stats = roles[role];
  stats.max_hp = r.value("hp", stats.max_hp);
  stats.damage = r.value("damage", stats.damage);
  stats.steps = r.value("steps", stats.steps);
  stats.cost = r.value("cost", stats.cost);
  stats.spawnable = r.value("spawnable", stats.spawnable);

  if (r.contains("ability")) {
    const json &a = r["ability"];
    if (a.contains("kind")) {
      std::string kind = a["kind"].get<std::string>();
      if (!ability_from_name(kind, stats.ability.kind)) {
        spdlog::error("[Frontline] Unknown ability '{}' for {}", kind, name);
        return false;
      }
    }
    stats.ability.period = a.value("period", stats.ability.period);
    stats.ability.radius = a.value("radius", stats.ability.radius);
    stats.ability.magnitude = a.value("magnitude", stats.ability.magnitude);
  }
  return true;
}

bool parse_rules(const std::string &text, RoleTable &roles,
                 BattleConfig &config) {
  RoleTable next_roles = roles;
  BattleConfig next_config = config;

  try {
    json j = json::parse(text);

    if (j.contains("battle") && !parse_battle(j["battle"], next_config))
      return false;

    if (j.contains("roles")) {
      for (auto &r : j["roles"]) {
        if (!parse_role(r, next_roles))
          return false;
      }
    }
  } catch (json::parse_error &e) {
    spdlog::error("[Frontline] Parse error in rules: {}", e.what());
    return false;
  } catch (json::type_error &e) {
    spdlog::error("[Frontline] Type error in rules: {}", e.what());
    return false;
  } catch (json::out_of_range &e) {
    spdlog::error("[Frontline] Missing field in rules: {}", e.what());
    return false;
  }

  std::string problem = validate_rules(next_roles, next_config);
  if (!problem.empty()) {
    spdlog::error("[Frontline] Invalid rules: {}", problem);
    return false;
  }

  roles = next_roles;
  config = next_config;
  return true;
}

bool load_rules_file(const std::string &path, RoleTable &roles,
                     BattleConfig &config) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("[Frontline] Failed to open {}", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!parse_rules(ss.str(), roles, config))
    return false;
  spdlog::info("[Frontline] Loaded rules from {}", path);
  return true;
}

bool load_terrain_file(const std::string &path, TerrainGrid &out) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("[Frontline] Failed to open {}", path);
    return false;
  }

  std::vector<std::string> rows;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!line.empty())
      rows.push_back(line);
  }

  try {
    out = terrain_from_rows(rows);
  } catch (std::invalid_argument &e) {
    spdlog::error("[Frontline] Bad terrain in {}: {}", path, e.what());
    return false;
  }
  spdlog::info("[Frontline] Loaded {}x{} terrain from {}", out.width,
               out.height, path);
  return true;
}

std::string validate_rules(const RoleTable &roles, const BattleConfig &c) {
  if (c.hq_max_hp < 1)
    return "hq_max_hp must be at least 1";
  if (c.starting_resources < 0 || c.initial_units < 0 || c.spawn_margin < 0)
    return "starting_resources, initial_units and spawn_margin must be >= 0";
  if (c.income_interval < 0 || c.territory_income_interval < 0 ||
      c.income_amount < 0 || c.depot_income < 0)
    return "income settings must be >= 0";
  if (c.tiles_per_resource < 1)
    return "tiles_per_resource must be at least 1";
  if (c.move_cd_min < 1 || c.move_cd_max < c.move_cd_min)
    return "move cooldown range must satisfy 1 <= min <= max";
  if (c.engage_radius < 0 || c.defend_radius < 0 || c.hold_radius < 0 ||
      c.regroup_distance < 0)
    return "policy radii must be >= 0";
  if (c.attack_cooldown < 0)
    return "attack_cooldown must be >= 0";
  if (c.siege_threshold < 1)
    return "siege_threshold must be at least 1";
  if (c.veteran_kills < 1)
    return "veteran_kills must be at least 1";
  if (c.vision_radius < 0 || c.min_vision_radius < 0 || c.watchtower_vision < 0)
    return "vision radii must be >= 0";
  if (c.capture_ticks < 1 || c.vacate_ticks < 1)
    return "capture_ticks and vacate_ticks must be at least 1";
  if (c.capture_ticks > 0xFFFF || c.vacate_ticks > 0xFFFF)
    return "capture_ticks and vacate_ticks must fit in 16 bits";
  if (c.morale_start < 0 || c.morale_start > 100)
    return "morale_start must be within 0..100";
  if (c.retreat_morale > c.waver_morale)
    return "retreat_morale must not exceed waver_morale";
  if (c.waver_skip_pct < 0 || c.waver_skip_pct > 100)
    return "waver_skip_pct must be within 0..100";
  if (c.attrition_interval < 1 || c.attrition_damage < 0)
    return "attrition_interval must be >= 1 and attrition_damage >= 0";
  if (c.weather >= WEATHER_COUNT || c.weather_period < 0)
    return "bad weather settings";
  if (c.building_count < 0 || c.building_count > MAX_BUILDINGS)
    return "building_count out of range";

  for (int r = 0; r < ROLE_COUNT; r++) {
    const RoleStats &s = roles.roles[r];
    const std::string name = role_name((Role)r);
    if (s.max_hp < 1)
      return name + ": hp must be at least 1";
    if (s.damage < 0 || s.cost < 0)
      return name + ": damage and cost must be >= 0";
    if (s.steps < 1)
      return name + ": steps must be at least 1";
    const AbilitySpec &a = s.ability;
    if (a.kind >= ABILITY_COUNT)
      return name + ": unknown ability";
    if (a.radius < 0 || a.magnitude < 0.0f)
      return name + ": ability radius and magnitude must be >= 0";
    if (a.kind != ABILITY_NONE && a.kind != ABILITY_VISION && a.period < 1)
      return name + ": ability period must be at least 1";
    if (a.kind == ABILITY_SHIELD && a.magnitude > 1.0f)
      return name + ": shield reduction must be within 0..1";
  }
  return "";
}

} // namespace frontline
