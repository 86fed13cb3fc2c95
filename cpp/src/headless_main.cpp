// Headless tick driver: loads rules + terrain, runs one battle, logs the
// result.
//
//   frontline_headless <rules.json> <field.txt> [max_ticks] [-v]

#include "ecs/battle.h"
#include "ecs/rules_loader.h"
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

using namespace frontline;

int main(int argc, char **argv) {
  std::string rules_path;
  std::string terrain_path;
  uint64_t max_ticks = 20000;
  bool verbose = false;

  int positional = 0;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "-v") {
      verbose = true;
    } else if (positional == 0) {
      rules_path = arg;
      positional++;
    } else if (positional == 1) {
      terrain_path = arg;
      positional++;
    } else if (positional == 2) {
      max_ticks = std::strtoull(arg.c_str(), nullptr, 10);
      positional++;
    }
  }
  if (positional < 2) {
    spdlog::error("usage: {} <rules.json> <field.txt> [max_ticks] [-v]",
                  argv[0]);
    return 2;
  }
  if (verbose)
    spdlog::set_level(spdlog::level::debug);

  RoleTable roles = default_role_table();
  BattleConfig config;
  TerrainGrid terrain;
  if (!load_rules_file(rules_path, roles, config) ||
      !load_terrain_file(terrain_path, terrain))
    return 1;

  try {
    Battle battle(terrain, roles, config);
    LogEventSink sink;
    if (verbose)
      battle.attach_event_sink(&sink);

    uint8_t winner = NO_TEAM;
    while (!battle.is_game_over(winner) && battle.tick() < max_ticks)
      battle.advance_tick();
    if (!battle.is_game_over())
      battle.stop();

    spdlog::info("[Frontline] Finished at tick {}: winner {}, Blue {} units / "
                 "HQ {}, Red {} units / HQ {}",
                 battle.tick(),
                 winner == TEAM_BLUE ? "Blue"
                 : winner == TEAM_RED ? "Red"
                                      : "none",
                 battle.get_alive_count(TEAM_BLUE),
                 battle.get_hq_health(TEAM_BLUE),
                 battle.get_alive_count(TEAM_RED),
                 battle.get_hq_health(TEAM_RED));
    battle.attach_event_sink(nullptr);
  } catch (const std::invalid_argument &e) {
    spdlog::error("[Frontline] Rejected battle setup: {}", e.what());
    return 1;
  } catch (const std::runtime_error &e) {
    spdlog::error("[Frontline] Unplayable terrain: {}", e.what());
    return 1;
  }
  return 0;
}
