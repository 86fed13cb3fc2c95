#ifndef FRONTLINE_BATTLE_H
#define FRONTLINE_BATTLE_H

#include "battle_events.h"
#include "frontline_components.h"
#include <flecs.h>
#include <vector>

namespace frontline {

struct UnitSnapshot {
  uint32_t id;
  uint8_t team;
  Role role;
  Tile tile;
  int hp;
  int max_hp;
  int morale;
  bool supplied;
  bool veteran;
};

// Owns one battle: the flecs world, its singletons, systems and observer.
// Single-threaded; drive it with advance_tick().
class Battle {
private:
  flecs::world ecs;
  flecs::observer death_observer;

  void init_ecs(const TerrainGrid &terrain, const RoleTable &roles,
                const BattleConfig &config);

public:
  // Throws std::invalid_argument for rejected rules or placements and
  // std::runtime_error when the two HQs cannot reach each other.
  Battle(const TerrainGrid &terrain, const RoleTable &roles,
         const BattleConfig &config);
  ~Battle();

  Battle(const Battle &) = delete;
  Battle &operator=(const Battle &) = delete;

  // --- Lifecycle ---
  void advance_tick(); // no-op once the battle is over
  bool is_game_over() const;
  bool is_game_over(uint8_t &winner) const;
  OutcomeReason outcome_reason() const;
  void stop(); // ends the battle with no winner

  // --- Units ---
  // Null entity when the tile is out of bounds, blocked or occupied.
  flecs::entity spawn_unit(uint8_t team, Role role, Tile tile);
  // False when the unit is already gone.
  bool remove_unit(flecs::entity unit);
  std::vector<UnitSnapshot> snapshot() const;

  // Non-owning; nullptr detaches.
  void attach_event_sink(EventSink *sink);

  // --- Queries ---
  uint64_t tick() const;
  int get_alive_count(uint8_t team) const;
  int get_resources(uint8_t team) const;
  int get_hq_health(uint8_t team) const;
  Tile get_hq_anchor(uint8_t team) const;
  uint8_t tile_owner(Tile t) const;
  uint8_t building_owner(int index) const;
  bool is_visible(uint8_t team, Tile t) const;
  bool is_supplied(uint8_t team, Tile t) const;
  Weather weather() const;
  const TerrainGrid &terrain() const;

  flecs::world &world() { return ecs; }
};

} // namespace frontline

#endif // FRONTLINE_BATTLE_H
