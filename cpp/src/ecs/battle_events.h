#ifndef FRONTLINE_BATTLE_EVENTS_H
#define FRONTLINE_BATTLE_EVENTS_H

#include "../core/grid.h"
#include <flecs.h>

namespace frontline {

enum EventType : uint8_t {
  EVENT_SPAWN = 0,
  EVENT_MOVE,
  EVENT_ATTACK,    // value = damage dealt
  EVENT_ATTACK_HQ, // value = HQ hp left
  EVENT_DEATH,
  EVENT_PROMOTE,
  EVENT_WALL,    // tile = the new wall
  EVENT_CAPTURE, // team = new owner (NO_TEAM when lost), value = building index or -1
  EVENT_TYPE_COUNT
};

const char *event_name(EventType type);

struct BattleEvent {
  EventType type;
  uint64_t tick;
  uint32_t unit_id; // 0 for tile/building events
  uint8_t team;
  uint8_t role;
  Tile tile;
  int value;
};

// Telemetry collaborator. Must not throw back into the tick.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void on_event(const BattleEvent &ev) = 0;
};

// Forwards every event to spdlog at debug level.
class LogEventSink : public EventSink {
public:
  void on_event(const BattleEvent &ev) override;
};

// No-op when no sink is attached.
void emit(flecs::world &w, const BattleEvent &ev);

// Fills tick/unit/team/role/tile from a unit entity.
BattleEvent unit_event(flecs::world &w, EventType type, flecs::entity unit,
                       int value = 0);

} // namespace frontline

#endif // FRONTLINE_BATTLE_EVENTS_H
