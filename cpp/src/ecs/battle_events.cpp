#include "battle_events.h"
#include "frontline_components.h"
#include <spdlog/spdlog.h>

namespace frontline {

const char *event_name(EventType type) {
  static const char *NAMES[EVENT_TYPE_COUNT] = {
      "spawn", "move", "attack", "attack_hq", "death", "promote", "wall",
      "capture"};
  return type < EVENT_TYPE_COUNT ? NAMES[type] : "unknown";
}

void LogEventSink::on_event(const BattleEvent &ev) {
  spdlog::debug("[Frontline] t={} {} unit={} team={} role={} at ({},{}) "
                "value={}",
                ev.tick, event_name(ev.type), ev.unit_id, (int)ev.team,
                ev.role < ROLE_COUNT ? role_name((Role)ev.role) : "-",
                ev.tile.x, ev.tile.y, ev.value);
}

void emit(flecs::world &w, const BattleEvent &ev) {
  EventSink *sink = w.get<EventHub>().sink;
  if (sink)
    sink->on_event(ev);
}

BattleEvent unit_event(flecs::world &w, EventType type, flecs::entity unit,
                       int value) {
  BattleEvent ev = {};
  ev.type = type;
  ev.tick = w.get<BattleClock>().tick;
  ev.unit_id = unit.get<UnitId>().id;
  ev.team = unit.get<TeamId>().team;
  ev.role = unit.get<RoleId>().role;
  ev.tile = unit.get<Tile>();
  ev.value = value;
  return ev;
}

} // namespace frontline
