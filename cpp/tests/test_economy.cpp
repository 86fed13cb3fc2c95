// ═════════════════════════════════════════════════════════════
// Category 6: ECONOMY - Spawning, Income & Rollback
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: spawn refuses blocked tiles") {
  start({"............", "............", "......#.....", "............",
         "............", "............", "............"});
  spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);

  CHECK(battle->spawn_unit(TEAM_RED, ROLE_INFANTRY, {5, 3}).id() == 0);
  CHECK(battle->spawn_unit(TEAM_RED, ROLE_INFANTRY, {6, 2}).id() == 0);
  CHECK(battle->spawn_unit(TEAM_RED, ROLE_INFANTRY, {12, 0}).id() == 0);
  CHECK(battle->spawn_unit(TEAM_RED, ROLE_COUNT, {7, 0}).id() == 0);
  CHECK(battle->get_alive_count(TEAM_RED) == 0);
  CHECK(sink.count(EVENT_SPAWN) == 1);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: spawned units carry role stats") {
  start();
  flecs::entity tank = spawn(TEAM_RED, ROLE_TANK, 7, 4, false);
  CHECK(tank.has<IsAlive>());
  CHECK(tank.get<Health>().hp == 200);
  CHECK(tank.get<Weapon>().damage == 20);
  CHECK(tank.get<Morale>().value == 75);
  CHECK(tank.get<TeamId>().team == TEAM_RED);

  flecs::entity scout = spawn(TEAM_RED, ROLE_SCOUT, 7, 5, false);
  CHECK(scout.get<UnitId>().id > tank.get<UnitId>().id);
  CHECK(scout.get<Mobility>().steps == 2);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: income tick buys a unit") {
  config.auto_spawn = true;
  start();

  step(59);
  CHECK(battle->get_alive_count(TEAM_BLUE) == 0);
  CHECK(battle->get_resources(TEAM_BLUE) == 10);

  step(1);
  REQUIRE(battle->get_alive_count(TEAM_BLUE) == 1);
  CHECK(battle->snapshot().size() == 2);
  REQUIRE(sink.count(EVENT_SPAWN) == 2);

  BattleEvent spawned = {};
  for (const BattleEvent &ev : sink.events) {
    if (ev.type == EVENT_SPAWN && ev.team == TEAM_BLUE)
      spawned = ev;
  }
  CHECK(spawned.tick == 60);
  CHECK(battle->get_resources(TEAM_BLUE) == 11 - roles[(Role)spawned.role].cost);

  // Spawned inside the spawn box, never on the HQ
  const Tile hq = battle->get_hq_anchor(TEAM_BLUE);
  const Tile at = spawned.tile;
  CHECK(at.x >= hq.x - config.spawn_margin);
  CHECK(at.x <= hq.x + 1 + config.spawn_margin);
  CHECK(at.y >= hq.y - config.spawn_margin);
  CHECK(at.y <= hq.y + 1 + config.spawn_margin);
  CHECK_FALSE((at.x >= hq.x && at.x <= hq.x + 1 && at.y >= hq.y &&
               at.y <= hq.y + 1));
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: full spawn box keeps the resources") {
  config.auto_spawn = true;
  start({"############", "#..........#", "#..######..#", "############"});
  spawn(TEAM_BLUE, ROLE_INFANTRY, 3, 1);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 4, 1);

  step(60);
  CHECK(battle->get_resources(TEAM_BLUE) == 11);
  CHECK(battle->get_alive_count(TEAM_BLUE) == 2);
  CHECK(battle->get_alive_count(TEAM_RED) == 1);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: depots add income to their owner") {
  config.capture_ticks = 1;
  config.territory_income_interval = 0;
  config.building_count = 1;
  config.buildings[0] = {{5, 3}, BUILDING_DEPOT};
  start();
  spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);

  step(60);
  CHECK(battle->building_owner(0) == TEAM_BLUE);
  CHECK(battle->get_resources(TEAM_BLUE) == 13);
  CHECK(battle->get_resources(TEAM_RED) == 11);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: held territory pays out") {
  config.capture_ticks = 1;
  config.tiles_per_resource = 1;
  config.income_interval = 0;
  start();
  spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 6, 5);

  step(49);
  CHECK(battle->get_resources(TEAM_BLUE) == 10);
  step(1);
  CHECK(battle->get_resources(TEAM_BLUE) == 12);
  CHECK(battle->get_resources(TEAM_RED) == 10); // HQ tiles do not count
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat6: initial deployment is free") {
  config.initial_units = 3;
  start();
  CHECK(battle->get_alive_count(TEAM_BLUE) == 3);
  CHECK(battle->get_alive_count(TEAM_RED) == 3);
  CHECK(battle->get_resources(TEAM_BLUE) == 10);
  CHECK(battle->get_resources(TEAM_RED) == 10);
  CHECK(battle->tick() == 0);
}

TEST_CASE_FIXTURE(BattleTestHarness,
                  "Cat6: an empty roster loses even with resources to spend") {
  config.auto_spawn = true;
  start();
  flecs::entity blue = spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
  spawn(TEAM_RED, ROLE_INFANTRY, 8, 5);
  CHECK(battle->remove_unit(blue));
  REQUIRE(battle->get_resources(TEAM_BLUE) >= roles[ROLE_SCOUT].cost);

  step(1);
  uint8_t winner = NO_TEAM;
  CHECK(battle->is_game_over(winner));
  CHECK(winner == TEAM_RED);
  CHECK(battle->outcome_reason() == OUTCOME_ELIMINATED);
}

TEST_CASE_FIXTURE(BattleTestHarness,
                  "Cat6: a side that never fielded a unit is not eliminated") {
  start();
  spawn(TEAM_RED, ROLE_INFANTRY, 8, 5);

  step(5);
  CHECK_FALSE(battle->is_game_over());
}
