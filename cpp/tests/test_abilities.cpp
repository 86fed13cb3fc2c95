// ═════════════════════════════════════════════════════════════
// Category 5: ABILITIES & FOG - Heal, Repair, Walls, Vision
// ═════════════════════════════════════════════════════════════

static int count_walls(const TerrainGrid &grid) {
  int walls = 0;
  for (int i = 0; i < grid.tile_count(); i++) {
    if (grid.kind[i] == TERRAIN_WALL)
      walls++;
  }
  return walls;
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: medic heals on its period") {
  start();
  spawn(TEAM_BLUE, ROLE_MEDIC, 3, 2);
  flecs::entity patient = spawn(TEAM_BLUE, ROLE_INFANTRY, 3, 3);
  patient.ensure<Health>().hp = 50;

  step(59);
  CHECK(hp(patient) == 50);
  step(1);
  CHECK(hp(patient) == 51);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: heal never exceeds max hp") {
  roles[ROLE_MEDIC].ability.magnitude = 500.0f;
  start();
  spawn(TEAM_BLUE, ROLE_MEDIC, 3, 2);
  flecs::entity patient = spawn(TEAM_BLUE, ROLE_INFANTRY, 3, 3);
  patient.ensure<Health>().hp = 50;

  step(60);
  CHECK(hp(patient) == 100);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: repair bot restores its own HQ") {
  start();
  world().ensure<HQs>().hq[TEAM_BLUE].hp = 400;
  spawn(TEAM_BLUE, ROLE_REPAIR_BOT, 3, 2);

  step(59);
  CHECK(battle->get_hq_health(TEAM_BLUE) == 400);
  step(1);
  CHECK(battle->get_hq_health(TEAM_BLUE) == 402);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: repair bot out of range does nothing") {
  start();
  world().ensure<HQs>().hq[TEAM_BLUE].hp = 400;
  spawn(TEAM_BLUE, ROLE_REPAIR_BOT, 6, 3);

  step(120);
  CHECK(battle->get_hq_health(TEAM_BLUE) == 400);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: engineer raises one adjacent wall") {
  start();
  spawn(TEAM_BLUE, ROLE_BARRIER_ENGINEER, 5, 3);

  step(299);
  CHECK(count_walls(battle->terrain()) == 0);
  step(1);
  CHECK(count_walls(battle->terrain()) == 1);
  REQUIRE(sink.count(EVENT_WALL) == 1);

  Tile wall = {-1, -1};
  for (const BattleEvent &ev : sink.events) {
    if (ev.type == EVENT_WALL)
      wall = ev.tile;
  }
  CHECK(manhattan(wall, {5, 3}) == 1);
  CHECK(terrain_kind(battle->terrain(), wall) == TERRAIN_WALL);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: wall only lands on a free tile") {
  start();
  spawn(TEAM_BLUE, ROLE_BARRIER_ENGINEER, 5, 3);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 6, 3);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 4, 3);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 2);

  step(300);
  CHECK(terrain_kind(battle->terrain(), {5, 4}) == TERRAIN_WALL);
  CHECK(count_walls(battle->terrain()) == 1);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: spotter sees further, fog cuts it") {
  SUBCASE("clear") {
    start();
    spawn(TEAM_BLUE, ROLE_SPOTTER, 5, 3);
    step(1);
    CHECK(battle->is_visible(TEAM_BLUE, {11, 3}));
    CHECK(battle->is_visible(TEAM_BLUE, {5, 3}));
    CHECK_FALSE(battle->is_visible(TEAM_RED, {0, 6}));
  }
  SUBCASE("plain infantry") {
    start();
    spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
    step(1);
    CHECK_FALSE(battle->is_visible(TEAM_BLUE, {11, 3}));
    CHECK(battle->is_visible(TEAM_BLUE, {10, 3}));
  }
  SUBCASE("fog") {
    config.weather = WEATHER_FOG;
    start();
    spawn(TEAM_BLUE, ROLE_SPOTTER, 5, 3);
    step(1);
    CHECK(battle->weather() == WEATHER_FOG);
    CHECK_FALSE(battle->is_visible(TEAM_BLUE, {11, 3}));
    CHECK(battle->is_visible(TEAM_BLUE, {10, 3}));
  }
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: owned watchtower extends vision") {
  config.capture_ticks = 1;
  config.building_count = 1;
  config.buildings[0] = {{5, 3}, BUILDING_WATCHTOWER};
  start();
  spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);

  // Fog is computed before capture within a tick
  step(1);
  CHECK(battle->building_owner(0) == TEAM_BLUE);
  CHECK_FALSE(battle->is_visible(TEAM_BLUE, {11, 2}));
  step(1);
  CHECK(battle->is_visible(TEAM_BLUE, {11, 2}));
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: enemies are only engaged when seen") {
  TileMask goals;

  SUBCASE("in sight") {
    start();
    flecs::entity hunter = spawn(TEAM_BLUE, ROLE_INFANTRY, 4, 5);
    spawn(TEAM_RED, ROLE_INFANTRY, 8, 5);
    step(1);
    CHECK(select_target(world(), hunter, goals) == GOAL_ENGAGE);
    CHECK(goals[battle->terrain().index({7, 5})]);
  }
  SUBCASE("out of sight") {
    config.vision_radius = 2;
    config.min_vision_radius = 1;
    start();
    flecs::entity hunter = spawn(TEAM_BLUE, ROLE_INFANTRY, 4, 5);
    spawn(TEAM_RED, ROLE_INFANTRY, 8, 5);
    step(1);
    CHECK(select_target(world(), hunter, goals) == GOAL_HOLD);
    CHECK(goals[battle->terrain().index({3, 3})]);
  }
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: visible threat near the HQ is defended") {
  // Wide field: the threat is out of the defender's engage range
  TileMask goals;
  GoalKind expected = GOAL_DEFEND;
  SUBCASE("within defend_radius") {}
  SUBCASE("beyond defend_radius") {
    config.defend_radius = 2;
    expected = GOAL_HOLD;
  }

  start(open_field(20, 7));
  flecs::entity defender = spawn(TEAM_BLUE, ROLE_INFANTRY, 12, 3);
  spawn(TEAM_RED, ROLE_INFANTRY, 5, 3);
  step(1);
  REQUIRE(battle->is_visible(TEAM_BLUE, {5, 3}));

  CHECK(select_target(world(), defender, goals) == expected);
  if (expected == GOAL_DEFEND) {
    CHECK(goals.count() == 4);
    CHECK(goals[battle->terrain().index({4, 3})]);
    CHECK(goals[battle->terrain().index({6, 3})]);
  }
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: short-handed units regroup") {
  TileMask goals;
  start();
  flecs::entity straggler = spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 0);

  SUBCASE("ally too far") {
    spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 6);
    CHECK(select_target(world(), straggler, goals) == GOAL_REGROUP);
    CHECK(goals[battle->terrain().index({5, 5})]);
    CHECK(goals[battle->terrain().index({4, 6})]);
    CHECK_FALSE(goals[battle->terrain().index({5, 1})]);
  }
  SUBCASE("ally within regroup_distance") {
    spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 4);
    CHECK(select_target(world(), straggler, goals) == GOAL_HOLD);
  }
  SUBCASE("roster at safety_roster") {
    spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 6);
    spawn(TEAM_BLUE, ROLE_INFANTRY, 8, 6);
    CHECK(battle->get_alive_count(TEAM_BLUE) == 3);
    CHECK(select_target(world(), straggler, goals) == GOAL_HOLD);
  }
  SUBCASE("alone") {
    CHECK(select_target(world(), straggler, goals) == GOAL_HOLD);
  }
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat5: a full roster advances on the enemy HQ") {
  TileMask goals;
  start();
  flecs::entity lead = spawn(TEAM_BLUE, ROLE_INFANTRY, 4, 0);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 0);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 6, 0);
  spawn(TEAM_BLUE, ROLE_INFANTRY, 4, 6);

  SUBCASE("below offense_roster") {
    CHECK(select_target(world(), lead, goals) == GOAL_HOLD);
  }
  SUBCASE("at offense_roster") {
    spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 6);
    CHECK(select_target(world(), lead, goals) == GOAL_ADVANCE);
    CHECK(goals.count() == 4);
    CHECK(goals[battle->terrain().index({9, 2})]);
    CHECK(goals[battle->terrain().index({10, 3})]);
  }
}
