// ═════════════════════════════════════════════════════════════
// Category 3: COMBAT - Strikes, Auras, Siege & Promotion
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(BattleTestHarness,
                  "Cat3: adjacent infantry trade blows on the cooldown") {
  start();
  flecs::entity blue = spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
  flecs::entity red = spawn(TEAM_RED, ROLE_INFANTRY, 6, 3);

  step(1);
  CHECK(hp(blue) == 90);
  CHECK(hp(red) == 90);

  // attack_cooldown = 5: nothing lands on ticks 2..5
  step(4);
  CHECK(hp(blue) == 90);
  CHECK(hp(red) == 90);

  step(1);
  CHECK(hp(blue) == 80);
  CHECK(hp(red) == 80);
  CHECK(sink.count(EVENT_ATTACK) == 4);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: shield halves damage while alive") {
  start();
  flecs::entity shield = spawn(TEAM_BLUE, ROLE_SHIELDBEARER, 4, 3);
  flecs::entity blue = spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
  flecs::entity red = spawn(TEAM_RED, ROLE_INFANTRY, 6, 3);

  step(1);
  CHECK(hp(blue) == 95);
  CHECK(hp(red) == 90);

  // Aura is recomputed every tick: gone with its source
  CHECK(battle->remove_unit(shield));
  step(5);
  CHECK(hp(blue) == 85);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: shieldbearer does not shield itself") {
  start();
  flecs::entity shield = spawn(TEAM_BLUE, ROLE_SHIELDBEARER, 5, 3);
  flecs::entity red = spawn(TEAM_RED, ROLE_INFANTRY, 6, 3);

  step(1);
  CHECK(hp(shield) == 110);
  CHECK(hp(red) == 94);
  CHECK(shield.get<Auras>().damage_reduction == doctest::Approx(0.0f));
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: commander aura boosts allies only") {
  start();
  spawn(TEAM_BLUE, ROLE_COMMANDER, 4, 3);
  flecs::entity blue = spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
  flecs::entity red = spawn(TEAM_RED, ROLE_INFANTRY, 6, 3);

  step(1);
  CHECK(hp(red) == 88); // (int)(10 * 1.25)
  CHECK(hp(blue) == 90);
  CHECK(blue.get<Auras>().hasted);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: siege every third tick ends the battle") {
  start();
  world().ensure<HQs>().hq[TEAM_RED].hp = 10;
  spawn(TEAM_BLUE, ROLE_TANK, 9, 2);

  step(2);
  CHECK_FALSE(battle->is_game_over());
  CHECK(battle->get_hq_health(TEAM_RED) == 10);

  step(1);
  uint8_t winner = NO_TEAM;
  CHECK(battle->is_game_over(winner));
  CHECK(winner == TEAM_BLUE);
  CHECK(battle->outcome_reason() == OUTCOME_HQ_DESTROYED);
  CHECK(battle->get_hq_health(TEAM_RED) == 0);
  CHECK(sink.count(EVENT_ATTACK_HQ) == 1);

  // Further ticks are no-ops
  step(10);
  CHECK(battle->tick() == 3);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: leaving the footprint resets siege") {
  start();
  flecs::entity tank = spawn(TEAM_BLUE, ROLE_TANK, 9, 2);

  step(2);
  CHECK(tank.get<Siege>().counter == 2);

  // Teleport off the footprint (occupancy is rebuilt next tick)
  tank.ensure<Tile>() = {7, 2};
  step(1);
  CHECK(tank.get<Siege>().counter == 0);
  CHECK(battle->get_hq_health(TEAM_RED) == 500);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: third kill promotes to veteran") {
  start();
  flecs::entity tank = spawn(TEAM_BLUE, ROLE_TANK, 5, 3);
  for (Tile t : {Tile{6, 3}, Tile{4, 3}, Tile{5, 4}}) {
    flecs::entity scout = spawn(TEAM_RED, ROLE_SCOUT, t.x, t.y);
    scout.ensure<Health>().hp = 1;
  }

  step(6);
  CHECK(tank.get<Weapon>().kills == 2);
  CHECK_FALSE(tank.has<Veteran>());

  step(5);
  CHECK(tank.get<Weapon>().kills == 3);
  CHECK(tank.has<Veteran>());
  CHECK(tank.get<Health>().max_hp == 250);
  CHECK(tank.get<Weapon>().damage == 25);
  CHECK(sink.count(EVENT_PROMOTE) == 1);

  uint8_t winner = NO_TEAM;
  CHECK(battle->is_game_over(winner));
  CHECK(winner == TEAM_BLUE);
  CHECK(battle->outcome_reason() == OUTCOME_ELIMINATED);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat3: a killed unit never acts again") {
  start();
  flecs::entity blue = spawn(TEAM_BLUE, ROLE_INFANTRY, 5, 3);
  flecs::entity red = spawn(TEAM_RED, ROLE_INFANTRY, 6, 3);
  red.ensure<Health>().hp = 5;
  spawn(TEAM_RED, ROLE_INFANTRY, 10, 6); // keeps Red in the battle

  step(1);
  CHECK(hp(blue) == 100);
  CHECK_FALSE(red.is_alive()); // swept the same tick
  CHECK(battle->get_alive_count(TEAM_RED) == 1);
  CHECK(world().get<Factions>().side[TEAM_RED].losses == 1);
  CHECK(world().get<Factions>().side[TEAM_BLUE].kills == 1);

  // The tile was freed the moment it died
  CHECK(world().get<OccupancyGrid>().occupant[battle->terrain().index({6, 3})] ==
        0);
}
