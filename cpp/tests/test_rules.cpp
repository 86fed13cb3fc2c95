// ═════════════════════════════════════════════════════════════
// Category 8: RULES - JSON Loading, Validation & Construction
// ═════════════════════════════════════════════════════════════

TEST_CASE("Cat8: rules JSON overrides defaults") {
  RoleTable roles = default_role_table();
  BattleConfig config;

  const std::string text = R"({
    "battle": {
      "seed": 7,
      "weather": "fog",
      "weather_period": 100,
      "hq_anchor": { "blue": [1, 4] },
      "capture_ticks": 12,
      "buildings": [ { "kind": "depot", "x": 10, "y": 5 } ]
    },
    "roles": [
      { "role": "tank", "hp": 220, "cost": 6 },
      { "role": "medic", "ability": { "period": 30 } }
    ]
  })";

  REQUIRE(parse_rules(text, roles, config));
  CHECK(config.seed == 7);
  CHECK(config.weather == WEATHER_FOG);
  CHECK(config.weather_period == 100);
  CHECK(config.hq_anchor[TEAM_BLUE] == Tile{1, 4});
  CHECK(config.hq_anchor[TEAM_RED] == Tile{-1, -1});
  CHECK(config.capture_ticks == 12);
  CHECK(config.vacate_ticks == 100);
  REQUIRE(config.building_count == 1);
  CHECK(config.buildings[0].kind == BUILDING_DEPOT);
  CHECK(config.buildings[0].tile == Tile{10, 5});

  CHECK(roles[ROLE_TANK].max_hp == 220);
  CHECK(roles[ROLE_TANK].cost == 6);
  CHECK(roles[ROLE_TANK].damage == 20);
  CHECK(roles[ROLE_MEDIC].ability.kind == ABILITY_HEAL);
  CHECK(roles[ROLE_MEDIC].ability.period == 30);
}

TEST_CASE("Cat8: bad rules leave the tables untouched") {
  RoleTable roles = default_role_table();
  BattleConfig config;
  config.seed = 99;
  spdlog::set_level(spdlog::level::off);

  SUBCASE("malformed JSON") {
    CHECK_FALSE(parse_rules("{ \"battle\": ", roles, config));
  }
  SUBCASE("unknown role") {
    CHECK_FALSE(parse_rules(
        R"({"battle": {"seed": 1}, "roles": [{"role": "dragon"}]})", roles,
        config));
  }
  SUBCASE("wrong type") {
    CHECK_FALSE(parse_rules(R"({"battle": {"seed": "seven"}})", roles, config));
  }
  SUBCASE("missing building field") {
    CHECK_FALSE(parse_rules(
        R"({"battle": {"seed": 1, "buildings": [{"kind": "depot", "x": 3}]}})",
        roles, config));
  }
  SUBCASE("unknown weather") {
    CHECK_FALSE(parse_rules(R"({"battle": {"weather": "hail"}})", roles, config));
  }
  SUBCASE("fails validation") {
    CHECK_FALSE(parse_rules(
        R"({"battle": {"seed": 1, "move_cd_min": 30, "move_cd_max": 20}})",
        roles, config));
  }

  CHECK(config.seed == 99);
  CHECK(config.move_cd_min == 10);
  CHECK(config.building_count == 0);
  CHECK(roles[ROLE_TANK].max_hp == 200);
  spdlog::set_level(spdlog::level::warn);
}

TEST_CASE("Cat8: validate_rules") {
  RoleTable roles = default_role_table();
  BattleConfig config;
  CHECK(validate_rules(roles, config).empty());

  SUBCASE("shield over 100%") {
    roles[ROLE_SHIELDBEARER].ability.magnitude = 1.5f;
    CHECK_FALSE(validate_rules(roles, config).empty());
  }
  SUBCASE("zero-period heal") {
    roles[ROLE_MEDIC].ability.period = 0;
    CHECK_FALSE(validate_rules(roles, config).empty());
  }
  SUBCASE("retreat above waver") {
    config.retreat_morale = 50;
    CHECK_FALSE(validate_rules(roles, config).empty());
  }
  SUBCASE("no territory income divisor") {
    config.tiles_per_resource = 0;
    CHECK_FALSE(validate_rules(roles, config).empty());
  }
}

TEST_CASE("Cat8: missing files are reported, not thrown") {
  spdlog::set_level(spdlog::level::off);
  RoleTable roles = default_role_table();
  BattleConfig config;
  TerrainGrid grid;
  CHECK_FALSE(load_rules_file("/nonexistent/rules.json", roles, config));
  CHECK_FALSE(load_terrain_file("/nonexistent/field.txt", grid));
  spdlog::set_level(spdlog::level::warn);
}

TEST_CASE("Cat8: shipped rules and field build a battle") {
  RoleTable roles = default_role_table();
  BattleConfig config;
  TerrainGrid grid;
  REQUIRE(load_rules_file(std::string(FRONTLINE_DATA_DIR) + "/rules.json",
                          roles, config));
  REQUIRE(load_terrain_file(std::string(FRONTLINE_DATA_DIR) + "/field.txt",
                            grid));
  CHECK(grid.width == 40);
  CHECK(grid.height == 30);
  CHECK(config.building_count == 4);
  CHECK(roles[ROLE_COMMANDER].ability.kind == ABILITY_COMMAND);

  Battle battle(grid, roles, config);
  CHECK(battle.get_hq_anchor(TEAM_BLUE) == Tile{1, 14});
  CHECK(battle.get_hq_anchor(TEAM_RED) == Tile{37, 14});
  CHECK(battle.get_alive_count(TEAM_BLUE) == config.initial_units);
  CHECK(battle.get_alive_count(TEAM_RED) == config.initial_units);
  CHECK(battle.get_hq_health(TEAM_RED) == 500);
  CHECK_FALSE(battle.is_game_over());
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat8: construction rejects bad setups") {
  SUBCASE("invalid rules") {
    config.hq_max_hp = 0;
    CHECK_THROWS_AS(start(), std::invalid_argument);
  }
  SUBCASE("map too small") {
    CHECK_THROWS_AS(start({"...", "..."}), std::invalid_argument);
  }
  SUBCASE("default anchors on a narrow map") {
    CHECK_THROWS_AS(start(open_field(5, 2)), std::invalid_argument);
  }
  SUBCASE("overlapping HQs") {
    config.hq_anchor[TEAM_BLUE] = {4, 2};
    config.hq_anchor[TEAM_RED] = {5, 3};
    CHECK_THROWS_AS(start(), std::invalid_argument);
  }
  SUBCASE("HQ off the map") {
    config.hq_anchor[TEAM_RED] = {11, 2};
    CHECK_THROWS_AS(start(), std::invalid_argument);
  }
  SUBCASE("building on a wall") {
    config.building_count = 1;
    config.buildings[0] = {{6, 0}, BUILDING_WATCHTOWER};
    CHECK_THROWS_AS(start({"......#.....", "............", "............",
                           "............", "............", "............",
                           "............"}),
                    std::invalid_argument);
  }
  SUBCASE("building on an HQ") {
    config.building_count = 1;
    config.buildings[0] = {{2, 3}, BUILDING_DEPOT};
    CHECK_THROWS_AS(start(), std::invalid_argument);
  }
  SUBCASE("HQs walled apart") {
    CHECK_THROWS_AS(start({"......#.....", "......#.....", "......#.....",
                           "......#.....", "......#.....", "......#.....",
                           "......#....."}),
                    std::runtime_error);
  }
  CHECK(!battle);
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat8: HQ tiles are carved out of walls") {
  start({"............", "............", ".##.......##", ".##.......##",
         "............", "............", "............"});
  CHECK(walkable(battle->terrain(), {1, 2}));
  CHECK(walkable(battle->terrain(), {10, 3}));
}

TEST_CASE_FIXTURE(BattleTestHarness, "Cat8: smallest grids that hold both HQs") {
  SUBCASE("default anchors") {
    start(open_field(6, 2));
    CHECK(battle->get_hq_anchor(TEAM_BLUE) == Tile{1, 0});
    CHECK(battle->get_hq_anchor(TEAM_RED) == Tile{3, 0});
  }
  SUBCASE("explicit anchors") {
    config.hq_anchor[TEAM_BLUE] = {0, 0};
    config.hq_anchor[TEAM_RED] = {2, 0};
    start(open_field(4, 2));
    CHECK(battle->get_hq_anchor(TEAM_RED) == Tile{2, 0});
  }
  CHECK_FALSE(battle->is_game_over());
}
