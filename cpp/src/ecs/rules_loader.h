#ifndef FRONTLINE_RULES_LOADER_H
#define FRONTLINE_RULES_LOADER_H

#include "frontline_rules.h"
#include <string>

namespace frontline {

// Applies a JSON document on top of `roles` / `config`. Both are left
// untouched on failure. Errors are logged.
//
//   { "battle": { "seed": 7, "weather": "fog", "hq_anchor": {"blue": [1,4]},
//                 "buildings": [{"kind": "depot", "x": 10, "y": 5}], ... },
//     "roles":  [ {"role": "tank", "hp": 220, "ability": {"kind": "none"}} ] }
bool parse_rules(const std::string &text, RoleTable &roles,
                 BattleConfig &config);
bool load_rules_file(const std::string &path, RoleTable &roles,
                     BattleConfig &config);

// One row per line, glyphs '.', '#', 'f'. Blank lines are ignored.
bool load_terrain_file(const std::string &path, TerrainGrid &out);

// Empty when valid, otherwise the first problem found.
std::string validate_rules(const RoleTable &roles, const BattleConfig &config);

} // namespace frontline

#endif // FRONTLINE_RULES_LOADER_H
