#pragma once

#include <string>
#include <vector>

#include "hextactics/core/rules.h"
#include "hextactics/util/json.h"

namespace hextactics {

// Load a rules table from a JSON document of the form
//
//   {
//     "terrains": { "<id>": { "name", "type", "buildableUnitIds" } },
//     "units": { "<id>": { "name", "unitClass", "unitTerrain", "health",
//                          "movementPoints", "retreatPoints", "attackRange",
//                          "defense", "coins", "splashDamage", "actionOrder",
//                          "attackVsClass": { "<class>:<terrain>": n } } },
//     "terrainUnitProperties": { "<terrain>:<unit>": { "movementCost",
//                          "attackBonus", "defenseBonus", "healingBonus",
//                          "canCapture", "canBuild" } }
//   }
//
// Throws std::runtime_error on malformed JSON or when "units" or "terrains"
// is missing or empty. Individual malformed entries are skipped with a warning.
RulesTable load_rules_from_json(const std::string& text);
RulesTable load_rules_from_file(const std::string& path);

json::Value rules_to_json(const RulesTable& rules);

// Consistency problems (dangling ids, unknown actions). Empty = OK.
std::vector<std::string> validate_rules(const RulesTable& rules);

} // namespace hextactics
