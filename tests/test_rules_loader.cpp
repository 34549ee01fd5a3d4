#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "hextactics/core/rules_loader.h"
#include "hextactics/util/digest.h"
#include "hextactics/util/json.h"

#define HT_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

bool contains(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

} // namespace

int test_rules_loader() {
  using namespace hextactics;

  // Shipped rules.
  const RulesTable rules = load_rules_from_file("data/rules/default_rules.json");
  HT_ASSERT(validate_rules(rules).empty());
  HT_ASSERT(rules.units.size() == 7);
  HT_ASSERT(rules.terrains.size() == 15);

  const UnitDef& soldier = rules.unit(1);
  HT_ASSERT(soldier.name == "Soldier");
  HT_ASSERT(soldier.cost == 75);
  HT_ASSERT(soldier.attack_vs_class.at("Light:Land") == 6);
  HT_ASSERT((soldier.action_order == std::vector<std::string>{"move", "attack|capture"}));

  const UnitDef& artillery = rules.unit(4);
  HT_ASSERT(artillery.attack_range == 3);
  HT_ASSERT(artillery.splash_damage == 1);
  HT_ASSERT(artillery.retreat_points == 1.0);

  HT_ASSERT((rules.terrain(kTerrainLandBase).buildable_unit_ids == std::vector<int>{1, 2, 3, 4, 27}));
  const TerrainUnitProperties* base = rules.find_properties(kTerrainLandBase, 1);
  HT_ASSERT(base != nullptr);
  HT_ASSERT(base->can_capture);
  HT_ASSERT(base->defense_bonus == 2);
  HT_ASSERT(base->healing_bonus == 2);

  // Round trip through the writer keeps the table identical.
  const RulesTable again = load_rules_from_json(json::stringify(rules_to_json(rules), 0));
  HT_ASSERT(digest_rules64(again) == digest_rules64(rules));

  // Required sections.
  bool threw = false;
  try {
    load_rules_from_json(R"({"terrains":{"5":{"name":"Grass"}}})");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("units") != std::string::npos;
  }
  HT_ASSERT(threw);

  threw = false;
  try {
    load_rules_from_json(R"({"terrains":{}, "units":{"1":{}}})");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  HT_ASSERT(threw);

  threw = false;
  try {
    load_rules_from_file("data/rules/does_not_exist.json");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  HT_ASSERT(threw);

  // Malformed entries are skipped; defaults fill missing fields.
  const RulesTable partial = load_rules_from_json(R"({
    "terrains": {"5": {"name": "Grass"}, "x": {"name": "Bad"}},
    "units": {"1": {"name": "Scout", "actionOrder": ["move", "dance"]}, "2": 7},
    "terrainUnitProperties": {"5:1": {"movementCost": 2}, "nonsense": {}}
  })");
  HT_ASSERT(partial.terrains.size() == 1);
  HT_ASSERT(partial.units.size() == 1);
  HT_ASSERT(partial.unit(1).unit_class == "Light");
  HT_ASSERT(partial.find_properties(5, 1) != nullptr);
  HT_ASSERT(partial.find_properties(5, 1)->movement_cost == 2.0);

  const std::vector<std::string> problems = validate_rules(partial);
  HT_ASSERT(contains(problems, "unknown action 'dance'"));

  RulesTable dangling = partial;
  dangling.terrains[5].buildable_unit_ids.push_back(99);
  HT_ASSERT(contains(validate_rules(dangling), "unknown buildable unit 99"));

  return 0;
}
