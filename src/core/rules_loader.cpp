#include "hextactics/core/rules_loader.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "hextactics/util/file_io.h"
#include "hextactics/util/log.h"
#include "hextactics/util/sorted_keys.h"
#include "hextactics/util/strings.h"

namespace hextactics {
namespace {

bool parse_id(const std::string& s, int* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') return false;
  *out = static_cast<int>(v);
  return true;
}

int int_field(const json::Value& obj, const char* key, int def) {
  const json::Value* v = obj.find(key);
  return v ? static_cast<int>(v->int_value(def)) : def;
}

double number_field(const json::Value& obj, const char* key, double def) {
  const json::Value* v = obj.find(key);
  return v ? v->number_value(def) : def;
}

std::string string_field(const json::Value& obj, const char* key, const std::string& def = "") {
  const json::Value* v = obj.find(key);
  return v ? v->string_value(def) : def;
}

bool bool_field(const json::Value& obj, const char* key, bool def) {
  const json::Value* v = obj.find(key);
  return v ? v->bool_value(def) : def;
}

TerrainDef parse_terrain(int id, const json::Value& tj) {
  TerrainDef t;
  t.id = id;
  t.name = string_field(tj, "name", "Terrain " + std::to_string(id));
  t.type = string_field(tj, "type", "nature");
  if (const json::Value* b = tj.find("buildableUnitIds")) {
    for (const auto& e : b->array()) t.buildable_unit_ids.push_back(static_cast<int>(e.int_value()));
  }
  return t;
}

UnitDef parse_unit(int id, const json::Value& uj) {
  UnitDef u;
  u.id = id;
  u.name = string_field(uj, "name", "Unit " + std::to_string(id));
  u.unit_class = string_field(uj, "unitClass", "Light");
  u.unit_terrain = string_field(uj, "unitTerrain", "Land");
  u.health = int_field(uj, "health", u.health);
  u.movement_points = number_field(uj, "movementPoints", u.movement_points);
  u.retreat_points = number_field(uj, "retreatPoints", u.retreat_points);
  u.attack_range = int_field(uj, "attackRange", u.attack_range);
  u.defense = int_field(uj, "defense", u.defense);
  u.cost = int_field(uj, "coins", u.cost);
  u.splash_damage = int_field(uj, "splashDamage", u.splash_damage);
  if (const json::Value* ao = uj.find("actionOrder")) {
    for (const auto& e : ao->array()) u.action_order.push_back(e.string_value());
  }
  if (const json::Value* avc = uj.find("attackVsClass")) {
    for (const auto& [k, v] : avc->object()) u.attack_vs_class[k] = static_cast<int>(v.int_value());
  }
  return u;
}

TerrainUnitProperties parse_properties(int terrain_id, int unit_id, const json::Value& pj) {
  TerrainUnitProperties p;
  p.terrain_id = terrain_id;
  p.unit_id = unit_id;
  p.movement_cost = number_field(pj, "movementCost", p.movement_cost);
  p.attack_bonus = int_field(pj, "attackBonus", 0);
  p.defense_bonus = int_field(pj, "defenseBonus", 0);
  p.healing_bonus = int_field(pj, "healingBonus", 0);
  p.can_capture = bool_field(pj, "canCapture", false);
  p.can_build = bool_field(pj, "canBuild", false);
  return p;
}

bool is_known_action(const std::string& a) {
  return a == kActionMove || a == kActionAttack || a == kActionCapture || a == kActionBuild || a == kActionHeal ||
         a == kActionRetreat;
}

} // namespace

RulesTable load_rules_from_json(const std::string& text) {
  const json::Value root = json::parse(text);
  if (!root.is_object()) throw std::runtime_error("rules: document root must be an object");

  const json::Value* terrains = root.find("terrains");
  const json::Value* units = root.find("units");
  if (!terrains || !terrains->is_object() || terrains->object().empty()) {
    throw std::runtime_error("rules: missing or empty 'terrains'");
  }
  if (!units || !units->is_object() || units->object().empty()) {
    throw std::runtime_error("rules: missing or empty 'units'");
  }

  RulesTable rules;
  for (const auto& [key, tj] : terrains->object()) {
    int id = 0;
    if (!parse_id(key, &id) || !tj.is_object()) {
      log::warn("rules: skipping terrain entry '" + key + "'");
      continue;
    }
    rules.terrains[id] = parse_terrain(id, tj);
  }
  for (const auto& [key, uj] : units->object()) {
    int id = 0;
    if (!parse_id(key, &id) || !uj.is_object()) {
      log::warn("rules: skipping unit entry '" + key + "'");
      continue;
    }
    rules.units[id] = parse_unit(id, uj);
  }

  if (const json::Value* props = root.find("terrainUnitProperties")) {
    for (const auto& [key, pj] : props->object()) {
      const std::size_t colon = key.find(':');
      int terrain_id = 0;
      int unit_id = 0;
      if (colon == std::string::npos || !parse_id(key.substr(0, colon), &terrain_id) ||
          !parse_id(key.substr(colon + 1), &unit_id) || !pj.is_object()) {
        log::warn("rules: skipping terrain/unit properties entry '" + key + "'");
        continue;
      }
      rules.add_properties(parse_properties(terrain_id, unit_id, pj));
    }
  }

  log::info("rules: loaded " + std::to_string(rules.terrains.size()) + " terrains, " +
            std::to_string(rules.units.size()) + " units, " +
            std::to_string(rules.terrain_unit_properties.size()) + " terrain/unit properties");
  return rules;
}

RulesTable load_rules_from_file(const std::string& path) { return load_rules_from_json(read_text_file(path)); }

json::Value rules_to_json(const RulesTable& rules) {
  json::Object terrains;
  for (int id : util::sorted_keys(rules.terrains)) {
    const TerrainDef& t = rules.terrains.at(id);
    json::Array buildable;
    for (int b : t.buildable_unit_ids) buildable.push_back(static_cast<double>(b));
    json::Object o;
    o["name"] = t.name;
    o["type"] = t.type;
    o["buildableUnitIds"] = json::array(std::move(buildable));
    terrains[std::to_string(id)] = json::object(std::move(o));
  }

  json::Object units;
  for (int id : util::sorted_keys(rules.units)) {
    const UnitDef& u = rules.units.at(id);
    json::Object o;
    o["name"] = u.name;
    o["unitClass"] = u.unit_class;
    o["unitTerrain"] = u.unit_terrain;
    o["health"] = static_cast<double>(u.health);
    o["movementPoints"] = u.movement_points;
    o["retreatPoints"] = u.retreat_points;
    o["attackRange"] = static_cast<double>(u.attack_range);
    o["defense"] = static_cast<double>(u.defense);
    o["coins"] = static_cast<double>(u.cost);
    o["splashDamage"] = static_cast<double>(u.splash_damage);
    json::Array order;
    for (const auto& a : u.action_order) order.push_back(a);
    o["actionOrder"] = json::array(std::move(order));
    json::Object avc;
    for (const auto& [k, v] : u.attack_vs_class) avc[k] = static_cast<double>(v);
    o["attackVsClass"] = json::object(std::move(avc));
    units[std::to_string(id)] = json::object(std::move(o));
  }

  json::Object props;
  for (const auto& [key, p] : rules.terrain_unit_properties) {
    json::Object o;
    o["movementCost"] = p.movement_cost;
    o["attackBonus"] = static_cast<double>(p.attack_bonus);
    o["defenseBonus"] = static_cast<double>(p.defense_bonus);
    o["healingBonus"] = static_cast<double>(p.healing_bonus);
    o["canCapture"] = p.can_capture;
    o["canBuild"] = p.can_build;
    props[key] = json::object(std::move(o));
  }

  json::Object root;
  root["terrains"] = json::object(std::move(terrains));
  root["units"] = json::object(std::move(units));
  root["terrainUnitProperties"] = json::object(std::move(props));
  return json::object(std::move(root));
}

std::vector<std::string> validate_rules(const RulesTable& rules) {
  std::vector<std::string> errors;
  if (rules.units.empty()) errors.push_back("no unit definitions");
  if (rules.terrains.empty()) errors.push_back("no terrain definitions");

  for (int id : util::sorted_keys(rules.terrains)) {
    const TerrainDef& t = rules.terrains.at(id);
    for (int b : t.buildable_unit_ids) {
      if (!rules.find_unit(b)) {
        errors.push_back("terrain " + std::to_string(id) + " lists unknown buildable unit " + std::to_string(b));
      }
    }
  }

  for (int id : util::sorted_keys(rules.units)) {
    const UnitDef& u = rules.units.at(id);
    if (u.health <= 0) errors.push_back("unit " + std::to_string(id) + " has non-positive health");
    if (u.movement_points < 0.0) errors.push_back("unit " + std::to_string(id) + " has negative movement points");
    if (u.attack_range < 1) errors.push_back("unit " + std::to_string(id) + " has attack range < 1");
    for (const std::string& slot : u.action_order) {
      for (const std::string& a : split_trimmed(slot, '|')) {
        if (!is_known_action(a)) {
          errors.push_back("unit " + std::to_string(id) + " has unknown action '" + a + "'");
        }
      }
    }
  }

  for (const std::string& key : util::sorted_keys(rules.terrain_unit_properties)) {
    const TerrainUnitProperties& p = rules.terrain_unit_properties.at(key);
    if (!rules.find_terrain(p.terrain_id)) errors.push_back("properties " + key + " reference unknown terrain");
    if (!rules.find_unit(p.unit_id)) errors.push_back("properties " + key + " reference unknown unit");
  }
  return errors;
}

} // namespace hextactics
