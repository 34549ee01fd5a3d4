#include "hextactics/core/rules.h"

#include <stdexcept>

namespace hextactics {

std::string terrain_unit_key(int terrain_id, int unit_id) {
  return std::to_string(terrain_id) + ":" + std::to_string(unit_id);
}

const TerrainDef* RulesTable::find_terrain(int id) const {
  const auto it = terrains.find(id);
  return it == terrains.end() ? nullptr : &it->second;
}

const UnitDef* RulesTable::find_unit(int id) const {
  const auto it = units.find(id);
  return it == units.end() ? nullptr : &it->second;
}

const TerrainUnitProperties* RulesTable::find_properties(int terrain_id, int unit_id) const {
  const auto it = terrain_unit_properties.find(terrain_unit_key(terrain_id, unit_id));
  return it == terrain_unit_properties.end() ? nullptr : &it->second;
}

const TerrainDef& RulesTable::terrain(int id) const {
  const TerrainDef* t = find_terrain(id);
  if (!t) throw std::logic_error("rules: unknown terrain id " + std::to_string(id));
  return *t;
}

const UnitDef& RulesTable::unit(int id) const {
  const UnitDef* u = find_unit(id);
  if (!u) throw std::logic_error("rules: unknown unit type " + std::to_string(id));
  return *u;
}

void RulesTable::add_properties(TerrainUnitProperties p) {
  const std::string key = terrain_unit_key(p.terrain_id, p.unit_id);
  terrain_unit_properties[key] = std::move(p);
}

std::vector<std::string> effective_action_order(const UnitDef& def) {
  if (!def.action_order.empty()) return def.action_order;
  return {kActionMove, std::string(kActionAttack) + "|" + kActionCapture};
}

} // namespace hextactics
