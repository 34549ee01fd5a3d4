#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "hextactics/core/entities.h"

namespace hextactics {

// Terrain ids with built-in meaning.
inline constexpr int kTerrainLandBase = 1;
inline constexpr int kTerrainNavalBase = 2;
inline constexpr int kTerrainAirportBase = 3;
inline constexpr int kTerrainDesert = 4;
inline constexpr int kTerrainGrass = 5;
inline constexpr int kTerrainWaterRegular = 10;
inline constexpr int kTerrainWaterShallow = 14;
inline constexpr int kTerrainWaterDeep = 15;
inline constexpr int kTerrainMissileSilo = 16;
inline constexpr int kTerrainBridgeRegular = 17;
inline constexpr int kTerrainBridgeShallow = 18;
inline constexpr int kTerrainBridgeDeep = 19;
inline constexpr int kTerrainMines = 20;
inline constexpr int kTerrainRoad = 22;

// Action names used in unit action orders.
inline constexpr const char* kActionMove = "move";
inline constexpr const char* kActionAttack = "attack";
inline constexpr const char* kActionCapture = "capture";
inline constexpr const char* kActionBuild = "build";
inline constexpr const char* kActionHeal = "heal";
inline constexpr const char* kActionRetreat = "retreat";

// Unit terrain of airborne units (immune to splash, heal only at airports).
inline constexpr const char* kUnitTerrainAir = "Air";

struct TerrainDef {
  int id{0};
  std::string name;
  // city, nature, bridge, water, road
  std::string type;
  std::vector<int> buildable_unit_ids;
};

struct UnitDef {
  int id{0};
  std::string name;

  // Defender-side key into attackers' attack tables is "<unit_class>:<unit_terrain>".
  std::string unit_class;
  std::string unit_terrain;

  int health{10};
  double movement_points{3.0};
  double retreat_points{0.0};
  int attack_range{1};
  int defense{0};
  int cost{0};
  int splash_damage{0};

  // Slots such as "move" or "attack|capture". Empty means the default order.
  std::vector<std::string> action_order;

  // Base attack value by defender "<class>:<terrain>". Missing = cannot attack.
  std::unordered_map<std::string, int> attack_vs_class;

  std::string defender_key() const { return unit_class + ":" + unit_terrain; }
};

// Per (terrain, unit type) behaviour.
struct TerrainUnitProperties {
  int terrain_id{0};
  int unit_id{0};
  // <= 0 means the default cost of 1.
  double movement_cost{1.0};
  int attack_bonus{0};
  int defense_bonus{0};
  int healing_bonus{0};
  bool can_capture{false};
  bool can_build{false};
};

// Read-only rules shared by every game built from it.
struct RulesTable {
  std::unordered_map<int, TerrainDef> terrains;
  std::unordered_map<int, UnitDef> units;
  // Keyed by terrain_unit_key().
  std::unordered_map<std::string, TerrainUnitProperties> terrain_unit_properties;

  const TerrainDef* find_terrain(int id) const;
  const UnitDef* find_unit(int id) const;
  const TerrainUnitProperties* find_properties(int terrain_id, int unit_id) const;

  // Throw std::logic_error for ids a validated game state should never reference.
  const TerrainDef& terrain(int id) const;
  const UnitDef& unit(int id) const;

  void add_properties(TerrainUnitProperties p);
};

std::string terrain_unit_key(int terrain_id, int unit_id);

// The action order a unit type actually runs: its own, or move then attack|capture.
std::vector<std::string> effective_action_order(const UnitDef& def);

} // namespace hextactics
