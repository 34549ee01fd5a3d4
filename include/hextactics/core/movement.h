#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "hextactics/core/entities.h"
#include "hextactics/core/hex_coords.h"
#include "hextactics/core/rules.h"
#include "hextactics/core/world.h"

namespace hextactics {

// Best known way into `to`.
struct PathEdge {
  AxialCoord from;
  AxialCoord to;
  double movement_cost{0.0};
  double total_cost{0.0};
  std::string terrain_name;
  std::string explanation;

  // Another unit stands here: usable to pass through, never to stop on.
  bool is_occupied{false};
};

// Result of a movement search from one source.
struct AllPaths {
  AxialCoord source;
  std::unordered_map<AxialCoord, PathEdge, AxialCoordHash> edges;

  const PathEdge* edge_to(const AxialCoord& c) const;

  // Reachable and not occupied.
  bool can_stop_at(const AxialCoord& c) const;

  // Coordinates the unit can end its move on, sorted.
  std::vector<AxialCoord> destinations() const;
};

struct Path {
  // Source first, destination last.
  std::vector<AxialCoord> steps;
  double total_cost{0.0};
};

// Terrain id used for movement rules at c: the crossing's terrain when a road
// or bridge is present, the tile's own terrain otherwise. 0 without a tile.
int effective_tile_type(const World& world, const AxialCoord& c);

// Cost for a unit type to enter c. nullopt when there is no tile or the
// (terrain, unit) pair has no properties entry.
std::optional<double> entry_cost(const RulesTable& rules, const World& world, int unit_type, const AxialCoord& c);

// Dijkstra expansion from `start` with `budget` movement points.
//
// prevent_pass_through == false: occupied tiles are costed and expanded
// through but flagged is_occupied. true: occupied tiles are not entered.
AllPaths compute_all_paths(const RulesTable& rules, const World& world, int unit_type, const AxialCoord& start,
                           double budget, bool prevent_pass_through);

// Uses the unit's coordinate, type and remaining budget.
AllPaths compute_unit_paths(const RulesTable& rules, const World& world, const Unit& unit,
                            bool prevent_pass_through = false);

// Walks predecessors back from dest. False when dest is not in paths.
bool reconstruct_path(const AllPaths& paths, const AxialCoord& dest, Path* out);

// Cheapest path for `unit` to stop on `dest` within its remaining budget.
// Passing through other units is allowed; stopping on one is not.
bool find_path(const RulesTable& rules, const World& world, const Unit& unit, const AxialCoord& dest, Path* out,
               std::string* error = nullptr);

} // namespace hextactics
