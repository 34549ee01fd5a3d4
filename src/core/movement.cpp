#include "hextactics/core/movement.h"

#include <algorithm>
#include <cstdio>
#include <queue>

namespace hextactics {
namespace {

struct Frontier {
  double cost{0.0};
  AxialCoord coord;
};

// Min-heap on cost; ties broken by coordinate so expansion order (and with it
// the chosen predecessors) never depends on hashing.
struct FrontierGreater {
  bool operator()(const Frontier& a, const Frontier& b) const {
    if (a.cost != b.cost) return a.cost > b.cost;
    return b.coord < a.coord;
  }
};

std::string format_points(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", v);
  return buf;
}

int bridge_type_for(int water_type) {
  switch (water_type) {
    case kTerrainWaterShallow: return kTerrainBridgeShallow;
    case kTerrainWaterDeep: return kTerrainBridgeDeep;
    default: return kTerrainBridgeRegular;
  }
}

AllPaths search(const RulesTable& rules, const World& world, int unit_type, const AxialCoord& start, double budget,
                bool prevent_pass_through, const std::optional<AxialCoord>& stop_at) {
  AllPaths out;
  out.source = start;

  const UnitDef* def = rules.find_unit(unit_type);
  const std::string unit_name = def ? def->name : "Unit";

  std::unordered_map<AxialCoord, double, AxialCoordHash> best;
  std::priority_queue<Frontier, std::vector<Frontier>, FrontierGreater> pq;
  best[start] = 0.0;
  pq.push({0.0, start});

  while (!pq.empty()) {
    const Frontier cur = pq.top();
    pq.pop();
    if (cur.cost > best[cur.coord]) continue;
    if (stop_at && cur.coord == *stop_at) break;

    for (const AxialCoord& next : neighbors(cur.coord)) {
      if (!world.tile_at(next)) continue;
      const bool occupied = world.unit_at(next) != nullptr;
      if (prevent_pass_through && occupied) continue;

      const std::optional<double> step = entry_cost(rules, world, unit_type, next);
      if (!step) continue;

      const double total = cur.cost + *step;
      if (total > budget) continue;

      const auto it = best.find(next);
      if (it != best.end() && !(total < it->second)) continue;
      best[next] = total;
      pq.push({total, next});

      PathEdge e;
      e.from = cur.coord;
      e.to = next;
      e.movement_cost = *step;
      e.total_cost = total;
      const TerrainDef* terrain = rules.find_terrain(effective_tile_type(world, next));
      e.terrain_name = terrain ? terrain->name : "unknown";
      e.explanation = e.terrain_name + " costs " + unit_name + " " + format_points(*step) + " movement points";
      e.is_occupied = occupied;
      out.edges[next] = std::move(e);
    }
  }
  return out;
}

} // namespace

const PathEdge* AllPaths::edge_to(const AxialCoord& c) const {
  const auto it = edges.find(c);
  return it == edges.end() ? nullptr : &it->second;
}

bool AllPaths::can_stop_at(const AxialCoord& c) const {
  const PathEdge* e = edge_to(c);
  return e && !e->is_occupied;
}

std::vector<AxialCoord> AllPaths::destinations() const {
  std::vector<AxialCoord> out;
  for (const auto& [c, e] : edges) {
    if (!e.is_occupied) out.push_back(c);
  }
  std::sort(out.begin(), out.end());
  return out;
}

int effective_tile_type(const World& world, const AxialCoord& c) {
  const Tile* t = world.tile_at(c);
  if (!t) return 0;
  switch (t->crossing) {
    case CrossingType::Road: return kTerrainRoad;
    case CrossingType::Bridge: return bridge_type_for(t->tile_type);
    case CrossingType::None: break;
  }
  return t->tile_type;
}

std::optional<double> entry_cost(const RulesTable& rules, const World& world, int unit_type, const AxialCoord& c) {
  const int terrain = effective_tile_type(world, c);
  if (terrain == 0) return std::nullopt;
  const TerrainUnitProperties* p = rules.find_properties(terrain, unit_type);
  if (!p) return std::nullopt;
  return p->movement_cost > 0.0 ? p->movement_cost : 1.0;
}

AllPaths compute_all_paths(const RulesTable& rules, const World& world, int unit_type, const AxialCoord& start,
                           double budget, bool prevent_pass_through) {
  return search(rules, world, unit_type, start, budget, prevent_pass_through, std::nullopt);
}

AllPaths compute_unit_paths(const RulesTable& rules, const World& world, const Unit& unit,
                            bool prevent_pass_through) {
  return compute_all_paths(rules, world, unit.unit_type, unit.coord, unit.distance_left, prevent_pass_through);
}

bool reconstruct_path(const AllPaths& paths, const AxialCoord& dest, Path* out) {
  if (dest == paths.source) {
    if (out) *out = Path{{dest}, 0.0};
    return true;
  }
  const PathEdge* e = paths.edge_to(dest);
  if (!e) return false;

  Path p;
  p.total_cost = e->total_cost;
  AxialCoord cur = dest;
  // Every edge strictly lowers the cost, so the walk terminates at the source.
  while (cur != paths.source) {
    p.steps.push_back(cur);
    const PathEdge* step = paths.edge_to(cur);
    if (!step) return false;
    cur = step->from;
  }
  p.steps.push_back(paths.source);
  std::reverse(p.steps.begin(), p.steps.end());
  if (out) *out = std::move(p);
  return true;
}

bool find_path(const RulesTable& rules, const World& world, const Unit& unit, const AxialCoord& dest, Path* out,
               std::string* error) {
  if (dest == unit.coord) {
    if (error) *error = "destination is the unit's own position";
    return false;
  }
  if (world.unit_at(dest)) {
    if (error) *error = "destination " + format_coord(dest) + " is occupied";
    return false;
  }
  const AllPaths paths = search(rules, world, unit.unit_type, unit.coord, unit.distance_left, false, dest);
  if (!paths.can_stop_at(dest) || !reconstruct_path(paths, dest, out)) {
    if (error) {
      *error = "destination " + format_coord(dest) + " is not reachable from " + format_coord(unit.coord);
    }
    return false;
  }
  return true;
}

} // namespace hextactics
