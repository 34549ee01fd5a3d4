#include "hextactics/core/progression.h"

#include <algorithm>
#include <stdexcept>

#include "hextactics/util/strings.h"

namespace hextactics {
namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

// Actions a slot offers once a chosen alternative is taken into account.
std::vector<std::string> offered(const std::string& slot, const std::string& chosen) {
  std::vector<std::string> actions = slot_actions(slot);
  if (!chosen.empty() && contains(actions, chosen)) return {chosen};
  return actions;
}

} // namespace

std::vector<std::string> slot_actions(const std::string& slot) {
  std::vector<std::string> out;
  for (std::string& a : split_trimmed(slot, '|')) {
    if (!a.empty()) out.push_back(std::move(a));
  }
  return out;
}

bool is_point_based_action(const std::string& action) { return action == kActionMove || action == kActionRetreat; }

bool can_perform_action(const Unit& unit, const std::string& action) {
  if (is_point_based_action(action)) return unit.distance_left > 0.0;
  return true;
}

std::vector<std::string> allowed_actions(const RulesTable& rules, const Unit& unit) {
  const std::vector<std::string> order = effective_action_order(rules.unit(unit.unit_type));
  if (unit.progression_step < 0 || unit.progression_step >= static_cast<int>(order.size())) return {};

  std::vector<std::string> out;
  for (const std::string& a : offered(order[static_cast<std::size_t>(unit.progression_step)], unit.chosen_alternative)) {
    if (can_perform_action(unit, a)) out.push_back(a);
  }
  return out;
}

int open_slot_for_action(const RulesTable& rules, const Unit& unit, const std::string& action) {
  const std::vector<std::string> order = effective_action_order(rules.unit(unit.unit_type));
  const int step = unit.progression_step;
  if (step < 0 || step >= static_cast<int>(order.size())) return -1;

  const std::vector<std::string> current = offered(order[static_cast<std::size_t>(step)], unit.chosen_alternative);
  if (contains(current, action)) return can_perform_action(unit, action) ? step : -1;

  const bool current_point_based =
      std::any_of(current.begin(), current.end(), [](const std::string& a) { return is_point_based_action(a); });
  if (!current_point_based || step + 1 >= static_cast<int>(order.size())) return -1;

  const std::vector<std::string> next = slot_actions(order[static_cast<std::size_t>(step + 1)]);
  if (contains(next, action) && can_perform_action(unit, action)) return step + 1;
  return -1;
}

void advance_progression(const RulesTable& rules, Unit& unit, int slot, const std::string& action) {
  const UnitDef& def = rules.unit(unit.unit_type);
  const std::vector<std::string> order = effective_action_order(def);

  if (is_point_based_action(action)) {
    if (slot > unit.progression_step) {
      unit.progression_step = slot;
      unit.chosen_alternative.clear();
    }
    if (slot < static_cast<int>(order.size()) && slot_actions(order[static_cast<std::size_t>(slot)]).size() > 1) {
      unit.chosen_alternative = action;
    }
    if (unit.distance_left <= 0.0) {
      unit.distance_left = 0.0;
      unit.progression_step = slot + 1;
      unit.chosen_alternative.clear();
    }
    return;
  }

  unit.progression_step = slot + 1;
  unit.chosen_alternative.clear();
  if (unit.progression_step >= static_cast<int>(order.size())) {
    unit.distance_left = 0.0;
  } else if (order[static_cast<std::size_t>(unit.progression_step)] == kActionRetreat) {
    unit.distance_left = def.retreat_points;
  }
}

bool is_unit_exhausted(const Unit& unit, int turn) {
  return unit.last_topped_up_turn >= turn && unit.distance_left <= 0.0;
}

bool needs_top_up(const Unit& unit, int turn) { return unit.last_topped_up_turn < turn; }

int resting_heal_amount(const RulesTable& rules, const World& world, const Unit& unit, int turn) {
  const UnitDef& def = rules.unit(unit.unit_type);
  if (unit.available_health >= def.health) return 0;
  if (unit.last_acted_turn >= std::max(turn - 1, 1)) return 0;

  const Tile* tile = world.tile_at(unit.coord);
  if (!tile) return 0;
  if (tile->player != kNeutralPlayer && tile->player != unit.player) return 0;
  if (def.unit_terrain == kUnitTerrainAir && tile->tile_type != kTerrainAirportBase) return 0;

  const TerrainUnitProperties* p = rules.find_properties(tile->tile_type, unit.unit_type);
  if (!p || p->healing_bonus <= 0) return 0;
  return std::min(p->healing_bonus, def.health - unit.available_health);
}

TopUpResult top_up_unit_if_needed(const RulesTable& rules, World& world, const AxialCoord& c, int turn) {
  TopUpResult result;
  const Unit* current = world.unit_at(c);
  if (!current) throw std::logic_error("top_up: no unit at " + format_coord(c));
  if (!needs_top_up(*current, turn)) return result;

  const UnitDef& def = rules.unit(current->unit_type);
  const int heal = current->available_health > 0 ? resting_heal_amount(rules, world, *current, turn) : 0;

  Unit* u = world.mutable_unit_at(c);
  result.refreshed = true;
  u->distance_left = def.movement_points;
  if (u->available_health <= 0) {
    u->available_health = def.health;
  } else {
    u->available_health += heal;
    result.healed = heal;
  }
  u->attack_history.clear();
  u->attacks_received_this_turn = 0;
  u->progression_step = 0;
  u->chosen_alternative.clear();

  const int started = u->capture_started_turn;
  const PlayerId owner = u->player;
  u->capture_started_turn = 0;
  u->last_topped_up_turn = turn;

  if (started > 0 && started < turn) {
    Tile* tile = world.mutable_tile_at(c);
    if (tile && tile->player != owner) {
      result.capture_completed = true;
      result.capture_coord = c;
      result.previous_owner = tile->player;
      tile->player = owner;
    }
  }
  return result;
}

} // namespace hextactics
