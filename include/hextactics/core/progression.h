#pragma once

#include <string>
#include <vector>

#include "hextactics/core/entities.h"
#include "hextactics/core/rules.h"
#include "hextactics/core/world.h"

namespace hextactics {

// Actions of one slot: "attack|capture" -> {"attack", "capture"}.
std::vector<std::string> slot_actions(const std::string& slot);

// move and retreat consume movement points; everything else is one-shot.
bool is_point_based_action(const std::string& action);

// Resource check for a single action: point-based actions need budget left.
bool can_perform_action(const Unit& unit, const std::string& action);

// Actions legal at the unit's current step, honouring a chosen alternative
// and filtered by can_perform_action. Empty once the step passes the last slot.
std::vector<std::string> allowed_actions(const RulesTable& rules, const Unit& unit);

// Slot in which `action` may be performed now, or -1.
//
// Besides the current slot, while the current slot is point-based the next
// slot is open too: the unit may stop moving and act immediately.
int open_slot_for_action(const RulesTable& rules, const Unit& unit, const std::string& action);

// Bookkeeping after `action` was performed from `slot`.
//
// One-shot actions move the step past `slot`; if the following slot is a
// retreat, the budget becomes the unit type's retreat points. Point-based
// actions enter `slot` and leave it only when the budget is spent.
void advance_progression(const RulesTable& rules, Unit& unit, int slot, const std::string& action);

// True when the unit was refreshed this turn and has no movement left.
// A stale unit is never exhausted: it will refresh on next access.
bool is_unit_exhausted(const Unit& unit, int turn);

bool needs_top_up(const Unit& unit, int turn);

// Health regained by resting at the unit's position.
//
// Nothing if the unit acted on or after max(turn - 1, 1), stands on an
// enemy-owned tile, or is airborne away from an Airport Base. Otherwise the
// (terrain, unit) healing bonus, capped at the missing health.
int resting_heal_amount(const RulesTable& rules, const World& world, const Unit& unit, int turn);

struct TopUpResult {
  bool refreshed{false};

  // A capture begun on an earlier turn completed during this refresh.
  bool capture_completed{false};
  AxialCoord capture_coord;
  PlayerId previous_owner{kNeutralPlayer};

  int healed{0};
};

// Lazily refresh the unit at c for `turn` (no-op when already current):
// restore budget and progression, heal, clear attack history, and complete a
// pending capture by flipping tile ownership. Throws std::logic_error when
// there is no unit at c.
TopUpResult top_up_unit_if_needed(const RulesTable& rules, World& world, const AxialCoord& c, int turn);

} // namespace hextactics
