#pragma once

#include <string>
#include <variant>
#include <vector>

#include "hextactics/core/changes.h"
#include "hextactics/core/entities.h"
#include "hextactics/core/hex_coords.h"

namespace hextactics {

// Player actions with every position already resolved to a coordinate.

struct MoveUnitAction {
  AxialCoord from;
  AxialCoord to;
};

struct AttackUnitAction {
  AxialCoord attacker;
  AxialCoord defender;
};

struct BuildUnitAction {
  AxialCoord pos;
  int unit_type{0};
};

struct CaptureBuildingAction {
  AxialCoord pos;
};

// Rest in place. amount 0 = the resting heal the terrain grants.
struct HealUnitAction {
  AxialCoord pos;
  int amount{0};
};

struct EndTurnAction {};

using MoveAction =
    std::variant<MoveUnitAction, AttackUnitAction, BuildUnitAction, CaptureBuildingAction, HealUnitAction, EndTurnAction>;

struct Move {
  // Proposing player; 0 = whoever is to move.
  PlayerId player{kNeutralPlayer};
  MoveAction action;

  // Filled in when the move is applied.
  std::vector<Change> changes;
};

const char* move_kind_label(const MoveAction& a);

// "attack (1, 0) -> (2, 0)" style summary for logs.
std::string describe_move(const Move& m);

} // namespace hextactics
