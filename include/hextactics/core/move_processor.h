#pragma once

#include <string>
#include <vector>

#include "hextactics/core/changes.h"
#include "hextactics/core/game_state.h"
#include "hextactics/core/history.h"
#include "hextactics/core/moves.h"
#include "hextactics/core/rules.h"

namespace hextactics {

// Validates and applies player moves against a GameState.
//
// Every entry point runs the move on a pushed World layer and snapshots the
// scalar state (player, turn, coins, RNG). A rejected move pops the layer and
// restores the snapshot, so the caller sees either the whole move or nothing.
//
// Rejections (illegal move, not your turn, insufficient coins, ...) return
// false with a message in *error. Rules/state inconsistencies throw
// std::logic_error.
class MoveProcessor {
 public:
  MoveProcessor(const RulesTable& rules, const GameConfig& cfg);

  // Runs one move and reports the would-be changes in move.changes,
  // then discards everything: world, coins, turn and RNG are left as they were.
  bool dry_run(GameState& state, Move& move, std::string* error = nullptr) const;

  // Applies moves in order as one unit. On success bumps state.version by one
  // and describes the commit in *group. On failure nothing is applied and no
  // move keeps any changes.
  bool apply_group(GameState& state, std::vector<Move>& moves, MoveGroup* group,
                   std::string* error = nullptr) const;

  // Player after `p` in turn order, and whether that wraps into a new turn.
  PlayerId next_player(PlayerId p, bool* wraps = nullptr) const;

  // Income the given player collects when their turn ends.
  int income_for(const GameState& state, PlayerId p) const;

 private:
  bool run(GameState& state, Move& move, std::string* error) const;

  bool handle(GameState& state, const MoveUnitAction& a, std::vector<Change>& out, std::string* error) const;
  bool handle(GameState& state, const AttackUnitAction& a, std::vector<Change>& out, std::string* error) const;
  bool handle(GameState& state, const BuildUnitAction& a, std::vector<Change>& out, std::string* error) const;
  bool handle(GameState& state, const CaptureBuildingAction& a, std::vector<Change>& out, std::string* error) const;
  bool handle(GameState& state, const HealUnitAction& a, std::vector<Change>& out, std::string* error) const;
  bool handle(GameState& state, const EndTurnAction& a, std::vector<Change>& out, std::string* error) const;

  // Lazily refreshes the current player's unit at c, recording a completed capture.
  void refresh_unit(GameState& state, const AxialCoord& c, std::vector<Change>& out) const;

  // Applies damage to the unit at c and records it; removes the unit at 0 health.
  void damage_unit(World& world, const AxialCoord& c, int damage, std::vector<Change>& out) const;

  const RulesTable& rules_;
  const GameConfig& cfg_;
};

} // namespace hextactics
