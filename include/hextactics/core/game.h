#pragma once

#include <memory>
#include <string>
#include <vector>

#include "hextactics/core/combat.h"
#include "hextactics/core/game_state.h"
#include "hextactics/core/history.h"
#include "hextactics/core/moves.h"
#include "hextactics/core/rules.h"

namespace hextactics {

// One game: shared read-only rules, its configuration, the state it started
// from, the live state and the history that leads from one to the other.
class Game {
 public:
  Game(std::shared_ptr<const RulesTable> rules, GameConfig cfg, World world, const std::string& game_id = "");
  Game(std::shared_ptr<const RulesTable> rules, GameConfig cfg, GameState initial, GameState state, History history);

  const RulesTable& rules() const { return *rules_; }
  const std::shared_ptr<const RulesTable>& rules_ptr() const { return rules_; }
  const GameConfig& config() const { return cfg_; }
  const GameState& initial_state() const { return initial_; }
  const GameState& state() const { return state_; }
  const History& history() const { return history_; }
  std::uint64_t version() const { return state_.version; }

  // Applies the moves as one group and appends it to the history.
  // On failure nothing changes and *error says which move was rejected.
  bool process_moves(std::vector<Move>& moves, std::string* error = nullptr);
  bool process_move(Move& move, std::string* error = nullptr);

  // Would-be changes of `move`; the game is left untouched.
  bool dry_run(Move& move, std::string* error = nullptr);

  std::vector<Move> unit_options(const AxialCoord& c);
  std::vector<Move> tile_options(const AxialCoord& c);

  AttackForecast forecast_attack(const AxialCoord& attacker, const AxialCoord& defender,
                                 int simulations = kDefaultDamageSimulations) const;

  // Replays the history from the initial state and compares with the live state.
  bool verify(std::string* error = nullptr) const;

 private:
  std::shared_ptr<const RulesTable> rules_;
  GameConfig cfg_;
  GameState initial_;
  GameState state_;
  History history_;
};

} // namespace hextactics
