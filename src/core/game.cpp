#include "hextactics/core/game.h"

#include <stdexcept>
#include <utility>

#include "hextactics/core/move_processor.h"
#include "hextactics/core/options.h"
#include "hextactics/util/log.h"

namespace hextactics {

Game::Game(std::shared_ptr<const RulesTable> rules, GameConfig cfg, World world, const std::string& game_id)
    : rules_(std::move(rules)), cfg_(std::move(cfg)) {
  if (!rules_) throw std::logic_error("Game: rules table is required");
  initial_ = make_initial_state(cfg_, std::move(world), game_id);
  state_ = initial_;
}

Game::Game(std::shared_ptr<const RulesTable> rules, GameConfig cfg, GameState initial, GameState state,
           History history)
    : rules_(std::move(rules)),
      cfg_(std::move(cfg)),
      initial_(std::move(initial)),
      state_(std::move(state)),
      history_(std::move(history)) {
  if (!rules_) throw std::logic_error("Game: rules table is required");
}

bool Game::process_moves(std::vector<Move>& moves, std::string* error) {
  const MoveProcessor mp(*rules_, cfg_);
  MoveGroup group;
  if (!mp.apply_group(state_, moves, &group, error)) return false;
  history_.append(std::move(group));
  log::debug("game " + state_.game_id + " at version " + std::to_string(state_.version));
  return true;
}

bool Game::process_move(Move& move, std::string* error) {
  std::vector<Move> moves{move};
  if (!process_moves(moves, error)) return false;
  move = std::move(moves.front());
  return true;
}

bool Game::dry_run(Move& move, std::string* error) {
  const MoveProcessor mp(*rules_, cfg_);
  return mp.dry_run(state_, move, error);
}

std::vector<Move> Game::unit_options(const AxialCoord& c) { return hextactics::unit_options(*rules_, cfg_, state_, c); }

std::vector<Move> Game::tile_options(const AxialCoord& c) { return hextactics::tile_options(*rules_, cfg_, state_, c); }

AttackForecast Game::forecast_attack(const AxialCoord& attacker, const AxialCoord& defender, int simulations) const {
  const Unit* a = state_.world.unit_at(attacker);
  const Unit* d = state_.world.unit_at(defender);
  if (!a || !d) {
    AttackForecast f;
    f.error = "no unit at " + format_coord(a ? defender : attacker);
    return f;
  }
  return hextactics::forecast_attack(*rules_, state_.world, *a, *d, simulations);
}

bool Game::verify(std::string* error) const { return verify_replay(initial_, history_, state_, error); }

} // namespace hextactics
