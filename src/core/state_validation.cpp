#include "hextactics/core/state_validation.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace hextactics {
namespace {

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

} // namespace

std::vector<std::string> validate_game_state(const GameState& s, const RulesTable* rules) {
  std::vector<std::string> errors;

  if (s.turn_counter < 1) errors.push_back(join("turn_counter ", s.turn_counter, " is below 1"));
  if (s.current_player <= kNeutralPlayer) errors.push_back(join("current_player ", s.current_player, " is not a player"));
  if (!s.player_coins.empty() && s.player_coins.find(s.current_player) == s.player_coins.end()) {
    errors.push_back(join("current_player ", s.current_player, " has no coin balance"));
  }
  for (const auto& [p, coins] : s.player_coins) {
    if (coins < 0) errors.push_back(join("player ", p, " has negative coins (", coins, ")"));
  }
  if (s.finished && s.winner == kNeutralPlayer) errors.push_back("game is finished without a winner");
  if (!s.finished && s.winner != kNeutralPlayer) errors.push_back(join("winner ", s.winner, " set on a running game"));

  const auto tiles = s.world.tiles();
  if (static_cast<int>(tiles.size()) != s.world.num_tiles()) {
    errors.push_back(join("tile count ", s.world.num_tiles(), " does not match ", tiles.size(), " live tiles"));
  }
  for (const Tile* t : tiles) {
    if (rules && !rules->find_terrain(t->tile_type)) {
      errors.push_back(join("tile ", format_coord(t->coord), " has unknown terrain ", t->tile_type));
    }
    if (t->last_acted_turn > s.turn_counter) {
      errors.push_back(join("tile ", format_coord(t->coord), " acted in the future (turn ", t->last_acted_turn, ")"));
    }
  }

  const auto units = s.world.units();
  if (static_cast<int>(units.size()) != s.world.num_units()) {
    errors.push_back(join("unit count ", s.world.num_units(), " does not match ", units.size(), " live units"));
  }
  std::set<std::pair<PlayerId, std::string>> shortcuts;
  for (const Unit* u : units) {
    const std::string at = format_coord(u->coord);
    if (u->player <= kNeutralPlayer) errors.push_back(join("unit ", at, " has no owner"));
    if (!s.world.tile_at(u->coord)) errors.push_back(join("unit ", at, " stands off the map"));
    if (u->available_health <= 0) errors.push_back(join("unit ", at, " is alive with ", u->available_health, " health"));
    if (u->distance_left < 0.0) errors.push_back(join("unit ", at, " has negative movement budget"));
    if (u->progression_step < 0) errors.push_back(join("unit ", at, " has negative progression step"));
    if (u->capture_started_turn > s.turn_counter) {
      errors.push_back(join("unit ", at, " started a capture in the future (turn ", u->capture_started_turn, ")"));
    }
    if (!u->shortcut.empty() && !shortcuts.insert({u->player, u->shortcut}).second) {
      errors.push_back(join("unit ", at, " reuses label ", u->shortcut));
    }
    if (rules) {
      const UnitDef* def = rules->find_unit(u->unit_type);
      if (!def) {
        errors.push_back(join("unit ", at, " has unknown type ", u->unit_type));
      } else if (u->available_health > def->health) {
        errors.push_back(join("unit ", at, " has ", u->available_health, " health, above max ", def->health));
      }
    }
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace hextactics
