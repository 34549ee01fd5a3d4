#include "hextactics/core/game_state.h"

#include <utility>

#include "hextactics/core/rules.h"

namespace hextactics {
namespace {

int or_default(int configured, int fallback) { return configured > 0 ? configured : fallback; }

} // namespace

int tile_income(const IncomeConfig& income, int tile_type) {
  switch (tile_type) {
    case kTerrainLandBase: return or_default(income.landbase_income, kDefaultLandBaseIncome);
    case kTerrainNavalBase: return or_default(income.navalbase_income, kDefaultNavalBaseIncome);
    case kTerrainAirportBase: return or_default(income.airportbase_income, kDefaultAirportBaseIncome);
    case kTerrainMissileSilo: return or_default(income.missilesilo_income, kDefaultMissileSiloIncome);
    case kTerrainMines: return or_default(income.mines_income, kDefaultMinesIncome);
    default: return 0;
  }
}

int starting_coins(const PlayerConfig& p) { return or_default(p.starting_coins, kDefaultStartingCoins); }

GameState make_initial_state(const GameConfig& cfg, World world, const std::string& game_id) {
  GameState s;
  s.game_id = game_id;
  s.current_player = cfg.players.empty() ? PlayerId{1} : cfg.players.front().player_id;
  s.turn_counter = 1;
  s.version = 0;
  s.rng_state = cfg.seed;
  for (const PlayerConfig& p : cfg.players) s.player_coins[p.player_id] = starting_coins(p);
  s.world = std::move(world);
  return s;
}

} // namespace hextactics
