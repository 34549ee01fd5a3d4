#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "hextactics/core/entities.h"
#include "hextactics/core/world.h"

namespace hextactics {

// Built-in income per owned tile, used wherever IncomeConfig leaves a value at 0.
inline constexpr int kDefaultLandBaseIncome = 100;
inline constexpr int kDefaultNavalBaseIncome = 150;
inline constexpr int kDefaultAirportBaseIncome = 200;
inline constexpr int kDefaultMissileSiloIncome = 300;
inline constexpr int kDefaultMinesIncome = 500;
inline constexpr int kDefaultStartingCoins = 300;

// Per-game income table. 0 means "use the built-in default".
struct IncomeConfig {
  int landbase_income{0};
  int navalbase_income{0};
  int airportbase_income{0};
  int missilesilo_income{0};
  int mines_income{0};

  // Flat amount every player gets when their turn ends. 0 = none.
  int game_income{0};
};

struct PlayerConfig {
  PlayerId player_id{kNeutralPlayer};
  std::string name;
  int team_id{0};
  // <= 0 means kDefaultStartingCoins.
  int starting_coins{0};
};

struct GameConfig {
  // Turn order. Ids are expected to be 1..N.
  std::vector<PlayerConfig> players;

  IncomeConfig income;

  // Unit types that may be built. Empty = anything the terrain allows.
  std::vector<int> allowed_units;

  // Seed for the authoritative combat RNG.
  std::uint64_t seed{0};
};

struct GameState {
  int save_version{1};

  std::string game_id;

  PlayerId current_player{1};
  int turn_counter{1};

  // Bumped by exactly one for every committed move group.
  std::uint64_t version{0};

  std::map<PlayerId, int> player_coins;

  // splitmix64 state of the per-game combat RNG.
  std::uint64_t rng_state{0};

  PlayerId winner{kNeutralPlayer};
  bool finished{false};

  World world;
};

// Income one owned tile of the given terrain yields, honouring defaults.
int tile_income(const IncomeConfig& income, int tile_type);

int starting_coins(const PlayerConfig& p);

// Fresh state: player 1 to move on turn 1, starting coins, RNG seeded from cfg.seed.
GameState make_initial_state(const GameConfig& cfg, World world, const std::string& game_id = "");

} // namespace hextactics
