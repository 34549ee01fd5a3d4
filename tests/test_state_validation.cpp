#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "hextactics/core/state_validation.h"
#include "test.h"

#define HT_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

} // namespace

int test_state_validation() {
  using namespace hextactics;
  using namespace hextactics::testing;

  const RulesTable rules = make_test_rules();
  World w = make_grass_world(2);
  w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
  w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{1, 0}));
  const GameState good = make_initial_state(make_config(2), std::move(w), "valid");

  HT_ASSERT(validate_game_state(good).empty());
  HT_ASSERT(validate_game_state(good, &rules).empty());
  HT_ASSERT(good.player_coins.at(1) == kDefaultStartingCoins);

  {
    GameState s = good;
    s.turn_counter = 0;
    s.player_coins[2] = -5;
    const auto errors = validate_game_state(s);
    HT_ASSERT(has_error(errors, "turn_counter 0"));
    HT_ASSERT(has_error(errors, "player 2 has negative coins"));
    HT_ASSERT(std::is_sorted(errors.begin(), errors.end()));
  }

  {
    GameState s = good;
    s.finished = true;
    HT_ASSERT(has_error(validate_game_state(s), "finished without a winner"));
    s.finished = false;
    s.winner = 2;
    HT_ASSERT(has_error(validate_game_state(s), "set on a running game"));
  }

  {
    GameState s = good;
    s.current_player = 3;
    HT_ASSERT(has_error(validate_game_state(s), "has no coin balance"));
  }

  {
    GameState s = good;
    Unit* u = s.world.mutable_unit_at(AxialCoord{0, 0});
    u->available_health = 14;
    u->capture_started_turn = 5;
    u->distance_left = -1.0;
    Unit stray = make_unit(rules, kSoldier, 1, AxialCoord{9, 9});
    stray.shortcut = "A1";
    s.world.add_unit(stray);

    const auto without_rules = validate_game_state(s);
    HT_ASSERT(!has_error(without_rules, "above max"));
    HT_ASSERT(has_error(without_rules, "started a capture in the future"));
    HT_ASSERT(has_error(without_rules, "negative movement budget"));
    HT_ASSERT(has_error(without_rules, "stands off the map"));
    HT_ASSERT(has_error(without_rules, "reuses label A1"));

    const auto with_rules = validate_game_state(s, &rules);
    HT_ASSERT(has_error(with_rules, "14 health, above max 10"));
  }

  {
    GameState s = good;
    set_tile(s.world, AxialCoord{2, 0}, 77);
    Unit ghost = make_unit(rules, kSoldier, 2, AxialCoord{-1, 0});
    ghost.unit_type = 404;
    s.world.add_unit(ghost);
    const auto errors = validate_game_state(s, &rules);
    HT_ASSERT(has_error(errors, "unknown terrain 77"));
    HT_ASSERT(has_error(errors, "unknown type 404"));
  }

  return 0;
}
