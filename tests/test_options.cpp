#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "hextactics/core/game.h"
#include "hextactics/util/digest.h"
#include "test.h"

#define HT_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

using namespace hextactics;
using namespace hextactics::testing;

template <typename T>
int count_actions(const std::vector<Move>& moves) {
  return static_cast<int>(std::count_if(moves.begin(), moves.end(),
                                        [](const Move& m) { return std::holds_alternative<T>(m.action); }));
}

} // namespace

int test_options() {
  const RulesTable rules = make_test_rules();

  World w = make_grass_world(3);
  set_tile(w, AxialCoord{0, 0}, kTerrainLandBase, kNeutralPlayer);
  set_tile(w, AxialCoord{-2, 0}, kTerrainLandBase, 1);
  set_tile(w, AxialCoord{-2, 1}, kTerrainLandBase, 1);
  w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
  w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{1, 0}));
  w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{-2, 1}));
  GameConfig cfg = make_config(2);
  cfg.players[0].starting_coins = 150;
  Game g(std::make_shared<const RulesTable>(rules), cfg, std::move(w), "options");
  const std::uint64_t before = digest_game_state64(g.state());

  // Unit options: moves, the adjacent enemy, and capturing the base underfoot.
  const std::vector<Move> opts = g.unit_options(AxialCoord{0, 0});
  HT_ASSERT(count_actions<MoveUnitAction>(opts) > 0);
  HT_ASSERT(count_actions<AttackUnitAction>(opts) == 1);
  HT_ASSERT(count_actions<CaptureBuildingAction>(opts) == 1);
  HT_ASSERT(count_actions<HealUnitAction>(opts) == 0);
  for (const Move& m : opts) {
    HT_ASSERT(m.changes.empty());
    HT_ASSERT(m.player == 1);
    if (const auto* mv = std::get_if<MoveUnitAction>(&m.action)) {
      HT_ASSERT((mv->to != AxialCoord{1, 0}));
      HT_ASSERT((mv->to != AxialCoord{0, 0}));
    }
  }
  const auto* attack = std::get_if<AttackUnitAction>(&std::find_if(opts.begin(), opts.end(), [](const Move& m) {
                                                       return std::holds_alternative<AttackUnitAction>(m.action);
                                                     })->action);
  HT_ASSERT((attack->defender == AxialCoord{1, 0}));

  // Every option can actually be played.
  for (const Move& m : opts) {
    Move copy = m;
    HT_ASSERT(g.dry_run(copy));
  }
  HT_ASSERT(digest_game_state64(g.state()) == before);

  // Enemy units and empty tiles have nothing to offer the current player.
  HT_ASSERT(g.unit_options(AxialCoord{1, 0}).empty());
  HT_ASSERT(g.unit_options(AxialCoord{2, 0}).empty());

  // Builds are filtered by coins; occupied tiles offer none.
  const std::vector<Move> builds = g.tile_options(AxialCoord{-2, 0});
  HT_ASSERT(builds.size() == 2);
  HT_ASSERT(std::get<BuildUnitAction>(builds[0].action).unit_type == kSoldier);
  HT_ASSERT(std::get<BuildUnitAction>(builds[1].action).unit_type == kMedic);
  HT_ASSERT(g.tile_options(AxialCoord{-2, 1}).empty());
  HT_ASSERT(g.tile_options(AxialCoord{0, 0}).empty());

  // Once the unit has spent its activation there is nothing left.
  Move cap;
  cap.player = 1;
  cap.action = CaptureBuildingAction{AxialCoord{0, 0}};
  HT_ASSERT(g.process_move(cap));
  HT_ASSERT(g.unit_options(AxialCoord{0, 0}).empty());

  HT_ASSERT(digest_game_state64(g.state()) != before);
  return 0;
}
