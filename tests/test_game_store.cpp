#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hextactics/core/game_store.h"
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

Move make_move(PlayerId p, MoveAction a) {
  Move m;
  m.player = p;
  m.action = std::move(a);
  return m;
}

World duel_world(const RulesTable& rules) {
  World w = make_grass_world(3);
  w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
  w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{3, 0}));
  return w;
}

} // namespace

int test_game_store() {
  auto rules = std::make_shared<const RulesTable>(make_test_rules());
  GameStore store(rules);

  std::string err;
  HT_ASSERT(store.create_game("alpha", make_config(2), duel_world(*rules), &err) == CommitStatus::Ok);
  HT_ASSERT(store.create_game("alpha", make_config(2), duel_world(*rules), &err) == CommitStatus::AlreadyExists);
  HT_ASSERT(store.create_game("beta", make_config(2), duel_world(*rules)) == CommitStatus::Ok);
  HT_ASSERT((store.game_ids() == std::vector<std::string>{"alpha", "beta"}));

  HT_ASSERT(!store.load("missing").has_value());
  std::vector<Move> none{make_move(1, EndTurnAction{})};
  HT_ASSERT(store.submit_moves("missing", 0, &none, &err) == CommitStatus::NotFound);

  // Accepted write bumps the version and hands back the changes.
  {
    std::vector<Move> moves{make_move(1, MoveUnitAction{AxialCoord{0, 0}, AxialCoord{1, 0}}),
                            make_move(1, EndTurnAction{})};
    HT_ASSERT(store.submit_moves("alpha", 0, &moves, &err) == CommitStatus::Ok);
    HT_ASSERT(!moves[0].changes.empty());
    const std::optional<Game> g = store.load("alpha");
    HT_ASSERT(g.has_value());
    HT_ASSERT(g->version() == 1);
    HT_ASSERT(g->state().current_player == 2);
    HT_ASSERT(g->history().size() == 1);
  }

  // A writer holding an old version is turned away.
  {
    std::vector<Move> stale{make_move(2, EndTurnAction{})};
    HT_ASSERT(store.submit_moves("alpha", 0, &stale, &err) == CommitStatus::VersionMismatch);
    HT_ASSERT(err.find("version 1") != std::string::npos);
    HT_ASSERT(store.load("alpha")->version() == 1);
  }

  // Two writers load the same version; the second save loses.
  {
    std::optional<Game> first = store.load("beta");
    std::optional<Game> second = store.load("beta");
    Move a = make_move(1, EndTurnAction{});
    Move b = make_move(1, MoveUnitAction{AxialCoord{0, 0}, AxialCoord{0, 1}});
    HT_ASSERT(first->process_move(a));
    HT_ASSERT(second->process_move(b));
    HT_ASSERT(store.save(*first, 0, &err) == CommitStatus::Ok);
    HT_ASSERT(store.save(*second, 0, &err) == CommitStatus::VersionMismatch);
    HT_ASSERT(store.load("beta")->state().current_player == 2);
  }

  // A rejected move stores nothing.
  {
    std::vector<Move> bad{make_move(2, MoveUnitAction{AxialCoord{3, 0}, AxialCoord{2, 0}}),
                          make_move(2, MoveUnitAction{AxialCoord{0, 0}, AxialCoord{0, 1}})};
    HT_ASSERT(store.submit_moves("alpha", 1, &bad, &err) == CommitStatus::Rejected);
    HT_ASSERT(!err.empty());
    const std::optional<Game> g = store.load("alpha");
    HT_ASSERT(g->version() == 1);
    HT_ASSERT(g->state().world.unit_at(AxialCoord{3, 0}) != nullptr);
  }

  // Loaded copies are independent of the stored game.
  {
    std::optional<Game> copy = store.load("alpha");
    Move end = make_move(2, EndTurnAction{});
    HT_ASSERT(copy->process_move(end));
    HT_ASSERT(store.load("alpha")->version() == 1);
  }

  HT_ASSERT(store.verify("alpha", &err));
  HT_ASSERT(store.verify("beta", &err));
  HT_ASSERT(!store.verify("missing", &err));

  HT_ASSERT(std::string(commit_status_label(CommitStatus::VersionMismatch)) == "version_mismatch");
  return 0;
}
