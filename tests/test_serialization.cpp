#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "hextactics/core/game.h"
#include "hextactics/core/serialization.h"
#include "hextactics/core/state_validation.h"
#include "hextactics/util/digest.h"
#include "hextactics/util/json.h"
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

template <typename F>
bool throws_runtime_error(F&& f) {
  try {
    f();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_serialization() {
  const RulesTable rules = make_test_rules();

  World w = make_grass_world(3);
  set_tile(w, AxialCoord{-2, 0}, kTerrainLandBase, 1);
  set_tile(w, AxialCoord{2, 0}, kTerrainLandBase, kNeutralPlayer);
  w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{1, 0}));
  w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{0, 1}));
  w.add_unit(make_unit(rules, kStriker, 2, AxialCoord{-3, 3}));
  Game g(std::make_shared<const RulesTable>(rules), make_config(2, 0xfeedfacecafebeefULL), std::move(w), "save-test");

  std::vector<Move> turn1{make_move(1, BuildUnitAction{AxialCoord{-2, 0}, kSoldier}),
                          make_move(1, AttackUnitAction{AxialCoord{1, 0}, AxialCoord{0, 1}})};
  HT_ASSERT(g.process_moves(turn1));
  std::vector<Move> end1{make_move(1, EndTurnAction{})};
  HT_ASSERT(g.process_moves(end1));
  std::vector<Move> turn2{make_move(2, MoveUnitAction{AxialCoord{-3, 3}, AxialCoord{-3, 2}}),
                          make_move(2, EndTurnAction{})};
  HT_ASSERT(g.process_moves(turn2));

  // Game state round trip.
  {
    const std::string text = serialize_game_to_json(g.state());
    const GameState loaded = deserialize_game_from_json(text);
    HT_ASSERT(digest_game_state64(loaded) == digest_game_state64(g.state()));
    HT_ASSERT(loaded.rng_state == g.state().rng_state);
    HT_ASSERT(loaded.game_id == "save-test");
    HT_ASSERT(validate_game_state(loaded, &rules).empty());

    // Output is byte-stable.
    HT_ASSERT(serialize_game_to_json(loaded) == text);

    const json::Value root = json::parse(text);
    HT_ASSERT(root.at("rng_state").string_value().size() == 16);
    HT_ASSERT(root.at("tiles").find("-2,0") != nullptr);
    HT_ASSERT(root.at("player_coins").at("1").int_value() == 325);
  }

  // History round trip replays to the same state.
  {
    const History loaded = deserialize_history_from_json(serialize_history_to_json(g.history()));
    HT_ASSERT(loaded.size() == g.history().size());
    HT_ASSERT(digest_changes64(loaded.all_changes()) == digest_changes64(g.history().all_changes()));
    std::string err;
    HT_ASSERT(verify_replay(g.initial_state(), loaded, g.state(), &err));
  }

  // Move documents.
  {
    const Move heal = make_move(1, HealUnitAction{AxialCoord{4, -5}, 3});
    const json::Value v = move_to_json(heal);
    HT_ASSERT(v.at("action").at("type").string_value() == "heal");
    HT_ASSERT(v.at("action").at("pos").string_value() == "4,-5");
    const Move back = move_from_json(v);
    const auto* a = std::get_if<HealUnitAction>(&back.action);
    HT_ASSERT(a && a->amount == 3 && (a->pos == AxialCoord{4, -5}));

    const json::Value end = json::parse(R"({"player":2,"action":{"type":"end_turn"}})");
    const Move m = move_from_json(end);
    HT_ASSERT(m.player == 2);
    HT_ASSERT(std::holds_alternative<EndTurnAction>(m.action));
    HT_ASSERT(m.changes.empty());

    HT_ASSERT(throws_runtime_error([] { move_from_json(json::parse(R"({"player":1,"action":{"type":"fly"}})")); }));
  }

  // Change documents carry their kind.
  {
    const Change c = TileOwnerChanged{AxialCoord{1, 2}, 0, 2};
    const json::Value v = change_to_json(c);
    HT_ASSERT(v.at("type").string_value() == "tile_owner_changed");
    const Change back = change_from_json(v);
    const auto* t = std::get_if<TileOwnerChanged>(&back);
    HT_ASSERT(t && t->new_owner == 2 && (t->tile == AxialCoord{1, 2}));
    HT_ASSERT(throws_runtime_error([] { change_from_json(json::parse(R"({"type":"weather"})")); }));
  }

  // Structurally invalid saves are refused.
  {
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json("[1,2]"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json("{\"tiles\": "); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"rng_state":"not-hex"})"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"player_coins":{"one":5}})"); }));

    json::Value root = serialize_game_to_json_value(g.state());
    json::Object& tiles = *(*root.as_object())["tiles"].as_object();
    json::Value moved = tiles.at("-2,0");
    tiles.erase("-2,0");
    tiles["9,9"] = moved;
    const std::string text = json::stringify(root, 0);
    HT_ASSERT(throws_runtime_error([&] { deserialize_game_from_json(text); }));
  }

  // Numbers that do not fit their field are refused rather than wrapped.
  {
    HT_ASSERT(deserialize_game_from_json(R"({"rng_state":12})").rng_state == 12);
    HT_ASSERT(deserialize_game_from_json(R"({"turn_counter":7,"version":3})").turn_counter == 7);
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"rng_state":-1})"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"rng_state":1.5})"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"rng_state":1e30})"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"version":-3})"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"turn_counter":4294967297})"); }));
    HT_ASSERT(throws_runtime_error([] { deserialize_game_from_json(R"({"player_coins":{"1":1e12}})"); }));
    HT_ASSERT(throws_runtime_error(
        [] { game_config_from_json(json::parse(R"({"players":[{"id":1}],"allowedUnits":[1e10]})")); }));
  }

  // Game configuration.
  {
    GameConfig cfg = make_config(3, 0x0123456789abcdefULL);
    cfg.players[1].starting_coins = 500;
    cfg.income.mines_income = 250;
    cfg.income.game_income = 25;
    cfg.allowed_units = {kSoldier, kMedic};
    const json::Value v = game_config_to_json(cfg);
    HT_ASSERT(v.at("seed").string_value() == "0123456789abcdef");

    const GameConfig back = game_config_from_json(json::parse(json::stringify(v, 0)));
    HT_ASSERT(back.players.size() == 3);
    HT_ASSERT(back.players[1].player_id == 2);
    HT_ASSERT(back.players[1].starting_coins == 500);
    HT_ASSERT(back.players[2].name == "Player C");
    HT_ASSERT(back.income.mines_income == 250);
    HT_ASSERT(back.income.game_income == 25);
    HT_ASSERT((back.allowed_units == std::vector<int>{kSoldier, kMedic}));
    HT_ASSERT(back.seed == cfg.seed);

    HT_ASSERT(throws_runtime_error(
        [] { game_config_from_json(json::parse(R"({"players":[{"id":0,"name":"nobody"}]})")); }));
  }

  return 0;
}
