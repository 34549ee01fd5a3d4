#pragma once

#include <string>
#include <vector>

#include "hextactics/core/changes.h"
#include "hextactics/core/game_state.h"
#include "hextactics/core/history.h"
#include "hextactics/core/moves.h"
#include "hextactics/util/json.h"

namespace hextactics {

// JSON form of game state, history, moves and changes.
//
// Coordinates are written as "q,r" keys, 64-bit values (RNG state) as
// 16-digit hex strings. Output is deterministic: objects are written with
// sorted keys and maps are walked in coordinate order.
//
// Readers throw std::runtime_error on structurally invalid documents.

json::Value unit_to_json(const Unit& u);
Unit unit_from_json(const json::Value& v);

json::Value tile_to_json(const Tile& t);
Tile tile_from_json(const json::Value& v);

json::Value change_to_json(const Change& c);
Change change_from_json(const json::Value& v);

json::Value move_to_json(const Move& m);
Move move_from_json(const json::Value& v);

json::Value history_to_json(const History& h);
History history_from_json(const json::Value& v);

json::Value serialize_game_to_json_value(const GameState& state);
std::string serialize_game_to_json(const GameState& state);
GameState deserialize_game_from_json(const std::string& json_text);

std::string serialize_history_to_json(const History& h);
History deserialize_history_from_json(const std::string& json_text);

// Game configuration:
// {"players":[{"id":1,"name":"..","team":1,"startingCoins":300}],
//  "income":{"landbase":..,"navalbase":..,"airportbase":..,"missilesilo":..,"mines":..,"game":..},
//  "allowedUnits":[1,2],"seed":"hex"}
json::Value game_config_to_json(const GameConfig& cfg);
GameConfig game_config_from_json(const json::Value& v);

} // namespace hextactics
