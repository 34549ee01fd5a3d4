#include "hextactics/core/serialization.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "hextactics/util/log.h"

namespace hextactics {
namespace {

using json::Array;
using json::Object;
using json::Value;

template <typename T>
inline constexpr bool kAlwaysFalse = false;

constexpr int kCurrentSaveVersion = 1;

std::string u64_to_hex(std::uint64_t v) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

bool is_whole(double d) { return std::isfinite(d) && std::floor(d) == d; }

std::uint64_t u64_from_json(const Value& v) {
  if (const double* d = v.as_number()) {
    // 2^64 is exactly representable; anything at or above it is not a uint64.
    if (!is_whole(*d) || *d < 0.0 || *d >= 18446744073709551616.0) {
      throw std::runtime_error("expected an unsigned 64-bit integer, got " + json::stringify(v, 0));
    }
    return static_cast<std::uint64_t>(*d);
  }
  const std::string s = v.string_value();
  if (s.empty() || s.size() > 16) throw std::runtime_error("expected a 64-bit hex string, got '" + s + "'");
  std::uint64_t out = 0;
  for (char ch : s) {
    int digit = 0;
    if (ch >= '0' && ch <= '9') {
      digit = ch - '0';
    } else if (ch >= 'a' && ch <= 'f') {
      digit = ch - 'a' + 10;
    } else if (ch >= 'A' && ch <= 'F') {
      digit = ch - 'A' + 10;
    } else {
      throw std::runtime_error("expected a 64-bit hex string, got '" + s + "'");
    }
    out = (out << 4) | static_cast<std::uint64_t>(digit);
  }
  return out;
}

Value coord_to_json(const AxialCoord& c) { return coord_key(c); }

AxialCoord coord_from_json(const Value& v) {
  AxialCoord c;
  const std::string key = v.string_value();
  if (!parse_coord_key(key, &c)) throw std::runtime_error("invalid coordinate key '" + key + "'");
  return c;
}

int int_from_json(const Value& v, const std::string& what) {
  const double* d = v.as_number();
  if (!d || !is_whole(*d) || *d < static_cast<double>(std::numeric_limits<int>::min()) ||
      *d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(what + ": expected a 32-bit integer, got " + json::stringify(v, 0));
  }
  return static_cast<int>(*d);
}

// Absent or non-numeric fields read as def.
int int_field(const Value& o, const char* key, int def = 0) {
  const Value* v = o.find(key);
  if (!v || !v->as_number()) return def;
  return int_from_json(*v, key);
}

std::string crossing_to_string(CrossingType c) {
  switch (c) {
    case CrossingType::None: return "none";
    case CrossingType::Road: return "road";
    case CrossingType::Bridge: return "bridge";
  }
  return "none";
}

CrossingType crossing_from_string(const std::string& s) {
  if (s == "road") return CrossingType::Road;
  if (s == "bridge") return CrossingType::Bridge;
  return CrossingType::None;
}

Value units_to_json(const std::vector<Unit>& units) {
  Array a;
  for (const Unit& u : units) a.push_back(unit_to_json(u));
  return a;
}

std::vector<Unit> units_from_json(const Value& v) {
  std::vector<Unit> out;
  for (const Value& u : v.array()) out.push_back(unit_from_json(u));
  return out;
}

} // namespace

Value unit_to_json(const Unit& u) {
  Object o;
  o["coord"] = coord_to_json(u.coord);
  o["player"] = static_cast<double>(u.player);
  o["unit_type"] = static_cast<double>(u.unit_type);
  o["shortcut"] = u.shortcut;
  o["available_health"] = static_cast<double>(u.available_health);
  o["distance_left"] = u.distance_left;
  o["progression_step"] = static_cast<double>(u.progression_step);
  if (!u.chosen_alternative.empty()) o["chosen_alternative"] = u.chosen_alternative;
  o["last_topped_up_turn"] = static_cast<double>(u.last_topped_up_turn);
  o["last_acted_turn"] = static_cast<double>(u.last_acted_turn);
  o["capture_started_turn"] = static_cast<double>(u.capture_started_turn);
  Array history;
  for (const AttackRecord& r : u.attack_history) {
    Object ro;
    ro["position"] = coord_to_json(r.position);
    ro["ranged"] = r.is_ranged;
    ro["turn"] = static_cast<double>(r.turn);
    history.push_back(std::move(ro));
  }
  o["attack_history"] = std::move(history);
  o["attacks_received_this_turn"] = static_cast<double>(u.attacks_received_this_turn);
  return o;
}

Unit unit_from_json(const Value& v) {
  Unit u;
  u.coord = coord_from_json(v.at("coord"));
  u.player = int_field(v, "player");
  u.unit_type = int_field(v, "unit_type");
  if (const Value* s = v.find("shortcut")) u.shortcut = s->string_value();
  u.available_health = int_field(v, "available_health");
  if (const Value* d = v.find("distance_left")) u.distance_left = d->number_value();
  u.progression_step = int_field(v, "progression_step");
  if (const Value* a = v.find("chosen_alternative")) u.chosen_alternative = a->string_value();
  u.last_topped_up_turn = int_field(v, "last_topped_up_turn");
  u.last_acted_turn = int_field(v, "last_acted_turn");
  u.capture_started_turn = int_field(v, "capture_started_turn");
  if (const Value* h = v.find("attack_history")) {
    for (const Value& rv : h->array()) {
      AttackRecord r;
      r.position = coord_from_json(rv.at("position"));
      if (const Value* ranged = rv.find("ranged")) r.is_ranged = ranged->bool_value();
      r.turn = int_field(rv, "turn");
      u.attack_history.push_back(r);
    }
  }
  u.attacks_received_this_turn = int_field(v, "attacks_received_this_turn");
  return u;
}

Value tile_to_json(const Tile& t) {
  Object o;
  o["coord"] = coord_to_json(t.coord);
  o["tile_type"] = static_cast<double>(t.tile_type);
  o["player"] = static_cast<double>(t.player);
  if (!t.shortcut.empty()) o["shortcut"] = t.shortcut;
  o["last_acted_turn"] = static_cast<double>(t.last_acted_turn);
  if (t.crossing != CrossingType::None) o["crossing"] = crossing_to_string(t.crossing);
  return o;
}

Tile tile_from_json(const Value& v) {
  Tile t;
  t.coord = coord_from_json(v.at("coord"));
  t.tile_type = int_field(v, "tile_type");
  t.player = int_field(v, "player");
  if (const Value* s = v.find("shortcut")) t.shortcut = s->string_value();
  t.last_acted_turn = int_field(v, "last_acted_turn");
  if (const Value* c = v.find("crossing")) t.crossing = crossing_from_string(c->string_value());
  return t;
}

Value change_to_json(const Change& change) {
  Object o;
  o["type"] = std::string(change_kind_label(change));
  std::visit(
      [&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, UnitMoved> || std::is_same_v<T, UnitDamaged>) {
          o["previous"] = unit_to_json(c.previous);
          o["updated"] = unit_to_json(c.updated);
        } else if constexpr (std::is_same_v<T, UnitKilled>) {
          o["previous"] = unit_to_json(c.previous);
        } else if constexpr (std::is_same_v<T, UnitHealed>) {
          o["previous"] = unit_to_json(c.previous);
          o["updated"] = unit_to_json(c.updated);
          o["amount"] = static_cast<double>(c.amount);
        } else if constexpr (std::is_same_v<T, UnitBuilt>) {
          o["unit"] = unit_to_json(c.unit);
          o["tile"] = coord_to_json(c.tile);
          o["cost"] = static_cast<double>(c.cost);
          o["player_coins"] = static_cast<double>(c.player_coins);
        } else if constexpr (std::is_same_v<T, CoinsChanged>) {
          o["player"] = static_cast<double>(c.player);
          o["previous_coins"] = static_cast<double>(c.previous_coins);
          o["new_coins"] = static_cast<double>(c.new_coins);
          o["reason"] = c.reason;
        } else if constexpr (std::is_same_v<T, CaptureStarted>) {
          o["unit"] = unit_to_json(c.unit);
          o["tile"] = coord_to_json(c.tile);
          o["tile_type"] = static_cast<double>(c.tile_type);
          o["current_owner"] = static_cast<double>(c.current_owner);
        } else if constexpr (std::is_same_v<T, CaptureCompleted>) {
          o["tile"] = coord_to_json(c.tile);
          o["capturer"] = static_cast<double>(c.capturer);
          o["previous_owner"] = static_cast<double>(c.previous_owner);
        } else if constexpr (std::is_same_v<T, TileOwnerChanged>) {
          o["tile"] = coord_to_json(c.tile);
          o["previous_owner"] = static_cast<double>(c.previous_owner);
          o["new_owner"] = static_cast<double>(c.new_owner);
        } else if constexpr (std::is_same_v<T, PlayerChanged>) {
          o["previous_player"] = static_cast<double>(c.previous_player);
          o["new_player"] = static_cast<double>(c.new_player);
          o["previous_turn"] = static_cast<double>(c.previous_turn);
          o["new_turn"] = static_cast<double>(c.new_turn);
          o["reset_units"] = units_to_json(c.reset_units);
        } else if constexpr (std::is_same_v<T, GameFinished>) {
          o["winner"] = static_cast<double>(c.winner);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled change kind");
        }
      },
      change);
  return o;
}

Change change_from_json(const Value& v) {
  const std::string type = v.at("type").string_value();
  if (type == "unit_moved") return UnitMoved{unit_from_json(v.at("previous")), unit_from_json(v.at("updated"))};
  if (type == "unit_damaged") return UnitDamaged{unit_from_json(v.at("previous")), unit_from_json(v.at("updated"))};
  if (type == "unit_killed") return UnitKilled{unit_from_json(v.at("previous"))};
  if (type == "unit_healed") {
    return UnitHealed{unit_from_json(v.at("previous")), unit_from_json(v.at("updated")), int_field(v, "amount")};
  }
  if (type == "unit_built") {
    return UnitBuilt{unit_from_json(v.at("unit")), coord_from_json(v.at("tile")), int_field(v, "cost"),
                     int_field(v, "player_coins")};
  }
  if (type == "coins_changed") {
    return CoinsChanged{int_field(v, "player"), int_field(v, "previous_coins"), int_field(v, "new_coins"),
                        v.at("reason").string_value()};
  }
  if (type == "capture_started") {
    return CaptureStarted{unit_from_json(v.at("unit")), coord_from_json(v.at("tile")), int_field(v, "tile_type"),
                          int_field(v, "current_owner")};
  }
  if (type == "capture_completed") {
    return CaptureCompleted{coord_from_json(v.at("tile")), int_field(v, "capturer"), int_field(v, "previous_owner")};
  }
  if (type == "tile_owner_changed") {
    return TileOwnerChanged{coord_from_json(v.at("tile")), int_field(v, "previous_owner"), int_field(v, "new_owner")};
  }
  if (type == "player_changed") {
    PlayerChanged pc;
    pc.previous_player = int_field(v, "previous_player");
    pc.new_player = int_field(v, "new_player");
    pc.previous_turn = int_field(v, "previous_turn");
    pc.new_turn = int_field(v, "new_turn");
    if (const Value* r = v.find("reset_units")) pc.reset_units = units_from_json(*r);
    return pc;
  }
  if (type == "game_finished") return GameFinished{int_field(v, "winner")};
  throw std::runtime_error("unknown change type '" + type + "'");
}

Value move_to_json(const Move& m) {
  Object action;
  action["type"] = std::string(move_kind_label(m.action));
  std::visit(
      [&](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, MoveUnitAction>) {
          action["from"] = coord_to_json(a.from);
          action["to"] = coord_to_json(a.to);
        } else if constexpr (std::is_same_v<T, AttackUnitAction>) {
          action["attacker"] = coord_to_json(a.attacker);
          action["defender"] = coord_to_json(a.defender);
        } else if constexpr (std::is_same_v<T, BuildUnitAction>) {
          action["pos"] = coord_to_json(a.pos);
          action["unit_type"] = static_cast<double>(a.unit_type);
        } else if constexpr (std::is_same_v<T, CaptureBuildingAction>) {
          action["pos"] = coord_to_json(a.pos);
        } else if constexpr (std::is_same_v<T, HealUnitAction>) {
          action["pos"] = coord_to_json(a.pos);
          if (a.amount > 0) action["amount"] = static_cast<double>(a.amount);
        } else if constexpr (std::is_same_v<T, EndTurnAction>) {
          // no fields
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled move kind");
        }
      },
      m.action);

  Object o;
  o["player"] = static_cast<double>(m.player);
  o["action"] = std::move(action);
  Array changes;
  for (const Change& c : m.changes) changes.push_back(change_to_json(c));
  o["changes"] = std::move(changes);
  return o;
}

Move move_from_json(const Value& v) {
  Move m;
  m.player = int_field(v, "player");
  const Value& a = v.at("action");
  const std::string type = a.at("type").string_value();
  if (type == "move") {
    m.action = MoveUnitAction{coord_from_json(a.at("from")), coord_from_json(a.at("to"))};
  } else if (type == "attack") {
    m.action = AttackUnitAction{coord_from_json(a.at("attacker")), coord_from_json(a.at("defender"))};
  } else if (type == "build") {
    m.action = BuildUnitAction{coord_from_json(a.at("pos")), int_field(a, "unit_type")};
  } else if (type == "capture") {
    m.action = CaptureBuildingAction{coord_from_json(a.at("pos"))};
  } else if (type == "heal") {
    m.action = HealUnitAction{coord_from_json(a.at("pos")), int_field(a, "amount")};
  } else if (type == "end_turn") {
    m.action = EndTurnAction{};
  } else {
    throw std::runtime_error("unknown move type '" + type + "'");
  }
  if (const Value* changes = v.find("changes")) {
    for (const Value& c : changes->array()) m.changes.push_back(change_from_json(c));
  }
  return m;
}

Value history_to_json(const History& h) {
  Array groups;
  for (const MoveGroup& g : h.groups()) {
    Object go;
    go["version"] = static_cast<double>(g.version);
    go["rng_before"] = u64_to_hex(g.rng_before);
    go["rng_after"] = u64_to_hex(g.rng_after);
    Array moves;
    for (const Move& m : g.moves) moves.push_back(move_to_json(m));
    go["moves"] = std::move(moves);
    groups.push_back(std::move(go));
  }
  Object o;
  o["groups"] = std::move(groups);
  return o;
}

History history_from_json(const Value& v) {
  History h;
  for (const Value& gv : v.at("groups").array()) {
    MoveGroup g;
    g.version = u64_from_json(gv.at("version"));
    g.rng_before = u64_from_json(gv.at("rng_before"));
    g.rng_after = u64_from_json(gv.at("rng_after"));
    for (const Value& mv : gv.at("moves").array()) g.moves.push_back(move_from_json(mv));
    try {
      h.append(std::move(g));
    } catch (const std::logic_error& e) {
      throw std::runtime_error(std::string("invalid history: ") + e.what());
    }
  }
  return h;
}

Value serialize_game_to_json_value(const GameState& state) {
  Object o;
  o["save_version"] = static_cast<double>(kCurrentSaveVersion);
  o["game_id"] = state.game_id;
  o["current_player"] = static_cast<double>(state.current_player);
  o["turn_counter"] = static_cast<double>(state.turn_counter);
  o["version"] = static_cast<double>(state.version);
  o["rng_state"] = u64_to_hex(state.rng_state);
  o["winner"] = static_cast<double>(state.winner);
  o["finished"] = state.finished;

  Object coins;
  for (const auto& [p, c] : state.player_coins) coins[std::to_string(p)] = static_cast<double>(c);
  o["player_coins"] = std::move(coins);

  Object tiles;
  for (const Tile* t : state.world.tiles()) tiles[coord_key(t->coord)] = tile_to_json(*t);
  o["tiles"] = std::move(tiles);

  Object units;
  for (const Unit* u : state.world.units()) units[coord_key(u->coord)] = unit_to_json(*u);
  o["units"] = std::move(units);
  return o;
}

std::string serialize_game_to_json(const GameState& state) {
  return json::stringify(serialize_game_to_json_value(state), 2);
}

GameState deserialize_game_from_json(const std::string& json_text) {
  const Value root = json::parse(json_text);
  if (!root.is_object()) throw std::runtime_error("game save must be a JSON object");

  GameState s;
  s.save_version = int_field(root, "save_version", kCurrentSaveVersion);
  if (s.save_version > kCurrentSaveVersion) {
    log::warn("game save version " + std::to_string(s.save_version) + " is newer than " +
              std::to_string(kCurrentSaveVersion));
  }
  if (const Value* id = root.find("game_id")) s.game_id = id->string_value();
  s.current_player = int_field(root, "current_player", 1);
  s.turn_counter = int_field(root, "turn_counter", 1);
  if (const Value* v = root.find("version")) s.version = u64_from_json(*v);
  if (const Value* r = root.find("rng_state")) s.rng_state = u64_from_json(*r);
  s.winner = int_field(root, "winner");
  if (const Value* f = root.find("finished")) s.finished = f->bool_value();

  if (const Value* coins = root.find("player_coins")) {
    for (const auto& [key, val] : coins->object()) {
      PlayerId player = kNeutralPlayer;
      try {
        player = std::stoi(key);
      } catch (const std::exception&) {
        throw std::runtime_error("invalid player id '" + key + "' in player_coins");
      }
      s.player_coins[player] = int_from_json(val, "player_coins." + key);
    }
  }

  if (const Value* tiles = root.find("tiles")) {
    for (const auto& [key, tv] : tiles->object()) {
      Tile t = tile_from_json(tv);
      if (coord_key(t.coord) != key) throw std::runtime_error("tile key '" + key + "' does not match its coord");
      s.world.add_tile(std::move(t));
    }
  }
  if (const Value* units = root.find("units")) {
    for (const auto& [key, uv] : units->object()) {
      Unit u = unit_from_json(uv);
      if (coord_key(u.coord) != key) throw std::runtime_error("unit key '" + key + "' does not match its coord");
      s.world.add_unit(std::move(u));
    }
  }
  return s;
}

std::string serialize_history_to_json(const History& h) { return json::stringify(history_to_json(h), 2); }

History deserialize_history_from_json(const std::string& json_text) {
  return history_from_json(json::parse(json_text));
}

Value game_config_to_json(const GameConfig& cfg) {
  Array players;
  for (const PlayerConfig& p : cfg.players) {
    Object po;
    po["id"] = static_cast<double>(p.player_id);
    po["name"] = p.name;
    po["team"] = static_cast<double>(p.team_id);
    po["startingCoins"] = static_cast<double>(p.starting_coins);
    players.push_back(std::move(po));
  }
  Object income;
  income["landbase"] = static_cast<double>(cfg.income.landbase_income);
  income["navalbase"] = static_cast<double>(cfg.income.navalbase_income);
  income["airportbase"] = static_cast<double>(cfg.income.airportbase_income);
  income["missilesilo"] = static_cast<double>(cfg.income.missilesilo_income);
  income["mines"] = static_cast<double>(cfg.income.mines_income);
  income["game"] = static_cast<double>(cfg.income.game_income);
  Array allowed;
  for (int id : cfg.allowed_units) allowed.push_back(static_cast<double>(id));

  Object o;
  o["players"] = std::move(players);
  o["income"] = std::move(income);
  o["allowedUnits"] = std::move(allowed);
  o["seed"] = u64_to_hex(cfg.seed);
  return o;
}

GameConfig game_config_from_json(const Value& v) {
  GameConfig cfg;
  for (const Value& pv : v.at("players").array()) {
    PlayerConfig p;
    p.player_id = int_field(pv, "id");
    if (p.player_id <= 0) throw std::runtime_error("player id must be positive");
    if (const Value* n = pv.find("name")) p.name = n->string_value();
    p.team_id = int_field(pv, "team", p.player_id);
    p.starting_coins = int_field(pv, "startingCoins");
    cfg.players.push_back(std::move(p));
  }
  if (const Value* inc = v.find("income")) {
    cfg.income.landbase_income = int_field(*inc, "landbase");
    cfg.income.navalbase_income = int_field(*inc, "navalbase");
    cfg.income.airportbase_income = int_field(*inc, "airportbase");
    cfg.income.missilesilo_income = int_field(*inc, "missilesilo");
    cfg.income.mines_income = int_field(*inc, "mines");
    cfg.income.game_income = int_field(*inc, "game");
  }
  if (const Value* allowed = v.find("allowedUnits")) {
    for (const Value& id : allowed->array()) cfg.allowed_units.push_back(int_from_json(id, "allowedUnits"));
  }
  if (const Value* seed = v.find("seed")) cfg.seed = u64_from_json(*seed);
  return cfg;
}

} // namespace hextactics
