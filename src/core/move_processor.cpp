#include "hextactics/core/move_processor.h"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include "hextactics/core/combat.h"
#include "hextactics/core/movement.h"
#include "hextactics/core/progression.h"
#include "hextactics/util/hash_rng.h"
#include "hextactics/util/log.h"

namespace hextactics {
namespace {

bool reject(std::string* error, const std::string& msg) {
  if (error) *error = msg;
  return false;
}

// Pushes a World layer and remembers the scalar state. Unless committed, the
// destructor pops the layer and restores the scalars.
class OverlayScope {
 public:
  explicit OverlayScope(GameState& state)
      : state_(state),
        current_player_(state.current_player),
        turn_counter_(state.turn_counter),
        version_(state.version),
        coins_(state.player_coins),
        rng_state_(state.rng_state),
        winner_(state.winner),
        finished_(state.finished) {
    state_.world.push();
  }

  OverlayScope(const OverlayScope&) = delete;
  OverlayScope& operator=(const OverlayScope&) = delete;

  ~OverlayScope() {
    if (!open_) return;
    state_.world.pop();
    state_.current_player = current_player_;
    state_.turn_counter = turn_counter_;
    state_.version = version_;
    state_.player_coins = std::move(coins_);
    state_.rng_state = rng_state_;
    state_.winner = winner_;
    state_.finished = finished_;
  }

  void commit() {
    state_.world.merge_top();
    open_ = false;
  }

 private:
  GameState& state_;
  bool open_{true};
  PlayerId current_player_;
  int turn_counter_;
  std::uint64_t version_;
  std::map<PlayerId, int> coins_;
  std::uint64_t rng_state_;
  PlayerId winner_;
  bool finished_;
};

void clamp_health(Unit& u, int damage) { u.available_health = std::max(0, u.available_health - damage); }

void record_capture(const TopUpResult& r, PlayerId capturer, std::vector<Change>& out) {
  if (!r.capture_completed) return;
  out.push_back(TileOwnerChanged{r.capture_coord, r.previous_owner, capturer});
  out.push_back(CaptureCompleted{r.capture_coord, capturer, r.previous_owner});
  log::info("capture completed at " + format_coord(r.capture_coord) + " by player " + std::to_string(capturer));
}

} // namespace

MoveProcessor::MoveProcessor(const RulesTable& rules, const GameConfig& cfg) : rules_(rules), cfg_(cfg) {}

bool MoveProcessor::dry_run(GameState& state, Move& move, std::string* error) const {
  OverlayScope scope(state);
  return run(state, move, error);
}

bool MoveProcessor::apply_group(GameState& state, std::vector<Move>& moves, MoveGroup* group,
                                std::string* error) const {
  if (moves.empty()) return reject(error, "no moves to apply");

  const std::uint64_t rng_before = state.rng_state;
  {
    OverlayScope scope(state);
    for (std::size_t i = 0; i < moves.size(); ++i) {
      std::string err;
      if (!run(state, moves[i], &err)) {
        for (Move& m : moves) m.changes.clear();
        return reject(error, "move " + std::to_string(i) + " (" + describe_move(moves[i]) + "): " + err);
      }
    }
    scope.commit();
  }

  state.version += 1;
  if (group) {
    group->version = state.version;
    group->rng_before = rng_before;
    group->rng_after = state.rng_state;
    group->moves = moves;
  }
  return true;
}

PlayerId MoveProcessor::next_player(PlayerId p, bool* wraps) const {
  if (wraps) *wraps = false;
  if (cfg_.players.empty()) return p;
  for (std::size_t i = 0; i < cfg_.players.size(); ++i) {
    if (cfg_.players[i].player_id != p) continue;
    if (i + 1 < cfg_.players.size()) return cfg_.players[i + 1].player_id;
    break;
  }
  if (wraps) *wraps = true;
  return cfg_.players.front().player_id;
}

int MoveProcessor::income_for(const GameState& state, PlayerId p) const {
  int income = 0;
  for (const Tile* t : state.world.tiles()) {
    if (t->player == p) income += tile_income(cfg_.income, t->tile_type);
  }
  if (cfg_.income.game_income > 0) income += cfg_.income.game_income;
  return income;
}

bool MoveProcessor::run(GameState& state, Move& move, std::string* error) const {
  if (state.finished) return reject(error, "game is over");
  if (move.player != kNeutralPlayer && move.player != state.current_player) {
    return reject(error, "not player " + std::to_string(move.player) + "'s turn (player " +
                             std::to_string(state.current_player) + " to move)");
  }

  std::vector<Change> changes;
  std::string err;
  const bool ok = std::visit([&](const auto& a) { return handle(state, a, changes, &err); }, move.action);
  if (!ok) {
    log::debug("rejected " + describe_move(move) + ": " + err);
    return reject(error, err);
  }
  move.changes = std::move(changes);
  return true;
}

void MoveProcessor::refresh_unit(GameState& state, const AxialCoord& c, std::vector<Change>& out) const {
  const Unit* u = state.world.unit_at(c);
  if (!u || u->player != state.current_player) return;
  const PlayerId owner = u->player;
  const TopUpResult r = top_up_unit_if_needed(rules_, state.world, c, state.turn_counter);
  record_capture(r, owner, out);
}

void MoveProcessor::damage_unit(World& world, const AxialCoord& c, int damage, std::vector<Change>& out) const {
  Unit* u = world.mutable_unit_at(c);
  if (!u) throw std::logic_error("damage_unit: no unit at " + format_coord(c));
  const Unit previous = *u;
  clamp_health(*u, damage);
  out.push_back(UnitDamaged{previous, *u});
  if (u->available_health <= 0) {
    out.push_back(UnitKilled{previous});
    world.remove_unit(c);
  }
}

bool MoveProcessor::handle(GameState& state, const MoveUnitAction& a, std::vector<Change>& out,
                           std::string* error) const {
  World& world = state.world;
  const Unit* found = world.unit_at(a.from);
  if (!found) return reject(error, "no unit at " + format_coord(a.from));
  if (found->player != state.current_player) {
    return reject(error, "unit at " + format_coord(a.from) + " belongs to player " + std::to_string(found->player));
  }

  refresh_unit(state, a.from, out);
  const Unit unit = *world.unit_at(a.from);

  std::string action = kActionMove;
  int slot = open_slot_for_action(rules_, unit, action);
  if (slot < 0) {
    action = kActionRetreat;
    slot = open_slot_for_action(rules_, unit, action);
  }
  if (slot < 0) return reject(error, "unit at " + format_coord(a.from) + " cannot move now");

  Path path;
  std::string err;
  if (!find_path(rules_, world, unit, a.to, &path, &err)) return reject(error, err);

  Unit& moved = world.move_unit(a.from, a.to);
  moved.distance_left = std::max(0.0, moved.distance_left - path.total_cost);
  moved.last_acted_turn = state.turn_counter;
  // Leaving the tile abandons a capture in progress.
  moved.capture_started_turn = 0;
  advance_progression(rules_, moved, slot, action);
  out.push_back(UnitMoved{unit, moved});
  return true;
}

bool MoveProcessor::handle(GameState& state, const AttackUnitAction& a, std::vector<Change>& out,
                           std::string* error) const {
  World& world = state.world;
  const Unit* att = world.unit_at(a.attacker);
  const Unit* def = world.unit_at(a.defender);
  if (!att) return reject(error, "no attacker at " + format_coord(a.attacker));
  if (!def) return reject(error, "no unit to attack at " + format_coord(a.defender));
  if (att->player != state.current_player) {
    return reject(error, "attacker belongs to player " + std::to_string(att->player));
  }
  if (def->player == att->player) return reject(error, "cannot attack your own unit");

  refresh_unit(state, a.attacker, out);
  const Unit attacker = *world.unit_at(a.attacker);
  const Unit defender = *world.unit_at(a.defender);

  const int slot = open_slot_for_action(rules_, attacker, kActionAttack);
  if (slot < 0) return reject(error, "unit at " + format_coord(a.attacker) + " cannot attack now");
  if (!base_attack_value(rules_, attacker.unit_type, defender.unit_type)) {
    return reject(error, rules_.unit(attacker.unit_type).name + " cannot attack " +
                             rules_.unit(defender.unit_type).name);
  }
  const int distance = hex_distance(attacker.coord, defender.coord);
  if (distance > rules_.unit(attacker.unit_type).attack_range) {
    return reject(error, "target at " + format_coord(a.defender) + " is out of range");
  }

  // Draw order: primary damage, counter damage, splash.
  util::HashRng rng(state.rng_state);
  const int bonus = wound_bonus(defender, attacker.coord);
  int defender_damage = 0;
  std::string err;
  if (!simulate_combat_damage(rules_, make_combat_context(world, attacker, defender, bonus), rng, &defender_damage,
                              &err)) {
    return reject(error, err);
  }
  int attacker_damage = 0;
  if (can_attack_target(rules_, defender, attacker)) {
    if (!simulate_combat_damage(rules_, make_combat_context(world, defender, attacker, 0), rng, &attacker_damage,
                                &err)) {
      throw std::logic_error("counter-attack: " + err);
    }
  }

  Unit* att_mut = world.mutable_unit_at(a.attacker);
  advance_progression(rules_, *att_mut, slot, kActionAttack);
  att_mut->last_acted_turn = state.turn_counter;
  clamp_health(*att_mut, attacker_damage);
  const Unit attacker_after = *att_mut;

  Unit* def_mut = world.mutable_unit_at(a.defender);
  def_mut->attack_history.push_back(AttackRecord{attacker.coord, distance >= 2, state.turn_counter});
  def_mut->attacks_received_this_turn += 1;
  clamp_health(*def_mut, defender_damage);
  const Unit defender_after = *def_mut;

  out.push_back(UnitDamaged{defender, defender_after});
  out.push_back(UnitDamaged{attacker, attacker_after});
  if (defender_after.available_health <= 0) {
    out.push_back(UnitKilled{defender});
    world.remove_unit(a.defender);
  }
  if (attacker_after.available_health <= 0) {
    out.push_back(UnitKilled{attacker});
    world.remove_unit(a.attacker);
  } else {
    for (const SplashTarget& t : compute_splash_damage(rules_, world, attacker_after, a.defender, rng)) {
      damage_unit(world, t.coord, t.damage, out);
    }
  }

  state.rng_state = rng.state();
  return true;
}

bool MoveProcessor::handle(GameState& state, const BuildUnitAction& a, std::vector<Change>& out,
                           std::string* error) const {
  World& world = state.world;
  const Tile* tile = world.tile_at(a.pos);
  if (!tile) return reject(error, "no tile at " + format_coord(a.pos));
  if (tile->player != state.current_player) {
    return reject(error, "tile at " + format_coord(a.pos) + " is not owned by player " +
                             std::to_string(state.current_player));
  }
  const TerrainDef& terrain = rules_.terrain(tile->tile_type);
  if (std::find(terrain.buildable_unit_ids.begin(), terrain.buildable_unit_ids.end(), a.unit_type) ==
      terrain.buildable_unit_ids.end()) {
    return reject(error, terrain.name + " cannot build unit type " + std::to_string(a.unit_type));
  }
  const UnitDef* def = rules_.find_unit(a.unit_type);
  if (!def) return reject(error, "unknown unit type " + std::to_string(a.unit_type));
  if (!cfg_.allowed_units.empty() &&
      std::find(cfg_.allowed_units.begin(), cfg_.allowed_units.end(), a.unit_type) == cfg_.allowed_units.end()) {
    return reject(error, def->name + " is not allowed in this game");
  }
  if (tile->last_acted_turn == state.turn_counter) {
    return reject(error, "tile at " + format_coord(a.pos) + " already built this turn");
  }
  if (world.unit_at(a.pos)) return reject(error, "tile at " + format_coord(a.pos) + " is occupied");
  const int coins = state.player_coins[state.current_player];
  if (coins < def->cost) {
    return reject(error, "insufficient coins: " + def->name + " costs " + std::to_string(def->cost) + ", have " +
                             std::to_string(coins));
  }

  const int remaining = coins - def->cost;
  state.player_coins[state.current_player] = remaining;

  Unit u;
  u.coord = a.pos;
  u.player = state.current_player;
  u.unit_type = a.unit_type;
  u.available_health = def->health;
  u.distance_left = 0.0;
  u.last_acted_turn = state.turn_counter;
  u.last_topped_up_turn = state.turn_counter;
  u.progression_step = 1;
  world.add_unit(u);
  world.mutable_tile_at(a.pos)->last_acted_turn = state.turn_counter;

  out.push_back(UnitBuilt{*world.unit_at(a.pos), a.pos, def->cost, remaining});
  out.push_back(CoinsChanged{state.current_player, coins, remaining, "build"});
  return true;
}

bool MoveProcessor::handle(GameState& state, const CaptureBuildingAction& a, std::vector<Change>& out,
                           std::string* error) const {
  World& world = state.world;
  const Unit* found = world.unit_at(a.pos);
  if (!found) return reject(error, "no unit at " + format_coord(a.pos));
  if (found->player != state.current_player) {
    return reject(error, "unit at " + format_coord(a.pos) + " belongs to player " + std::to_string(found->player));
  }

  refresh_unit(state, a.pos, out);
  const Unit unit = *world.unit_at(a.pos);
  const Tile* tile = world.tile_at(a.pos);
  if (!tile) return reject(error, "no tile at " + format_coord(a.pos));
  if (tile->player == unit.player) return reject(error, "tile at " + format_coord(a.pos) + " is already yours");

  const TerrainUnitProperties* props = rules_.find_properties(tile->tile_type, unit.unit_type);
  if (!props || !props->can_capture) {
    return reject(error, rules_.unit(unit.unit_type).name + " cannot capture " + rules_.terrain(tile->tile_type).name);
  }
  if (unit.capture_started_turn != 0) return reject(error, "unit is already capturing");

  const int slot = open_slot_for_action(rules_, unit, kActionCapture);
  if (slot < 0) return reject(error, "unit at " + format_coord(a.pos) + " cannot capture now");

  const int tile_type = tile->tile_type;
  const PlayerId owner = tile->player;
  Unit* u = world.mutable_unit_at(a.pos);
  u->capture_started_turn = state.turn_counter;
  u->last_acted_turn = state.turn_counter;
  advance_progression(rules_, *u, slot, kActionCapture);
  out.push_back(CaptureStarted{*u, a.pos, tile_type, owner});
  return true;
}

bool MoveProcessor::handle(GameState& state, const HealUnitAction& a, std::vector<Change>& out,
                           std::string* error) const {
  World& world = state.world;
  const Unit* found = world.unit_at(a.pos);
  if (!found) return reject(error, "no unit at " + format_coord(a.pos));
  if (found->player != state.current_player) {
    return reject(error, "unit at " + format_coord(a.pos) + " belongs to player " + std::to_string(found->player));
  }

  refresh_unit(state, a.pos, out);
  const Unit unit = *world.unit_at(a.pos);
  const int max_health = rules_.unit(unit.unit_type).health;
  if (unit.available_health >= max_health) return reject(error, "unit is at full health");

  const int slot = open_slot_for_action(rules_, unit, kActionHeal);
  if (slot < 0) return reject(error, "unit at " + format_coord(a.pos) + " cannot heal now");

  int amount = a.amount > 0 ? std::min(a.amount, max_health - unit.available_health)
                            : resting_heal_amount(rules_, world, unit, state.turn_counter);
  if (amount <= 0) return reject(error, "unit cannot heal at " + format_coord(a.pos));

  Unit* u = world.mutable_unit_at(a.pos);
  u->available_health += amount;
  u->last_acted_turn = state.turn_counter;
  advance_progression(rules_, *u, slot, kActionHeal);
  out.push_back(UnitHealed{unit, *u, amount});
  return true;
}

bool MoveProcessor::handle(GameState& state, const EndTurnAction&, std::vector<Change>& out,
                           std::string* error) const {
  if (cfg_.players.empty()) return reject(error, "no players configured");

  const PlayerId ending = state.current_player;
  const int income = income_for(state, ending);
  if (income > 0) {
    const int before = state.player_coins[ending];
    state.player_coins[ending] = before + income;
    out.push_back(CoinsChanged{ending, before, before + income, "income"});
  }

  bool wraps = false;
  const PlayerId incoming = next_player(ending, &wraps);
  const int previous_turn = state.turn_counter;
  state.current_player = incoming;
  if (wraps) state.turn_counter += 1;

  PlayerChanged pc;
  pc.previous_player = ending;
  pc.new_player = incoming;
  pc.previous_turn = previous_turn;
  pc.new_turn = state.turn_counter;

  std::vector<AxialCoord> coords;
  for (const Unit* u : state.world.units_of_player(incoming)) coords.push_back(u->coord);
  for (const AxialCoord& c : coords) {
    const TopUpResult r = top_up_unit_if_needed(rules_, state.world, c, state.turn_counter);
    if (!r.refreshed) continue;
    record_capture(r, incoming, out);
    pc.reset_units.push_back(*state.world.unit_at(c));
  }
  out.push_back(std::move(pc));

  log::info("player " + std::to_string(ending) + " ended turn " + std::to_string(previous_turn) + "; player " +
            std::to_string(incoming) + " to move on turn " + std::to_string(state.turn_counter));

  const std::vector<PlayerId> alive = state.world.players_with_units();
  if (cfg_.players.size() > 1 && alive.size() == 1) {
    state.winner = alive.front();
    state.finished = true;
    out.push_back(GameFinished{state.winner});
    log::info("player " + std::to_string(state.winner) + " wins");
  }
  return true;
}

} // namespace hextactics
