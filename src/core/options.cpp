#include "hextactics/core/options.h"

#include "hextactics/core/combat.h"
#include "hextactics/core/move_processor.h"
#include "hextactics/core/movement.h"
#include "hextactics/core/progression.h"

namespace hextactics {
namespace {

// Scratch layer for looking at a refreshed unit; always popped.
class ScratchLayer {
 public:
  explicit ScratchLayer(World& world) : world_(world) { world_.push(); }
  ~ScratchLayer() { world_.pop(); }
  ScratchLayer(const ScratchLayer&) = delete;
  ScratchLayer& operator=(const ScratchLayer&) = delete;

 private:
  World& world_;
};

void keep_if_legal(const MoveProcessor& mp, GameState& state, MoveAction action, std::vector<Move>& out) {
  Move m;
  m.player = state.current_player;
  m.action = std::move(action);
  if (!mp.dry_run(state, m)) return;
  m.changes.clear();
  out.push_back(std::move(m));
}

} // namespace

std::vector<Move> unit_options(const RulesTable& rules, const GameConfig& cfg, GameState& state,
                               const AxialCoord& c) {
  std::vector<Move> out;
  const Unit* found = state.world.unit_at(c);
  if (!found || found->player != state.current_player || state.finished) return out;

  std::vector<MoveAction> candidates;
  {
    ScratchLayer scratch(state.world);
    top_up_unit_if_needed(rules, state.world, c, state.turn_counter);
    const Unit unit = *state.world.unit_at(c);

    if (open_slot_for_action(rules, unit, kActionMove) >= 0 || open_slot_for_action(rules, unit, kActionRetreat) >= 0) {
      for (const AxialCoord& dest : compute_unit_paths(rules, state.world, unit).destinations()) {
        if (dest != c) candidates.push_back(MoveUnitAction{c, dest});
      }
    }
    if (open_slot_for_action(rules, unit, kActionAttack) >= 0) {
      for (const Unit* target : state.world.units()) {
        if (can_attack_target(rules, unit, *target)) candidates.push_back(AttackUnitAction{c, target->coord});
      }
    }
    if (open_slot_for_action(rules, unit, kActionCapture) >= 0) candidates.push_back(CaptureBuildingAction{c});
    if (open_slot_for_action(rules, unit, kActionHeal) >= 0) candidates.push_back(HealUnitAction{c, 0});
  }

  const MoveProcessor mp(rules, cfg);
  for (MoveAction& a : candidates) keep_if_legal(mp, state, std::move(a), out);
  return out;
}

std::vector<Move> tile_options(const RulesTable& rules, const GameConfig& cfg, GameState& state,
                               const AxialCoord& c) {
  std::vector<Move> out;
  const Tile* tile = state.world.tile_at(c);
  if (!tile || tile->player != state.current_player || state.finished) return out;
  const TerrainDef* terrain = rules.find_terrain(tile->tile_type);
  if (!terrain) return out;

  const MoveProcessor mp(rules, cfg);
  for (int unit_type : terrain->buildable_unit_ids) keep_if_legal(mp, state, BuildUnitAction{c, unit_type}, out);
  return out;
}

} // namespace hextactics
