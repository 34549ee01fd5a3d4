#include "hextactics/core/changes.h"

#include <stdexcept>
#include <type_traits>

#include "hextactics/core/game_state.h"

namespace hextactics {
namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

void overwrite_unit(World& world, const Unit& snapshot) {
  Unit* u = world.mutable_unit_at(snapshot.coord);
  if (!u) throw std::logic_error("replay: no unit at " + format_coord(snapshot.coord));
  *u = snapshot;
}

Tile& require_tile(World& world, const AxialCoord& c) {
  Tile* t = world.mutable_tile_at(c);
  if (!t) throw std::logic_error("replay: no tile at " + format_coord(c));
  return *t;
}

} // namespace

const char* change_kind_label(const Change& c) {
  return std::visit(
      [](const auto& ch) -> const char* {
        using T = std::decay_t<decltype(ch)>;
        if constexpr (std::is_same_v<T, UnitMoved>) {
          return "unit_moved";
        } else if constexpr (std::is_same_v<T, UnitDamaged>) {
          return "unit_damaged";
        } else if constexpr (std::is_same_v<T, UnitKilled>) {
          return "unit_killed";
        } else if constexpr (std::is_same_v<T, UnitHealed>) {
          return "unit_healed";
        } else if constexpr (std::is_same_v<T, UnitBuilt>) {
          return "unit_built";
        } else if constexpr (std::is_same_v<T, CoinsChanged>) {
          return "coins_changed";
        } else if constexpr (std::is_same_v<T, CaptureStarted>) {
          return "capture_started";
        } else if constexpr (std::is_same_v<T, CaptureCompleted>) {
          return "capture_completed";
        } else if constexpr (std::is_same_v<T, TileOwnerChanged>) {
          return "tile_owner_changed";
        } else if constexpr (std::is_same_v<T, PlayerChanged>) {
          return "player_changed";
        } else if constexpr (std::is_same_v<T, GameFinished>) {
          return "game_finished";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled change kind");
        }
      },
      c);
}

void apply_change(GameState& state, const Change& change) {
  World& world = state.world;
  std::visit(
      [&](const auto& ch) {
        using T = std::decay_t<decltype(ch)>;
        if constexpr (std::is_same_v<T, UnitMoved>) {
          world.move_unit(ch.previous.coord, ch.updated.coord);
          overwrite_unit(world, ch.updated);
        } else if constexpr (std::is_same_v<T, UnitDamaged> || std::is_same_v<T, UnitHealed>) {
          overwrite_unit(world, ch.updated);
        } else if constexpr (std::is_same_v<T, UnitKilled>) {
          if (!world.remove_unit(ch.previous.coord)) {
            throw std::logic_error("replay: no unit to remove at " + format_coord(ch.previous.coord));
          }
        } else if constexpr (std::is_same_v<T, UnitBuilt>) {
          if (world.unit_at(ch.unit.coord)) {
            throw std::logic_error("replay: build target " + format_coord(ch.unit.coord) + " is occupied");
          }
          world.add_unit(ch.unit);
          require_tile(world, ch.tile).last_acted_turn = ch.unit.last_acted_turn;
        } else if constexpr (std::is_same_v<T, CoinsChanged>) {
          state.player_coins[ch.player] = ch.new_coins;
        } else if constexpr (std::is_same_v<T, CaptureStarted>) {
          overwrite_unit(world, ch.unit);
        } else if constexpr (std::is_same_v<T, CaptureCompleted>) {
          // Ownership itself moves with the accompanying TileOwnerChanged.
          if (Unit* u = world.mutable_unit_at(ch.tile)) u->capture_started_turn = 0;
        } else if constexpr (std::is_same_v<T, TileOwnerChanged>) {
          require_tile(world, ch.tile).player = ch.new_owner;
        } else if constexpr (std::is_same_v<T, PlayerChanged>) {
          state.current_player = ch.new_player;
          state.turn_counter = ch.new_turn;
          for (const Unit& u : ch.reset_units) overwrite_unit(world, u);
        } else if constexpr (std::is_same_v<T, GameFinished>) {
          state.winner = ch.winner;
          state.finished = true;
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled change kind");
        }
      },
      change);
}

void apply_changes(GameState& state, const std::vector<Change>& changes) {
  for (const Change& c : changes) apply_change(state, c);
}

} // namespace hextactics
