#pragma once

#include <vector>

#include "hextactics/core/game_state.h"
#include "hextactics/core/moves.h"
#include "hextactics/core/rules.h"

namespace hextactics {

// Legal next moves for the current player's unit at c: move destinations
// (sorted), attack targets, capture and heal. Every returned Move passed a
// dry run and can be applied as is; its changes list is left empty.
//
// The state is only used for speculative evaluation and is restored before
// returning.
std::vector<Move> unit_options(const RulesTable& rules, const GameConfig& cfg, GameState& state,
                               const AxialCoord& c);

// Affordable build moves for the tile at c, in the terrain's buildable order.
std::vector<Move> tile_options(const RulesTable& rules, const GameConfig& cfg, GameState& state,
                               const AxialCoord& c);

} // namespace hextactics
