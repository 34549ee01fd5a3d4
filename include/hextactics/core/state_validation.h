#pragma once

#include <string>
#include <vector>

#include "hextactics/core/game_state.h"
#include "hextactics/core/rules.h"

namespace hextactics {

// Check the invariants of a GameState.
//
// Intended for tests, replay verification and loading hand-edited saves.
// If `rules` is provided, unit and terrain ids are checked against it and
// unit health against the type's maximum.
//
// Returns a sorted list of human-readable errors. Empty => valid.
std::vector<std::string> validate_game_state(const GameState& s, const RulesTable* rules = nullptr);

} // namespace hextactics
