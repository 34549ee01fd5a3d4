#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hextactics/core/changes.h"
#include "hextactics/core/game_state.h"
#include "hextactics/core/rules.h"

namespace hextactics {

// Options controlling which parts of a GameState are included in a digest.
struct DigestOptions {
  // Include game_id and save_version.
  bool include_identity{true};

  // Include the write version and the RNG state. Off compares board positions only.
  bool include_versioning{true};
};

// Stable 64-bit digest of a game state.
//
//  - Deterministic across runs/platforms (no dependence on unordered_map iteration order).
//  - Independent of how the World is layered: only the merged view is hashed.
//  - Sensitive to ordering of attack histories.
std::uint64_t digest_game_state64(const GameState& state, const DigestOptions& opt = {});

// Digest of a change list, in order. Two replicas that applied the same
// moves must produce the same value.
std::uint64_t digest_changes64(const std::vector<Change>& changes);

// Identifies a rules table in bug reports and regression tests.
std::uint64_t digest_rules64(const RulesTable& rules);

// Fixed-width lowercase hex.
std::string digest64_to_hex(std::uint64_t v);

} // namespace hextactics
