#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hextactics/core/moves.h"

namespace hextactics {

struct GameState;

// Moves committed together in one versioned write.
struct MoveGroup {
  // GameState::version this group produced.
  std::uint64_t version{0};
  std::uint64_t rng_before{0};
  std::uint64_t rng_after{0};
  std::vector<Move> moves;
};

// Append-only log of move groups.
class History {
 public:
  // Throws std::logic_error unless group.version is exactly one past the last group's.
  void append(MoveGroup group);

  const std::vector<MoveGroup>& groups() const { return groups_; }
  std::size_t size() const { return groups_.size(); }
  bool empty() const { return groups_.empty(); }

  // Every change of every move, in order.
  std::vector<Change> all_changes() const;

 private:
  std::vector<MoveGroup> groups_;
};

// Replay one group's changes and restore the version and RNG state it recorded.
void replay_group(GameState& state, const MoveGroup& group);

// Replays the whole history onto a copy of `initial`.
GameState replay_history(const GameState& initial, const History& history);

// Replays history from `initial` and compares the result with `expected`
// by digest. On divergence returns false, logs an error and fills *error.
bool verify_replay(const GameState& initial, const History& history, const GameState& expected,
                   std::string* error = nullptr);

} // namespace hextactics
