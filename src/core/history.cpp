#include "hextactics/core/history.h"

#include <stdexcept>

#include "hextactics/core/game_state.h"
#include "hextactics/util/digest.h"
#include "hextactics/util/log.h"

namespace hextactics {

void History::append(MoveGroup group) {
  if (!groups_.empty() && group.version != groups_.back().version + 1) {
    throw std::logic_error("history: group version " + std::to_string(group.version) + " does not follow " +
                           std::to_string(groups_.back().version));
  }
  groups_.push_back(std::move(group));
}

std::vector<Change> History::all_changes() const {
  std::vector<Change> out;
  for (const MoveGroup& g : groups_) {
    for (const Move& m : g.moves) out.insert(out.end(), m.changes.begin(), m.changes.end());
  }
  return out;
}

void replay_group(GameState& state, const MoveGroup& group) {
  if (state.rng_state != group.rng_before) {
    throw std::logic_error("replay: RNG state does not match the state group " + std::to_string(group.version) +
                           " was applied to");
  }
  for (const Move& m : group.moves) apply_changes(state, m.changes);
  state.rng_state = group.rng_after;
  state.version = group.version;
}

GameState replay_history(const GameState& initial, const History& history) {
  GameState s = initial;
  for (const MoveGroup& g : history.groups()) replay_group(s, g);
  return s;
}

bool verify_replay(const GameState& initial, const History& history, const GameState& expected,
                   std::string* error) {
  std::string msg;
  try {
    const GameState replayed = replay_history(initial, history);
    const std::uint64_t got = digest_game_state64(replayed);
    const std::uint64_t want = digest_game_state64(expected);
    if (got == want) return true;
    msg = "replay digest " + digest64_to_hex(got) + " != expected " + digest64_to_hex(want);
  } catch (const std::logic_error& e) {
    msg = std::string("replay failed: ") + e.what();
  }
  log::error("verify_replay: " + msg);
  if (error) *error = msg;
  return false;
}

} // namespace hextactics
