#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hextactics/core/game.h"

namespace hextactics {

enum class CommitStatus {
  Ok,
  // A move failed validation; nothing was stored.
  Rejected,
  // The caller's version is stale. Reload and retry.
  VersionMismatch,
  NotFound,
  AlreadyExists,
};

const char* commit_status_label(CommitStatus s);

// In-memory persistence boundary for games.
//
// Readers get copies. Writers present the version they last observed and are
// turned away with VersionMismatch when another write landed first. The lock
// only guards the map; moves are applied on a copy outside it.
class GameStore {
 public:
  explicit GameStore(std::shared_ptr<const RulesTable> rules);

  CommitStatus create_game(const std::string& game_id, GameConfig cfg, World world, std::string* error = nullptr);

  std::optional<Game> load(const std::string& game_id) const;

  // Replaces the stored game if it is still at expected_version.
  CommitStatus save(const Game& game, std::uint64_t expected_version, std::string* error = nullptr);

  // Load, apply `moves` as one group, save. On Ok, *moves carry their changes.
  CommitStatus submit_moves(const std::string& game_id, std::uint64_t expected_version, std::vector<Move>* moves,
                            std::string* error = nullptr);

  bool verify(const std::string& game_id, std::string* error = nullptr) const;

  std::vector<std::string> game_ids() const;

 private:
  std::shared_ptr<const RulesTable> rules_;
  mutable std::mutex mu_;
  std::map<std::string, Game> games_;
};

} // namespace hextactics
