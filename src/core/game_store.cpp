#include "hextactics/core/game_store.h"

#include <utility>

#include "hextactics/util/log.h"

namespace hextactics {

const char* commit_status_label(CommitStatus s) {
  switch (s) {
    case CommitStatus::Ok: return "ok";
    case CommitStatus::Rejected: return "rejected";
    case CommitStatus::VersionMismatch: return "version_mismatch";
    case CommitStatus::NotFound: return "not_found";
    case CommitStatus::AlreadyExists: return "already_exists";
  }
  return "unknown";
}

GameStore::GameStore(std::shared_ptr<const RulesTable> rules) : rules_(std::move(rules)) {}

CommitStatus GameStore::create_game(const std::string& game_id, GameConfig cfg, World world, std::string* error) {
  Game game(rules_, std::move(cfg), std::move(world), game_id);
  std::lock_guard<std::mutex> lock(mu_);
  if (games_.count(game_id)) {
    if (error) *error = "game '" + game_id + "' already exists";
    return CommitStatus::AlreadyExists;
  }
  games_.emplace(game_id, std::move(game));
  log::info("created game '" + game_id + "'");
  return CommitStatus::Ok;
}

std::optional<Game> GameStore::load(const std::string& game_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = games_.find(game_id);
  if (it == games_.end()) return std::nullopt;
  return it->second;
}

CommitStatus GameStore::save(const Game& game, std::uint64_t expected_version, std::string* error) {
  const std::string& id = game.state().game_id;
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = games_.find(id);
  if (it == games_.end()) {
    if (error) *error = "game '" + id + "' not found";
    return CommitStatus::NotFound;
  }
  if (it->second.version() != expected_version) {
    if (error) {
      *error = "game '" + id + "' is at version " + std::to_string(it->second.version()) + ", expected " +
               std::to_string(expected_version);
    }
    log::debug("save of '" + id + "' lost the race");
    return CommitStatus::VersionMismatch;
  }
  it->second = game;
  return CommitStatus::Ok;
}

CommitStatus GameStore::submit_moves(const std::string& game_id, std::uint64_t expected_version,
                                     std::vector<Move>* moves, std::string* error) {
  std::optional<Game> game = load(game_id);
  if (!game) {
    if (error) *error = "game '" + game_id + "' not found";
    return CommitStatus::NotFound;
  }
  if (game->version() != expected_version) {
    if (error) {
      *error = "game '" + game_id + "' is at version " + std::to_string(game->version()) + ", expected " +
               std::to_string(expected_version);
    }
    return CommitStatus::VersionMismatch;
  }
  if (!moves || !game->process_moves(*moves, error)) {
    if (!moves && error) *error = "no moves";
    return CommitStatus::Rejected;
  }
  return save(*game, expected_version, error);
}

bool GameStore::verify(const std::string& game_id, std::string* error) const {
  const std::optional<Game> game = load(game_id);
  if (!game) {
    if (error) *error = "game '" + game_id + "' not found";
    return false;
  }
  return game->verify(error);
}

std::vector<std::string> GameStore::game_ids() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  for (const auto& [id, _] : games_) out.push_back(id);
  return out;
}

} // namespace hextactics
