#pragma once

#include <string>
#include <variant>
#include <vector>

#include "hextactics/core/entities.h"
#include "hextactics/core/hex_coords.h"

namespace hextactics {

struct GameState;

// One observable effect of an applied move. Unit-carrying changes hold full
// snapshots so a replica can replay them without the rules.

struct UnitMoved {
  Unit previous;
  Unit updated;
};

// Emitted for both sides of every attack (damage may be 0) and for splash victims.
struct UnitDamaged {
  Unit previous;
  Unit updated;
};

struct UnitKilled {
  Unit previous;
};

struct UnitHealed {
  Unit previous;
  Unit updated;
  int amount{0};
};

struct UnitBuilt {
  Unit unit;
  AxialCoord tile;
  int cost{0};
  int player_coins{0};
};

struct CoinsChanged {
  PlayerId player{kNeutralPlayer};
  int previous_coins{0};
  int new_coins{0};
  // "build", "income"
  std::string reason;
};

struct CaptureStarted {
  // Capturing unit after the action.
  Unit unit;
  AxialCoord tile;
  int tile_type{0};
  PlayerId current_owner{kNeutralPlayer};
};

struct CaptureCompleted {
  AxialCoord tile;
  PlayerId capturer{kNeutralPlayer};
  PlayerId previous_owner{kNeutralPlayer};
};

struct TileOwnerChanged {
  AxialCoord tile;
  PlayerId previous_owner{kNeutralPlayer};
  PlayerId new_owner{kNeutralPlayer};
};

struct PlayerChanged {
  PlayerId previous_player{kNeutralPlayer};
  PlayerId new_player{kNeutralPlayer};
  int previous_turn{0};
  int new_turn{0};
  // Incoming player's units after their refresh.
  std::vector<Unit> reset_units;
};

struct GameFinished {
  PlayerId winner{kNeutralPlayer};
};

using Change = std::variant<UnitMoved, UnitDamaged, UnitKilled, UnitHealed, UnitBuilt, CoinsChanged, CaptureStarted,
                            CaptureCompleted, TileOwnerChanged, PlayerChanged, GameFinished>;

const char* change_kind_label(const Change& c);

// Replays changes onto state without validation.
//
// Throws std::logic_error when a change does not fit the state (missing unit,
// occupied destination): a replica that diverged cannot be patched up.
void apply_changes(GameState& state, const std::vector<Change>& changes);
void apply_change(GameState& state, const Change& change);

} // namespace hextactics
