#pragma once

#include <string>
#include <vector>

#include "hextactics/core/hex_coords.h"

namespace hextactics {

using PlayerId = int;
inline constexpr PlayerId kNeutralPlayer = 0;

// Roads and bridges laid over a tile replace its terrain for movement costs.
enum class CrossingType { None = 0, Road = 1, Bridge = 2 };

struct Tile {
  AxialCoord coord;
  int tile_type{0};
  PlayerId player{kNeutralPlayer};
  std::string shortcut;

  // Last turn this tile produced a unit (0 = never). A tile builds at most once per turn.
  int last_acted_turn{0};

  CrossingType crossing{CrossingType::None};
};

struct AttackRecord {
  AxialCoord position;
  bool is_ranged{false};
  int turn{0};

  bool operator==(const AttackRecord& o) const {
    return position == o.position && is_ranged == o.is_ranged && turn == o.turn;
  }
};

struct Unit {
  AxialCoord coord;
  PlayerId player{kNeutralPlayer};
  int unit_type{0};

  // "A1", "B4": player letter followed by a per-player counter.
  std::string shortcut;

  int available_health{0};

  // Remaining movement budget for the current activation. Never negative.
  double distance_left{0.0};

  // Index into the unit type's action order.
  int progression_step{0};

  // Which option of an "a|b" slot the unit committed to (empty = none yet).
  std::string chosen_alternative;

  int last_topped_up_turn{0};
  int last_acted_turn{0};

  // Turn the current capture began on (0 = not capturing).
  int capture_started_turn{0};

  // Attacks received since the last refresh, oldest first.
  std::vector<AttackRecord> attack_history;
  int attacks_received_this_turn{0};
};

bool same_unit_state(const Unit& a, const Unit& b);

// Label letter for a player: 1 -> 'A', 2 -> 'B', ...
char player_letter(PlayerId p);

} // namespace hextactics
