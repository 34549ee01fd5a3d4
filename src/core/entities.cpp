#include "hextactics/core/entities.h"

namespace hextactics {

bool same_unit_state(const Unit& a, const Unit& b) {
  return a.coord == b.coord && a.player == b.player && a.unit_type == b.unit_type && a.shortcut == b.shortcut &&
         a.available_health == b.available_health && a.distance_left == b.distance_left &&
         a.progression_step == b.progression_step && a.chosen_alternative == b.chosen_alternative &&
         a.last_topped_up_turn == b.last_topped_up_turn && a.last_acted_turn == b.last_acted_turn &&
         a.capture_started_turn == b.capture_started_turn && a.attack_history == b.attack_history &&
         a.attacks_received_this_turn == b.attacks_received_this_turn;
}

char player_letter(PlayerId p) {
  if (p < 1 || p > 26) return '?';
  return static_cast<char>('A' + (p - 1));
}

} // namespace hextactics
