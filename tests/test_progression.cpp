#include <iostream>
#include <string>
#include <vector>

#include "hextactics/core/progression.h"
#include "test.h"

#define HT_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_progression() {
  using namespace hextactics;
  using namespace hextactics::testing;
  using Actions = std::vector<std::string>;
  const RulesTable rules = make_test_rules();
  const AxialCoord o{0, 0};

  HT_ASSERT(slot_actions("attack|capture") == (Actions{"attack", "capture"}));
  HT_ASSERT(slot_actions(" move ") == (Actions{"move"}));
  HT_ASSERT(is_point_based_action("retreat"));
  HT_ASSERT(!is_point_based_action("attack"));

  // Default order: move, then attack|capture.
  {
    Unit u = make_unit(rules, kSoldier, 1, o);
    HT_ASSERT(allowed_actions(rules, u) == (Actions{"move"}));
    HT_ASSERT(open_slot_for_action(rules, u, "move") == 0);
    // Look-ahead: the next slot is open while moving.
    HT_ASSERT(open_slot_for_action(rules, u, "attack") == 1);
    HT_ASSERT(open_slot_for_action(rules, u, "capture") == 1);
    HT_ASSERT(open_slot_for_action(rules, u, "heal") == -1);

    // Spending part of the budget keeps the unit in the move slot.
    u.distance_left = 1.0;
    advance_progression(rules, u, 0, "move");
    HT_ASSERT(u.progression_step == 0);

    // Spending the rest moves on to attack|capture.
    u.distance_left = 0.0;
    advance_progression(rules, u, 0, "move");
    HT_ASSERT(u.progression_step == 1);
    HT_ASSERT(allowed_actions(rules, u) == (Actions{"attack", "capture"}));
    HT_ASSERT(open_slot_for_action(rules, u, "move") == -1);

    // Past the last slot nothing is allowed.
    advance_progression(rules, u, 1, "capture");
    HT_ASSERT(u.progression_step == 2);
    HT_ASSERT(allowed_actions(rules, u).empty());
    HT_ASSERT(open_slot_for_action(rules, u, "attack") == -1);
  }

  // A chosen alternative narrows the slot.
  {
    Unit u = make_unit(rules, kSoldier, 1, o);
    u.progression_step = 1;
    u.chosen_alternative = "capture";
    HT_ASSERT(allowed_actions(rules, u) == (Actions{"capture"}));
    HT_ASSERT(open_slot_for_action(rules, u, "attack") == -1);
  }

  // Look-ahead attack ends the activation and zeroes the budget.
  {
    Unit u = make_unit(rules, kSoldier, 1, o);
    const int slot = open_slot_for_action(rules, u, "attack");
    advance_progression(rules, u, slot, "attack");
    HT_ASSERT(u.progression_step == 2);
    HT_ASSERT(u.distance_left == 0.0);
  }

  // Artillery: move, attack, retreat. After the attack the retreat budget applies.
  {
    Unit u = make_unit(rules, kArtillery, 1, o);
    const int slot = open_slot_for_action(rules, u, "attack");
    HT_ASSERT(slot == 1);
    advance_progression(rules, u, slot, "attack");
    HT_ASSERT(u.progression_step == 2);
    HT_ASSERT(u.distance_left == 1.0);
    HT_ASSERT(allowed_actions(rules, u) == (Actions{"retreat"}));
    advance_progression(rules, u, 2, "retreat");
    HT_ASSERT(u.progression_step == 2);
    u.distance_left = 0.0;
    advance_progression(rules, u, 2, "retreat");
    HT_ASSERT(u.progression_step == 3);
    HT_ASSERT(allowed_actions(rules, u).empty());
  }

  // A move slot with no budget is filtered out.
  {
    Unit u = make_unit(rules, kStriker, 1, o);
    u.distance_left = 0.0;
    HT_ASSERT(allowed_actions(rules, u).empty());
  }

  // Exhaustion only counts once the unit was refreshed this turn.
  {
    Unit u = make_unit(rules, kSoldier, 1, o);
    u.distance_left = 0.0;
    u.last_topped_up_turn = 1;
    HT_ASSERT(is_unit_exhausted(u, 1));
    HT_ASSERT(!is_unit_exhausted(u, 2));
    HT_ASSERT(needs_top_up(u, 2));
  }

  // Lazy refresh.
  {
    World w = make_grass_world(2);
    Unit u = make_unit(rules, kSoldier, 1, o);
    u.distance_left = 0.0;
    u.progression_step = 2;
    u.chosen_alternative = "attack";
    u.available_health = 6;
    u.last_acted_turn = 1;
    u.attack_history.push_back(AttackRecord{AxialCoord{1, 0}, false, 1});
    u.attacks_received_this_turn = 1;
    w.add_unit(u);

    const TopUpResult same_turn = top_up_unit_if_needed(rules, w, o, 1);
    HT_ASSERT(!same_turn.refreshed);

    // Acted on turn 1, so no resting heal on turn 2.
    const TopUpResult r = top_up_unit_if_needed(rules, w, o, 2);
    HT_ASSERT(r.refreshed);
    HT_ASSERT(r.healed == 0);
    const Unit* after = w.unit_at(o);
    HT_ASSERT(after->distance_left == 3.0);
    HT_ASSERT(after->progression_step == 0);
    HT_ASSERT(after->chosen_alternative.empty());
    HT_ASSERT(after->attack_history.empty());
    HT_ASSERT(after->attacks_received_this_turn == 0);
    HT_ASSERT(after->last_topped_up_turn == 2);
    HT_ASSERT(after->available_health == 6);

    // Idle since turn 1: heals by the grass bonus on turn 3.
    const TopUpResult r3 = top_up_unit_if_needed(rules, w, o, 3);
    HT_ASSERT(r3.healed == 1);
    HT_ASSERT(w.unit_at(o)->available_health == 7);
  }

  // Resting heal rules.
  {
    World w = make_grass_world(2);
    set_tile(w, AxialCoord{1, 0}, kTerrainLandBase, 2);
    set_tile(w, AxialCoord{-1, 0}, kTerrainLandBase, 1);
    set_tile(w, AxialCoord{0, 1}, kTerrainAirportBase, 1);

    Unit u = make_unit(rules, kSoldier, 1, AxialCoord{-1, 0});
    u.available_health = 5;
    HT_ASSERT(resting_heal_amount(rules, w, u, 5) == 2);
    u.available_health = 9;
    HT_ASSERT(resting_heal_amount(rules, w, u, 5) == 1);  // capped at max
    u.available_health = 5;
    u.last_acted_turn = 4;
    HT_ASSERT(resting_heal_amount(rules, w, u, 5) == 0);  // acted last turn
    u.last_acted_turn = 0;
    u.coord = AxialCoord{1, 0};
    HT_ASSERT(resting_heal_amount(rules, w, u, 5) == 0);  // enemy tile

    Unit jet = make_unit(rules, kJet, 1, o);
    jet.available_health = 5;
    HT_ASSERT(resting_heal_amount(rules, w, jet, 5) == 0);
    jet.coord = AxialCoord{0, 1};
    HT_ASSERT(resting_heal_amount(rules, w, jet, 5) == 2);
  }

  // Capture completes on the capturer's next refresh.
  {
    World w = make_grass_world(2);
    set_tile(w, o, kTerrainLandBase, kNeutralPlayer);
    Unit u = make_unit(rules, kSoldier, 1, o);
    u.capture_started_turn = 1;
    w.add_unit(u);
    const TopUpResult r = top_up_unit_if_needed(rules, w, o, 2);
    HT_ASSERT(r.capture_completed);
    HT_ASSERT(r.capture_coord == o);
    HT_ASSERT(r.previous_owner == kNeutralPlayer);
    HT_ASSERT(w.tile_at(o)->player == 1);
    HT_ASSERT(w.unit_at(o)->capture_started_turn == 0);
  }

  return 0;
}
