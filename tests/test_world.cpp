#include <iostream>
#include <set>
#include <stdexcept>

#include "hextactics/core/world.h"
#include "test.h"

#define HT_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

int distinct_live_units(const hextactics::World& w) {
  std::set<hextactics::AxialCoord> coords;
  for (const hextactics::Unit* u : w.units()) coords.insert(u->coord);
  return static_cast<int>(coords.size());
}

} // namespace

int test_world() {
  using namespace hextactics;
  using namespace hextactics::testing;
  const RulesTable rules = make_test_rules();

  // Labels follow the player letter and a per-player counter.
  {
    World w = make_grass_world(2);
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{1, 0}));
    w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{-1, 0}));
    HT_ASSERT(w.unit_at(AxialCoord{0, 0})->shortcut == "A1");
    HT_ASSERT(w.unit_at(AxialCoord{1, 0})->shortcut == "A2");
    HT_ASSERT(w.unit_at(AxialCoord{-1, 0})->shortcut == "B1");

    // A unit arriving with a label keeps later labels unique.
    Unit labelled = make_unit(rules, kSoldier, 2, AxialCoord{0, 1});
    labelled.shortcut = "B7";
    w.add_unit(labelled);
    w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{0, -1}));
    HT_ASSERT(w.unit_at(AxialCoord{0, -1})->shortcut == "B8");
    HT_ASSERT(w.players_with_units() == (std::vector<PlayerId>{1, 2}));
  }

  // Adding onto an occupied coordinate replaces and returns the occupant.
  {
    World w = make_grass_world(1);
    HT_ASSERT(!w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0})).has_value());
    const auto replaced = w.add_unit(make_unit(rules, kStriker, 2, AxialCoord{0, 0}));
    HT_ASSERT(replaced.has_value());
    HT_ASSERT(replaced->unit_type == kSoldier);
    HT_ASSERT(w.num_units() == 1);
    HT_ASSERT(w.unit_at(AxialCoord{0, 0})->unit_type == kStriker);
  }

  // Moving within a pushed layer never duplicates the unit, and pop restores the parent.
  {
    World w = make_grass_world(3);
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
    w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{2, 0}));
    HT_ASSERT(w.num_units() == 2);

    w.push();
    HT_ASSERT(w.depth() == 2);
    w.move_unit(AxialCoord{0, 0}, AxialCoord{1, -1});
    HT_ASSERT(w.unit_at(AxialCoord{0, 0}) == nullptr);
    HT_ASSERT(w.unit_at(AxialCoord{1, -1}) != nullptr);
    HT_ASSERT((w.unit_at(AxialCoord{1, -1})->coord == AxialCoord{1, -1}));
    HT_ASSERT(w.num_units() == 2);
    HT_ASSERT(distinct_live_units(w) == 2);
    HT_ASSERT(w.units().size() == 2);

    w.push();
    w.move_unit(AxialCoord{1, -1}, AxialCoord{0, 0});
    w.remove_unit(AxialCoord{2, 0});
    HT_ASSERT(w.num_units() == 1);
    HT_ASSERT(w.units().size() == 1);
    w.pop();

    HT_ASSERT(w.num_units() == 2);
    HT_ASSERT(w.units().size() == 2);
    HT_ASSERT(w.unit_at(AxialCoord{2, 0}) != nullptr);
    w.pop();

    HT_ASSERT(w.depth() == 1);
    HT_ASSERT(w.unit_at(AxialCoord{0, 0}) != nullptr);
    HT_ASSERT(w.unit_at(AxialCoord{1, -1}) == nullptr);
    HT_ASSERT(distinct_live_units(w) == w.num_units());
  }

  // Copy-on-write: mutating through a child never touches the parent.
  {
    World w = make_grass_world(1);
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
    w.push();
    w.mutable_unit_at(AxialCoord{0, 0})->available_health = 3;
    w.mutable_tile_at(AxialCoord{1, 0})->player = 2;
    HT_ASSERT(w.unit_at(AxialCoord{0, 0})->available_health == 3);
    w.pop();
    HT_ASSERT(w.unit_at(AxialCoord{0, 0})->available_health == 10);
    HT_ASSERT(w.tile_at(AxialCoord{1, 0})->player == kNeutralPlayer);
  }

  // Tombstones hide parent entries in merged iteration, and merge_top keeps them.
  {
    World w = make_grass_world(2);
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{1, 0}));
    w.push();
    w.push();
    HT_ASSERT(w.remove_unit(AxialCoord{1, 0}));
    HT_ASSERT(!w.remove_unit(AxialCoord{1, 0}));
    w.remove_tile(AxialCoord{2, 0});
    w.add_unit(make_unit(rules, kStriker, 1, AxialCoord{-1, 0}));
    for (const Unit* u : w.units()) HT_ASSERT(!(u->coord == AxialCoord{1, 0}));
    w.merge_top();
    HT_ASSERT(w.depth() == 2);
    HT_ASSERT(w.unit_at(AxialCoord{1, 0}) == nullptr);
    HT_ASSERT(w.tile_at(AxialCoord{2, 0}) == nullptr);
    HT_ASSERT(w.num_units() == 2);
    HT_ASSERT(w.num_tiles() == 18);
    w.merge_top();
    HT_ASSERT(w.depth() == 1);
    HT_ASSERT(w.num_units() == 2);
    HT_ASSERT(w.units().size() == 2);
    HT_ASSERT(w.tiles().size() == 18);
    HT_ASSERT(w.unit_at(AxialCoord{-1, 0})->shortcut == "A3");
  }

  // Merged views are sorted by coordinate.
  {
    World w = make_grass_world(2);
    w.add_unit(make_unit(rules, kSoldier, 2, AxialCoord{2, -1}));
    w.push();
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{-2, 1}));
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
    const auto units = w.units();
    HT_ASSERT(units.size() == 3);
    HT_ASSERT((units[0]->coord == AxialCoord{-2, 1}));
    HT_ASSERT((units[2]->coord == AxialCoord{2, -1}));
    HT_ASSERT(w.units_of_player(1).size() == 2);
  }

  // Invalid layer operations and moves are programming errors.
  {
    World w = make_grass_world(1);
    bool threw = false;
    try {
      w.pop();
    } catch (const std::logic_error&) {
      threw = true;
    }
    HT_ASSERT(threw);

    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{0, 0}));
    w.add_unit(make_unit(rules, kSoldier, 1, AxialCoord{1, 0}));
    threw = false;
    try {
      w.move_unit(AxialCoord{0, 0}, AxialCoord{1, 0});
    } catch (const std::logic_error&) {
      threw = true;
    }
    HT_ASSERT(threw);
    HT_ASSERT(w.num_units() == 2);
  }

  return 0;
}
