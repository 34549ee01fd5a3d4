#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "hextactics/core/entities.h"
#include "hextactics/core/hex_coords.h"

namespace hextactics {

// Layered, copy-on-write store of tiles and units keyed by coordinate.
//
// Layers live in an arena; each holds its own entries, its own tombstones and
// the index of its parent. Reads walk the parent chain from the top layer.
// Writes only ever touch the top layer, so a pushed layer can be evaluated
// and then dropped (pop) or folded into its parent (merge_top).
//
// Pointers returned by the accessors stay valid until the next mutating call.
class World {
 public:
  World();

  // --- layers ---
  void push();
  // Throws std::logic_error on the base layer.
  void pop();
  void merge_top();
  // 1 when only the base layer exists.
  std::size_t depth() const { return layers_.size(); }

  // --- units ---
  const Unit* unit_at(const AxialCoord& c) const;

  // Copies a parent layer's unit into the top layer before handing it out.
  Unit* mutable_unit_at(const AxialCoord& c);

  // Places u at u.coord and returns the unit it replaced, if any.
  // An empty shortcut is filled with the next label for the unit's player.
  std::optional<Unit> add_unit(Unit u);

  // Returns false when no unit is at c.
  bool remove_unit(const AxialCoord& c);

  // Relocates the unit at `from` to the empty coordinate `to` and updates its
  // coord. Throws std::logic_error if `from` is empty or `to` is occupied.
  Unit& move_unit(const AxialCoord& from, const AxialCoord& to);

  int num_units() const;

  // Merged view, sorted by coordinate.
  std::vector<const Unit*> units() const;
  std::vector<const Unit*> units_of_player(PlayerId p) const;

  // Players with at least one live unit, ascending.
  std::vector<PlayerId> players_with_units() const;

  // --- tiles ---
  const Tile* tile_at(const AxialCoord& c) const;
  Tile* mutable_tile_at(const AxialCoord& c);
  std::optional<Tile> add_tile(Tile t);
  bool remove_tile(const AxialCoord& c);
  int num_tiles() const;
  std::vector<const Tile*> tiles() const;

 private:
  using CoordSet = std::unordered_set<AxialCoord, AxialCoordHash>;
  template <typename T>
  using CoordMap = std::unordered_map<AxialCoord, T, AxialCoordHash>;

  struct Layer {
    int parent{-1};
    CoordMap<Unit> units;
    CoordMap<Tile> tiles;
    CoordSet unit_tombstones;
    CoordSet tile_tombstones;
    int unit_count{0};
    int tile_count{0};
    std::map<PlayerId, int> shortcut_counters;
  };

  template <typename T>
  const T* lookup(const AxialCoord& c, CoordMap<T> Layer::*entries, CoordSet Layer::*tombs) const;

  template <typename T>
  std::vector<const T*> merged(CoordMap<T> Layer::*entries, CoordSet Layer::*tombs) const;

  template <typename T>
  T* copy_up(const AxialCoord& c, CoordMap<T> Layer::*entries, CoordSet Layer::*tombs);

  Layer& top() { return layers_.back(); }
  const Layer& top() const { return layers_.back(); }
  int top_index() const { return static_cast<int>(layers_.size()) - 1; }

  std::vector<Layer> layers_;
};

} // namespace hextactics
