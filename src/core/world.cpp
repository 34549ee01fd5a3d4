#include "hextactics/core/world.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace hextactics {

World::World() { layers_.emplace_back(); }

void World::push() {
  Layer child;
  child.parent = top_index();
  child.unit_count = top().unit_count;
  child.tile_count = top().tile_count;
  child.shortcut_counters = top().shortcut_counters;
  layers_.push_back(std::move(child));
}

void World::pop() {
  if (layers_.size() <= 1) throw std::logic_error("World::pop on the base layer");
  layers_.pop_back();
}

void World::merge_top() {
  if (layers_.size() <= 1) throw std::logic_error("World::merge_top on the base layer");
  Layer child = std::move(layers_.back());
  layers_.pop_back();
  Layer& parent = top();
  const bool parent_has_parent = parent.parent >= 0;

  for (const AxialCoord& c : child.unit_tombstones) {
    parent.units.erase(c);
    if (parent_has_parent) parent.unit_tombstones.insert(c);
  }
  for (auto& [c, u] : child.units) {
    parent.unit_tombstones.erase(c);
    parent.units[c] = std::move(u);
  }
  for (const AxialCoord& c : child.tile_tombstones) {
    parent.tiles.erase(c);
    if (parent_has_parent) parent.tile_tombstones.insert(c);
  }
  for (auto& [c, t] : child.tiles) {
    parent.tile_tombstones.erase(c);
    parent.tiles[c] = std::move(t);
  }
  parent.unit_count = child.unit_count;
  parent.tile_count = child.tile_count;
  parent.shortcut_counters = std::move(child.shortcut_counters);
}

template <typename T>
const T* World::lookup(const AxialCoord& c, CoordMap<T> Layer::*entries, CoordSet Layer::*tombs) const {
  for (int i = top_index(); i >= 0; i = layers_[static_cast<std::size_t>(i)].parent) {
    const Layer& l = layers_[static_cast<std::size_t>(i)];
    const auto& m = l.*entries;
    const auto it = m.find(c);
    if (it != m.end()) return &it->second;
    if ((l.*tombs).count(c)) return nullptr;
  }
  return nullptr;
}

template <typename T>
std::vector<const T*> World::merged(CoordMap<T> Layer::*entries, CoordSet Layer::*tombs) const {
  // Keys already yielded or tombstoned by a higher layer hide lower entries.
  CoordSet hidden;
  std::vector<const T*> out;
  for (int i = top_index(); i >= 0; i = layers_[static_cast<std::size_t>(i)].parent) {
    const Layer& l = layers_[static_cast<std::size_t>(i)];
    for (const auto& [c, v] : l.*entries) {
      if (!hidden.count(c)) out.push_back(&v);
    }
    for (const auto& kv : l.*entries) hidden.insert(kv.first);
    for (const AxialCoord& c : l.*tombs) hidden.insert(c);
  }
  std::sort(out.begin(), out.end(), [](const T* a, const T* b) { return a->coord < b->coord; });
  return out;
}

template <typename T>
T* World::copy_up(const AxialCoord& c, CoordMap<T> Layer::*entries, CoordSet Layer::*tombs) {
  Layer& t = top();
  auto& m = t.*entries;
  const auto it = m.find(c);
  if (it != m.end()) return &it->second;
  if ((t.*tombs).count(c)) return nullptr;
  const T* below = lookup(c, entries, tombs);
  if (!below) return nullptr;
  T copy = *below;
  auto inserted = m.emplace(c, std::move(copy));
  return &inserted.first->second;
}

const Unit* World::unit_at(const AxialCoord& c) const {
  return lookup(c, &Layer::units, &Layer::unit_tombstones);
}

Unit* World::mutable_unit_at(const AxialCoord& c) { return copy_up(c, &Layer::units, &Layer::unit_tombstones); }

std::optional<Unit> World::add_unit(Unit u) {
  std::optional<Unit> previous;
  if (const Unit* existing = unit_at(u.coord)) previous = *existing;

  Layer& t = top();
  int& counter = t.shortcut_counters[u.player];
  if (u.shortcut.empty()) {
    u.shortcut = std::string(1, player_letter(u.player)) + std::to_string(++counter);
  } else if (u.shortcut.size() > 1 && u.shortcut[0] == player_letter(u.player)) {
    // Keep later labels unique when units arrive with a label already set.
    const std::string digits = u.shortcut.substr(1);
    if (std::all_of(digits.begin(), digits.end(), [](char ch) { return ch >= '0' && ch <= '9'; }) &&
        digits.size() < 9) {
      counter = std::max(counter, std::stoi(digits));
    }
  }
  const AxialCoord c = u.coord;
  t.unit_tombstones.erase(c);
  t.units[c] = std::move(u);
  if (!previous) ++t.unit_count;
  return previous;
}

bool World::remove_unit(const AxialCoord& c) {
  if (!unit_at(c)) return false;
  Layer& t = top();
  t.units.erase(c);
  if (t.parent >= 0) t.unit_tombstones.insert(c);
  --t.unit_count;
  return true;
}

Unit& World::move_unit(const AxialCoord& from, const AxialCoord& to) {
  const Unit* src = unit_at(from);
  if (!src) throw std::logic_error("move_unit: no unit at " + format_coord(from));
  if (from == to) return *mutable_unit_at(from);
  if (unit_at(to)) throw std::logic_error("move_unit: destination " + format_coord(to) + " is occupied");

  Unit moved = *src;
  remove_unit(from);
  moved.coord = to;
  add_unit(std::move(moved));
  return top().units.at(to);
}

int World::num_units() const { return top().unit_count; }

std::vector<const Unit*> World::units() const { return merged(&Layer::units, &Layer::unit_tombstones); }

std::vector<const Unit*> World::units_of_player(PlayerId p) const {
  std::vector<const Unit*> all = units();
  all.erase(std::remove_if(all.begin(), all.end(), [p](const Unit* u) { return u->player != p; }), all.end());
  return all;
}

std::vector<PlayerId> World::players_with_units() const {
  std::vector<PlayerId> out;
  for (const Unit* u : units()) out.push_back(u->player);
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

const Tile* World::tile_at(const AxialCoord& c) const {
  return lookup(c, &Layer::tiles, &Layer::tile_tombstones);
}

Tile* World::mutable_tile_at(const AxialCoord& c) { return copy_up(c, &Layer::tiles, &Layer::tile_tombstones); }

std::optional<Tile> World::add_tile(Tile tile) {
  std::optional<Tile> previous;
  if (const Tile* existing = tile_at(tile.coord)) previous = *existing;

  Layer& t = top();
  const AxialCoord c = tile.coord;
  t.tile_tombstones.erase(c);
  t.tiles[c] = std::move(tile);
  if (!previous) ++t.tile_count;
  return previous;
}

bool World::remove_tile(const AxialCoord& c) {
  if (!tile_at(c)) return false;
  Layer& t = top();
  t.tiles.erase(c);
  if (t.parent >= 0) t.tile_tombstones.insert(c);
  --t.tile_count;
  return true;
}

int World::num_tiles() const { return top().tile_count; }

std::vector<const Tile*> World::tiles() const { return merged(&Layer::tiles, &Layer::tile_tombstones); }

} // namespace hextactics
