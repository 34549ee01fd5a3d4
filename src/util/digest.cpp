#include "hextactics/util/digest.h"

#include <cstring>
#include <type_traits>
#include <variant>

#include "hextactics/util/sorted_keys.h"

namespace hextactics {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  // Little-endian bytes regardless of host.
  void add_u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }
  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    add_u64(static_cast<std::uint64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
  }

  void add_double(double v) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));
    // -0.0 -> +0.0
    if ((u << 1) == 0) u = 0;
    add_u64(u);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

void hash_coord(Digest64& d, const AxialCoord& c) {
  d.add_i64(c.q);
  d.add_i64(c.r);
}

void hash_unit(Digest64& d, const Unit& u) {
  hash_coord(d, u.coord);
  d.add_i64(u.player);
  d.add_i64(u.unit_type);
  d.add_string(u.shortcut);
  d.add_i64(u.available_health);
  d.add_double(u.distance_left);
  d.add_i64(u.progression_step);
  d.add_string(u.chosen_alternative);
  d.add_i64(u.last_topped_up_turn);
  d.add_i64(u.last_acted_turn);
  d.add_i64(u.capture_started_turn);
  d.add_size(u.attack_history.size());
  for (const AttackRecord& r : u.attack_history) {
    hash_coord(d, r.position);
    d.add_bool(r.is_ranged);
    d.add_i64(r.turn);
  }
  d.add_i64(u.attacks_received_this_turn);
}

void hash_tile(Digest64& d, const Tile& t) {
  hash_coord(d, t.coord);
  d.add_i64(t.tile_type);
  d.add_i64(t.player);
  d.add_string(t.shortcut);
  d.add_i64(t.last_acted_turn);
  d.add_enum(t.crossing);
}

void hash_change(Digest64& d, const Change& change) {
  d.add_size(change.index());
  std::visit(
      [&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, UnitMoved> || std::is_same_v<T, UnitDamaged>) {
          hash_unit(d, c.previous);
          hash_unit(d, c.updated);
        } else if constexpr (std::is_same_v<T, UnitKilled>) {
          hash_unit(d, c.previous);
        } else if constexpr (std::is_same_v<T, UnitHealed>) {
          hash_unit(d, c.previous);
          hash_unit(d, c.updated);
          d.add_i64(c.amount);
        } else if constexpr (std::is_same_v<T, UnitBuilt>) {
          hash_unit(d, c.unit);
          hash_coord(d, c.tile);
          d.add_i64(c.cost);
          d.add_i64(c.player_coins);
        } else if constexpr (std::is_same_v<T, CoinsChanged>) {
          d.add_i64(c.player);
          d.add_i64(c.previous_coins);
          d.add_i64(c.new_coins);
          d.add_string(c.reason);
        } else if constexpr (std::is_same_v<T, CaptureStarted>) {
          hash_unit(d, c.unit);
          hash_coord(d, c.tile);
          d.add_i64(c.tile_type);
          d.add_i64(c.current_owner);
        } else if constexpr (std::is_same_v<T, CaptureCompleted>) {
          hash_coord(d, c.tile);
          d.add_i64(c.capturer);
          d.add_i64(c.previous_owner);
        } else if constexpr (std::is_same_v<T, TileOwnerChanged>) {
          hash_coord(d, c.tile);
          d.add_i64(c.previous_owner);
          d.add_i64(c.new_owner);
        } else if constexpr (std::is_same_v<T, PlayerChanged>) {
          d.add_i64(c.previous_player);
          d.add_i64(c.new_player);
          d.add_i64(c.previous_turn);
          d.add_i64(c.new_turn);
          d.add_size(c.reset_units.size());
          for (const Unit& u : c.reset_units) hash_unit(d, u);
        } else if constexpr (std::is_same_v<T, GameFinished>) {
          d.add_i64(c.winner);
        }
      },
      change);
}

} // namespace

std::uint64_t digest_game_state64(const GameState& state, const DigestOptions& opt) {
  Digest64 d;
  if (opt.include_identity) {
    d.add_i64(state.save_version);
    d.add_string(state.game_id);
  }
  d.add_i64(state.current_player);
  d.add_i64(state.turn_counter);
  if (opt.include_versioning) {
    d.add_u64(state.version);
    d.add_u64(state.rng_state);
  }
  d.add_i64(state.winner);
  d.add_bool(state.finished);

  // std::map iterates in key order already.
  d.add_size(state.player_coins.size());
  for (const auto& [p, coins] : state.player_coins) {
    d.add_i64(p);
    d.add_i64(coins);
  }

  // World views come back sorted by coordinate.
  const auto tiles = state.world.tiles();
  d.add_size(tiles.size());
  for (const Tile* t : tiles) hash_tile(d, *t);
  const auto units = state.world.units();
  d.add_size(units.size());
  for (const Unit* u : units) hash_unit(d, *u);
  return d.value();
}

std::uint64_t digest_changes64(const std::vector<Change>& changes) {
  Digest64 d;
  d.add_size(changes.size());
  for (const Change& c : changes) hash_change(d, c);
  return d.value();
}

std::uint64_t digest_rules64(const RulesTable& rules) {
  Digest64 d;
  d.add_size(rules.terrains.size());
  for (int id : util::sorted_keys(rules.terrains)) {
    const TerrainDef& t = rules.terrains.at(id);
    d.add_i64(t.id);
    d.add_string(t.name);
    d.add_string(t.type);
    d.add_size(t.buildable_unit_ids.size());
    for (int u : t.buildable_unit_ids) d.add_i64(u);
  }

  d.add_size(rules.units.size());
  for (int id : util::sorted_keys(rules.units)) {
    const UnitDef& u = rules.units.at(id);
    d.add_i64(u.id);
    d.add_string(u.name);
    d.add_string(u.unit_class);
    d.add_string(u.unit_terrain);
    d.add_i64(u.health);
    d.add_double(u.movement_points);
    d.add_double(u.retreat_points);
    d.add_i64(u.attack_range);
    d.add_i64(u.defense);
    d.add_i64(u.cost);
    d.add_i64(u.splash_damage);
    d.add_size(u.action_order.size());
    for (const std::string& s : u.action_order) d.add_string(s);
    d.add_size(u.attack_vs_class.size());
    for (const std::string& k : util::sorted_keys(u.attack_vs_class)) {
      d.add_string(k);
      d.add_i64(u.attack_vs_class.at(k));
    }
  }

  d.add_size(rules.terrain_unit_properties.size());
  for (const std::string& k : util::sorted_keys(rules.terrain_unit_properties)) {
    const TerrainUnitProperties& p = rules.terrain_unit_properties.at(k);
    d.add_i64(p.terrain_id);
    d.add_i64(p.unit_id);
    d.add_double(p.movement_cost);
    d.add_i64(p.attack_bonus);
    d.add_i64(p.defense_bonus);
    d.add_i64(p.healing_bonus);
    d.add_bool(p.can_capture);
    d.add_bool(p.can_build);
  }
  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

} // namespace hextactics
