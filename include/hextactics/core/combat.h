#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hextactics/core/entities.h"
#include "hextactics/core/rules.h"
#include "hextactics/core/world.h"
#include "hextactics/util/hash_rng.h"

namespace hextactics {

inline constexpr int kDefaultDamageSimulations = 10000;
inline constexpr std::uint64_t kDamagePreviewSeed = 12345;

// Dice rolled per health point of the attacker.
inline constexpr int kRollsPerHealthPoint = 6;

// Splash totals at or below this are dropped.
inline constexpr int kSplashDamageThreshold = 4;

// Everything the hit formula and damage roll need about one exchange.
struct CombatContext {
  int attacker_type{0};
  int attacker_tile_type{0};
  int attacker_health{0};
  int defender_type{0};
  int defender_tile_type{0};
  int wound_bonus{0};
};

CombatContext make_combat_context(const World& world, const Unit& attacker, const Unit& defender, int wound_bonus);

// Base attack value of attacker_type against defender_type's "<class>:<terrain>".
// False when the attacker cannot attack that kind of unit.
bool base_attack_value(const RulesTable& rules, int attacker_type, int defender_type, int* out = nullptr);

// Enemy, attackable kind, and within the attacker's range.
bool can_attack_target(const RulesTable& rules, const Unit& attacker, const Unit& target);

// p = clamp(0.05 * ((A + Ta) - (D + Td) + B) + 0.5, 0, 1)
//
// A: attacker's base value vs the defender, Ta: attacker's terrain attack bonus,
// D: defender's defense, Td: defender's terrain defense bonus, B: wound bonus.
bool hit_probability(const RulesTable& rules, const CombatContext& ctx, double* p, std::string* error = nullptr);

// Bonus from the defender's attack history for an attack launched from attacker_pos.
int wound_bonus(const Unit& defender, const AxialCoord& attacker_pos);

// Six rolls per attacker health point; damage = floor(hits / 6), capped at attacker_health.
int roll_damage(double p, int attacker_health, util::HashRng& rng);

bool simulate_combat_damage(const RulesTable& rules, const CombatContext& ctx, util::HashRng& rng, int* damage,
                            std::string* error = nullptr);

struct DamageRange {
  int min_value{0};
  int max_value{0};
  double probability{0.0};
};

struct DamageDistribution {
  int simulations{0};
  int min_damage{0};
  int max_damage{0};
  double expected_damage{0.0};
  // One entry per observed damage value, ascending.
  std::vector<DamageRange> ranges;
};

// Monte Carlo preview on its own fixed-seed generator. Never touches a game's RNG.
bool damage_distribution(const RulesTable& rules, const CombatContext& ctx, int simulations, DamageDistribution* out,
                         std::string* error = nullptr);

struct SplashTarget {
  AxialCoord coord;
  int damage{0};
};

// Splash from `attacker` landing around defender_coord, in neighbour order.
// Air units, units without a tile, the attacker itself and units the attacker
// cannot hurt are skipped; allegiance is ignored.
std::vector<SplashTarget> compute_splash_damage(const RulesTable& rules, const World& world, const Unit& attacker,
                                                const AxialCoord& defender_coord, util::HashRng& rng);

// Read-only preview of an attack and its counter-attack.
struct AttackForecast {
  bool ok{false};
  std::string error;

  int wound_bonus{0};
  double hit_probability{0.0};
  DamageDistribution defender_damage;

  bool counter_attack{false};
  double counter_hit_probability{0.0};
  DamageDistribution attacker_damage;
};

AttackForecast forecast_attack(const RulesTable& rules, const World& world, const Unit& attacker,
                               const Unit& defender, int simulations = kDefaultDamageSimulations);

} // namespace hextactics
