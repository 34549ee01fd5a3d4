#include "hextactics/core/combat.h"

#include <algorithm>
#include <map>

#include "hextactics/core/hex_coords.h"

namespace hextactics {
namespace {

int tile_type_at(const World& world, const AxialCoord& c) {
  const Tile* t = world.tile_at(c);
  return t ? t->tile_type : 0;
}

} // namespace

CombatContext make_combat_context(const World& world, const Unit& attacker, const Unit& defender, int wound_bonus) {
  CombatContext ctx;
  ctx.attacker_type = attacker.unit_type;
  ctx.attacker_tile_type = tile_type_at(world, attacker.coord);
  ctx.attacker_health = attacker.available_health;
  ctx.defender_type = defender.unit_type;
  ctx.defender_tile_type = tile_type_at(world, defender.coord);
  ctx.wound_bonus = wound_bonus;
  return ctx;
}

bool base_attack_value(const RulesTable& rules, int attacker_type, int defender_type, int* out) {
  const UnitDef* a = rules.find_unit(attacker_type);
  const UnitDef* d = rules.find_unit(defender_type);
  if (!a || !d) return false;
  const auto it = a->attack_vs_class.find(d->defender_key());
  if (it == a->attack_vs_class.end()) return false;
  if (out) *out = it->second;
  return true;
}

bool can_attack_target(const RulesTable& rules, const Unit& attacker, const Unit& target) {
  if (attacker.player == target.player) return false;
  if (!base_attack_value(rules, attacker.unit_type, target.unit_type)) return false;
  const UnitDef* def = rules.find_unit(attacker.unit_type);
  return def && hex_distance(attacker.coord, target.coord) <= def->attack_range;
}

bool hit_probability(const RulesTable& rules, const CombatContext& ctx, double* p, std::string* error) {
  const UnitDef* attacker = rules.find_unit(ctx.attacker_type);
  const UnitDef* defender = rules.find_unit(ctx.defender_type);
  if (!attacker || !defender) {
    if (error) *error = "unknown unit type in combat";
    return false;
  }
  int a = 0;
  if (!base_attack_value(rules, ctx.attacker_type, ctx.defender_type, &a)) {
    if (error) *error = attacker->name + " cannot attack " + defender->defender_key();
    return false;
  }

  int ta = 0;
  if (const TerrainUnitProperties* tp = rules.find_properties(ctx.attacker_tile_type, ctx.attacker_type)) {
    ta = tp->attack_bonus;
  }
  int td = 0;
  if (const TerrainUnitProperties* tp = rules.find_properties(ctx.defender_tile_type, ctx.defender_type)) {
    td = tp->defense_bonus;
  }

  const double raw = 0.05 * (static_cast<double>((a + ta) - (defender->defense + td)) + ctx.wound_bonus) + 0.5;
  if (p) *p = std::clamp(raw, 0.0, 1.0);
  return true;
}

int wound_bonus(const Unit& defender, const AxialCoord& attacker_pos) {
  if (defender.attack_history.empty()) return 0;

  const bool current_ranged = hex_distance(attacker_pos, defender.coord) >= 2;
  const AxialCoord current_vec = attacker_pos - defender.coord;

  int bonus = 0;
  for (const AttackRecord& rec : defender.attack_history) {
    if (current_ranged || rec.is_ranged) {
      bonus += 1;
      continue;
    }
    // Both adjacent: flanking geometry.
    const AxialCoord prior_vec = rec.position - defender.coord;
    if (hex_distance(rec.position, attacker_pos) == 1) {
      bonus += 1;
    } else if (prior_vec == -current_vec) {
      bonus += 3;
    } else {
      bonus += 2;
    }
  }
  return bonus;
}

int roll_damage(double p, int attacker_health, util::HashRng& rng) {
  if (attacker_health <= 0) return 0;
  int hits = 0;
  for (int hp = 0; hp < attacker_health; ++hp) {
    for (int roll = 0; roll < kRollsPerHealthPoint; ++roll) {
      if (rng.next_u01() < p) ++hits;
    }
  }
  return std::min(hits / kRollsPerHealthPoint, attacker_health);
}

bool simulate_combat_damage(const RulesTable& rules, const CombatContext& ctx, util::HashRng& rng, int* damage,
                            std::string* error) {
  double p = 0.0;
  if (!hit_probability(rules, ctx, &p, error)) return false;
  const int d = roll_damage(p, ctx.attacker_health, rng);
  if (damage) *damage = d;
  return true;
}

bool damage_distribution(const RulesTable& rules, const CombatContext& ctx, int simulations, DamageDistribution* out,
                         std::string* error) {
  if (simulations <= 0) simulations = kDefaultDamageSimulations;
  double p = 0.0;
  if (!hit_probability(rules, ctx, &p, error)) return false;

  util::HashRng rng(kDamagePreviewSeed);
  std::map<int, int> counts;
  double total = 0.0;
  for (int i = 0; i < simulations; ++i) {
    const int d = roll_damage(p, ctx.attacker_health, rng);
    ++counts[d];
    total += d;
  }

  DamageDistribution dist;
  dist.simulations = simulations;
  dist.expected_damage = total / simulations;
  dist.min_damage = counts.begin()->first;
  dist.max_damage = counts.rbegin()->first;
  for (const auto& [value, n] : counts) {
    dist.ranges.push_back({value, value, static_cast<double>(n) / simulations});
  }
  if (out) *out = std::move(dist);
  return true;
}

std::vector<SplashTarget> compute_splash_damage(const RulesTable& rules, const World& world, const Unit& attacker,
                                                const AxialCoord& defender_coord, util::HashRng& rng) {
  std::vector<SplashTarget> out;
  const UnitDef* def = rules.find_unit(attacker.unit_type);
  if (!def || def->splash_damage <= 0) return out;

  for (const AxialCoord& c : neighbors(defender_coord)) {
    const Unit* target = world.unit_at(c);
    if (!target || c == attacker.coord) continue;
    const UnitDef* tdef = rules.find_unit(target->unit_type);
    if (!tdef || tdef->unit_terrain == kUnitTerrainAir) continue;
    if (!world.tile_at(c)) continue;

    const CombatContext ctx = make_combat_context(world, attacker, *target, 0);
    double p = 0.0;
    if (!hit_probability(rules, ctx, &p)) continue;

    int total = 0;
    for (int i = 0; i < def->splash_damage; ++i) total += roll_damage(p, ctx.attacker_health, rng);
    if (total > kSplashDamageThreshold) out.push_back({c, total});
  }
  return out;
}

AttackForecast forecast_attack(const RulesTable& rules, const World& world, const Unit& attacker,
                               const Unit& defender, int simulations) {
  AttackForecast f;
  if (!can_attack_target(rules, attacker, defender)) {
    f.error = "target at " + format_coord(defender.coord) + " cannot be attacked from " + format_coord(attacker.coord);
    return f;
  }

  f.wound_bonus = wound_bonus(defender, attacker.coord);
  const CombatContext ctx = make_combat_context(world, attacker, defender, f.wound_bonus);
  if (!hit_probability(rules, ctx, &f.hit_probability, &f.error)) return f;
  if (!damage_distribution(rules, ctx, simulations, &f.defender_damage, &f.error)) return f;

  if (can_attack_target(rules, defender, attacker)) {
    const CombatContext counter = make_combat_context(world, defender, attacker, 0);
    f.counter_attack = hit_probability(rules, counter, &f.counter_hit_probability) &&
                       damage_distribution(rules, counter, simulations, &f.attacker_damage);
  }
  f.ok = true;
  return f;
}

} // namespace hextactics
