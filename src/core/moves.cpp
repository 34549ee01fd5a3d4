#include "hextactics/core/moves.h"

#include <type_traits>

namespace hextactics {
namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

} // namespace

const char* move_kind_label(const MoveAction& a) {
  return std::visit(
      [](const auto& act) -> const char* {
        using T = std::decay_t<decltype(act)>;
        if constexpr (std::is_same_v<T, MoveUnitAction>) {
          return "move";
        } else if constexpr (std::is_same_v<T, AttackUnitAction>) {
          return "attack";
        } else if constexpr (std::is_same_v<T, BuildUnitAction>) {
          return "build";
        } else if constexpr (std::is_same_v<T, CaptureBuildingAction>) {
          return "capture";
        } else if constexpr (std::is_same_v<T, HealUnitAction>) {
          return "heal";
        } else if constexpr (std::is_same_v<T, EndTurnAction>) {
          return "end_turn";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled move kind");
        }
      },
      a);
}

std::string describe_move(const Move& m) {
  std::string out = move_kind_label(m.action);
  std::visit(
      [&](const auto& act) {
        using T = std::decay_t<decltype(act)>;
        if constexpr (std::is_same_v<T, MoveUnitAction>) {
          out += " " + format_coord(act.from) + " -> " + format_coord(act.to);
        } else if constexpr (std::is_same_v<T, AttackUnitAction>) {
          out += " " + format_coord(act.attacker) + " -> " + format_coord(act.defender);
        } else if constexpr (std::is_same_v<T, BuildUnitAction>) {
          out += " type " + std::to_string(act.unit_type) + " at " + format_coord(act.pos);
        } else if constexpr (std::is_same_v<T, CaptureBuildingAction> || std::is_same_v<T, HealUnitAction>) {
          out += " at " + format_coord(act.pos);
        }
      },
      m.action);
  if (m.player != kNeutralPlayer) out += " (player " + std::to_string(m.player) + ")";
  return out;
}

} // namespace hextactics
