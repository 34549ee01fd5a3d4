#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hextactics {

// Axial hex coordinate. The implicit third cube axis is s = -q - r.
struct AxialCoord {
  int q{0};
  int r{0};

  int s() const { return -q - r; }

  AxialCoord operator+(const AxialCoord& o) const { return {q + o.q, r + o.r}; }
  AxialCoord operator-(const AxialCoord& o) const { return {q - o.q, r - o.r}; }
  AxialCoord operator-() const { return {-q, -r}; }

  bool operator==(const AxialCoord& o) const { return q == o.q && r == o.r; }
  bool operator!=(const AxialCoord& o) const { return !(*this == o); }

  // Q-major ordering, used wherever coordinates must be iterated deterministically.
  bool operator<(const AxialCoord& o) const { return q != o.q ? q < o.q : r < o.r; }
};

struct AxialCoordHash {
  std::size_t operator()(const AxialCoord& c) const noexcept;
};

// Neighbour directions in the order the game enumerates them.
enum class HexDirection { Left = 0, TopLeft, TopRight, Right, BottomRight, BottomLeft };

inline constexpr int kNumHexDirections = 6;

inline constexpr std::array<HexDirection, kNumHexDirections> kAllHexDirections = {
    HexDirection::Left,  HexDirection::TopLeft,     HexDirection::TopRight,
    HexDirection::Right, HexDirection::BottomRight, HexDirection::BottomLeft,
};

AxialCoord direction_offset(HexDirection d);
HexDirection opposite_direction(HexDirection d);
const char* hex_direction_label(HexDirection d);

AxialCoord neighbor(const AxialCoord& c, HexDirection d);

// Neighbours in kAllHexDirections order.
std::array<AxialCoord, kNumHexDirections> neighbors(const AxialCoord& c);

// Cube distance.
int hex_distance(const AxialCoord& a, const AxialCoord& b);

// Direction from `from` to an adjacent `to`; nullopt when not adjacent.
std::optional<HexDirection> direction_to(const AxialCoord& from, const AxialCoord& to);

// All coordinates within `radius` of center (center included), Q-major order.
std::vector<AxialCoord> hex_range(const AxialCoord& center, int radius);

// Coordinates at exactly `radius`, walking the ring starting from the
// BottomLeft corner. radius 0 yields the center alone.
std::vector<AxialCoord> hex_ring(const AxialCoord& center, int radius);

// "q,r" map key.
std::string coord_key(const AxialCoord& c);
bool parse_coord_key(const std::string& key, AxialCoord* out);

// "(q, r)" for messages.
std::string format_coord(const AxialCoord& c);

} // namespace hextactics
