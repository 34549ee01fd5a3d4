#include "hextactics/core/hex_coords.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <limits>

#include "hextactics/util/strings.h"

namespace hextactics {
namespace {

constexpr std::array<AxialCoord, kNumHexDirections> kOffsets = {{
    {-1, 0},  // Left
    {0, -1},  // TopLeft
    {1, -1},  // TopRight
    {1, 0},   // Right
    {0, 1},   // BottomRight
    {-1, 1},  // BottomLeft
}};

bool parse_int(const std::string& raw, int* out) {
  const std::string s = trim(raw);
  if (s.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') return false;
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
  *out = static_cast<int>(v);
  return true;
}

} // namespace

std::size_t AxialCoordHash::operator()(const AxialCoord& c) const noexcept {
  const std::uint64_t packed =
      (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.q)) << 32) | static_cast<std::uint32_t>(c.r);
  return std::hash<std::uint64_t>{}(packed);
}

AxialCoord direction_offset(HexDirection d) { return kOffsets[static_cast<std::size_t>(d)]; }

HexDirection opposite_direction(HexDirection d) {
  return static_cast<HexDirection>((static_cast<int>(d) + 3) % kNumHexDirections);
}

const char* hex_direction_label(HexDirection d) {
  switch (d) {
    case HexDirection::Left: return "L";
    case HexDirection::TopLeft: return "TL";
    case HexDirection::TopRight: return "TR";
    case HexDirection::Right: return "R";
    case HexDirection::BottomRight: return "BR";
    case HexDirection::BottomLeft: return "BL";
  }
  return "?";
}

AxialCoord neighbor(const AxialCoord& c, HexDirection d) { return c + direction_offset(d); }

std::array<AxialCoord, kNumHexDirections> neighbors(const AxialCoord& c) {
  std::array<AxialCoord, kNumHexDirections> out;
  for (int i = 0; i < kNumHexDirections; ++i) out[static_cast<std::size_t>(i)] = c + kOffsets[static_cast<std::size_t>(i)];
  return out;
}

int hex_distance(const AxialCoord& a, const AxialCoord& b) {
  const AxialCoord d = a - b;
  return (std::abs(d.q) + std::abs(d.r) + std::abs(d.s())) / 2;
}

std::optional<HexDirection> direction_to(const AxialCoord& from, const AxialCoord& to) {
  const AxialCoord d = to - from;
  for (HexDirection dir : kAllHexDirections) {
    if (direction_offset(dir) == d) return dir;
  }
  return std::nullopt;
}

std::vector<AxialCoord> hex_range(const AxialCoord& center, int radius) {
  std::vector<AxialCoord> out;
  if (radius < 0) return out;
  for (int dq = -radius; dq <= radius; ++dq) {
    const int r_lo = std::max(-radius, -dq - radius);
    const int r_hi = std::min(radius, -dq + radius);
    for (int dr = r_lo; dr <= r_hi; ++dr) out.push_back({center.q + dq, center.r + dr});
  }
  return out;
}

std::vector<AxialCoord> hex_ring(const AxialCoord& center, int radius) {
  std::vector<AxialCoord> out;
  if (radius < 0) return out;
  if (radius == 0) {
    out.push_back(center);
    return out;
  }
  const AxialCoord start = direction_offset(HexDirection::BottomLeft);
  AxialCoord cur{center.q + start.q * radius, center.r + start.r * radius};
  // From the BottomLeft corner the sides run Right, TopRight, TopLeft, Left,
  // BottomLeft, BottomRight: direction indices 3, 2, 1, 0, 5, 4.
  for (int side = 0; side < kNumHexDirections; ++side) {
    const HexDirection dir =
        kAllHexDirections[static_cast<std::size_t>((3 - side + kNumHexDirections) % kNumHexDirections)];
    for (int step = 0; step < radius; ++step) {
      out.push_back(cur);
      cur = neighbor(cur, dir);
    }
  }
  return out;
}

std::string coord_key(const AxialCoord& c) { return std::to_string(c.q) + "," + std::to_string(c.r); }

bool parse_coord_key(const std::string& key, AxialCoord* out) {
  const std::size_t comma = key.find(',');
  if (comma == std::string::npos) return false;
  AxialCoord c;
  if (!parse_int(key.substr(0, comma), &c.q)) return false;
  if (!parse_int(key.substr(comma + 1), &c.r)) return false;
  if (out) *out = c;
  return true;
}

std::string format_coord(const AxialCoord& c) {
  return "(" + std::to_string(c.q) + ", " + std::to_string(c.r) + ")";
}

} // namespace hextactics
