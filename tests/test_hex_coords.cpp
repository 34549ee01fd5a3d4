#include <algorithm>
#include <iostream>
#include <set>

#include "hextactics/core/hex_coords.h"

#define HT_ASSERT(expr)                                                                             \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_hex_coords() {
  using namespace hextactics;
  const AxialCoord o{0, 0};

  HT_ASSERT(hex_distance(o, AxialCoord{3, -1}) == 3);
  HT_ASSERT(hex_distance(AxialCoord{-2, 2}, AxialCoord{2, -2}) == 4);
  HT_ASSERT(hex_distance(AxialCoord{1, 1}, AxialCoord{1, 1}) == 0);

  // Neighbours come back in Left, TopLeft, TopRight, Right, BottomRight, BottomLeft order.
  const auto n = neighbors(o);
  HT_ASSERT((n[0] == AxialCoord{-1, 0}));
  HT_ASSERT((n[1] == AxialCoord{0, -1}));
  HT_ASSERT((n[2] == AxialCoord{1, -1}));
  HT_ASSERT((n[3] == AxialCoord{1, 0}));
  HT_ASSERT((n[4] == AxialCoord{0, 1}));
  HT_ASSERT((n[5] == AxialCoord{-1, 1}));
  for (HexDirection d : kAllHexDirections) {
    HT_ASSERT(direction_offset(opposite_direction(d)) == -direction_offset(d));
    HT_ASSERT(direction_to(o, neighbor(o, d)) == d);
  }
  HT_ASSERT(!direction_to(o, AxialCoord{2, 0}).has_value());

  HT_ASSERT(hex_range(o, 0).size() == 1);
  HT_ASSERT(hex_range(o, 2).size() == 19);
  {
    const auto range = hex_range(AxialCoord{4, -2}, 3);
    HT_ASSERT(range.size() == 37);
    HT_ASSERT(std::is_sorted(range.begin(), range.end()));
    for (const AxialCoord& c : range) HT_ASSERT(hex_distance(c, AxialCoord{4, -2}) <= 3);
  }

  {
    const auto ring = hex_ring(o, 1);
    HT_ASSERT(ring.size() == 6);
    HT_ASSERT((ring.front() == AxialCoord{-1, 1}));
    HT_ASSERT((ring[1] == AxialCoord{0, 1}));
    const auto ring3 = hex_ring(AxialCoord{1, 1}, 3);
    HT_ASSERT(ring3.size() == 18);
    std::set<AxialCoord> unique(ring3.begin(), ring3.end());
    HT_ASSERT(unique.size() == 18);
    for (const AxialCoord& c : ring3) HT_ASSERT(hex_distance(c, AxialCoord{1, 1}) == 3);
  }

  {
    HT_ASSERT(coord_key(AxialCoord{-3, 12}) == "-3,12");
    AxialCoord c;
    HT_ASSERT(parse_coord_key("-3,12", &c));
    HT_ASSERT((c == AxialCoord{-3, 12}));
    HT_ASSERT(parse_coord_key(" 4 , -5 ", &c));
    HT_ASSERT((c == AxialCoord{4, -5}));
    HT_ASSERT(!parse_coord_key("4", &c));
    HT_ASSERT(!parse_coord_key("a,b", &c));
    HT_ASSERT(!parse_coord_key("1,2,3", &c));
    HT_ASSERT(format_coord(AxialCoord{2, -1}) == "(2, -1)");
  }

  return 0;
}
