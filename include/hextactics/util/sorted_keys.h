#pragma once

#include <algorithm>
#include <vector>

namespace hextactics::util {

// Rules tables and game maps are std::unordered_map. Anything that feeds a
// digest, a serialized save or the RNG must walk them in sorted key order.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace hextactics::util
