#pragma once

#include <cstdint>

namespace hextactics::util {

// splitmix64 finaliser (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) { return static_cast<double>(x >> 11) * 0x1.0p-53; }

// Sequential generator whose whole state is one word.
//
// The combat RNG of a game is a HashRng seeded from GameConfig::seed. Its
// state() is written back into GameState::rng_state after every attack, so a
// replica that restores the word continues the exact same sequence.
class HashRng {
 public:
  explicit HashRng(std::uint64_t state) : state_(state) {}

  std::uint64_t state() const { return state_; }

  std::uint64_t next_u64() {
    state_ = splitmix64(state_);
    return state_;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

 private:
  std::uint64_t state_;
};

} // namespace hextactics::util
