#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace keys {

// xorshift64 over a caller-owned state word. A zero state is reseeded so a
// default-constructed config still produces a usable sequence.
inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x9E3779B97F4A7C15ULL;
  }
  state ^= state << 13;
  state ^= state >> 7;
  state ^= state << 17;
  return state;
}

// Uniform index in [0, count).
inline std::size_t rand_index(std::uint64_t& state, std::size_t count) {
  if (count == 0) {
    throw std::invalid_argument("rand_index: empty range");
  }
  return static_cast<std::size_t>(advance_rng(state) % count);
}

// Uniform integer in [lo, hi].
inline int rand_int(std::uint64_t& state, int lo, int hi) {
  if (hi < lo) {
    throw std::invalid_argument("rand_int: empty range [" + std::to_string(lo) + "," +
                                std::to_string(hi) + "]");
  }
  const auto span = static_cast<std::size_t>(static_cast<std::int64_t>(hi) - lo + 1);
  return lo + static_cast<int>(rand_index(state, span));
}

template <typename T>
const T& rand_choice(std::uint64_t& state, const std::vector<T>& values) {
  if (values.empty()) {
    throw std::invalid_argument("rand_choice: no candidates");
  }
  return values[rand_index(state, values.size())];
}

} // namespace keys
