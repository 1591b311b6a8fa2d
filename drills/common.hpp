#pragma once

#include "../include/keys/pitch_class.hpp"
#include "../include/keys/types.hpp"
#include "../src/rng.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace keys::drills {

inline std::vector<int> all_roots() {
  std::vector<int> roots;
  roots.reserve(kPitchClassCount);
  for (int pc = 0; pc < kPitchClassCount; ++pc) {
    roots.push_back(pc);
  }
  return roots;
}

inline std::vector<int> allowed_roots(const PracticeConfig& config) {
  if (config.roots.empty()) {
    return all_roots();
  }
  std::vector<int> roots = config.roots;
  std::sort(roots.begin(), roots.end());
  roots.erase(std::unique(roots.begin(), roots.end()), roots.end());
  return roots;
}

// Uniform pick that skips `previous` whenever another candidate exists.
template <typename T>
T pick_avoiding(std::uint64_t& rng_state, std::vector<T> candidates,
                const std::optional<T>& previous) {
  if (previous.has_value() && candidates.size() > 1) {
    candidates.erase(std::remove(candidates.begin(), candidates.end(), previous.value()),
                     candidates.end());
  }
  return rand_choice(rng_state, candidates);
}

} // namespace keys::drills
