#include "keys/types.hpp"

#include "keys/pitch_class.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace keys {

void PracticeConfig::validate() const {
  if (enabled_modes.empty()) {
    throw std::invalid_argument("enabled_modes must not be empty");
  }
  for (Mode mode : enabled_modes) {
    const auto& modes = all_modes();
    if (std::find(modes.begin(), modes.end(), mode) == modes.end()) {
      throw std::invalid_argument("enabled_modes contains an unknown mode");
    }
  }
  for (int root : roots) {
    if (!is_valid_pitch_class(root)) {
      throw std::invalid_argument("root out of range: " + std::to_string(root));
    }
  }
  std::vector<std::string> labels;
  for (const auto& label : intervals) {
    const std::string canonical = canonical_interval_label(label);
    if (std::find(labels.begin(), labels.end(), canonical) == labels.end()) {
      labels.push_back(canonical);
    }
  }
  // One label would repeat the same prompt for a whole run of a root.
  if (practice_type == PracticeType::ScaleDegree && labels.size() == 1) {
    throw std::invalid_argument("intervals must name at least two distinct labels, got " +
                                labels.front());
  }
  if (prompts_per_root_min < 1) {
    throw std::invalid_argument("prompts_per_root.min must be at least 1");
  }
  if (prompts_per_root_min > prompts_per_root_max) {
    throw std::invalid_argument("prompts_per_root.min must not exceed prompts_per_root.max");
  }
  if (coincidence_window_ms < 0) {
    throw std::invalid_argument("coincidence_window_ms must not be negative");
  }
}

} // namespace keys
