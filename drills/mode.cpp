#include "mode.hpp"

#include "common.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace keys {

void ModeDrill::configure(const PracticeConfig& config) {
  config_ = config;
  picks_.clear();
  std::vector<Mode> modes;
  for (Mode mode : config.enabled_modes) {
    if (std::find(modes.begin(), modes.end(), mode) == modes.end()) {
      modes.push_back(mode);
    }
  }
  for (Mode mode : modes) {
    for (int root : drills::allowed_roots(config)) {
      picks_.emplace_back(mode, root);
    }
  }
  last_pick_.reset();
}

RoundPlan ModeDrill::next_round(std::uint64_t& rng_state) {
  const Pick pick = drills::pick_avoiding(rng_state, picks_, last_pick_);
  last_pick_ = pick;

  const Mode mode = pick.first;
  const int root = pick.second;
  const auto ascending = build_scale(root, mode);

  RoundPlan plan;
  plan.type = PracticeType::Mode;
  plan.root = root;
  plan.mode = mode;
  plan.spelling = spelling_for_root(root);
  plan.category = mode_name(mode);
  plan.expected = ascending;
  std::copy(ascending.rbegin(), ascending.rend(), std::back_inserter(plan.expected));
  plan.expected_names = spell_sequence(plan.expected, plan.spelling);

  std::string scale_text;
  for (std::size_t i = 0; i < ascending.size(); ++i) {
    if (i > 0) {
      scale_text += " - ";
    }
    scale_text += plan.expected_names[i];
  }
  plan.prompt_text = mode_name(mode) + " in " + note_name(root) + ": " + scale_text;
  return plan;
}

} // namespace keys
