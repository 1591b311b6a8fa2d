#include "degree.hpp"

#include "common.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace keys {
namespace {

std::vector<std::string> default_labels() {
  std::vector<std::string> labels;
  for (const auto& label : interval_labels()) {
    if (label != "1") {
      labels.push_back(label);
    }
  }
  return labels;
}

std::vector<std::string> resolve_labels(const PracticeConfig& config) {
  if (config.intervals.empty()) {
    return default_labels();
  }
  std::vector<std::string> labels;
  for (const auto& label : config.intervals) {
    auto canonical = canonical_interval_label(label);
    if (std::find(labels.begin(), labels.end(), canonical) == labels.end()) {
      labels.push_back(canonical);
    }
  }
  return labels;
}

} // namespace

void ScaleDegreeDrill::configure(const PracticeConfig& config) {
  config_ = config;
  roots_ = drills::allowed_roots(config);
  labels_ = resolve_labels(config);
  root_.reset();
  remaining_ = 0;
  last_label_.reset();
  retry_label_.reset();
}

RoundPlan ScaleDegreeDrill::next_round(std::uint64_t& rng_state) {
  if (retry_label_.has_value() && root_.has_value()) {
    std::string label = retry_label_.value();
    retry_label_.reset();
    last_label_ = label;
    return make_plan(label, false);
  }
  retry_label_.reset();

  bool new_root = false;
  if (!root_.has_value() || remaining_ <= 0) {
    if (config_.root_reroll == RootReroll::Distinct) {
      root_ = drills::pick_avoiding(rng_state, roots_, root_);
    } else {
      root_ = rand_choice(rng_state, roots_);
    }
    remaining_ = rand_int(rng_state, config_.prompts_per_root_min, config_.prompts_per_root_max);
    new_root = true;
  }

  std::string label = drills::pick_avoiding(rng_state, labels_, last_label_);
  last_label_ = label;
  --remaining_;
  return make_plan(label, new_root);
}

void ScaleDegreeDrill::apply_feedback(const RoundResult& result) {
  if (!config_.repeat_missed || result.escaped || result.passed) {
    return;
  }
  retry_label_ = last_label_;
}

RoundPlan ScaleDegreeDrill::make_plan(const std::string& label, bool new_root) const {
  const int root = root_.value();
  RoundPlan plan;
  plan.type = PracticeType::ScaleDegree;
  plan.root = root;
  plan.spelling = spelling_for_root(root);
  plan.interval_label = label;
  plan.category = label;
  plan.expected = {interval_to_pitch_class(root, label)};
  plan.expected_names = spell_sequence(plan.expected, plan.spelling);
  if (new_root) {
    plan.confirm_root = root;
  }
  plan.prompt_text = "Play " + interval_prompt_text(label) + " (from " + note_name(root) + ")";
  return plan;
}

} // namespace keys
