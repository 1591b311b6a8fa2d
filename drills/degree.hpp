#pragma once

#include "drill.hpp"

#include <optional>
#include <string>
#include <vector>

namespace keys {

// Scale-degree prompts: one root held for a run of interval prompts.
class ScaleDegreeDrill : public DrillModule {
public:
  void configure(const PracticeConfig& config) override;
  RoundPlan next_round(std::uint64_t& rng_state) override;
  void apply_feedback(const RoundResult& result) override;

  std::optional<int> current_root() const { return root_; }
  int prompts_remaining() const { return remaining_; }

private:
  RoundPlan make_plan(const std::string& label, bool new_root) const;

  PracticeConfig config_{};
  std::vector<int> roots_;
  std::vector<std::string> labels_;
  std::optional<int> root_;
  int remaining_ = 0;
  std::optional<std::string> last_label_;
  std::optional<std::string> retry_label_;
};

} // namespace keys
