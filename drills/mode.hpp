#pragma once

#include "drill.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace keys {

// Full modes played ascending then descending as one 16-position round.
class ModeDrill : public DrillModule {
public:
  void configure(const PracticeConfig& config) override;
  RoundPlan next_round(std::uint64_t& rng_state) override;

private:
  using Pick = std::pair<Mode, int>;

  PracticeConfig config_{};
  std::vector<Pick> picks_;
  std::optional<Pick> last_pick_;
};

} // namespace keys
