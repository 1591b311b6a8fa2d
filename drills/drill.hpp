#pragma once

#include "../include/keys/types.hpp"

#include <cstdint>

namespace keys {

class DrillModule {
public:
  virtual ~DrillModule() = default;

  // Configure the drill with a validated practice configuration.
  virtual void configure(const PracticeConfig& config) = 0;

  // Produce the next round. `rng_state` is a mutable seed owned by the caller.
  virtual RoundPlan next_round(std::uint64_t& rng_state) = 0;

  // Allow modules to observe finished rounds. Default is no-op.
  virtual void apply_feedback(const RoundResult& /*result*/) {}
};

} // namespace keys
