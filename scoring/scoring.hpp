#pragma once

#include "../include/keys/types.hpp"

#include <string>
#include <vector>

namespace keys::scoring {

// Single writer for a SessionStats owned by the caller. Only terminal round
// results are accepted; counters never move backwards.
class StatsAggregator {
public:
  explicit StatsAggregator(SessionStats& stats) : stats_(stats) {}

  void record(const RoundResult& result);

  const SessionStats& snapshot() const noexcept { return stats_; }

private:
  SessionStats& stats_;
};

double accuracy_percent(const SessionStats& stats);

// "Correct: N | Incorrect: M | Accuracy: P%"
std::string summary_line(const SessionStats& stats);

// "Note k: Expected X, played Y" for every recorded miss.
std::vector<std::string> miss_lines(const SessionStats& stats);

DisplayEvent make_session_summary(const SessionStats& stats);

} // namespace keys::scoring
