#include "scoring.hpp"

#include "../assistance/assistance.hpp"
#include "../include/keys/pitch_class.hpp"
#include "../src/debug_log.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace keys::scoring {

void StatsAggregator::record(const RoundResult& result) {
  stats_.attempted += 1;
  if (result.passed) {
    stats_.correct += 1;
  }
  if (result.escaped) {
    stats_.escaped += 1;
  }
  stats_.total_elapsed_ms += result.elapsed_ms;

  auto& tally = stats_.by_category[result.category];
  tally.attempted += 1;
  if (result.passed) {
    tally.correct += 1;
  }

  if (stats_.position_errors.size() < result.positions.size()) {
    stats_.position_errors.resize(result.positions.size(), 0);
  }
  for (std::size_t i = 0; i < result.positions.size(); ++i) {
    const auto& position = result.positions[i];
    if (position.verdict != Verdict::Incorrect) {
      continue;
    }
    stats_.position_errors[i] += 1;

    MissRecord miss;
    miss.round_index = result.round_index;
    miss.position = static_cast<int>(i);
    miss.label = assistance::note_label(result.type, miss.position);
    miss.expected = position.expected;
    miss.observed = position.observed.value_or(-1);
    miss.expected_name = note_name(position.expected, result.spelling);
    miss.observed_name = note_name(miss.observed, result.spelling);
    miss.category = result.category;
    stats_.misses.push_back(std::move(miss));
  }

  session_debug("stats: " + summary_line(stats_));
}

double accuracy_percent(const SessionStats& stats) {
  return stats.accuracy();
}

std::string summary_line(const SessionStats& stats) {
  char accuracy[32];
  std::snprintf(accuracy, sizeof(accuracy), "%.1f", stats.accuracy());
  return "Correct: " + std::to_string(stats.correct) + " | Incorrect: " +
         std::to_string(stats.incorrect()) + " | Accuracy: " + accuracy + "%";
}

std::vector<std::string> miss_lines(const SessionStats& stats) {
  std::vector<std::string> lines;
  lines.reserve(stats.misses.size());
  for (const auto& miss : stats.misses) {
    lines.push_back(miss.label + ": Expected " + miss.expected_name + ", played " +
                    miss.observed_name);
  }
  return lines;
}

DisplayEvent make_session_summary(const SessionStats& stats) {
  DisplayEvent event;
  event.kind = DisplayKind::SessionSummary;
  event.round_index = static_cast<std::size_t>(stats.attempted);
  event.elapsed_ms = stats.total_elapsed_ms;
  event.text = summary_line(stats);
  return event;
}

} // namespace keys::scoring
