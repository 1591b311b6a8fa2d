#include "assistance.hpp"

#include "../include/keys/pitch_class.hpp"

#include <string>

namespace keys::assistance {
namespace {

std::string spelled(const RoundPlan& plan, int pc) {
  return note_name(pc, plan.spelling);
}

} // namespace

std::string direction_of(PracticeType type, int position) {
  if (type != PracticeType::Mode) {
    return "";
  }
  return position < kScaleLength ? "ascending" : "descending";
}

int number_within_direction(PracticeType type, int position) {
  if (type != PracticeType::Mode) {
    return position + 1;
  }
  return position % kScaleLength + 1;
}

std::string note_label(PracticeType type, int position) {
  std::string label = "Note " + std::to_string(number_within_direction(type, position));
  const std::string direction = direction_of(type, position);
  if (!direction.empty()) {
    label += " (" + direction + ")";
  }
  return label;
}

DisplayEvent make_prompt(const RoundPlan& plan, std::size_t round_index, bool root_prompt) {
  DisplayEvent event;
  event.kind = DisplayKind::Prompt;
  event.round_index = round_index;
  if (root_prompt) {
    event.expected = plan.root;
    event.text = "New root note: play " + note_name(plan.root);
    return event;
  }
  event.position = 0;
  if (!plan.expected.empty()) {
    event.expected = plan.expected.front();
  }
  event.text = plan.prompt_text;
  return event;
}

DisplayEvent make_root_check(const RoundPlan& plan, std::size_t round_index, int observed,
                             std::int64_t elapsed_ms) {
  DisplayEvent event;
  event.kind = DisplayKind::RootCheck;
  event.round_index = round_index;
  event.expected = plan.root;
  event.observed = observed;
  event.elapsed_ms = elapsed_ms;
  if (observed == plan.root) {
    event.verdict = Verdict::Correct;
    event.text = "Root confirmed: " + note_name(plan.root);
  } else {
    event.verdict = Verdict::Incorrect;
    event.text = "Not the root (you played " + spelled(plan, observed) + ", expected " +
                 note_name(plan.root) + ")";
  }
  return event;
}

DisplayEvent make_echo(const RoundPlan& plan, std::size_t round_index, int position,
                       int observed, std::int64_t elapsed_ms) {
  DisplayEvent event;
  event.kind = DisplayKind::PositionEcho;
  event.round_index = round_index;
  event.position = position;
  event.number = number_within_direction(plan.type, position);
  event.observed = observed;
  event.elapsed_ms = elapsed_ms;
  event.text = direction_of(plan.type, position) + " " + std::to_string(event.number.value());
  return event;
}

DisplayEvent make_verdict(const RoundPlan& plan, std::size_t round_index, int position,
                          const PositionOutcome& outcome, std::int64_t elapsed_ms) {
  DisplayEvent event;
  event.kind = DisplayKind::Verdict;
  event.round_index = round_index;
  event.position = position;
  event.number = number_within_direction(plan.type, position);
  event.expected = outcome.expected;
  event.observed = outcome.observed;
  event.verdict = outcome.verdict;
  event.elapsed_ms = elapsed_ms;

  const std::string expected_name = spelled(plan, outcome.expected);
  const std::string played_name =
      outcome.observed.has_value() ? spelled(plan, outcome.observed.value()) : "-";
  if (plan.type == PracticeType::ScaleDegree) {
    if (outcome.verdict == Verdict::Correct) {
      event.text = "Correct!";
    } else {
      event.text = "Wrong note (you played " + played_name + ", expected " + expected_name + ")";
    }
    return event;
  }

  const std::string prefix = note_label(plan.type, position) + ": ";
  switch (outcome.verdict) {
    case Verdict::Correct:
      event.text = prefix + expected_name;
      break;
    case Verdict::Incorrect:
      event.text = prefix + "Expected " + expected_name + ", played " + played_name;
      break;
    case Verdict::Excluded:
      event.text = prefix + "not played";
      break;
  }
  return event;
}

DisplayEvent make_timeout_hint(const RoundPlan& plan, std::size_t round_index,
                               std::optional<int> position, int expected,
                               std::int64_t elapsed_ms) {
  DisplayEvent event;
  event.kind = DisplayKind::TimeoutHint;
  event.round_index = round_index;
  event.position = position;
  if (position.has_value()) {
    event.number = number_within_direction(plan.type, position.value());
  }
  event.expected = expected;
  event.elapsed_ms = elapsed_ms;
  event.text = "Hint: The note is " + spelled(plan, expected);
  return event;
}

DisplayEvent make_round_summary(const RoundResult& result) {
  DisplayEvent event;
  event.kind = DisplayKind::RoundSummary;
  event.round_index = result.round_index;
  event.elapsed_ms = result.elapsed_ms;
  event.verdict = result.passed ? Verdict::Correct : Verdict::Incorrect;

  const int total = static_cast<int>(result.positions.size());
  const std::string tally = std::to_string(result.correct_count()) + "/" +
                            std::to_string(result.judged_count()) + " correct";
  if (result.escaped) {
    event.text = "Round ended early: " + tally + ", " +
                 std::to_string(total - result.judged_count()) + " not played";
  } else if (result.passed) {
    event.text = total > 1 ? "Complete! Well done!" : "Correct!";
  } else {
    event.text = tally;
  }
  return event;
}

} // namespace keys::assistance
