#include "keys/round_matcher.hpp"

#include "../assistance/assistance.hpp"
#include "keys/pitch_class.hpp"
#include "debug_log.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace keys {

RoundMatcher::RoundMatcher(RoundPlan plan, std::size_t round_index, std::int64_t start_ms,
                           MatchTiming timing)
    : plan_(std::move(plan)),
      round_index_(round_index),
      start_ms_(start_ms),
      timing_(timing),
      position_start_ms_(start_ms) {
  if (plan_.expected.empty()) {
    throw std::invalid_argument("RoundMatcher: expected sequence must not be empty");
  }
  outcomes_.reserve(plan_.expected.size());
  for (int expected : plan_.expected) {
    PositionOutcome outcome;
    outcome.expected = expected;
    outcomes_.push_back(outcome);
  }

  const bool root_first = plan_.confirm_root.has_value();
  state_ = root_first ? MatchState::AwaitingRoot : open_state();
  outbox_.push_back(assistance::make_prompt(plan_, round_index_, root_first));
}

MatchState RoundMatcher::open_state() const {
  return plan_.expected.size() > 1 ? MatchState::AwaitingSequence : MatchState::AwaitingNote;
}

std::optional<RoundResult> RoundMatcher::submit(const NoteEvent& event) {
  if (!event.is_note_on()) {
    return std::nullopt;
  }
  if (state_ == MatchState::RoundComplete) {
    return std::nullopt;
  }

  if (held_.has_value()) {
    const NoteEvent held = held_.value();
    held_.reset();
    if (forms_escape(held, event)) {
      return finish(event.timestamp_ms, true);
    }
    auto result = commit(held);
    if (result.has_value()) {
      return result;
    }
  }
  held_ = event;
  return std::nullopt;
}

std::optional<RoundResult> RoundMatcher::poll(std::int64_t now_ms) {
  if (state_ == MatchState::RoundComplete) {
    return std::nullopt;
  }
  if (held_.has_value()) {
    if (now_ms - held_->timestamp_ms <= timing_.coincidence_window_ms) {
      return std::nullopt;
    }
    const NoteEvent held = held_.value();
    held_.reset();
    auto result = commit(held);
    if (result.has_value()) {
      return result;
    }
  }
  if (!timing_.deadline_ms.has_value() || hint_emitted_) {
    return std::nullopt;
  }
  if (now_ms - position_start_ms_ < timing_.deadline_ms.value()) {
    return std::nullopt;
  }
  hint_emitted_ = true;

  if (state_ == MatchState::AwaitingRoot) {
    outbox_.push_back(assistance::make_timeout_hint(plan_, round_index_, std::nullopt, plan_.root,
                                                    since_start(now_ms)));
    session_debug("round " + std::to_string(round_index_) + " hint: root");
    return std::nullopt;
  }
  auto& outcome = outcomes_[index_];
  outcome.hinted = true;
  outbox_.push_back(assistance::make_timeout_hint(plan_, round_index_, static_cast<int>(index_),
                                                  outcome.expected, since_start(now_ms)));
  session_debug("round " + std::to_string(round_index_) + " hint: position " +
                std::to_string(index_));
  return std::nullopt;
}

std::vector<DisplayEvent> RoundMatcher::take_display() {
  std::vector<DisplayEvent> out;
  out.swap(outbox_);
  return out;
}

void RoundMatcher::confirm_root(const NoteEvent& event) {
  outbox_.push_back(assistance::make_root_check(plan_, round_index_, event.pitch_class,
                                                since_start(event.timestamp_ms)));
  if (event.pitch_class != plan_.root) {
    return;
  }
  state_ = open_state();
  position_start_ms_ = event.timestamp_ms;
  hint_emitted_ = false;
  outbox_.push_back(assistance::make_prompt(plan_, round_index_, false));
}

void RoundMatcher::judge(const NoteEvent& event) {
  const int position = static_cast<int>(index_);
  auto& outcome = outcomes_[index_];
  outcome.observed = event.pitch_class;
  const bool match = is_valid_pitch_class(event.pitch_class) &&
                     event.pitch_class == outcome.expected;
  outcome.verdict = match ? Verdict::Correct : Verdict::Incorrect;

  const std::int64_t elapsed = since_start(event.timestamp_ms);
  if (plan_.type == PracticeType::ScaleDegree) {
    outbox_.push_back(assistance::make_verdict(plan_, round_index_, position, outcome, elapsed));
  } else {
    outbox_.push_back(
        assistance::make_echo(plan_, round_index_, position, event.pitch_class, elapsed));
  }

  ++index_;
  position_start_ms_ = event.timestamp_ms;
  hint_emitted_ = false;
}

std::optional<RoundResult> RoundMatcher::commit(const NoteEvent& event) {
  if (state_ == MatchState::AwaitingRoot) {
    confirm_root(event);
    return std::nullopt;
  }
  judge(event);
  if (index_ >= plan_.expected.size()) {
    return finish(event.timestamp_ms, false);
  }
  return std::nullopt;
}

// Same valid pitch class, raw pitches exactly one octave apart, inside the
// coincidence window.
bool RoundMatcher::forms_escape(const NoteEvent& held, const NoteEvent& event) const {
  if (event.timestamp_ms - held.timestamp_ms > timing_.coincidence_window_ms) {
    return false;
  }
  if (!is_valid_pitch_class(event.pitch_class) || held.pitch_class != event.pitch_class) {
    return false;
  }
  const std::int64_t distance =
      static_cast<std::int64_t>(held.raw_pitch) - static_cast<std::int64_t>(event.raw_pitch);
  return distance == 12 || distance == -12;
}

RoundResult RoundMatcher::finish(std::int64_t end_ms, bool escaped) {
  state_ = MatchState::RoundComplete;

  RoundResult result;
  result.round_index = round_index_;
  result.type = plan_.type;
  result.root = plan_.root;
  result.spelling = plan_.spelling;
  result.category = plan_.category;
  result.positions = outcomes_;
  result.escaped = escaped;
  result.elapsed_ms = since_start(end_ms);
  const int judged = result.judged_count();
  result.passed = result.correct_count() == judged;

  if (plan_.type == PracticeType::Mode) {
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
      outbox_.push_back(assistance::make_verdict(plan_, round_index_, static_cast<int>(i),
                                                 outcomes_[i], result.elapsed_ms));
    }
  }
  outbox_.push_back(assistance::make_round_summary(result));

  std::ostringstream oss;
  oss << "round " << round_index_ << " complete: " << result.correct_count() << "/" << judged
      << " correct" << (escaped ? " (escaped)" : "") << " in " << result.elapsed_ms << " ms";
  session_debug(oss.str());
  return result;
}

} // namespace keys
