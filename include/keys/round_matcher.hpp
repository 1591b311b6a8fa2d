#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace keys {

struct MatchTiming {
  std::optional<std::int64_t> deadline_ms;
  std::int64_t coincidence_window_ms = 40;
};

// Positional matcher for a single round. Feed it note events in timestamp
// order; it reports the RoundResult exactly once, from whichever call ends
// the round. Display payloads accumulate in an outbox drained by the caller.
//
// A note-on is held for one coincidence window before it is judged, so that
// a second note-on an octave away inside the window turns the pair into an
// escape instead of an answer. The held note is committed by the next
// note-on or by a poll() past the window.
class RoundMatcher {
public:
  RoundMatcher(RoundPlan plan, std::size_t round_index, std::int64_t start_ms,
               MatchTiming timing);

  std::optional<RoundResult> submit(const NoteEvent& event);

  // Commits a held note whose window has passed, then emits at most one
  // timeout hint per open position.
  std::optional<RoundResult> poll(std::int64_t now_ms);

  MatchState state() const { return state_; }
  bool complete() const { return state_ == MatchState::RoundComplete; }
  std::size_t position() const { return index_; }
  bool holding() const { return held_.has_value(); }
  std::size_t round_index() const { return round_index_; }
  const RoundPlan& plan() const { return plan_; }
  const std::vector<PositionOutcome>& outcomes() const { return outcomes_; }

  std::vector<DisplayEvent> take_display();

private:
  MatchState open_state() const;
  std::optional<RoundResult> commit(const NoteEvent& event);
  void confirm_root(const NoteEvent& event);
  void judge(const NoteEvent& event);
  bool forms_escape(const NoteEvent& held, const NoteEvent& event) const;
  RoundResult finish(std::int64_t end_ms, bool escaped);
  std::int64_t since_start(std::int64_t now_ms) const { return now_ms - start_ms_; }

  RoundPlan plan_;
  std::size_t round_index_ = 0;
  std::int64_t start_ms_ = 0;
  MatchTiming timing_;

  MatchState state_ = MatchState::AwaitingNote;
  std::size_t index_ = 0;
  std::int64_t position_start_ms_ = 0;
  bool hint_emitted_ = false;
  std::vector<PositionOutcome> outcomes_;
  std::optional<NoteEvent> held_;
  std::vector<DisplayEvent> outbox_;
};

} // namespace keys
