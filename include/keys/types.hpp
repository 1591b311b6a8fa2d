#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace keys {

enum class PracticeType {
  ScaleDegree,
  Mode
};

inline std::string to_string(PracticeType type) {
  switch (type) {
    case PracticeType::ScaleDegree: return "scale-degree";
    case PracticeType::Mode: return "mode";
  }
  return "scale-degree";
}

inline PracticeType practice_type_from_string(const std::string& value) {
  if (value == "scale-degree") {
    return PracticeType::ScaleDegree;
  }
  if (value == "mode") {
    return PracticeType::Mode;
  }
  throw std::invalid_argument("Unknown practice type: " + value);
}

enum class TimePressure {
  None,
  Low,
  Medium,
  Hard
};

inline std::string to_string(TimePressure level) {
  switch (level) {
    case TimePressure::None: return "none";
    case TimePressure::Low: return "low";
    case TimePressure::Medium: return "medium";
    case TimePressure::Hard: return "hard";
  }
  return "none";
}

inline TimePressure time_pressure_from_string(const std::string& value) {
  if (value == "none") {
    return TimePressure::None;
  }
  if (value == "low") {
    return TimePressure::Low;
  }
  if (value == "medium") {
    return TimePressure::Medium;
  }
  if (value == "hard") {
    return TimePressure::Hard;
  }
  throw std::invalid_argument("Unknown time pressure level: " + value);
}

// Per-position response deadline; nullopt means no deadline.
inline std::optional<std::int64_t> deadline_ms(TimePressure level) {
  switch (level) {
    case TimePressure::None: return std::nullopt;
    case TimePressure::Low: return 15000;
    case TimePressure::Medium: return 10000;
    case TimePressure::Hard: return 5000;
  }
  return std::nullopt;
}

enum class Mode {
  Ionian,
  Dorian,
  Phrygian,
  Lydian,
  Mixolydian,
  Aeolian,
  Locrian
};

enum class RootReroll {
  Distinct,
  Uniform
};

inline std::string to_string(RootReroll policy) {
  return policy == RootReroll::Uniform ? "uniform" : "distinct";
}

inline RootReroll root_reroll_from_string(const std::string& value) {
  if (value == "distinct") {
    return RootReroll::Distinct;
  }
  if (value == "uniform") {
    return RootReroll::Uniform;
  }
  throw std::invalid_argument("Unknown root reroll policy: " + value);
}

enum class Spelling {
  Sharps,
  Flats
};

//-----------------------------------------------------------------
// INPUT BOUNDARY
//-----------------------------------------------------------------
enum class NoteKind {
  On,
  Off
};

struct NoteEvent {
  int pitch_class = 0;   // expected in [0,11]; anything else is judged as a mismatch
  int raw_pitch = 0;     // MIDI note number, used for octave detection
  NoteKind kind = NoteKind::On;
  int velocity = 100;
  std::int64_t timestamp_ms = 0;

  // Some keyboards send note-on with velocity 0 instead of note-off.
  bool is_note_on() const { return kind == NoteKind::On && velocity > 0; }
};

//-----------------------------------------------------------------
// CONFIGURATION
//-----------------------------------------------------------------
struct PracticeConfig {
  PracticeType practice_type = PracticeType::ScaleDegree;
  std::vector<Mode> enabled_modes = {Mode::Ionian, Mode::Aeolian};
  TimePressure time_pressure = TimePressure::Medium;
  std::vector<int> roots;                 // empty = all 12 pitch classes
  std::vector<std::string> intervals;     // empty = every label except "1"
  int prompts_per_root_min = 5;
  int prompts_per_root_max = 7;
  RootReroll root_reroll = RootReroll::Distinct;
  bool repeat_missed = false;
  std::int64_t coincidence_window_ms = 40;
  std::uint64_t seed = 0;

  std::optional<std::int64_t> deadline() const { return deadline_ms(time_pressure); }

  // Throws std::invalid_argument on any inconsistency.
  void validate() const;
};

//-----------------------------------------------------------------
// ROUNDS
//-----------------------------------------------------------------
struct RoundPlan {
  PracticeType type = PracticeType::ScaleDegree;
  int root = 0;
  std::vector<int> expected;
  // Set on the first prompt after a new root is chosen (Scale-Degree only).
  std::optional<int> confirm_root;
  std::optional<std::string> interval_label;
  std::optional<Mode> mode;
  Spelling spelling = Spelling::Sharps;
  std::string category;
  std::string prompt_text;
  std::vector<std::string> expected_names;
};

enum class Verdict {
  Correct,
  Incorrect,
  Excluded
};

inline std::string to_string(Verdict verdict) {
  switch (verdict) {
    case Verdict::Correct: return "correct";
    case Verdict::Incorrect: return "incorrect";
    case Verdict::Excluded: return "excluded";
  }
  return "excluded";
}

struct PositionOutcome {
  int expected = 0;
  std::optional<int> observed;
  Verdict verdict = Verdict::Excluded;
  bool hinted = false;
};

struct RoundResult {
  std::size_t round_index = 0;
  PracticeType type = PracticeType::ScaleDegree;
  int root = 0;
  Spelling spelling = Spelling::Sharps;
  std::string category;
  std::vector<PositionOutcome> positions;
  bool passed = false;
  bool escaped = false;
  std::int64_t elapsed_ms = 0;

  int judged_count() const;
  int correct_count() const;
};

inline int RoundResult::judged_count() const {
  int count = 0;
  for (const auto& position : positions) {
    if (position.verdict != Verdict::Excluded) {
      ++count;
    }
  }
  return count;
}

inline int RoundResult::correct_count() const {
  int count = 0;
  for (const auto& position : positions) {
    if (position.verdict == Verdict::Correct) {
      ++count;
    }
  }
  return count;
}

//-----------------------------------------------------------------
// STATISTICS
//-----------------------------------------------------------------
struct MissRecord {
  std::size_t round_index = 0;
  int position = 0;
  std::string label;  // position as shown to the player, e.g. "Note 3 (descending)"
  int expected = 0;
  int observed = 0;
  std::string expected_name;
  std::string observed_name;
  std::string category;
};

struct CategoryTally {
  int attempted = 0;
  int correct = 0;
};

struct SessionStats {
  int attempted = 0;
  int correct = 0;
  int escaped = 0;
  std::int64_t total_elapsed_ms = 0;
  std::vector<int> position_errors;
  std::vector<MissRecord> misses;
  std::map<std::string, CategoryTally> by_category;

  int incorrect() const { return attempted - correct; }

  double accuracy() const {
    if (attempted == 0) {
      return 0.0;
    }
    return 100.0 * static_cast<double>(correct) / static_cast<double>(attempted);
  }

  double average_elapsed_ms() const {
    if (attempted == 0) {
      return 0.0;
    }
    return static_cast<double>(total_elapsed_ms) / static_cast<double>(attempted);
  }
};

//-----------------------------------------------------------------
// OUTPUT BOUNDARY
//-----------------------------------------------------------------
enum class DisplayKind {
  Prompt,
  RootCheck,
  PositionEcho,
  Verdict,
  TimeoutHint,
  RoundSummary,
  SessionSummary
};

inline std::string to_string(DisplayKind kind) {
  switch (kind) {
    case DisplayKind::Prompt: return "prompt";
    case DisplayKind::RootCheck: return "root_check";
    case DisplayKind::PositionEcho: return "echo";
    case DisplayKind::Verdict: return "verdict";
    case DisplayKind::TimeoutHint: return "hint";
    case DisplayKind::RoundSummary: return "round_summary";
    case DisplayKind::SessionSummary: return "session_summary";
  }
  return "prompt";
}

struct DisplayEvent {
  DisplayKind kind = DisplayKind::Prompt;
  std::size_t round_index = 0;
  std::optional<int> position;   // 0-based index into the expected sequence
  std::optional<int> number;     // 1-based note number within the current scale direction
  std::optional<int> expected;
  std::optional<int> observed;
  std::optional<Verdict> verdict;
  std::int64_t elapsed_ms = 0;
  std::string text;
};

enum class MatchState {
  Idle,
  AwaitingRoot,
  AwaitingNote,
  AwaitingSequence,
  RoundComplete
};

inline std::string to_string(MatchState state) {
  switch (state) {
    case MatchState::Idle: return "idle";
    case MatchState::AwaitingRoot: return "awaiting_root";
    case MatchState::AwaitingNote: return "awaiting_note";
    case MatchState::AwaitingSequence: return "awaiting_sequence";
    case MatchState::RoundComplete: return "round_complete";
  }
  return "idle";
}

} // namespace keys
