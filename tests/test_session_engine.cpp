#include "keys/pitch_class.hpp"
#include "scoring/scoring.hpp"
#include "keys/session_engine.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

keys::NoteEvent note_on(int raw_pitch, std::int64_t t) {
  keys::NoteEvent event;
  event.raw_pitch = raw_pitch;
  event.pitch_class = keys::pitch_class_of_midi(raw_pitch);
  event.kind = keys::NoteKind::On;
  event.velocity = 80;
  event.timestamp_ms = t;
  return event;
}

keys::PracticeConfig degree_config(std::uint64_t seed) {
  keys::PracticeConfig config;
  config.practice_type = keys::PracticeType::ScaleDegree;
  config.time_pressure = keys::TimePressure::Hard;
  config.prompts_per_root_min = 5;
  config.prompts_per_root_max = 5;
  config.seed = seed;
  return config;
}

template <typename Exception, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

bool has_kind(const std::vector<keys::DisplayEvent>& events, keys::DisplayKind kind) {
  for (const auto& event : events) {
    if (event.kind == kind) {
      return true;
    }
  }
  return false;
}

constexpr std::int64_t kWindowMs = 40;

// Plays one scale-degree round at `t`, confirming the root when asked. The
// answer is held for the coincidence window, so the result arrives on poll.
std::optional<keys::RoundResult> play_degree_round(keys::SessionEngine& engine,
                                                   const keys::RoundPlan& plan, std::int64_t& t,
                                                   bool answer_correctly) {
  if (plan.confirm_root.has_value()) {
    t += 500;
    engine.submit(note_on(60 + plan.root, t));
  }
  t += 500;
  const int answer = answer_correctly ? plan.expected.front() : (plan.expected.front() + 1) % 12;
  engine.poll(t);
  if (auto early = engine.submit(note_on(60 + answer, t))) {
    return early;
  }
  return engine.poll(t + kWindowMs + 1);
}

void test_config_errors(TestSuite& suite) {
  keys::SessionStats stats;

  auto no_modes = degree_config(1);
  no_modes.practice_type = keys::PracticeType::Mode;
  no_modes.enabled_modes.clear();
  suite.require(throws<std::invalid_argument>([&] { keys::make_engine(no_modes, stats); }),
                "Empty mode set rejected at construction");

  auto inverted = degree_config(1);
  inverted.prompts_per_root_min = 7;
  inverted.prompts_per_root_max = 5;
  suite.require(throws<std::invalid_argument>([&] { keys::make_engine(inverted, stats); }),
                "min > max rejected");

  auto bad_interval = degree_config(1);
  bad_interval.intervals = {"9"};
  suite.require(throws<std::invalid_argument>([&] { keys::make_engine(bad_interval, stats); }),
                "Unknown interval rejected");

  auto one_label = degree_config(1);
  one_label.intervals = {"3"};
  suite.require(throws<std::invalid_argument>([&] { keys::make_engine(one_label, stats); }),
                "Single interval label would repeat the same prompt");

  auto aliased = degree_config(1);
  aliased.intervals = {"b5", "#4"};
  suite.require(throws<std::invalid_argument>([&] { keys::make_engine(aliased, stats); }),
                "Aliases of one label count as one label");

  auto two_labels = degree_config(1);
  two_labels.intervals = {"3", "5"};
  bool accepted = true;
  try {
    keys::make_engine(two_labels, stats);
  } catch (const std::invalid_argument&) {
    accepted = false;
  }
  suite.require(accepted, "Two labels are enough to alternate");

  auto bad_root = degree_config(1);
  bad_root.roots = {12};
  suite.require(throws<std::invalid_argument>([&] { keys::make_engine(bad_root, stats); }),
                "Root outside [0,11] rejected");
}

void test_scale_degree_session(TestSuite& suite) {
  keys::SessionStats stats;
  auto engine = keys::make_engine(degree_config(5), stats);
  suite.require(engine->state() == keys::MatchState::Idle, "Fresh engine is idle");

  std::int64_t t = 0;
  auto plan = engine->next_round(t);
  suite.require(plan.confirm_root.has_value(), "First prompt introduces the root");
  suite.require(engine->state() == keys::MatchState::AwaitingRoot, "Engine awaits the root");
  suite.require(throws<std::logic_error>([&] { engine->next_round(t + 1); }),
                "next_round while a round is in flight is rejected");

  auto result = play_degree_round(*engine, plan, t, true);
  suite.require(result.has_value() && result->passed, "Correct answer passes");
  suite.require(stats.attempted == 1 && stats.correct == 1, "Passed round counted");

  int expected_attempted = 1;
  int expected_correct = 1;
  for (int i = 0; i < 9; ++i) {
    t += 1000;
    plan = engine->next_round(t);
    const bool correct = i % 3 != 0;
    auto round = play_degree_round(*engine, plan, t, correct);
    suite.require(round.has_value(), "Every round terminates");
    ++expected_attempted;
    if (correct) {
      ++expected_correct;
    }
    suite.require(stats.attempted == expected_attempted, "Attempted grows by one per round");
    suite.require(stats.correct == expected_correct, "Correct grows only on passes");
    suite.require(stats.correct <= stats.attempted, "Correct never exceeds attempted");
  }
  suite.require(stats.misses.size() == 3, "Each wrong answer recorded as a miss");
  suite.require(!stats.position_errors.empty() && stats.position_errors[0] == 3,
                "Position errors tallied");

  auto drained = engine->drain_display();
  suite.require(has_kind(drained, keys::DisplayKind::Prompt), "Prompts reach the display");
  suite.require(has_kind(drained, keys::DisplayKind::RootCheck), "Root checks reach the display");
  suite.require(has_kind(drained, keys::DisplayKind::Verdict), "Verdicts reach the display");
  suite.require(engine->drain_display().empty(), "Drain empties the outbox");
}

void test_timeout_hint_via_engine(TestSuite& suite) {
  keys::SessionStats stats;
  auto engine = keys::make_engine(degree_config(8), stats);
  auto plan = engine->next_round(0);
  engine->drain_display();
  engine->poll(5000);
  engine->poll(5500);
  auto events = engine->drain_display();
  int hints = 0;
  for (const auto& event : events) {
    if (event.kind == keys::DisplayKind::TimeoutHint) {
      ++hints;
      suite.require(event.expected == plan.root, "Root hint names the root");
    }
  }
  suite.require(hints == 1, "Hard pressure hints once after five seconds");
  suite.require(engine->state() == keys::MatchState::AwaitingRoot, "Hint leaves state alone");
}

void test_mode_session_with_escape(TestSuite& suite) {
  keys::PracticeConfig config;
  config.practice_type = keys::PracticeType::Mode;
  config.enabled_modes = {keys::Mode::Ionian};
  config.roots = {0};
  config.time_pressure = keys::TimePressure::None;
  keys::SessionStats stats;
  auto engine = keys::make_engine(config, stats);

  std::int64_t t = 0;
  auto plan = engine->next_round(t);
  suite.require(plan.expected.size() == 16, "Mode round is sixteen positions");
  suite.require(engine->state() == keys::MatchState::AwaitingSequence, "Awaiting sequence");

  const std::vector<int> ascending = {60, 62, 64, 65, 67, 69, 71, 72};
  std::vector<int> pressed = ascending;
  pressed.insert(pressed.end(), ascending.rbegin(), ascending.rend());
  for (int pitch : pressed) {
    t += 400;
    engine->poll(t);
    engine->submit(note_on(pitch, t));
  }
  suite.require(stats.attempted == 0, "Last note still held");
  auto result = engine->poll(t + kWindowMs + 1);
  suite.require(result.has_value() && result->passed, "Clean ascent and descent passes");
  suite.require(engine->state() == keys::MatchState::RoundComplete, "Round complete");

  t += 1000;
  engine->next_round(t);
  engine->submit(note_on(48, t + 100));
  auto escaped = engine->submit(note_on(60, t + 110));
  suite.require(escaped.has_value() && escaped->escaped, "Octave gesture ends the round");
  suite.require(stats.attempted == 2, "Escaped round counts as attempted");
  suite.require(stats.escaped == 1, "Escaped round counted");
  suite.require(stats.correct == 2, "Escaped round with nothing judged wrong is correct");
  suite.require(escaped->judged_count() == 0, "Gesture notes are not judged");
  suite.require(stats.by_category["Ionian"].attempted == 2, "Per-mode tally kept");
}

void test_end_session(TestSuite& suite) {
  keys::SessionStats stats;
  auto engine = keys::make_engine(degree_config(13), stats);
  std::int64_t t = 0;
  auto plan = engine->next_round(t);
  play_degree_round(*engine, plan, t, true);

  t += 1000;
  engine->next_round(t);
  engine->poll(t + 200);
  engine->drain_display();

  auto final_stats = engine->end_session();
  suite.require(final_stats.attempted == 1, "In-flight round discarded");
  suite.require(stats.attempted == 1, "Caller-owned stats unchanged by interrupt");
  suite.require(engine->ended(), "Engine reports ended");
  suite.require(engine->state() == keys::MatchState::Idle, "Ended engine is idle");

  auto events = engine->drain_display();
  suite.require(events.size() == 1 && events.front().kind == keys::DisplayKind::SessionSummary,
                "Session summary emitted once");
  if (!events.empty()) {
    suite.require(events.front().text == "Correct: 1 | Incorrect: 0 | Accuracy: 100.0%",
                  "Summary line formatted");
  }

  engine->end_session();
  suite.require(engine->drain_display().empty(), "Second end_session emits nothing");
  suite.require(throws<std::logic_error>([&] { engine->submit(note_on(60, t + 5000)); }),
                "submit after end rejected");
  suite.require(throws<std::logic_error>([&] { engine->next_round(t + 5000); }),
                "next_round after end rejected");
}

void test_miss_lines(TestSuite& suite) {
  keys::SessionStats stats;
  keys::scoring::StatsAggregator aggregator(stats);

  keys::RoundResult mode_round;
  mode_round.type = keys::PracticeType::Mode;
  mode_round.category = "Ionian";
  std::vector<int> sequence = keys::build_scale(0, keys::Mode::Ionian);
  const std::vector<int> ascending = sequence;
  sequence.insert(sequence.end(), ascending.rbegin(), ascending.rend());
  for (int expected : sequence) {
    keys::PositionOutcome outcome;
    outcome.expected = expected;
    outcome.observed = expected;
    outcome.verdict = keys::Verdict::Correct;
    mode_round.positions.push_back(outcome);
  }
  mode_round.positions[9].observed = 10;
  mode_round.positions[9].verdict = keys::Verdict::Incorrect;
  aggregator.record(mode_round);

  keys::RoundResult degree_round;
  degree_round.round_index = 1;
  degree_round.type = keys::PracticeType::ScaleDegree;
  degree_round.spelling = keys::Spelling::Flats;
  degree_round.category = "b7";
  keys::PositionOutcome missed;
  missed.expected = 10;
  missed.observed = 9;
  missed.verdict = keys::Verdict::Incorrect;
  degree_round.positions.push_back(missed);
  aggregator.record(degree_round);

  const auto lines = keys::scoring::miss_lines(stats);
  suite.require(lines.size() == 2, "One line per miss");
  if (lines.size() == 2) {
    suite.require(lines[0] == "Note 2 (descending): Expected B, played A#",
                  "Mode misses use the per-direction numbering");
    suite.require(lines[1] == "Note 1: Expected Bb, played A", "Scale-degree miss line");
  }
  suite.require(stats.position_errors.size() == 16 && stats.position_errors[9] == 1 &&
                    stats.position_errors[0] == 1,
                "Position errors indexed by sequence position");
}

void test_introspection(TestSuite& suite) {
  keys::SessionStats stats;
  auto engine = keys::make_engine(degree_config(2), stats);
  engine->next_round(0);
  const auto info = engine->debug_state();
  suite.require(info.value("state", "") == "awaiting_root", "Debug state reports matcher state");
  suite.require(info.value("practice_type", "") == "scale-degree", "Debug state reports type");

  const auto caps = keys::capabilities();
  suite.require(caps["modes"].size() == 7, "Capabilities list seven modes");
  suite.require(caps["intervals"].size() == 12, "Capabilities list twelve intervals");
  suite.require(caps["time_pressure_seconds"]["hard"] == 5, "Hard pressure is five seconds");
  suite.require(caps["time_pressure_seconds"]["none"].is_null(), "No pressure has no deadline");
}

} // namespace

int main() {
  TestSuite suite;

  test_config_errors(suite);
  test_scale_degree_session(suite);
  test_timeout_hint_via_engine(suite);
  test_mode_session_with_escape(suite);
  test_end_session(suite);
  test_miss_lines(suite);
  test_introspection(suite);

  if (!suite.ok) {
    std::cerr << "Session engine tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Session engine tests passed" << std::endl;
  return 0;
}
