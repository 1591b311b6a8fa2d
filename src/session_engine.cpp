#include "keys/session_engine.hpp"

#include "../scoring/scoring.hpp"
#include "debug_log.hpp"
#include "keys/drill_factory.hpp"
#include "keys/pitch_class.hpp"
#include "keys/round_matcher.hpp"

#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace keys {
namespace {

DrillFactory& ensure_factory() {
  static std::once_flag flag;
  auto& factory = DrillFactory::instance();
  std::call_once(flag, [&factory]() { register_builtin_drills(factory); });
  return factory;
}

} // namespace

class SessionEngineImpl : public SessionEngine {
public:
  SessionEngineImpl(const PracticeConfig& config, SessionStats& stats)
      : config_(config),
        aggregator_(stats),
        module_(ensure_factory().create(config)),
        rng_state_(config.seed) {
    timing_.deadline_ms = config.deadline();
    timing_.coincidence_window_ms = config.coincidence_window_ms;
    session_debug("session created: " + to_string(config.practice_type) + ", time pressure " +
                  to_string(config.time_pressure));
  }

  RoundPlan next_round(std::int64_t now_ms) override {
    ensure_active();
    if (current_.has_value() && !current_->complete()) {
      throw std::logic_error("next_round: a round is still in flight");
    }
    RoundPlan plan = module_->next_round(rng_state_);
    current_.emplace(plan, rounds_started_, now_ms, timing_);
    ++rounds_started_;
    collect();
    session_debug("round " + std::to_string(current_->round_index()) + " started: " +
                  plan.prompt_text);
    return plan;
  }

  std::optional<RoundResult> submit(const NoteEvent& event) override {
    ensure_active();
    if (!current_.has_value()) {
      return std::nullopt;
    }
    auto result = current_->submit(event);
    settle(result);
    return result;
  }

  std::optional<RoundResult> poll(std::int64_t now_ms) override {
    if (ended_ || !current_.has_value()) {
      return std::nullopt;
    }
    auto result = current_->poll(now_ms);
    settle(result);
    return result;
  }

  std::vector<DisplayEvent> drain_display() override {
    std::vector<DisplayEvent> out;
    out.swap(outbox_);
    return out;
  }

  MatchState state() const override {
    if (ended_ || !current_.has_value()) {
      return MatchState::Idle;
    }
    return current_->state();
  }

  SessionStats end_session() override {
    if (!ended_) {
      if (current_.has_value() && !current_->complete()) {
        session_debug("round " + std::to_string(current_->round_index()) +
                      " discarded at session end");
      }
      current_.reset();
      ended_ = true;
      outbox_.push_back(scoring::make_session_summary(aggregator_.snapshot()));
    }
    return aggregator_.snapshot();
  }

  bool ended() const override { return ended_; }

  nlohmann::json debug_state() const override {
    nlohmann::json info = nlohmann::json::object();
    info["practice_type"] = to_string(config_.practice_type);
    info["time_pressure"] = to_string(config_.time_pressure);
    info["state"] = to_string(state());
    info["rounds_started"] = rounds_started_;
    info["ended"] = ended_;
    if (current_.has_value()) {
      const auto& plan = current_->plan();
      info["round_index"] = current_->round_index();
      info["position"] = current_->position();
      info["holding"] = current_->holding();
      info["expected_length"] = plan.expected.size();
      info["category"] = plan.category;
      info["root"] = note_name(plan.root);
    }
    const auto& stats = aggregator_.snapshot();
    info["attempted"] = stats.attempted;
    info["correct"] = stats.correct;
    return info;
  }

private:
  void ensure_active() const {
    if (ended_) {
      throw std::logic_error("session already ended");
    }
  }

  void settle(const std::optional<RoundResult>& result) {
    collect();
    if (result.has_value()) {
      aggregator_.record(*result);
      module_->apply_feedback(*result);
    }
  }

  void collect() {
    auto events = current_->take_display();
    std::move(events.begin(), events.end(), std::back_inserter(outbox_));
  }

  PracticeConfig config_;
  scoring::StatsAggregator aggregator_;
  std::unique_ptr<DrillModule> module_;
  std::uint64_t rng_state_ = 0;
  MatchTiming timing_;
  std::optional<RoundMatcher> current_;
  std::size_t rounds_started_ = 0;
  bool ended_ = false;
  std::vector<DisplayEvent> outbox_;
};

std::unique_ptr<SessionEngine> make_engine(const PracticeConfig& config, SessionStats& stats) {
  config.validate();
  return std::make_unique<SessionEngineImpl>(config, stats);
}

nlohmann::json capabilities() {
  nlohmann::json caps = nlohmann::json::object();
  caps["version"] = "v1";
  nlohmann::json types = nlohmann::json::array();
  for (const auto& family : ensure_factory().families()) {
    types.push_back(family);
  }
  caps["practice_types"] = types;
  nlohmann::json modes = nlohmann::json::array();
  for (Mode mode : all_modes()) {
    modes.push_back(mode_name(mode));
  }
  caps["modes"] = modes;
  nlohmann::json intervals = nlohmann::json::array();
  for (const auto& label : interval_labels()) {
    intervals.push_back(label);
  }
  caps["intervals"] = intervals;
  nlohmann::json pressure = nlohmann::json::object();
  for (TimePressure level :
       {TimePressure::None, TimePressure::Low, TimePressure::Medium, TimePressure::Hard}) {
    auto deadline = deadline_ms(level);
    pressure[to_string(level)] =
        deadline.has_value() ? nlohmann::json(*deadline / 1000) : nlohmann::json(nullptr);
  }
  caps["time_pressure_seconds"] = pressure;
  return caps;
}

} // namespace keys
