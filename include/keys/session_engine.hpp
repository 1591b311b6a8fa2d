#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace keys {

// Drives one practice session: pulls prompts from the drill for the
// configured practice type, matches note events against the round in
// flight and hands finished rounds to the statistics aggregator.
// Not reentrant; call from a single consumer loop.
class SessionEngine {
public:
  virtual ~SessionEngine() = default;

  // Starts the next round. Throws std::logic_error while a round is in flight.
  virtual RoundPlan next_round(std::int64_t now_ms) = 0;

  // Returns the result on the event that ends the current round.
  virtual std::optional<RoundResult> submit(const NoteEvent& event) = 0;

  // Advances the clock: commits a note held past its coincidence window and
  // emits due timeout hints. Returns the result if that ends the round.
  virtual std::optional<RoundResult> poll(std::int64_t now_ms) = 0;

  virtual std::vector<DisplayEvent> drain_display() = 0;

  virtual MatchState state() const = 0;

  // Abandons any in-flight round without counting it and returns the final
  // statistics snapshot.
  virtual SessionStats end_session() = 0;

  virtual bool ended() const = 0;

  virtual nlohmann::json debug_state() const = 0;
};

// Validates `config` (std::invalid_argument on error) before anything runs.
// `stats` must outlive the engine.
std::unique_ptr<SessionEngine> make_engine(const PracticeConfig& config, SessionStats& stats);

// JSON description of the practice types, modes, interval labels and time
// pressure levels the engine accepts.
nlohmann::json capabilities();

} // namespace keys
