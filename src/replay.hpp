#pragma once

#include "keys/session_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>

namespace keys {

struct ReplayOptions {
  bool text = false;  // human-readable lines instead of JSON lines
  std::int64_t coincidence_window_ms = 40;
};

struct ReplayReport {
  std::size_t lines = 0;
  std::size_t skipped = 0;
  std::size_t rounds_started = 0;
  std::size_t rounds_finished = 0;
  bool interrupted = false;
  SessionStats stats;
};

// Drives `engine` from JSON-lines note events until end of input or until
// `interrupted` reports true, writing display output and the final
// statistics to `out`. Malformed lines are reported on stderr and skipped.
//
// The first round starts at the first event's timestamp. Each later round
// starts one coincidence window after the previous one ended; events inside
// that gap are dropped. An interrupt discards the round in flight, while end
// of input first commits a note still held by the matcher.
ReplayReport replay(std::istream& events, SessionEngine& engine, const ReplayOptions& options,
                    std::ostream& out, const std::function<bool()>& interrupted);

} // namespace keys
