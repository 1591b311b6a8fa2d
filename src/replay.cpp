#include "replay.hpp"

#include "../scoring/scoring.hpp"
#include "json_bridge.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace keys {
namespace {

void emit(std::ostream& out, const DisplayEvent& event, bool text) {
  if (!text) {
    out << bridge::to_json(event).dump() << '\n';
    return;
  }
  if (event.kind == DisplayKind::Prompt) {
    out << "\nPlay: " << event.text << '\n';
  } else {
    out << "  " << event.text << '\n';
  }
}

void flush_display(std::ostream& out, SessionEngine& engine, bool text) {
  for (const auto& event : engine.drain_display()) {
    emit(out, event, text);
  }
}

} // namespace

ReplayReport replay(std::istream& events, SessionEngine& engine, const ReplayOptions& options,
                    std::ostream& out, const std::function<bool()>& interrupted) {
  ReplayReport report;
  std::optional<std::int64_t> round_start;
  std::optional<std::int64_t> next_round_at;
  std::optional<std::int64_t> last_t;

  auto start_round = [&](std::int64_t at) {
    engine.next_round(at);
    round_start = at;
    next_round_at.reset();
    ++report.rounds_started;
  };
  auto on_result = [&](const std::optional<RoundResult>& result) {
    if (!result.has_value()) {
      return;
    }
    ++report.rounds_finished;
    next_round_at = round_start.value() + result->elapsed_ms + options.coincidence_window_ms;
  };
  auto skip = [&](std::size_t line_no, const std::string& why) {
    ++report.skipped;
    std::cerr << "line " << line_no << ": skipped event: " << why << std::endl;
  };

  std::string line;
  std::size_t line_no = 0;
  while (!interrupted() && std::getline(events, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    ++report.lines;

    nlohmann::json entry;
    try {
      entry = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
      skip(line_no, ex.what());
      continue;
    }
    if (!entry.is_object()) {
      skip(line_no, "not an object");
      continue;
    }
    if (!entry.contains("t") || !entry.at("t").is_number_integer()) {
      skip(line_no, "missing integer 't'");
      continue;
    }
    const std::int64_t t = entry.at("t").get<std::int64_t>();
    if (last_t.has_value() && t < *last_t) {
      skip(line_no, "timestamp goes backwards");
      continue;
    }
    last_t = t;

    if (!round_start.has_value()) {
      start_round(t);
    }
    on_result(engine.poll(t));
    if (next_round_at.has_value() && t > *next_round_at) {
      start_round(*next_round_at);
      on_result(engine.poll(t));
    }
    if (entry.value("kind", std::string()) != "tick") {
      try {
        on_result(engine.submit(bridge::note_event_from_json(entry)));
      } catch (const std::invalid_argument& ex) {
        skip(line_no, ex.what());
      }
    }
    flush_display(out, engine, options.text);
  }

  // A blocked read cut short by a signal also lands here.
  report.interrupted = interrupted();
  if (!report.interrupted && last_t.has_value()) {
    on_result(engine.poll(*last_t + options.coincidence_window_ms + 1));
  }

  report.stats = engine.end_session();
  flush_display(out, engine, options.text);
  if (options.text) {
    out << "\n=== Session Statistics ===\n";
    for (const auto& miss : scoring::miss_lines(report.stats)) {
      out << miss << '\n';
    }
  } else {
    out << bridge::to_json(report.stats).dump() << '\n';
  }
  return report;
}

} // namespace keys
