#include "json_bridge.hpp"

#include "keys/pitch_class.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace keys::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

std::int64_t json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    return static_cast<std::int64_t>(std::llround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

// Fields stored as `int` reject values that would not survive narrowing.
int json_to_small_int(const nlohmann::json& value, std::string_view key) {
  const std::int64_t wide = json_to_int(value, key);
  if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Value out of range for field '" + std::string(key) + "'");
  }
  return static_cast<int>(wide);
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key)) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj.at(key);
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const auto v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

// Roots may be given as note names ("Bb") or pitch classes (10).
int json_to_root(const nlohmann::json& value) {
  if (value.is_string()) {
    return pitch_class_from_name(value.get<std::string>());
  }
  const std::int64_t pc = json_to_int(value, "roots");
  if (pc < 0 || pc >= kPitchClassCount) {
    throw std::invalid_argument("root out of range: " + std::to_string(pc));
  }
  return static_cast<int>(pc);
}

NoteKind json_to_note_kind(const nlohmann::json& value) {
  const std::string kind = json_to_string(value, "kind");
  if (kind == "on") {
    return NoteKind::On;
  }
  if (kind == "off") {
    return NoteKind::Off;
  }
  throw std::invalid_argument("Unknown note event kind: " + kind);
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json to_json(const PracticeConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["practice_type"] = to_string(config.practice_type);
  nlohmann::json modes = nlohmann::json::array();
  for (Mode mode : config.enabled_modes) {
    modes.push_back(mode_name(mode));
  }
  json["enabled_modes"] = std::move(modes);
  json["time_pressure"] = to_string(config.time_pressure);
  nlohmann::json roots = nlohmann::json::array();
  for (int root : config.roots) {
    roots.push_back(note_name(root));
  }
  json["roots"] = std::move(roots);
  json["intervals"] = config.intervals;
  json["prompts_per_root"] = {{"min", config.prompts_per_root_min},
                              {"max", config.prompts_per_root_max}};
  json["root_reroll"] = to_string(config.root_reroll);
  json["repeat_missed"] = config.repeat_missed;
  json["coincidence_window_ms"] = config.coincidence_window_ms;
  json["seed"] = config.seed;
  return json;
}

PracticeConfig practice_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw std::invalid_argument("Practice configuration must be a JSON object");
  }
  PracticeConfig config;
  if (!json_config.contains("practice_type")) {
    throw std::invalid_argument("Missing field 'practice_type'");
  }
  config.practice_type =
      practice_type_from_string(json_to_string(json_config.at("practice_type"), "practice_type"));

  assign_if_present(json_config, "enabled_modes", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array<string> for field 'enabled_modes'");
    }
    config.enabled_modes.clear();
    for (const auto& entry : value) {
      config.enabled_modes.push_back(mode_from_name(json_to_string(entry, "enabled_modes")));
    }
  });
  assign_if_present(json_config, "time_pressure", [&](const nlohmann::json& value) {
    config.time_pressure = time_pressure_from_string(json_to_string(value, "time_pressure"));
  });
  assign_if_present(json_config, "roots", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'roots'");
    }
    for (const auto& entry : value) {
      config.roots.push_back(json_to_root(entry));
    }
  });
  assign_if_present(json_config, "intervals", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array<string> for field 'intervals'");
    }
    for (const auto& entry : value) {
      config.intervals.push_back(canonical_interval_label(json_to_string(entry, "intervals")));
    }
  });
  assign_if_present(json_config, "prompts_per_root", [&](const nlohmann::json& value) {
    if (!value.is_object()) {
      throw std::invalid_argument("Expected object for field 'prompts_per_root'");
    }
    assign_if_present(value, "min", [&](const nlohmann::json& v) {
      config.prompts_per_root_min = json_to_small_int(v, "prompts_per_root.min");
    });
    assign_if_present(value, "max", [&](const nlohmann::json& v) {
      config.prompts_per_root_max = json_to_small_int(v, "prompts_per_root.max");
    });
  });
  assign_if_present(json_config, "root_reroll", [&](const nlohmann::json& value) {
    config.root_reroll = root_reroll_from_string(json_to_string(value, "root_reroll"));
  });
  assign_if_present(json_config, "repeat_missed", [&](const nlohmann::json& value) {
    config.repeat_missed = json_to_bool(value, "repeat_missed");
  });
  assign_if_present(json_config, "coincidence_window_ms", [&](const nlohmann::json& value) {
    config.coincidence_window_ms = json_to_int(value, "coincidence_window_ms");
  });
  assign_if_present(json_config, "seed", [&](const nlohmann::json& value) {
    config.seed = static_cast<std::uint64_t>(json_to_int(value, "seed"));
  });

  config.validate();
  return config;
}

nlohmann::json to_json(const NoteEvent& event) {
  nlohmann::json json = nlohmann::json::object();
  json["t"] = event.timestamp_ms;
  json["pitch"] = event.raw_pitch;
  json["pc"] = event.pitch_class;
  json["kind"] = event.kind == NoteKind::On ? "on" : "off";
  json["velocity"] = event.velocity;
  return json;
}

// The pitch class defaults to the raw pitch mod 12; an explicit "pc" is
// passed through untouched so malformed input reaches the matcher as-is.
NoteEvent note_event_from_json(const nlohmann::json& json_event) {
  if (!json_event.is_object()) {
    throw std::invalid_argument("Note event must be a JSON object");
  }
  NoteEvent event;
  event.timestamp_ms = json_to_int(require_field(json_event, "t"), "t");
  event.kind = json_to_note_kind(require_field(json_event, "kind"));
  event.raw_pitch = json_to_small_int(require_field(json_event, "pitch"), "pitch");
  event.pitch_class = pitch_class_of_midi(event.raw_pitch);
  assign_if_present(json_event, "pc", [&](const nlohmann::json& value) {
    event.pitch_class = json_to_small_int(value, "pc");
  });
  assign_if_present(json_event, "velocity", [&](const nlohmann::json& value) {
    event.velocity = json_to_small_int(value, "velocity");
  });
  return event;
}

nlohmann::json to_json(const RoundPlan& plan) {
  nlohmann::json json = nlohmann::json::object();
  json["type"] = to_string(plan.type);
  json["root"] = plan.root;
  json["root_name"] = note_name(plan.root);
  json["expected"] = plan.expected;
  json["expected_names"] = plan.expected_names;
  json["confirm_root"] = optional_json(plan.confirm_root);
  json["interval"] = optional_json(plan.interval_label);
  json["mode"] = plan.mode.has_value() ? nlohmann::json(mode_name(*plan.mode))
                                       : nlohmann::json(nullptr);
  json["category"] = plan.category;
  json["prompt"] = plan.prompt_text;
  return json;
}

nlohmann::json to_json(const RoundResult& result) {
  nlohmann::json json = nlohmann::json::object();
  json["round_index"] = result.round_index;
  json["type"] = to_string(result.type);
  json["root"] = result.root;
  json["category"] = result.category;
  json["passed"] = result.passed;
  json["escaped"] = result.escaped;
  json["elapsed_ms"] = result.elapsed_ms;
  nlohmann::json positions = nlohmann::json::array();
  for (const auto& position : result.positions) {
    nlohmann::json item = nlohmann::json::object();
    item["expected"] = position.expected;
    item["observed"] = optional_json(position.observed);
    item["verdict"] = to_string(position.verdict);
    item["hinted"] = position.hinted;
    positions.push_back(std::move(item));
  }
  json["positions"] = std::move(positions);
  return json;
}

nlohmann::json to_json(const SessionStats& stats) {
  nlohmann::json json = nlohmann::json::object();
  json["attempted"] = stats.attempted;
  json["correct"] = stats.correct;
  json["incorrect"] = stats.incorrect();
  json["escaped"] = stats.escaped;
  json["accuracy"] = stats.accuracy();
  json["avg_elapsed_ms"] = stats.average_elapsed_ms();
  json["position_errors"] = stats.position_errors;

  nlohmann::json misses = nlohmann::json::array();
  for (const auto& miss : stats.misses) {
    nlohmann::json item = nlohmann::json::object();
    item["round_index"] = miss.round_index;
    item["position"] = miss.position;
    item["label"] = miss.label;
    item["expected"] = miss.expected_name;
    item["played"] = miss.observed_name;
    item["category"] = miss.category;
    misses.push_back(std::move(item));
  }
  json["misses"] = std::move(misses);

  nlohmann::json by_category = nlohmann::json::array();
  for (const auto& entry : stats.by_category) {
    nlohmann::json item = nlohmann::json::object();
    item["label"] = entry.first;
    item["attempted"] = entry.second.attempted;
    item["correct"] = entry.second.correct;
    by_category.push_back(std::move(item));
  }
  json["by_category"] = std::move(by_category);
  return json;
}

nlohmann::json to_json(const DisplayEvent& event) {
  nlohmann::json json = nlohmann::json::object();
  json["kind"] = to_string(event.kind);
  json["round"] = event.round_index;
  json["position"] = optional_json(event.position);
  json["number"] = optional_json(event.number);
  json["expected"] = optional_json(event.expected);
  json["observed"] = optional_json(event.observed);
  json["verdict"] = event.verdict.has_value() ? nlohmann::json(to_string(*event.verdict))
                                              : nlohmann::json(nullptr);
  json["elapsed_ms"] = event.elapsed_ms;
  json["text"] = event.text;
  return json;
}

} // namespace keys::bridge
