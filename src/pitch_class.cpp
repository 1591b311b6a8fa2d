#include "keys/pitch_class.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

namespace keys {
namespace {

const std::array<const char*, kPitchClassCount> kSharpNames = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

const std::array<const char*, kPitchClassCount> kFlatNames = {
    "C", "Db", "D", "Eb", "E", "F", "Gb", "G", "Ab", "A", "Bb", "B"};

const std::array<const char*, kPitchClassCount> kRootNames = {
    "C", "Db", "D", "Eb", "E", "F", "F#", "G", "Ab", "A", "Bb", "B"};

struct IntervalEntry {
  const char* label;
  int semitones;
};

const std::array<IntervalEntry, 12> kIntervals = {{
    {"1", 0},  {"b2", 1}, {"2", 2},  {"b3", 3}, {"3", 4},   {"4", 5},
    {"#4", 6}, {"5", 7},  {"b6", 8}, {"6", 9},  {"b7", 10}, {"7", 11},
}};

const std::unordered_map<std::string, std::string>& interval_aliases() {
  static const std::unordered_map<std::string, std::string> aliases = {
      {"b5", "#4"}, {"#5", "b6"}};
  return aliases;
}

struct ModeEntry {
  Mode mode;
  const char* name;
  std::array<int, 7> steps;
};

// W = 2, H = 1
const std::array<ModeEntry, 7> kModes = {{
    {Mode::Ionian, "Ionian", {2, 2, 1, 2, 2, 2, 1}},
    {Mode::Dorian, "Dorian", {2, 1, 2, 2, 2, 1, 2}},
    {Mode::Phrygian, "Phrygian", {1, 2, 2, 2, 1, 2, 2}},
    {Mode::Lydian, "Lydian", {2, 2, 2, 1, 2, 2, 1}},
    {Mode::Mixolydian, "Mixolydian", {2, 2, 1, 2, 2, 1, 2}},
    {Mode::Aeolian, "Aeolian", {2, 1, 2, 2, 1, 2, 2}},
    {Mode::Locrian, "Locrian", {1, 2, 2, 1, 2, 2, 2}},
}};

const ModeEntry& mode_entry(Mode mode) {
  for (const auto& entry : kModes) {
    if (entry.mode == mode) {
      return entry;
    }
  }
  throw std::invalid_argument("Unknown mode value");
}

} // namespace

int normalize_pitch_class(int value) {
  int pc = value % kPitchClassCount;
  if (pc < 0) {
    pc += kPitchClassCount;
  }
  return pc;
}

int pitch_class_of_midi(int raw_pitch) {
  return normalize_pitch_class(raw_pitch);
}

int pitch_class_from_name(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("Empty note name");
  }
  std::string key = name;
  key[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(key[0])));
  for (int pc = 0; pc < kPitchClassCount; ++pc) {
    if (key == kSharpNames[pc] || key == kFlatNames[pc]) {
      return pc;
    }
  }
  throw std::invalid_argument("Unknown note name: " + name);
}

Spelling spelling_for_root(int root) {
  const int pc = normalize_pitch_class(root);
  const std::string name = kRootNames[pc];
  if (name.find('b') != std::string::npos || pc == 5) {
    return Spelling::Flats;
  }
  return Spelling::Sharps;
}

std::string note_name(int pc) {
  if (!is_valid_pitch_class(pc)) {
    return "?";
  }
  return kRootNames[pc];
}

std::string note_name(int pc, Spelling spelling) {
  if (!is_valid_pitch_class(pc)) {
    return "?";
  }
  return spelling == Spelling::Flats ? kFlatNames[pc] : kSharpNames[pc];
}

const std::vector<std::string>& interval_labels() {
  static const std::vector<std::string> labels = [] {
    std::vector<std::string> out;
    out.reserve(kIntervals.size());
    for (const auto& entry : kIntervals) {
      out.emplace_back(entry.label);
    }
    return out;
  }();
  return labels;
}

std::string canonical_interval_label(const std::string& label) {
  for (const auto& entry : kIntervals) {
    if (label == entry.label) {
      return label;
    }
  }
  const auto& aliases = interval_aliases();
  auto it = aliases.find(label);
  if (it != aliases.end()) {
    return it->second;
  }
  throw std::invalid_argument("Unsupported interval: " + label);
}

int interval_semitones(const std::string& label) {
  const std::string canonical = canonical_interval_label(label);
  for (const auto& entry : kIntervals) {
    if (canonical == entry.label) {
      return entry.semitones;
    }
  }
  throw std::invalid_argument("Unsupported interval: " + label);
}

int interval_to_pitch_class(int root, const std::string& label) {
  return normalize_pitch_class(root + interval_semitones(label));
}

std::string interval_prompt_text(const std::string& label) {
  return "the " + label;
}

const std::vector<Mode>& all_modes() {
  static const std::vector<Mode> modes = {Mode::Ionian,     Mode::Dorian,  Mode::Phrygian,
                                          Mode::Lydian,     Mode::Mixolydian,
                                          Mode::Aeolian,    Mode::Locrian};
  return modes;
}

std::string mode_name(Mode mode) {
  return mode_entry(mode).name;
}

Mode mode_from_name(const std::string& name) {
  for (const auto& entry : kModes) {
    if (name == entry.name) {
      return entry.mode;
    }
  }
  throw std::invalid_argument("Unsupported mode: " + name);
}

const std::array<int, 7>& mode_steps(Mode mode) {
  return mode_entry(mode).steps;
}

std::vector<int> build_scale(int root, Mode mode) {
  const auto& steps = mode_steps(mode);
  std::vector<int> scale;
  scale.reserve(kScaleLength);
  int offset = 0;
  scale.push_back(normalize_pitch_class(root));
  for (int step : steps) {
    offset += step;
    scale.push_back(normalize_pitch_class(root + offset));
  }
  return scale;
}

std::vector<std::string> spell_sequence(const std::vector<int>& sequence, Spelling spelling) {
  std::vector<std::string> names;
  names.reserve(sequence.size());
  std::transform(sequence.begin(), sequence.end(), std::back_inserter(names),
                 [spelling](int pc) { return note_name(pc, spelling); });
  return names;
}

} // namespace keys
