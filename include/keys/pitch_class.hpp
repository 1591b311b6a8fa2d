#pragma once

#include "types.hpp"

#include <array>
#include <string>
#include <vector>

namespace keys {

constexpr int kPitchClassCount = 12;
constexpr int kScaleLength = 8;  // seven degrees plus the octave

inline bool is_valid_pitch_class(int pc) {
  return pc >= 0 && pc < kPitchClassCount;
}

int normalize_pitch_class(int value);

int pitch_class_of_midi(int raw_pitch);

// Accepts sharp and flat spellings ("C#", "Db"). Throws on unknown names.
int pitch_class_from_name(const std::string& name);

// Roots spelled flat (Db, Eb, F, Ab, Bb) spell their notes with flats.
Spelling spelling_for_root(int root);

// Canonical name from the root table: C Db D Eb E F F# G Ab A Bb B.
std::string note_name(int pc);
std::string note_name(int pc, Spelling spelling);

//-----------------------------------------------------------------
// INTERVALS
//-----------------------------------------------------------------
const std::vector<std::string>& interval_labels();

// Maps aliases (b5, #5) onto the canonical table. Throws on unknown labels.
std::string canonical_interval_label(const std::string& label);

int interval_semitones(const std::string& label);

int interval_to_pitch_class(int root, const std::string& label);

std::string interval_prompt_text(const std::string& label);

//-----------------------------------------------------------------
// MODES
//-----------------------------------------------------------------
const std::vector<Mode>& all_modes();

std::string mode_name(Mode mode);

Mode mode_from_name(const std::string& name);

const std::array<int, 7>& mode_steps(Mode mode);

// Eight positions: the seven degrees and the root again at the octave.
std::vector<int> build_scale(int root, Mode mode);

std::vector<std::string> spell_sequence(const std::vector<int>& sequence, Spelling spelling);

} // namespace keys
