#include "keys/pitch_class.hpp"

#include <iostream>
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

template <typename Fn>
bool throws_invalid_argument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  TestSuite suite;

  {
    const auto& labels = keys::interval_labels();
    suite.require(labels.size() == 12, "Interval table should hold 12 labels");
    std::vector<bool> seen(12, false);
    for (const auto& label : labels) {
      const int semitones = keys::interval_semitones(label);
      suite.require(semitones >= 0 && semitones < 12, "Offset in range for " + label);
      if (semitones >= 0 && semitones < 12) {
        suite.require(!seen[semitones], "Offsets should be distinct: " + label);
        seen[semitones] = true;
      }
    }
    suite.require(keys::interval_semitones("3") == 4, "3 is four semitones");
    suite.require(keys::interval_semitones("b7") == 10, "b7 is ten semitones");
    suite.require(keys::interval_semitones("#4") == 6, "#4 is six semitones");
  }

  {
    for (int root = 0; root < 12; ++root) {
      for (const auto& label : keys::interval_labels()) {
        const int expected = (root + keys::interval_semitones(label)) % 12;
        suite.require(keys::interval_to_pitch_class(root, label) == expected,
                      "interval_to_pitch_class mod-12 for root " + std::to_string(root) +
                          " label " + label);
      }
    }
    suite.require(keys::interval_to_pitch_class(11, "b7") == 9, "B up a b7 is A");
  }

  {
    suite.require(keys::canonical_interval_label("b5") == "#4", "b5 aliases #4");
    suite.require(keys::canonical_interval_label("#5") == "b6", "#5 aliases b6");
    suite.require(keys::interval_semitones("b5") == 6, "Alias resolves to offset");
    suite.require(throws_invalid_argument([] { keys::interval_semitones("9"); }),
                  "Unknown interval label should fail fast");
    suite.require(throws_invalid_argument([] { keys::mode_from_name("Bogus"); }),
                  "Unknown mode name should fail fast");
  }

  {
    for (keys::Mode mode : keys::all_modes()) {
      const auto& steps = keys::mode_steps(mode);
      int sum = 0;
      for (int step : steps) {
        suite.require(step == 1 || step == 2, "Steps are whole or half");
        sum += step;
      }
      suite.require(sum == 12, "Steps of " + keys::mode_name(mode) + " sum to an octave");

      for (int root = 0; root < 12; ++root) {
        const auto scale = keys::build_scale(root, mode);
        suite.require(scale.size() == 8, "Scale has eight positions");
        if (scale.size() != 8) {
          continue;
        }
        suite.require(scale.front() == root, "Scale starts on the root");
        suite.require(scale.front() == scale.back(), "Octave repeats the root pitch class");
        for (std::size_t i = 0; i < 7; ++i) {
          const int delta = (scale[i + 1] - scale[i] + 12) % 12;
          suite.require(delta == steps[i], "Scale delta follows " + keys::mode_name(mode));
        }
      }
    }
    suite.require(keys::all_modes().size() == 7, "Seven diatonic modes");
    suite.require(keys::build_scale(0, keys::Mode::Ionian) ==
                      std::vector<int>({0, 2, 4, 5, 7, 9, 11, 0}),
                  "C Ionian");
    suite.require(keys::build_scale(9, keys::Mode::Aeolian) ==
                      std::vector<int>({9, 11, 0, 2, 4, 5, 7, 9}),
                  "A Aeolian");
    suite.require(keys::build_scale(2, keys::Mode::Dorian) ==
                      std::vector<int>({2, 4, 5, 7, 9, 11, 0, 2}),
                  "D Dorian");
  }

  {
    suite.require(keys::pitch_class_from_name("Db") == 1, "Db parses");
    suite.require(keys::pitch_class_from_name("C#") == 1, "C# parses");
    suite.require(keys::pitch_class_from_name("bb") == 10, "Lowercase letter accepted");
    suite.require(throws_invalid_argument([] { keys::pitch_class_from_name("H"); }),
                  "Unknown note name rejected");
    suite.require(keys::pitch_class_of_midi(60) == 0, "Middle C is pitch class 0");
    suite.require(keys::pitch_class_of_midi(-1) == 11, "Negative pitches wrap");
  }

  {
    suite.require(keys::note_name(10) == "Bb", "Root table spells Bb");
    suite.require(keys::note_name(6) == "F#", "Root table spells F#");
    suite.require(keys::note_name(13) == "?", "Out-of-range pitch class renders as ?");
    suite.require(keys::spelling_for_root(5) == keys::Spelling::Flats, "F spells with flats");
    suite.require(keys::spelling_for_root(3) == keys::Spelling::Flats, "Eb spells with flats");
    suite.require(keys::spelling_for_root(2) == keys::Spelling::Sharps, "D spells with sharps");
    suite.require(keys::note_name(10, keys::Spelling::Sharps) == "A#", "Sharp spelling");
    suite.require(keys::note_name(10, keys::Spelling::Flats) == "Bb", "Flat spelling");
    const auto f_major = keys::spell_sequence(keys::build_scale(5, keys::Mode::Ionian),
                                              keys::spelling_for_root(5));
    suite.require(f_major.size() == 8 && f_major[3] == "Bb", "F Ionian spells Bb");
    suite.require(keys::interval_prompt_text("b7") == "the b7", "Prompt wording");
  }

  if (!suite.ok) {
    std::cerr << "Pitch class tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Pitch class tests passed" << std::endl;
  return 0;
}
