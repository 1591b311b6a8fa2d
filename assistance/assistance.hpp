#pragma once

#include "../include/keys/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace keys::assistance {

// Display payloads emitted while a round is in progress.
DisplayEvent make_prompt(const RoundPlan& plan, std::size_t round_index, bool root_prompt);

DisplayEvent make_root_check(const RoundPlan& plan, std::size_t round_index, int observed,
                             std::int64_t elapsed_ms);

DisplayEvent make_echo(const RoundPlan& plan, std::size_t round_index, int position,
                       int observed, std::int64_t elapsed_ms);

DisplayEvent make_verdict(const RoundPlan& plan, std::size_t round_index, int position,
                          const PositionOutcome& outcome, std::int64_t elapsed_ms);

// `position` is empty while the root itself is being asked for.
DisplayEvent make_timeout_hint(const RoundPlan& plan, std::size_t round_index,
                               std::optional<int> position, int expected,
                               std::int64_t elapsed_ms);

DisplayEvent make_round_summary(const RoundResult& result);

// "ascending"/"descending" for Mode rounds, empty otherwise.
std::string direction_of(PracticeType type, int position);

// 1-based; Mode rounds restart at 1 for the descending half.
int number_within_direction(PracticeType type, int position);

// "Note 3 (descending)" for Mode rounds, "Note 1" otherwise.
std::string note_label(PracticeType type, int position);

} // namespace keys::assistance
