#pragma once

#include "../include/keys/session_engine.hpp"

namespace keys::bridge {

nlohmann::json to_json(const PracticeConfig& config);
PracticeConfig practice_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const NoteEvent& event);
NoteEvent note_event_from_json(const nlohmann::json& json_event);

nlohmann::json to_json(const RoundPlan& plan);

nlohmann::json to_json(const RoundResult& result);

nlohmann::json to_json(const SessionStats& stats);

nlohmann::json to_json(const DisplayEvent& event);

} // namespace keys::bridge
