#pragma once

#include "courtops/core/model/TournamentState.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace courtops::core::persist {

nlohmann::json WriteConfig(const model::TournamentConfig& config);
model::TournamentConfig ParseConfig(const nlohmann::json& node);

nlohmann::json WritePlayer(const model::Player& player);
model::Player ParsePlayer(const nlohmann::json& node);

nlohmann::json WriteMatch(const model::Match& match);
model::Match ParseMatch(const nlohmann::json& node);

nlohmann::json WriteAssignment(const model::Assignment& assignment);
model::Assignment ParseAssignment(const nlohmann::json& node);

nlohmann::json WriteSchedule(const model::Schedule& schedule);
model::Schedule ParseSchedule(const nlohmann::json& node);

nlohmann::json WriteMatchState(const model::MatchState& state);
model::MatchState ParseMatchState(const nlohmann::json& node);

nlohmann::json WriteMatchStates(const std::map<std::string, model::MatchState>& states);
std::map<std::string, model::MatchState> ParseMatchStates(const nlohmann::json& node);

}  // namespace courtops::core::persist
