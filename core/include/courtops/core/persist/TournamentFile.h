#pragma once

#include "courtops/core/model/TournamentState.h"

#include <map>
#include <string>

namespace courtops::core::persist {

constexpr const char* kTournamentFileVersion = "2.0";
constexpr const char* kMatchStateFileVersion = "1.0";

struct MatchStateFile {
    std::map<std::string, model::MatchState> match_states;
    std::string last_updated;
    std::string version = kMatchStateFileVersion;
};

std::string ToExportJson(const model::TournamentState& state, const std::string& exported_at);
bool ParseExportJson(const std::string& text, model::TournamentState& state, std::string* error);

// Full tournament export (config, roster, schedule and live match states).
bool SaveTournament(const std::string& path, const model::TournamentState& state, std::string* error);
bool LoadTournament(const std::string& path, model::TournamentState& state, std::string* error);

// Match-state mirror; the previous file is kept beside it as <stem>.backup.json.
bool SaveMatchStateFile(const std::string& path, const MatchStateFile& file, std::string* error);
// A missing file loads as empty; a corrupt one fails.
bool LoadMatchStateFile(const std::string& path, MatchStateFile& file, std::string* error);

// Imported states overwrite existing ones with the same match id.
void MergeMatchStates(std::map<std::string, model::MatchState>& into,
                      const std::map<std::string, model::MatchState>& imported);

}  // namespace courtops::core::persist
