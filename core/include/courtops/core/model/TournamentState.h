#pragma once

#include "courtops/core/model/MatchState.h"
#include "courtops/core/model/Tournament.h"

#include <map>
#include <string>
#include <vector>

namespace courtops::core::model {

struct TournamentState {
    TournamentConfig config;
    std::vector<Player> players;
    std::vector<Match> matches;
    Schedule schedule;
    std::map<std::string, MatchState> match_states;

    const Match* FindMatch(const std::string& match_id) const;
    Match* FindMatch(const std::string& match_id);
    const Player* FindPlayer(const std::string& player_id) const;
    const Assignment* FindAssignment(const std::string& match_id) const;
    Assignment* FindAssignment(const std::string& match_id);

    // Absent states read as a default scheduled state.
    MatchStatus StatusOf(const std::string& match_id) const;
    const MatchState* FindState(const std::string& match_id) const;
    MatchState& StateFor(const std::string& match_id);

    // Court the match is physically on: the actual court override, else the planned court.
    int CourtOf(const Assignment& assignment) const;

    // Actual end slot when an actual end time is recorded, else the planned end.
    int ActualEndSlot(const Assignment& assignment) const;
};

}  // namespace courtops::core::model
