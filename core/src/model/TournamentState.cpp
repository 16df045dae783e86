#include "courtops/core/model/TournamentState.h"

#include "courtops/core/util/TimeSlots.h"

#include <algorithm>

namespace courtops::core::model {

const Match* TournamentState::FindMatch(const std::string& match_id) const {
    const auto it = std::find_if(matches.begin(), matches.end(),
                                 [&](const Match& match) { return match.id == match_id; });
    return it == matches.end() ? nullptr : &*it;
}

Match* TournamentState::FindMatch(const std::string& match_id) {
    const auto it = std::find_if(matches.begin(), matches.end(),
                                 [&](const Match& match) { return match.id == match_id; });
    return it == matches.end() ? nullptr : &*it;
}

const Player* TournamentState::FindPlayer(const std::string& player_id) const {
    const auto it = std::find_if(players.begin(), players.end(),
                                 [&](const Player& player) { return player.id == player_id; });
    return it == players.end() ? nullptr : &*it;
}

const Assignment* TournamentState::FindAssignment(const std::string& match_id) const {
    const auto& list = schedule.assignments;
    const auto it = std::find_if(list.begin(), list.end(),
                                 [&](const Assignment& a) { return a.match_id == match_id; });
    return it == list.end() ? nullptr : &*it;
}

Assignment* TournamentState::FindAssignment(const std::string& match_id) {
    auto& list = schedule.assignments;
    const auto it = std::find_if(list.begin(), list.end(),
                                 [&](const Assignment& a) { return a.match_id == match_id; });
    return it == list.end() ? nullptr : &*it;
}

MatchStatus TournamentState::StatusOf(const std::string& match_id) const {
    const auto it = match_states.find(match_id);
    return it == match_states.end() ? MatchStatus::Scheduled : it->second.status;
}

const MatchState* TournamentState::FindState(const std::string& match_id) const {
    const auto it = match_states.find(match_id);
    return it == match_states.end() ? nullptr : &it->second;
}

MatchState& TournamentState::StateFor(const std::string& match_id) {
    auto [it, inserted] = match_states.try_emplace(match_id);
    if (inserted) {
        it->second.match_id = match_id;
    }
    return it->second;
}

int TournamentState::CourtOf(const Assignment& assignment) const {
    const auto* state = FindState(assignment.match_id);
    if (state && state->actual_court_id) {
        return *state->actual_court_id;
    }
    return assignment.court_id;
}

int TournamentState::ActualEndSlot(const Assignment& assignment) const {
    const auto* state = FindState(assignment.match_id);
    if (state && state->actual_end_time) {
        return util::TimeToSlot(*state->actual_end_time, config);
    }
    return assignment.end_slot();
}

}  // namespace courtops::core::model
