#include "courtops/core/conflicts/ConflictEvaluator.h"

#include "courtops/core/util/TimeSlots.h"

#include <algorithm>
#include <sstream>

namespace courtops::core::conflicts {

namespace {

using model::MatchStatus;

struct ActiveMatch {
    const model::Match* match = nullptr;
    MatchStatus status = MatchStatus::Scheduled;
    int court_id = 0;
};

std::optional<ActiveMatch> FindActiveMatch(const model::TournamentState& state,
                                           const std::string& player_id,
                                           const std::string& exclude_match_id,
                                           const EvaluatorOptions& options) {
    for (const auto& match : state.matches) {
        if (match.id == exclude_match_id) {
            continue;
        }
        const MatchStatus status = state.StatusOf(match.id);
        const bool blocking = status == MatchStatus::Started ||
                              (options.block_on_called && status == MatchStatus::Called);
        if (!blocking || !match.HasPlayer(player_id)) {
            continue;
        }
        ActiveMatch active;
        active.match = &match;
        active.status = status;
        if (const auto* assignment = state.FindAssignment(match.id)) {
            active.court_id = state.CourtOf(*assignment);
        }
        return active;
    }
    return std::nullopt;
}

struct LastFinished {
    const model::Match* match = nullptr;
    int end_slot = -1;
};

std::optional<LastFinished> FindLastFinished(const model::TournamentState& state,
                                             const std::string& player_id,
                                             const std::string& exclude_match_id) {
    std::optional<LastFinished> result;
    for (const auto& match : state.matches) {
        if (match.id == exclude_match_id || state.StatusOf(match.id) != MatchStatus::Finished) {
            continue;
        }
        if (!match.HasPlayer(player_id)) {
            continue;
        }
        const auto* assignment = state.FindAssignment(match.id);
        if (!assignment) {
            continue;
        }
        const int end_slot = state.ActualEndSlot(*assignment);
        if (!result || end_slot > result->end_slot) {
            result = LastFinished{&match, end_slot};
        }
    }
    return result;
}

std::string SlotsText(int slots) {
    return std::to_string(slots) + (slots == 1 ? " slot" : " slots");
}

std::string JoinReasons(const std::vector<PlayerStatus>& statuses) {
    if (statuses.size() == 1) {
        return statuses.front().player_name + " is " + statuses.front().reason;
    }
    std::ostringstream out;
    for (size_t i = 0; i < statuses.size(); ++i) {
        if (i > 0) {
            out << "; ";
        }
        out << statuses[i].player_name << ": " << statuses[i].reason;
    }
    return out.str();
}

}  // namespace

const char* ToString(TrafficLight light) {
    switch (light) {
        case TrafficLight::Green:
            return "green";
        case TrafficLight::Yellow:
            return "yellow";
        case TrafficLight::Red:
            return "red";
    }
    return "green";
}

std::vector<PlayerStatus> PlayerStatuses(const model::TournamentState& state,
                                         const std::string& match_id,
                                         int current_slot,
                                         const EvaluatorOptions& options) {
    std::vector<PlayerStatus> statuses;
    const auto* match = state.FindMatch(match_id);
    if (!match) {
        return statuses;
    }

    for (const auto& player_id : match->PlayerIds()) {
        const auto* player = state.FindPlayer(player_id);
        PlayerStatus status;
        status.player_id = player_id;
        status.player_name = player && !player->name.empty() ? player->name : player_id;

        if (const auto active = FindActiveMatch(state, player_id, match_id, options)) {
            status.availability = PlayerAvailability::Active;
            status.match_id = active->match->id;
            status.reason = std::string(active->status == MatchStatus::Called ? "called to " : "playing ") +
                            active->match->Label() + " on court " + std::to_string(active->court_id);
            statuses.push_back(std::move(status));
            continue;
        }

        if (const auto last = FindLastFinished(state, player_id, match_id)) {
            const int rest_minutes = player && player->min_rest_minutes ? *player->min_rest_minutes
                                                                       : state.config.default_rest_minutes;
            const int available_at = last->end_slot + util::RestSlots(rest_minutes, state.config);
            if (current_slot < available_at) {
                status.availability = PlayerAvailability::Resting;
                status.match_id = last->match->id;
                status.available_at_slot = available_at;
                status.reason = "resting after " + last->match->Label() + " (" +
                                SlotsText(available_at - current_slot) + " remaining)";
                statuses.push_back(std::move(status));
                continue;
            }
        }

        statuses.push_back(std::move(status));
    }
    return statuses;
}

ConflictVerdict EvaluateMatch(const model::TournamentState& state,
                              const std::string& match_id,
                              int current_slot,
                              const EvaluatorOptions& options) {
    const auto statuses = PlayerStatuses(state, match_id, current_slot, options);

    std::vector<PlayerStatus> active;
    std::vector<PlayerStatus> resting;
    for (const auto& status : statuses) {
        if (status.availability == PlayerAvailability::Active) {
            active.push_back(status);
        } else if (status.availability == PlayerAvailability::Resting) {
            resting.push_back(status);
        }
    }

    ConflictVerdict verdict;
    if (!active.empty()) {
        verdict.status = TrafficLight::Red;
        verdict.reason = JoinReasons(active);
        for (const auto& status : active) {
            verdict.players_blocked.push_back(status.player_name);
            if (std::find(verdict.blocked_by.begin(), verdict.blocked_by.end(), status.match_id) ==
                verdict.blocked_by.end()) {
                verdict.blocked_by.push_back(status.match_id);
            }
        }
        return verdict;
    }

    if (!resting.empty()) {
        int available_at = 0;
        for (const auto& status : resting) {
            verdict.players_resting.push_back(status.player_name);
            available_at = std::max(available_at, status.available_at_slot.value_or(0));
        }
        verdict.status = TrafficLight::Yellow;
        verdict.available_in_slots = available_at - current_slot;
        verdict.reason = JoinReasons(resting);
        return verdict;
    }

    verdict.reason = "Ready to call";
    return verdict;
}

VerdictMap EvaluateConflicts(const model::TournamentState& state,
                             int current_slot,
                             const EvaluatorOptions& options) {
    VerdictMap verdicts;
    for (const auto& assignment : state.schedule.assignments) {
        if (state.StatusOf(assignment.match_id) != MatchStatus::Scheduled) {
            continue;
        }
        if (!state.FindMatch(assignment.match_id)) {
            continue;
        }
        verdicts[assignment.match_id] = EvaluateMatch(state, assignment.match_id, current_slot, options);
    }
    return verdicts;
}

}  // namespace courtops::core::conflicts
