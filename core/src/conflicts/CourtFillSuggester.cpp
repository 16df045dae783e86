#include "courtops/core/conflicts/CourtFillSuggester.h"

#include "courtops/core/util/TimeSlots.h"

#include <algorithm>
#include <sstream>

namespace courtops::core::conflicts {

namespace {

using model::MatchStatus;

int CourtCount(const model::TournamentState& state) {
    int count = state.config.court_count;
    for (const auto& assignment : state.schedule.assignments) {
        count = std::max(count, state.CourtOf(assignment));
    }
    return count;
}

std::string JoinNames(const model::TournamentState& state, const std::vector<std::string>& side) {
    std::ostringstream out;
    for (size_t i = 0; i < side.size(); ++i) {
        if (i > 0) {
            out << " & ";
        }
        const auto* player = state.FindPlayer(side[i]);
        out << (player && !player->name.empty() ? player->name : side[i]);
    }
    return out.str();
}

}  // namespace

std::vector<FreeCourt> FindFreeCourts(const model::TournamentState& state, int current_slot) {
    std::vector<FreeCourt> free_courts;
    const int court_count = CourtCount(state);

    for (int court_id = 1; court_id <= court_count; ++court_id) {
        bool has_started = false;
        bool has_called = false;
        const model::Assignment* last_finished = nullptr;

        for (const auto& assignment : state.schedule.assignments) {
            if (state.CourtOf(assignment) != court_id) {
                continue;
            }
            const MatchStatus status = state.StatusOf(assignment.match_id);
            if (status == MatchStatus::Started) {
                has_started = true;
            } else if (status == MatchStatus::Called) {
                has_called = true;
            } else if (status == MatchStatus::Finished) {
                if (!last_finished || assignment.slot_id > last_finished->slot_id ||
                    (assignment.slot_id == last_finished->slot_id &&
                     assignment.match_id > last_finished->match_id)) {
                    last_finished = &assignment;
                }
            }
        }

        if (has_started || has_called || !last_finished) {
            continue;
        }

        FreeCourt court;
        court.court_id = court_id;
        court.free_at_slot = current_slot;
        court.last_match_id = last_finished->match_id;
        const auto* last_match = state.FindMatch(last_finished->match_id);
        court.last_match_label = last_match ? last_match->Label() : last_finished->match_id;
        court.finished_early = current_slot < last_finished->end_slot();
        free_courts.push_back(std::move(court));
    }
    return free_courts;
}

std::vector<CourtFillSuggestion> SuggestCourtFills(const model::TournamentState& state,
                                                   const VerdictMap& verdicts,
                                                   int current_slot,
                                                   const std::set<int>& skipped_courts) {
    std::vector<CourtFillSuggestion> suggestions;
    std::set<std::string> taken;

    for (const auto& court : FindFreeCourts(state, current_slot)) {
        if (skipped_courts.count(court.court_id) > 0) {
            continue;
        }

        const model::Assignment* best = nullptr;
        for (const auto& assignment : state.schedule.assignments) {
            const MatchStatus status = state.StatusOf(assignment.match_id);
            if (status == MatchStatus::Started || status == MatchStatus::Finished) {
                continue;
            }
            if (assignment.court_id == court.court_id || taken.count(assignment.match_id) > 0) {
                continue;
            }
            const auto* match_state = state.FindState(assignment.match_id);
            if (match_state && (match_state->pinned || match_state->postponed)) {
                continue;
            }
            const auto verdict = verdicts.find(assignment.match_id);
            if (verdict == verdicts.end() || verdict->second.status != TrafficLight::Green) {
                continue;
            }
            if (!best || assignment.slot_id < best->slot_id ||
                (assignment.slot_id == best->slot_id && assignment.match_id < best->match_id)) {
                best = &assignment;
            }
        }

        if (!best) {
            continue;
        }
        const auto* match = state.FindMatch(best->match_id);
        if (!match) {
            continue;
        }

        taken.insert(best->match_id);
        CourtFillSuggestion suggestion;
        suggestion.court_id = court.court_id;
        suggestion.suggested_match_id = best->match_id;
        suggestion.match_label = match->Label();
        suggestion.players = JoinNames(state, match->side_a) + " vs " + JoinNames(state, match->side_b);
        suggestion.original_court = best->court_id;
        suggestion.original_slot = best->slot_id;
        suggestion.original_time = util::SlotToTime(best->slot_id, state.config);
        suggestion.reason = court.finished_early ? court.last_match_label + " finished early"
                                                 : "Court is available";
        suggestions.push_back(std::move(suggestion));
    }
    return suggestions;
}

std::vector<CourtFillSuggestion> SuggestionTracker::Suggest(const model::TournamentState& state,
                                                            const VerdictMap& verdicts,
                                                            int current_slot) {
    Refresh(FindFreeCourts(state, current_slot));
    return SuggestCourtFills(state, verdicts, current_slot, skipped_);
}

void SuggestionTracker::Skip(int court_id) {
    skipped_.insert(court_id);
}

void SuggestionTracker::Refresh(const std::vector<FreeCourt>& free_courts) {
    std::set<int> ids;
    for (const auto& court : free_courts) {
        ids.insert(court.court_id);
    }
    if (ids != free_court_ids_) {
        free_court_ids_ = std::move(ids);
        skipped_.clear();
    }
}

}  // namespace courtops::core::conflicts
