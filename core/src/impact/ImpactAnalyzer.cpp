#include "courtops/core/impact/ImpactAnalyzer.h"

#include <algorithm>
#include <set>

namespace courtops::core::impact {

namespace {

using model::MatchStatus;

std::vector<std::string> SharedPlayerMatchesAfter(const model::TournamentState& state,
                                                  const model::Match& source,
                                                  int from_slot,
                                                  const std::set<std::string>& exclude) {
    std::vector<std::string> impacted;
    for (const auto& assignment : state.schedule.assignments) {
        if (exclude.count(assignment.match_id) > 0 || assignment.match_id == source.id) {
            continue;
        }
        if (state.StatusOf(assignment.match_id) != MatchStatus::Scheduled || assignment.slot_id < from_slot) {
            continue;
        }
        const auto* match = state.FindMatch(assignment.match_id);
        if (match && model::SharesPlayer(source, *match)) {
            impacted.push_back(assignment.match_id);
        }
    }
    return impacted;
}

}  // namespace

const char* ToString(SuggestedAction action) {
    switch (action) {
        case SuggestedAction::None:
            return "none";
        case SuggestedAction::Wait:
            return "wait";
        case SuggestedAction::ManualAdjust:
            return "manual_adjust";
        case SuggestedAction::Reoptimize:
            return "reoptimize";
    }
    return "none";
}

SuggestedAction ClassifyImpact(int overrun_slots, size_t impacted_count) {
    if (overrun_slots <= 0) {
        return SuggestedAction::None;
    }
    if (impacted_count == 0) {
        return SuggestedAction::Wait;
    }
    if (impacted_count <= 2) {
        return SuggestedAction::ManualAdjust;
    }
    return SuggestedAction::Reoptimize;
}

std::vector<model::Assignment> OverrunMatches(const model::TournamentState& state) {
    std::vector<model::Assignment> overruns;
    for (const auto& assignment : state.schedule.assignments) {
        const auto* match_state = state.FindState(assignment.match_id);
        if (!match_state || !match_state->actual_end_time) {
            continue;
        }
        if (state.ActualEndSlot(assignment) > assignment.end_slot()) {
            overruns.push_back(assignment);
        }
    }
    return overruns;
}

std::vector<model::Assignment> ImpactedMatches(const model::TournamentState& state) {
    std::set<std::string> impacted;
    for (const auto& overrun : OverrunMatches(state)) {
        const auto* match = state.FindMatch(overrun.match_id);
        if (!match) {
            continue;
        }
        for (auto& id : SharedPlayerMatchesAfter(state, *match, state.ActualEndSlot(overrun), {})) {
            impacted.insert(std::move(id));
        }
    }

    std::vector<model::Assignment> result;
    for (const auto& assignment : state.schedule.assignments) {
        if (impacted.count(assignment.match_id) > 0) {
            result.push_back(assignment);
        }
    }
    return result;
}

std::optional<ImpactAnalysis> AnalyzeImpact(const model::TournamentState& state,
                                            const std::string& match_id,
                                            std::optional<int> projected_end_slot) {
    const auto* assignment = state.FindAssignment(match_id);
    const auto* match = state.FindMatch(match_id);
    if (!assignment || !match) {
        return std::nullopt;
    }

    ImpactAnalysis analysis;
    analysis.match_id = match_id;
    analysis.match_number = match->match_number;
    analysis.scheduled_end_slot = assignment->end_slot();
    analysis.actual_end_slot = projected_end_slot ? *projected_end_slot : state.ActualEndSlot(*assignment);
    analysis.overrun_slots = std::max(0, analysis.actual_end_slot - analysis.scheduled_end_slot);
    analysis.directly_impacted = SharedPlayerMatchesAfter(state, *match, analysis.actual_end_slot, {});

    std::set<std::string> seen(analysis.directly_impacted.begin(), analysis.directly_impacted.end());
    for (const auto& direct_id : analysis.directly_impacted) {
        const auto* direct = state.FindMatch(direct_id);
        const auto* direct_assignment = state.FindAssignment(direct_id);
        if (!direct || !direct_assignment) {
            continue;
        }
        for (auto& id : SharedPlayerMatchesAfter(state, *direct, direct_assignment->slot_id, seen)) {
            if (id == match_id) {
                continue;
            }
            seen.insert(id);
            analysis.cascade_impacted.push_back(std::move(id));
        }
    }

    analysis.suggested_action = ClassifyImpact(analysis.overrun_slots, analysis.directly_impacted.size());
    return analysis;
}

}  // namespace courtops::core::impact
