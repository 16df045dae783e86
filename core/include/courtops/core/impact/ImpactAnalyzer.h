#pragma once

#include "courtops/core/model/TournamentState.h"

#include <optional>
#include <string>
#include <vector>

namespace courtops::core::impact {

enum class SuggestedAction {
    None,
    Wait,
    ManualAdjust,
    Reoptimize,
};

const char* ToString(SuggestedAction action);

struct ImpactAnalysis {
    std::string match_id;
    std::optional<int> match_number;
    int overrun_slots = 0;
    int actual_end_slot = 0;
    int scheduled_end_slot = 0;
    std::vector<std::string> directly_impacted;
    std::vector<std::string> cascade_impacted;
    SuggestedAction suggested_action = SuggestedAction::None;
};

SuggestedAction ClassifyImpact(int overrun_slots, size_t impacted_count);

// Assignments whose recorded actual end lies past their planned end.
std::vector<model::Assignment> OverrunMatches(const model::TournamentState& state);

// Scheduled matches that share a player with any overrun match and start at or after its actual end.
std::vector<model::Assignment> ImpactedMatches(const model::TournamentState& state);

// projected_end_slot stands in for the observed end while the match is still running.
std::optional<ImpactAnalysis> AnalyzeImpact(const model::TournamentState& state,
                                            const std::string& match_id,
                                            std::optional<int> projected_end_slot = std::nullopt);

}  // namespace courtops::core::impact
