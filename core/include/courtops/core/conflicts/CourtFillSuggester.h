#pragma once

#include "courtops/core/conflicts/ConflictEvaluator.h"
#include "courtops/core/model/TournamentState.h"

#include <set>
#include <string>
#include <vector>

namespace courtops::core::conflicts {

struct FreeCourt {
    int court_id = 0;
    int free_at_slot = 0;
    std::string last_match_id;
    std::string last_match_label;
    bool finished_early = false;
};

struct CourtFillSuggestion {
    int court_id = 0;
    std::string suggested_match_id;
    std::string match_label;
    std::string players;
    int original_court = 0;
    int original_slot = 0;
    std::string original_time;
    std::string reason;
};

// A court is free when nothing on it is started, something on it has finished,
// and nothing on it is currently called.
std::vector<FreeCourt> FindFreeCourts(const model::TournamentState& state, int current_slot);

std::vector<CourtFillSuggestion> SuggestCourtFills(const model::TournamentState& state,
                                                   const VerdictMap& verdicts,
                                                   int current_slot,
                                                   const std::set<int>& skipped_courts = {});

// Remembers operator "skip" decisions until the set of free courts changes.
class SuggestionTracker {
public:
    std::vector<CourtFillSuggestion> Suggest(const model::TournamentState& state,
                                             const VerdictMap& verdicts,
                                             int current_slot);
    void Skip(int court_id);
    const std::set<int>& skipped() const { return skipped_; }

private:
    void Refresh(const std::vector<FreeCourt>& free_courts);

    std::set<int> free_court_ids_{};
    std::set<int> skipped_{};
};

}  // namespace courtops::core::conflicts
