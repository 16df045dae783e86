#pragma once

#include "courtops/core/errors/LiveOpsError.h"
#include "courtops/core/lifecycle/MatchLifecycle.h"
#include "courtops/core/model/TournamentState.h"

#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace courtops::core::reassign {

// An interval on a court that must be cleared of displaceable matches.
struct Block {
    std::string owner_match_id;
    int court_id = 0;
    int start = 0;
    int end = 0;
};

struct MovedAssignment {
    std::string match_id;
    int from_court = 0;
    int from_slot = 0;
    int to_court = 0;
    int to_slot = 0;
};

struct StartOnCourtResult {
    std::vector<MovedAssignment> moved_assignments;
    model::MatchState match_state;
};

struct UndoStartResult {
    std::vector<MovedAssignment> restored_assignments;
    std::optional<model::MatchState> match_state;
};

// First slot on the court after every started or finished match placed there.
int NextAvailableSlot(const model::TournamentState& state, int court_id, const std::string& exclude_match_id);

// Drains the worklist, pushing every displaceable assignment that overlaps a
// block to the block's end and queueing its new interval. Pinned, started and
// finished matches and the members of `fixed` never move. Every match moved is
// added to `displaced`.
void ResolveOverlaps(const model::TournamentState& state,
                     std::vector<model::Assignment>& assignments,
                     std::deque<Block>& worklist,
                     const std::set<std::string>& fixed,
                     std::set<std::string>& displaced);

class CascadingReassigner {
public:
    explicit CascadingReassigner(const lifecycle::MatchLifecycle& lifecycle);

    bool StartOnCourt(model::TournamentState& state,
                      const std::string& match_id,
                      int target_court,
                      StartOnCourtResult* result,
                      errors::LiveOpsError* error) const;

    bool UndoStart(model::TournamentState& state,
                   const std::string& match_id,
                   UndoStartResult* result,
                   errors::LiveOpsError* error) const;

private:
    const lifecycle::MatchLifecycle& lifecycle_;
};

}  // namespace courtops::core::reassign
