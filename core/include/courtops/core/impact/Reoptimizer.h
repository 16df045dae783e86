#pragma once

#include "courtops/core/errors/LiveOpsError.h"
#include "courtops/core/model/TournamentState.h"
#include "courtops/core/solver/ISolver.h"

#include <atomic>
#include <set>
#include <string>

namespace courtops::core::impact {

constexpr int kMinReoptimizeFreezeHorizon = 2;

// Started and finished matches go in locked at their current placement; pinned
// matches that have not started go in locked at their planned placement.
solver::SolveRequest BuildReoptimizeRequest(const model::TournamentState& state, double time_limit_seconds);

// Matches whose placement a reoptimization must not change.
std::set<std::string> FrozenMatches(const model::TournamentState& state);

// Maps a solver reply onto an error. Only optimal and feasible replies are actionable.
bool CheckSolveResult(const solver::SolveResult& result, errors::LiveOpsError* error);

// Replaces the assignment table with the solver's, keeping the current placement
// of every match that is started or finished at apply time. Displacement stashes
// of superseded matches are dropped.
bool ApplySolveResult(model::TournamentState& state,
                      const solver::SolveResult& result,
                      model::Schedule* applied,
                      errors::LiveOpsError* error);

class Reoptimizer {
public:
    explicit Reoptimizer(solver::ISolver& solver);

    // Single-flight guard; a second Begin while one run is outstanding fails.
    bool TryBegin();
    void End();
    bool InFlight() const { return in_flight_.load(); }

    // Solver call only; never touches the model. Call between TryBegin and End.
    bool Solve(const solver::SolveRequest& request,
               const std::atomic<bool>* cancel,
               solver::SolveResult* result,
               errors::LiveOpsError* error);

    // Guarded build + solve + apply against state the caller owns exclusively.
    bool Run(model::TournamentState& state,
             double time_limit_seconds,
             const std::atomic<bool>* cancel,
             model::Schedule* applied,
             errors::LiveOpsError* error);

private:
    solver::ISolver& solver_;
    std::atomic<bool> in_flight_{false};
};

}  // namespace courtops::core::impact
