#include "courtops/core/impact/Reoptimizer.h"

#include <algorithm>
#include <map>

namespace courtops::core::impact {

namespace {

using model::MatchStatus;

bool IsCommitted(MatchStatus status) {
    return status == MatchStatus::Started || status == MatchStatus::Finished;
}

}  // namespace

std::set<std::string> FrozenMatches(const model::TournamentState& state) {
    std::set<std::string> frozen;
    for (const auto& assignment : state.schedule.assignments) {
        if (IsCommitted(state.StatusOf(assignment.match_id))) {
            frozen.insert(assignment.match_id);
        }
    }
    return frozen;
}

solver::SolveRequest BuildReoptimizeRequest(const model::TournamentState& state, double time_limit_seconds) {
    solver::SolveRequest request;
    request.config = state.config;
    request.config.freeze_horizon_slots =
        std::max(state.config.freeze_horizon_slots, kMinReoptimizeFreezeHorizon);
    request.players = state.players;
    request.matches = state.matches;
    request.time_limit_seconds = time_limit_seconds;

    for (const auto& assignment : state.schedule.assignments) {
        const MatchStatus status = state.StatusOf(assignment.match_id);
        const auto* match_state = state.FindState(assignment.match_id);
        const bool pinned = match_state && match_state->pinned;
        if (!IsCommitted(status) && !pinned) {
            continue;
        }
        solver::PreviousAssignment previous;
        previous.match_id = assignment.match_id;
        previous.slot_id = assignment.slot_id;
        previous.court_id = state.CourtOf(assignment);
        previous.locked = true;
        previous.pinned_slot_id = previous.slot_id;
        previous.pinned_court_id = previous.court_id;
        request.previous_assignments.push_back(std::move(previous));
    }
    return request;
}

bool CheckSolveResult(const solver::SolveResult& result, errors::LiveOpsError* error) {
    if (!result.error.empty()) {
        return errors::Fail(error, errors::ErrorCode::SolverFailure, result.error);
    }
    switch (result.status) {
        case solver::SolverStatus::Optimal:
        case solver::SolverStatus::Feasible:
            return true;
        case solver::SolverStatus::Infeasible:
        case solver::SolverStatus::ModelInvalid:
            return errors::Fail(error,
                                errors::ErrorCode::SolverInfeasible,
                                std::string("Solver returned ") + solver::ToString(result.status),
                                result.infeasible_reasons);
        case solver::SolverStatus::Unknown:
            break;
    }
    return errors::Fail(error, errors::ErrorCode::SolverFailure, "Solver returned no usable schedule",
                        result.infeasible_reasons);
}

bool ApplySolveResult(model::TournamentState& state,
                      const solver::SolveResult& result,
                      model::Schedule* applied,
                      errors::LiveOpsError* error) {
    if (!CheckSolveResult(result, error)) {
        return false;
    }

    const std::set<std::string> frozen = FrozenMatches(state);
    std::map<std::string, model::Assignment> current;
    for (const auto& assignment : state.schedule.assignments) {
        current[assignment.match_id] = assignment;
    }

    model::Schedule schedule;
    std::set<std::string> placed;
    for (const auto& assignment : result.assignments) {
        if (!placed.insert(assignment.match_id).second) {
            continue;
        }
        if (frozen.count(assignment.match_id) > 0) {
            schedule.assignments.push_back(current.at(assignment.match_id));
        } else {
            schedule.assignments.push_back(assignment);
        }
    }
    // Committed work the solver dropped stays where it is.
    for (const auto& id : frozen) {
        if (placed.insert(id).second) {
            schedule.assignments.push_back(current.at(id));
        }
    }
    for (const auto& id : result.unscheduled_matches) {
        if (placed.count(id) == 0) {
            schedule.unscheduled_matches.push_back(id);
        }
    }
    schedule.soft_violations = result.soft_violations;
    schedule.infeasible_reasons = result.infeasible_reasons;
    schedule.objective_score = result.objective_score;
    schedule.status = solver::ToString(result.status);

    for (auto& [match_id, match_state] : state.match_states) {
        if (frozen.count(match_id) == 0) {
            match_state.original.reset();
        }
    }
    state.schedule = std::move(schedule);
    if (applied) {
        *applied = state.schedule;
    }
    return true;
}

Reoptimizer::Reoptimizer(solver::ISolver& solver) : solver_(solver) {}

bool Reoptimizer::TryBegin() {
    bool expected = false;
    return in_flight_.compare_exchange_strong(expected, true);
}

void Reoptimizer::End() {
    in_flight_.store(false);
}

bool Reoptimizer::Solve(const solver::SolveRequest& request,
                        const std::atomic<bool>* cancel,
                        solver::SolveResult* result,
                        errors::LiveOpsError* error) {
    solver::SolveResult reply = solver_.Solve(request, cancel);
    if (!CheckSolveResult(reply, error)) {
        return false;
    }
    if (result) {
        *result = std::move(reply);
    }
    return true;
}

bool Reoptimizer::Run(model::TournamentState& state,
                      double time_limit_seconds,
                      const std::atomic<bool>* cancel,
                      model::Schedule* applied,
                      errors::LiveOpsError* error) {
    if (!TryBegin()) {
        return errors::Fail(error, errors::ErrorCode::ReoptimizeInProgress, "A reoptimization is already running");
    }
    const solver::SolveRequest request = BuildReoptimizeRequest(state, time_limit_seconds);
    solver::SolveResult result;
    const bool ok = Solve(request, cancel, &result, error) && ApplySolveResult(state, result, applied, error);
    End();
    return ok;
}

}  // namespace courtops::core::impact
