#pragma once

#include "courtops/core/model/Tournament.h"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace courtops::core::solver {

enum class SolverStatus {
    Optimal,
    Feasible,
    Infeasible,
    Unknown,
    ModelInvalid,
};

const char* ToString(SolverStatus status);
bool ParseSolverStatus(const std::string& text, SolverStatus& out);

struct PreviousAssignment {
    std::string match_id;
    int slot_id = 0;
    int court_id = 0;
    bool locked = false;
    std::optional<int> pinned_slot_id;
    std::optional<int> pinned_court_id;
};

struct SolveRequest {
    model::TournamentConfig config;
    std::vector<model::Player> players;
    std::vector<model::Match> matches;
    std::vector<PreviousAssignment> previous_assignments;
    double time_limit_seconds = 30.0;
};

struct SolveResult {
    SolverStatus status = SolverStatus::Unknown;
    std::vector<model::Assignment> assignments;
    std::vector<model::SoftViolation> soft_violations;
    std::vector<std::string> infeasible_reasons;
    std::vector<std::string> unscheduled_matches;
    std::optional<double> objective_score;
    // Transport-level failure (spawn, timeout, unparsable reply); empty when the solver answered.
    std::string error;
};

class ISolver {
public:
    virtual ~ISolver() = default;

    // Blocks until the solver answers, the time limit passes or *cancel turns true.
    virtual SolveResult Solve(const SolveRequest& request, const std::atomic<bool>* cancel) = 0;
};

}  // namespace courtops::core::solver
