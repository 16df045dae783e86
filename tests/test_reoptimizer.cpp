#include <catch2/catch.hpp>

#include "FakeSolver.h"
#include "TestFixtures.h"

#include "courtops/core/impact/Reoptimizer.h"

using namespace courtops::core;
using courtops::test::AddMatch;
using courtops::test::AddPlayers;
using courtops::test::BaseState;
using courtops::test::FakeSolver;
using courtops::test::Placed;
using courtops::test::SetStatus;
using model::MatchStatus;

namespace {

model::TournamentState ThreeMatches() {
    auto state = BaseState();
    AddPlayers(state, {"P1", "P2", "P3", "P4", "P5", "P6"});
    AddMatch(state, "M1", {"P1"}, {"P2"}, 2, 3);
    AddMatch(state, "M2", {"P3"}, {"P4"}, 1, 4);
    AddMatch(state, "M3", {"P5"}, {"P6"}, 3, 5);
    SetStatus(state, "M1", MatchStatus::Started);
    return state;
}

solver::SolveResult Reply(solver::SolverStatus status, std::vector<model::Assignment> assignments) {
    solver::SolveResult result;
    result.status = status;
    result.assignments = std::move(assignments);
    return result;
}

}  // namespace

TEST_CASE("the request locks started and pinned matches", "[reoptimizer]") {
    auto state = ThreeMatches();
    state.config.freeze_horizon_slots = 0;
    state.StateFor("M3").pinned = true;

    const auto request = impact::BuildReoptimizeRequest(state, 12.0);
    REQUIRE(request.config.freeze_horizon_slots == impact::kMinReoptimizeFreezeHorizon);
    REQUIRE(request.time_limit_seconds == 12.0);
    REQUIRE(request.matches.size() == 3);
    REQUIRE(request.previous_assignments.size() == 2);

    const auto& started = request.previous_assignments[0];
    REQUIRE(started.match_id == "M1");
    REQUIRE(started.locked);
    REQUIRE(started.slot_id == 3);
    REQUIRE(started.court_id == 2);
    REQUIRE(started.pinned_slot_id == std::optional<int>(3));
    REQUIRE(started.pinned_court_id == std::optional<int>(2));
    REQUIRE(request.previous_assignments[1].match_id == "M3");

    SECTION("a wider configured horizon is kept") {
        state.config.freeze_horizon_slots = 5;
        REQUIRE(impact::BuildReoptimizeRequest(state, 1.0).config.freeze_horizon_slots == 5);
    }
}

TEST_CASE("started matches keep their placement whatever the solver says", "[reoptimizer]") {
    auto state = ThreeMatches();
    FakeSolver solver(Reply(solver::SolverStatus::Optimal,
                            {Placed("M1", 1, 0), Placed("M2", 2, 6), Placed("M3", 3, 7)}));
    impact::Reoptimizer reoptimizer(solver);

    model::Schedule applied;
    errors::LiveOpsError error;
    REQUIRE(reoptimizer.Run(state, 5.0, nullptr, &applied, &error));
    REQUIRE(solver.calls.load() == 1);
    REQUIRE_FALSE(reoptimizer.InFlight());

    REQUIRE(state.FindAssignment("M1")->court_id == 2);
    REQUIRE(state.FindAssignment("M1")->slot_id == 3);
    REQUIRE(state.FindAssignment("M2")->court_id == 2);
    REQUIRE(state.FindAssignment("M2")->slot_id == 6);
    REQUIRE(state.schedule.status == "optimal");
    REQUIRE(applied.assignments.size() == 3);
}

TEST_CASE("committed matches the solver dropped stay on the schedule", "[reoptimizer]") {
    auto state = ThreeMatches();
    auto reply = Reply(solver::SolverStatus::Feasible, {Placed("M2", 1, 6)});
    reply.unscheduled_matches = {"M3"};

    errors::LiveOpsError error;
    REQUIRE(impact::ApplySolveResult(state, reply, nullptr, &error));
    REQUIRE(state.schedule.assignments.size() == 2);
    REQUIRE(state.FindAssignment("M1") != nullptr);
    REQUIRE(state.FindAssignment("M3") == nullptr);
    REQUIRE(state.schedule.unscheduled_matches == std::vector<std::string>{"M3"});
    REQUIRE(state.schedule.status == "feasible");
}

TEST_CASE("displacement stashes of rescheduled matches are dropped", "[reoptimizer]") {
    auto state = ThreeMatches();
    state.StateFor("M1").original = model::SlotPlacement{1, 1};
    state.StateFor("M2").original = model::SlotPlacement{2, 1};

    REQUIRE(impact::ApplySolveResult(
        state, Reply(solver::SolverStatus::Optimal, {Placed("M1", 2, 3), Placed("M2", 1, 4)}), nullptr, nullptr));
    REQUIRE(state.FindState("M1")->original.has_value());
    REQUIRE_FALSE(state.FindState("M2")->original.has_value());
}

TEST_CASE("an infeasible reply leaves the schedule untouched", "[reoptimizer]") {
    auto state = ThreeMatches();
    const auto before = state.schedule.assignments;
    auto reply = Reply(solver::SolverStatus::Infeasible, {});
    reply.infeasible_reasons = {"Not enough courts"};
    FakeSolver solver(reply);
    impact::Reoptimizer reoptimizer(solver);

    errors::LiveOpsError error;
    REQUIRE_FALSE(reoptimizer.Run(state, 5.0, nullptr, nullptr, &error));
    REQUIRE(error.code == errors::ErrorCode::SolverInfeasible);
    REQUIRE(error.reasons == std::vector<std::string>{"Not enough courts"});
    REQUIRE_FALSE(reoptimizer.InFlight());
    REQUIRE(state.schedule.assignments.size() == before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        REQUIRE(state.schedule.assignments[i].match_id == before[i].match_id);
        REQUIRE(state.schedule.assignments[i].slot_id == before[i].slot_id);
    }
}

TEST_CASE("solver failures are reported as such", "[reoptimizer]") {
    errors::LiveOpsError error;

    solver::SolveResult transport;
    transport.error = "Solver timed out after 100 ms";
    REQUIRE_FALSE(impact::CheckSolveResult(transport, &error));
    REQUIRE(error.code == errors::ErrorCode::SolverFailure);
    REQUIRE(error.message == "Solver timed out after 100 ms");

    REQUIRE_FALSE(impact::CheckSolveResult(Reply(solver::SolverStatus::Unknown, {}), &error));
    REQUIRE(error.code == errors::ErrorCode::SolverFailure);

    REQUIRE_FALSE(impact::CheckSolveResult(Reply(solver::SolverStatus::ModelInvalid, {}), &error));
    REQUIRE(error.code == errors::ErrorCode::SolverInfeasible);
}

TEST_CASE("only one reoptimization runs at a time", "[reoptimizer]") {
    auto state = ThreeMatches();
    FakeSolver solver(Reply(solver::SolverStatus::Optimal, {}));
    impact::Reoptimizer reoptimizer(solver);

    REQUIRE(reoptimizer.TryBegin());
    REQUIRE_FALSE(reoptimizer.TryBegin());

    errors::LiveOpsError error;
    REQUIRE_FALSE(reoptimizer.Run(state, 5.0, nullptr, nullptr, &error));
    REQUIRE(error.code == errors::ErrorCode::ReoptimizeInProgress);
    REQUIRE(solver.calls.load() == 0);

    reoptimizer.End();
    REQUIRE(reoptimizer.Run(state, 5.0, nullptr, nullptr, &error));
}
