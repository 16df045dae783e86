#include <catch2/catch.hpp>

#include "TestFixtures.h"

#include "courtops/core/conflicts/ConflictEvaluator.h"
#include "courtops/core/persist/TournamentFile.h"

using namespace courtops::core;
using courtops::test::AddMatch;
using courtops::test::AddPlayers;
using courtops::test::BaseState;
using courtops::test::SetStatus;
using conflicts::TrafficLight;
using model::MatchStatus;

namespace {

model::TournamentState TwoMatches() {
    auto state = BaseState();
    AddPlayers(state, {"P1", "P2", "P3", "P4"});
    AddMatch(state, "M1", {"P1"}, {"P2"}, 1, 0, 2);
    AddMatch(state, "M2", {"P1"}, {"P3"}, 2, 2, 1);
    return state;
}

}  // namespace

TEST_CASE("a player on court makes the match red", "[conflicts]") {
    auto state = TwoMatches();
    SetStatus(state, "M1", MatchStatus::Started);

    const auto verdicts = conflicts::EvaluateConflicts(state, 1);
    REQUIRE(verdicts.count("M1") == 0);
    const auto& verdict = verdicts.at("M2");
    REQUIRE(verdict.status == TrafficLight::Red);
    REQUIRE(verdict.reason == "P1 is playing M1 on court 1");
    REQUIRE(verdict.blocked_by == std::vector<std::string>{"M1"});
    REQUIRE(verdict.players_blocked == std::vector<std::string>{"P1"});
}

TEST_CASE("a player called elsewhere blocks unless disabled", "[conflicts]") {
    auto state = TwoMatches();
    SetStatus(state, "M1", MatchStatus::Called);

    const auto blocking = conflicts::EvaluateMatch(state, "M2", 0);
    REQUIRE(blocking.status == TrafficLight::Red);
    REQUIRE(blocking.reason == "P1 is called to M1 on court 1");

    conflicts::EvaluatorOptions options;
    options.block_on_called = false;
    REQUIRE(conflicts::EvaluateMatch(state, "M2", 0, options).status == TrafficLight::Green);
}

TEST_CASE("free players make the match green", "[conflicts]") {
    auto state = TwoMatches();
    const auto verdicts = conflicts::EvaluateConflicts(state, 0);
    REQUIRE(verdicts.at("M1").status == TrafficLight::Green);
    REQUIRE(verdicts.at("M1").reason == "Ready to call");
    REQUIRE(verdicts.at("M2").status == TrafficLight::Green);
}

TEST_CASE("a resting player makes the match yellow until rest is over", "[conflicts]") {
    auto state = TwoMatches();
    SetStatus(state, "M1", MatchStatus::Finished);
    // 10:30 is slot 3; 60 minutes of rest is 2 slots.
    state.StateFor("M1").actual_end_time = "10:30";

    const auto at_three = conflicts::EvaluateMatch(state, "M2", 3);
    REQUIRE(at_three.status == TrafficLight::Yellow);
    REQUIRE(at_three.available_in_slots == 2);
    REQUIRE(at_three.reason == "P1 is resting after M1 (2 slots remaining)");
    REQUIRE(at_three.players_resting == std::vector<std::string>{"P1"});

    const auto at_four = conflicts::EvaluateMatch(state, "M2", 4);
    REQUIRE(at_four.status == TrafficLight::Yellow);
    REQUIRE(at_four.reason == "P1 is resting after M1 (1 slot remaining)");

    REQUIRE(conflicts::EvaluateMatch(state, "M2", 5).status == TrafficLight::Green);
}

TEST_CASE("player rest overrides the tournament default", "[conflicts]") {
    auto state = TwoMatches();
    state.players[0].min_rest_minutes = 90;
    SetStatus(state, "M1", MatchStatus::Finished);
    state.StateFor("M1").actual_end_time = "10:30";

    const auto verdict = conflicts::EvaluateMatch(state, "M2", 5);
    REQUIRE(verdict.status == TrafficLight::Yellow);
    REQUIRE(verdict.available_in_slots == 1);
}

TEST_CASE("the planned end is used when no actual end was recorded", "[conflicts]") {
    auto state = TwoMatches();
    SetStatus(state, "M1", MatchStatus::Finished);
    // M1 occupies slots 0-1, so rest runs until slot 4.
    REQUIRE(conflicts::EvaluateMatch(state, "M2", 3).status == TrafficLight::Yellow);
    REQUIRE(conflicts::EvaluateMatch(state, "M2", 4).status == TrafficLight::Green);
}

TEST_CASE("red dominates yellow", "[conflicts]") {
    auto state = BaseState();
    AddPlayers(state, {"P1", "P2", "P3", "P4", "P5"});
    AddMatch(state, "M1", {"P1"}, {"P2"}, 1, 0);
    AddMatch(state, "M2", {"P3"}, {"P4"}, 2, 0);
    AddMatch(state, "M3", {"P1"}, {"P3"}, 3, 1);
    SetStatus(state, "M1", MatchStatus::Finished);
    SetStatus(state, "M2", MatchStatus::Started);

    const auto verdict = conflicts::EvaluateMatch(state, "M3", 1);
    REQUIRE(verdict.status == TrafficLight::Red);
    REQUIRE(verdict.blocked_by == std::vector<std::string>{"M2"});
    REQUIRE(verdict.players_resting.empty());
}

TEST_CASE("several blocked players are listed by name", "[conflicts]") {
    auto state = BaseState();
    AddPlayers(state, {"P1", "P2", "P3", "P4"});
    AddMatch(state, "M1", {"P1"}, {"P2"}, 1, 0);
    AddMatch(state, "M2", {"P3"}, {"P4"}, 2, 0);
    AddMatch(state, "M3", {"P1"}, {"P3"}, 3, 1);
    SetStatus(state, "M1", MatchStatus::Started);
    SetStatus(state, "M2", MatchStatus::Started);

    const auto verdict = conflicts::EvaluateMatch(state, "M3", 0);
    REQUIRE(verdict.status == TrafficLight::Red);
    REQUIRE(verdict.reason == "P1: playing M1 on court 1; P3: playing M2 on court 2");
    REQUIRE(verdict.blocked_by == std::vector<std::string>{"M1", "M2"});
}

TEST_CASE("a match without players is green", "[conflicts]") {
    auto state = BaseState();
    AddMatch(state, "M1", {}, {}, 1, 0);
    REQUIRE(conflicts::EvaluateMatch(state, "M1", 0).status == TrafficLight::Green);
}

TEST_CASE("evaluation leaves the state untouched and repeats exactly", "[conflicts]") {
    auto state = TwoMatches();
    SetStatus(state, "M1", MatchStatus::Finished);
    state.StateFor("M1").actual_end_time = "10:30";
    const auto before = persist::ToExportJson(state, "t");

    const auto first = conflicts::EvaluateConflicts(state, 3);
    const auto second = conflicts::EvaluateConflicts(state, 3);
    REQUIRE(persist::ToExportJson(state, "t") == before);
    REQUIRE(first.size() == second.size());
    for (const auto& [id, verdict] : first) {
        REQUIRE(second.at(id).status == verdict.status);
        REQUIRE(second.at(id).reason == verdict.reason);
    }
}
