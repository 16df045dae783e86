#include <catch2/catch.hpp>

#include "TestFixtures.h"

#include "courtops/core/lifecycle/MatchLifecycle.h"

using namespace courtops::core;
using courtops::test::AddMatch;
using courtops::test::BaseState;
using courtops::test::SetStatus;
using model::MatchStatus;

namespace {

const std::vector<MatchStatus> kAllStatuses{
    MatchStatus::Scheduled, MatchStatus::Called, MatchStatus::Started, MatchStatus::Finished};

lifecycle::MatchLifecycle FixedClock(const std::string& clock) {
    return lifecycle::MatchLifecycle([clock] { return clock; });
}

model::TournamentState SingleMatch() {
    auto state = BaseState();
    AddMatch(state, "M1", {"P1"}, {"P2"}, 1, 0);
    return state;
}

}  // namespace

TEST_CASE("transition accepts exactly the valid next statuses", "[lifecycle]") {
    const auto lifecycle = FixedClock("10:00");
    for (const auto from : kAllStatuses) {
        for (const auto to : kAllStatuses) {
            auto state = SingleMatch();
            SetStatus(state, "M1", from);
            errors::LiveOpsError error;
            model::MatchState out;
            const bool ok = lifecycle.Transition(state, "M1", to, {}, &out, &error);
            REQUIRE(ok == lifecycle::IsValidTransition(from, to));
            if (ok) {
                REQUIRE(state.StatusOf("M1") == to);
                REQUIRE(out.status == to);
            } else {
                REQUIRE(error.code == errors::ErrorCode::InvalidTransition);
                REQUIRE(state.StatusOf("M1") == from);
            }
        }
    }
}

TEST_CASE("valid next statuses follow the table", "[lifecycle]") {
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Scheduled, MatchStatus::Called));
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Scheduled, MatchStatus::Scheduled));
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Called, MatchStatus::Started));
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Called, MatchStatus::Scheduled));
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Started, MatchStatus::Finished));
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Started, MatchStatus::Called));
    REQUIRE(lifecycle::IsValidTransition(MatchStatus::Finished, MatchStatus::Started));

    REQUIRE_FALSE(lifecycle::IsValidTransition(MatchStatus::Scheduled, MatchStatus::Started));
    REQUIRE_FALSE(lifecycle::IsValidTransition(MatchStatus::Scheduled, MatchStatus::Finished));
    REQUIRE_FALSE(lifecycle::IsValidTransition(MatchStatus::Called, MatchStatus::Finished));
    REQUIRE_FALSE(lifecycle::IsValidTransition(MatchStatus::Finished, MatchStatus::Scheduled));
    REQUIRE_FALSE(lifecycle::IsValidTransition(MatchStatus::Finished, MatchStatus::Finished));
}

TEST_CASE("undo steps back one status", "[lifecycle]") {
    REQUIRE_FALSE(lifecycle::UndoTarget(MatchStatus::Scheduled).has_value());
    REQUIRE(lifecycle::UndoTarget(MatchStatus::Called) == MatchStatus::Scheduled);
    REQUIRE(lifecycle::UndoTarget(MatchStatus::Started) == MatchStatus::Called);
    REQUIRE(lifecycle::UndoTarget(MatchStatus::Finished) == MatchStatus::Started);

    const auto lifecycle = FixedClock("10:00");
    auto state = SingleMatch();

    SECTION("nothing to undo from scheduled") {
        errors::LiveOpsError error;
        REQUIRE_FALSE(lifecycle.Undo(state, "M1", nullptr, &error));
        REQUIRE(error.code == errors::ErrorCode::InvalidTransition);
        REQUIRE(error.message.find("Nothing to undo") != std::string::npos);
    }

    SECTION("undo finished clears the end time and score") {
        SetStatus(state, "M1", MatchStatus::Finished);
        auto& match_state = state.StateFor("M1");
        match_state.actual_start_time = "09:00";
        match_state.actual_end_time = "09:40";
        match_state.score = model::MatchScore{2, 1};
        match_state.set_scores = "21-15, 18-21, 21-19";

        model::MatchState out;
        REQUIRE(lifecycle.Undo(state, "M1", &out, nullptr));
        REQUIRE(out.status == MatchStatus::Started);
        REQUIRE(out.actual_start_time == std::optional<std::string>("09:00"));
        REQUIRE_FALSE(out.actual_end_time.has_value());
        REQUIRE_FALSE(out.score.has_value());
        REQUIRE(out.set_scores.empty());
    }

    SECTION("undo started clears the start time") {
        SetStatus(state, "M1", MatchStatus::Started);
        state.StateFor("M1").actual_start_time = "09:05";
        REQUIRE(lifecycle.Undo(state, "M1", nullptr, nullptr));
        REQUIRE(state.StatusOf("M1") == MatchStatus::Called);
        REQUIRE_FALSE(state.FindState("M1")->actual_start_time.has_value());
    }

    SECTION("undo called drops player confirmations") {
        SetStatus(state, "M1", MatchStatus::Called);
        state.StateFor("M1").player_confirmations["P1"] = true;
        REQUIRE(lifecycle.Undo(state, "M1", nullptr, nullptr));
        REQUIRE(state.StatusOf("M1") == MatchStatus::Scheduled);
        REQUIRE(state.FindState("M1")->player_confirmations.empty());
    }
}

TEST_CASE("start and finish stamp the clock once", "[lifecycle]") {
    auto state = SingleMatch();
    std::string clock = "10:00";
    const lifecycle::MatchLifecycle lifecycle([&clock] { return clock; });

    REQUIRE(lifecycle.Transition(state, "M1", MatchStatus::Called, {}, nullptr, nullptr));
    REQUIRE_FALSE(state.FindState("M1")->actual_start_time.has_value());

    REQUIRE(lifecycle.Transition(state, "M1", MatchStatus::Started, {}, nullptr, nullptr));
    REQUIRE(state.FindState("M1")->actual_start_time == std::optional<std::string>("10:00"));

    clock = "10:45";
    REQUIRE(lifecycle.Transition(state, "M1", MatchStatus::Finished, {}, nullptr, nullptr));
    REQUIRE(state.FindState("M1")->actual_end_time == std::optional<std::string>("10:45"));
    REQUIRE(state.FindState("M1")->actual_start_time == std::optional<std::string>("10:00"));

    SECTION("an explicit end time is kept") {
        auto other = SingleMatch();
        SetStatus(other, "M1", MatchStatus::Started);
        model::MatchStatePatch patch;
        patch.actual_end_time = "10:30";
        REQUIRE(lifecycle.Transition(other, "M1", MatchStatus::Finished, patch, nullptr, nullptr));
        REQUIRE(other.FindState("M1")->actual_end_time == std::optional<std::string>("10:30"));
    }
}

TEST_CASE("delay keeps the match scheduled", "[lifecycle]") {
    const auto lifecycle = FixedClock("10:00");
    auto state = SingleMatch();

    model::MatchStatePatch patch;
    patch.delayed = true;
    patch.delay_reason = "injury treatment";
    model::MatchState out;
    REQUIRE(lifecycle.Transition(state, "M1", MatchStatus::Scheduled, patch, &out, nullptr));
    REQUIRE(out.status == MatchStatus::Scheduled);
    REQUIRE(out.delayed);
    REQUIRE(out.delay_reason == "injury treatment");

    model::MatchStatePatch clear;
    clear.delayed = false;
    REQUIRE(lifecycle.Patch(state, "M1", clear, &out, nullptr));
    REQUIRE_FALSE(out.delayed);
    REQUIRE(out.delay_reason.empty());
}

TEST_CASE("unknown matches are rejected", "[lifecycle]") {
    const auto lifecycle = FixedClock("10:00");
    auto state = SingleMatch();
    errors::LiveOpsError error;
    REQUIRE_FALSE(lifecycle.Transition(state, "M99", MatchStatus::Called, {}, nullptr, &error));
    REQUIRE(error.code == errors::ErrorCode::UnknownMatch);
    REQUIRE(state.match_states.count("M99") == 0);
}
