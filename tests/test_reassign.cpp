#include <catch2/catch.hpp>

#include "TestFixtures.h"

#include "courtops/core/reassign/CascadingReassigner.h"

#include <set>

using namespace courtops::core;
using courtops::test::AddMatch;
using courtops::test::CascadeState;
using courtops::test::SetStatus;
using model::MatchStatus;

namespace {

struct Placement {
    int court = 0;
    int slot = 0;
};

Placement PlacementOf(const model::TournamentState& state, const std::string& id) {
    const auto* assignment = state.FindAssignment(id);
    REQUIRE(assignment != nullptr);
    return Placement{assignment->court_id, assignment->slot_id};
}

}  // namespace

TEST_CASE("next available slot follows started and finished matches", "[reassign]") {
    const auto state = CascadeState();
    REQUIRE(reassign::NextAvailableSlot(state, 1, "M5") == 10);
    REQUIRE(reassign::NextAvailableSlot(state, 2, "M5") == 0);
}

TEST_CASE("starting on another court cascades the displaced matches", "[reassign]") {
    auto state = CascadeState();
    const lifecycle::MatchLifecycle lifecycle([] { return std::string("14:00"); });
    const reassign::CascadingReassigner reassigner(lifecycle);

    reassign::StartOnCourtResult result;
    errors::LiveOpsError error;
    REQUIRE(reassigner.StartOnCourt(state, "M5", 1, &result, &error));

    REQUIRE(PlacementOf(state, "M5").court == 1);
    REQUIRE(PlacementOf(state, "M5").slot == 10);
    REQUIRE(PlacementOf(state, "M6").court == 1);
    REQUIRE(PlacementOf(state, "M6").slot == 12);
    REQUIRE(PlacementOf(state, "M7").court == 1);
    REQUIRE(PlacementOf(state, "M7").slot == 14);
    REQUIRE(PlacementOf(state, "M4").slot == 8);

    REQUIRE(result.match_state.status == MatchStatus::Started);
    REQUIRE(result.match_state.actual_court_id == std::optional<int>(1));
    REQUIRE(result.match_state.actual_start_time == std::optional<std::string>("14:00"));

    REQUIRE(result.moved_assignments.size() == 3);
    REQUIRE(result.moved_assignments[0].match_id == "M5");
    REQUIRE(result.moved_assignments[0].from_court == 2);
    REQUIRE(result.moved_assignments[0].to_court == 1);
    REQUIRE(result.moved_assignments[1].match_id == "M6");
    REQUIRE(result.moved_assignments[1].from_slot == 10);
    REQUIRE(result.moved_assignments[1].to_slot == 12);
    REQUIRE(result.moved_assignments[2].match_id == "M7");
    REQUIRE(result.moved_assignments[2].from_slot == 11);
    REQUIRE(result.moved_assignments[2].to_slot == 14);

    REQUIRE(state.FindState("M6")->original->slot_id == 10);
    REQUIRE(state.FindState("M7")->original->slot_id == 11);
}

TEST_CASE("cascading keeps every assignment and leaves no overlap", "[reassign]") {
    auto state = CascadeState();
    const size_t count = state.schedule.assignments.size();
    const lifecycle::MatchLifecycle lifecycle([] { return std::string("14:00"); });
    const reassign::CascadingReassigner reassigner(lifecycle);
    REQUIRE(reassigner.StartOnCourt(state, "M5", 1, nullptr, nullptr));

    REQUIRE(state.schedule.assignments.size() == count);
    std::set<std::string> ids;
    for (const auto& assignment : state.schedule.assignments) {
        ids.insert(assignment.match_id);
    }
    REQUIRE(ids.size() == count);

    for (const auto& lhs : state.schedule.assignments) {
        for (const auto& rhs : state.schedule.assignments) {
            if (lhs.match_id == rhs.match_id || lhs.court_id != rhs.court_id) {
                continue;
            }
            REQUIRE_FALSE(lhs.Overlaps(rhs.slot_id, rhs.end_slot()));
        }
    }
}

TEST_CASE("pinned matches are never displaced", "[reassign]") {
    auto state = CascadeState();
    AddMatch(state, "M8", {"P7"}, {"P8"}, 1, 12, 1);
    state.StateFor("M8").pinned = true;

    const lifecycle::MatchLifecycle lifecycle([] { return std::string("14:00"); });
    const reassign::CascadingReassigner reassigner(lifecycle);
    REQUIRE(reassigner.StartOnCourt(state, "M5", 1, nullptr, nullptr));

    REQUIRE(PlacementOf(state, "M8").slot == 12);
    REQUIRE_FALSE(state.FindState("M8")->original.has_value());
}

TEST_CASE("undo start is the exact inverse", "[reassign]") {
    auto state = CascadeState();
    const auto before = state.schedule.assignments;
    const lifecycle::MatchLifecycle lifecycle([] { return std::string("14:00"); });
    const reassign::CascadingReassigner reassigner(lifecycle);
    REQUIRE(reassigner.StartOnCourt(state, "M5", 1, nullptr, nullptr));

    reassign::UndoStartResult undo;
    errors::LiveOpsError error;
    REQUIRE(reassigner.UndoStart(state, "M5", &undo, &error));

    for (const auto& assignment : before) {
        const auto placement = PlacementOf(state, assignment.match_id);
        REQUIRE(placement.court == assignment.court_id);
        REQUIRE(placement.slot == assignment.slot_id);
        REQUIRE_FALSE((state.FindState(assignment.match_id) != nullptr &&
                       state.FindState(assignment.match_id)->original.has_value()));
    }
    REQUIRE(state.StatusOf("M5") == MatchStatus::Called);
    REQUIRE_FALSE(state.FindState("M5")->actual_court_id.has_value());
    REQUIRE_FALSE(state.FindState("M5")->actual_start_time.has_value());
    REQUIRE(undo.match_state.has_value());
    REQUIRE(undo.restored_assignments.size() == 3);

    SECTION("a second undo has nothing to restore") {
        reassign::UndoStartResult again;
        REQUIRE(reassigner.UndoStart(state, "M5", &again, nullptr));
        REQUIRE_FALSE(again.match_state.has_value());
        REQUIRE(again.restored_assignments.empty());
    }
}

TEST_CASE("start on court validates before moving anything", "[reassign]") {
    auto state = CascadeState();
    const auto before = state.schedule.assignments;
    const lifecycle::MatchLifecycle lifecycle([] { return std::string("14:00"); });
    const reassign::CascadingReassigner reassigner(lifecycle);
    errors::LiveOpsError error;

    SECTION("unknown match") {
        REQUIRE_FALSE(reassigner.StartOnCourt(state, "M99", 1, nullptr, &error));
        REQUIRE(error.code == errors::ErrorCode::UnknownMatch);
    }

    SECTION("court already in use") {
        AddMatch(state, "M9", {"P7"}, {"P8"}, 3, 9, 2);
        SetStatus(state, "M9", MatchStatus::Started);
        REQUIRE_FALSE(reassigner.StartOnCourt(state, "M5", 3, nullptr, &error));
        REQUIRE(error.code == errors::ErrorCode::TargetOccupied);
        REQUIRE(state.StatusOf("M5") == MatchStatus::Called);
    }

    SECTION("scheduled matches must be called first") {
        REQUIRE_FALSE(reassigner.StartOnCourt(state, "M6", 2, nullptr, &error));
        REQUIRE(error.code == errors::ErrorCode::InvalidTransition);
    }

    for (const auto& assignment : before) {
        REQUIRE(PlacementOf(state, assignment.match_id).slot == assignment.slot_id);
    }
}
