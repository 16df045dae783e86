#include "courtops/core/reassign/CascadingReassigner.h"

#include <algorithm>
#include <map>

namespace courtops::core::reassign {

namespace {

using model::MatchStatus;

bool IsDisplaceable(const model::TournamentState& state, const std::string& match_id) {
    const MatchStatus status = state.StatusOf(match_id);
    if (status != MatchStatus::Scheduled && status != MatchStatus::Called) {
        return false;
    }
    const auto* match_state = state.FindState(match_id);
    return !(match_state && match_state->pinned);
}

model::Assignment* FindIn(std::vector<model::Assignment>& assignments, const std::string& match_id) {
    const auto it = std::find_if(assignments.begin(), assignments.end(),
                                 [&](const model::Assignment& a) { return a.match_id == match_id; });
    return it == assignments.end() ? nullptr : &*it;
}

}  // namespace

int NextAvailableSlot(const model::TournamentState& state, int court_id, const std::string& exclude_match_id) {
    int next_slot = 0;
    for (const auto& assignment : state.schedule.assignments) {
        if (assignment.match_id == exclude_match_id || state.CourtOf(assignment) != court_id) {
            continue;
        }
        const MatchStatus status = state.StatusOf(assignment.match_id);
        if (status == MatchStatus::Started || status == MatchStatus::Finished) {
            next_slot = std::max(next_slot, assignment.end_slot());
        }
    }
    return next_slot;
}

void ResolveOverlaps(const model::TournamentState& state,
                     std::vector<model::Assignment>& assignments,
                     std::deque<Block>& worklist,
                     const std::set<std::string>& fixed,
                     std::set<std::string>& displaced) {
    while (!worklist.empty()) {
        const Block block = worklist.front();
        worklist.pop_front();

        // The owner may have been pushed again since this block was queued.
        if (fixed.count(block.owner_match_id) == 0) {
            const auto* owner = FindIn(assignments, block.owner_match_id);
            if (!owner || owner->court_id != block.court_id || owner->slot_id != block.start) {
                continue;
            }
        }

        std::vector<model::Assignment*> overlapping;
        for (auto& assignment : assignments) {
            if (assignment.court_id != block.court_id || assignment.match_id == block.owner_match_id) {
                continue;
            }
            if (fixed.count(assignment.match_id) > 0 || !IsDisplaceable(state, assignment.match_id)) {
                continue;
            }
            if (assignment.Overlaps(block.start, block.end)) {
                overlapping.push_back(&assignment);
            }
        }
        std::sort(overlapping.begin(), overlapping.end(), [](const auto* lhs, const auto* rhs) {
            if (lhs->slot_id != rhs->slot_id) {
                return lhs->slot_id < rhs->slot_id;
            }
            return lhs->match_id < rhs->match_id;
        });

        for (auto* assignment : overlapping) {
            assignment->slot_id = block.end;
            displaced.insert(assignment->match_id);
            worklist.push_back(Block{assignment->match_id, block.court_id, assignment->slot_id,
                                     assignment->end_slot()});
        }
    }
}

CascadingReassigner::CascadingReassigner(const lifecycle::MatchLifecycle& lifecycle) : lifecycle_(lifecycle) {}

bool CascadingReassigner::StartOnCourt(model::TournamentState& state,
                                       const std::string& match_id,
                                       int target_court,
                                       StartOnCourtResult* result,
                                       errors::LiveOpsError* error) const {
    const auto* current = state.FindAssignment(match_id);
    if (!state.FindMatch(match_id) || !current) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown or unscheduled match: " + match_id);
    }
    const MatchStatus status = state.StatusOf(match_id);
    if (!lifecycle::IsValidTransition(status, MatchStatus::Started)) {
        return errors::Fail(error,
                            errors::ErrorCode::InvalidTransition,
                            std::string("Cannot start match ") + match_id + " from '" + model::ToString(status) + "'");
    }
    for (const auto& assignment : state.schedule.assignments) {
        if (assignment.match_id != match_id && state.CourtOf(assignment) == target_court &&
            state.StatusOf(assignment.match_id) == MatchStatus::Started) {
            return errors::Fail(error,
                                errors::ErrorCode::TargetOccupied,
                                "Court " + std::to_string(target_court) + " is occupied by " + assignment.match_id);
        }
    }

    const model::Schedule previous_schedule = state.schedule;
    const auto previous_states = state.match_states;

    std::map<std::string, model::SlotPlacement> before;
    for (const auto& assignment : state.schedule.assignments) {
        before[assignment.match_id] = model::SlotPlacement{assignment.slot_id, assignment.court_id};
    }

    const int start_slot = NextAvailableSlot(state, target_court, match_id);
    std::vector<model::Assignment> working = state.schedule.assignments;
    auto* moving = FindIn(working, match_id);
    moving->slot_id = start_slot;
    moving->court_id = target_court;

    std::deque<Block> worklist;
    worklist.push_back(Block{match_id, target_court, moving->slot_id, moving->end_slot()});
    const std::set<std::string> fixed{match_id};
    std::set<std::string> displaced;
    ResolveOverlaps(state, working, worklist, fixed, displaced);

    state.schedule.assignments = std::move(working);

    std::vector<MovedAssignment> moved;
    std::vector<std::string> touched{match_id};
    touched.insert(touched.end(), displaced.begin(), displaced.end());
    for (const auto& id : touched) {
        const auto* now = state.FindAssignment(id);
        const auto& was = before[id];
        auto& match_state = state.StateFor(id);
        if (!match_state.original) {
            match_state.original = was;
        }
        moved.push_back(MovedAssignment{id, was.court_id, was.slot_id, now->court_id, now->slot_id});
    }

    model::MatchStatePatch patch;
    patch.actual_court_id = target_court;
    model::MatchState started;
    if (!lifecycle_.Transition(state, match_id, MatchStatus::Started, patch, &started, error)) {
        state.schedule = previous_schedule;
        state.match_states = previous_states;
        return false;
    }

    if (result) {
        result->moved_assignments = std::move(moved);
        result->match_state = started;
    }
    return true;
}

bool CascadingReassigner::UndoStart(model::TournamentState& state,
                                    const std::string& match_id,
                                    UndoStartResult* result,
                                    errors::LiveOpsError* error) const {
    auto* assignment = state.FindAssignment(match_id);
    if (!state.FindMatch(match_id) || !assignment) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown or unscheduled match: " + match_id);
    }
    const auto* existing = state.FindState(match_id);
    if (!existing || !existing->original) {
        if (result) {
            *result = UndoStartResult{};
        }
        return true;
    }
    if (existing->status != MatchStatus::Started) {
        return errors::Fail(error,
                            errors::ErrorCode::InvalidTransition,
                            std::string("Cannot undo start of match ") + match_id + " in '" +
                                model::ToString(existing->status) + "'");
    }

    std::vector<MovedAssignment> restored;
    const int displaced_court = assignment->court_id;
    auto& match_state = state.StateFor(match_id);
    const model::SlotPlacement home = *match_state.original;
    restored.push_back(MovedAssignment{match_id, assignment->court_id, assignment->slot_id, home.court_id, home.slot_id});
    assignment->slot_id = home.slot_id;
    assignment->court_id = home.court_id;
    match_state.original.reset();
    match_state.actual_court_id.reset();

    for (auto& other : state.schedule.assignments) {
        if (other.match_id == match_id) {
            continue;
        }
        const MatchStatus other_status = state.StatusOf(other.match_id);
        if (other_status != MatchStatus::Scheduled && other_status != MatchStatus::Called) {
            continue;
        }
        const auto found = state.match_states.find(other.match_id);
        if (found == state.match_states.end() || !found->second.original ||
            found->second.original->court_id != displaced_court) {
            continue;
        }
        const model::SlotPlacement placement = *found->second.original;
        restored.push_back(MovedAssignment{other.match_id, other.court_id, other.slot_id,
                                           placement.court_id, placement.slot_id});
        other.slot_id = placement.slot_id;
        other.court_id = placement.court_id;
        found->second.original.reset();
    }

    model::MatchState reverted;
    if (!lifecycle_.Undo(state, match_id, &reverted, error)) {
        return false;
    }
    if (result) {
        result->restored_assignments = std::move(restored);
        result->match_state = reverted;
    }
    return true;
}

}  // namespace courtops::core::reassign
