#include "courtops/core/lifecycle/MatchLifecycle.h"

#include "courtops/core/util/TimeSlots.h"

#include <algorithm>
#include <ctime>

namespace courtops::core::lifecycle {

using model::MatchStatus;

const std::vector<MatchStatus>& ValidNextStatuses(MatchStatus from) {
    // scheduled -> scheduled is a delay; the second entry of the others is the undo step.
    static const std::vector<MatchStatus> kScheduled{MatchStatus::Called, MatchStatus::Scheduled};
    static const std::vector<MatchStatus> kCalled{MatchStatus::Started, MatchStatus::Scheduled};
    static const std::vector<MatchStatus> kStarted{MatchStatus::Finished, MatchStatus::Called};
    static const std::vector<MatchStatus> kFinished{MatchStatus::Started};
    switch (from) {
        case MatchStatus::Scheduled:
            return kScheduled;
        case MatchStatus::Called:
            return kCalled;
        case MatchStatus::Started:
            return kStarted;
        case MatchStatus::Finished:
            return kFinished;
    }
    return kScheduled;
}

bool IsValidTransition(MatchStatus from, MatchStatus to) {
    const auto& next = ValidNextStatuses(from);
    return std::find(next.begin(), next.end(), to) != next.end();
}

std::optional<MatchStatus> UndoTarget(MatchStatus from) {
    switch (from) {
        case MatchStatus::Scheduled:
            return std::nullopt;
        case MatchStatus::Called:
            return MatchStatus::Scheduled;
        case MatchStatus::Started:
            return MatchStatus::Called;
        case MatchStatus::Finished:
            return MatchStatus::Started;
    }
    return std::nullopt;
}

MatchLifecycle::MatchLifecycle(ClockFn clock) : clock_(std::move(clock)) {}

std::string MatchLifecycle::Now() const {
    if (clock_) {
        return clock_();
    }
    return util::FormatClock(std::time(nullptr));
}

bool MatchLifecycle::Transition(model::TournamentState& state,
                                const std::string& match_id,
                                MatchStatus next,
                                const model::MatchStatePatch& patch,
                                model::MatchState* out,
                                errors::LiveOpsError* error) const {
    if (!state.FindMatch(match_id)) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown match: " + match_id);
    }
    const MatchStatus current = state.StatusOf(match_id);
    if (!IsValidTransition(current, next)) {
        return errors::Fail(error,
                            errors::ErrorCode::InvalidTransition,
                            std::string("Invalid state transition: cannot go from '") + model::ToString(current) +
                                "' to '" + model::ToString(next) + "' for match " + match_id);
    }

    auto& match_state = state.StateFor(match_id);
    model::ApplyPatch(match_state, patch);
    Enter(match_state, next);
    if (out) {
        *out = match_state;
    }
    return true;
}

bool MatchLifecycle::Undo(model::TournamentState& state,
                          const std::string& match_id,
                          model::MatchState* out,
                          errors::LiveOpsError* error) const {
    if (!state.FindMatch(match_id)) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown match: " + match_id);
    }
    const MatchStatus current = state.StatusOf(match_id);
    const auto target = UndoTarget(current);
    if (!target) {
        return errors::Fail(error,
                            errors::ErrorCode::InvalidTransition,
                            std::string("Nothing to undo: match ") + match_id + " is " + model::ToString(current));
    }

    auto& match_state = state.StateFor(match_id);
    Enter(match_state, *target);
    if (out) {
        *out = match_state;
    }
    return true;
}

bool MatchLifecycle::Patch(model::TournamentState& state,
                           const std::string& match_id,
                           const model::MatchStatePatch& patch,
                           model::MatchState* out,
                           errors::LiveOpsError* error) const {
    if (!state.FindMatch(match_id)) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown match: " + match_id);
    }
    auto& match_state = state.StateFor(match_id);
    model::ApplyPatch(match_state, patch);
    match_state.updated_at = util::FormatUtcTimestamp(std::time(nullptr));
    if (out) {
        *out = match_state;
    }
    return true;
}

void MatchLifecycle::Enter(model::MatchState& match_state, MatchStatus next) const {
    const MatchStatus previous = match_state.status;
    match_state.status = next;

    if (previous == MatchStatus::Called && next == MatchStatus::Scheduled) {
        match_state.player_confirmations.clear();
    }
    if (previous == MatchStatus::Started && next == MatchStatus::Called) {
        match_state.actual_start_time.reset();
    }
    if (previous == MatchStatus::Finished && next == MatchStatus::Started) {
        match_state.actual_end_time.reset();
        match_state.score.reset();
        match_state.set_scores.clear();
    }

    if (next == MatchStatus::Started && !match_state.actual_start_time) {
        match_state.actual_start_time = Now();
    }
    if (next == MatchStatus::Finished && !match_state.actual_end_time) {
        match_state.actual_end_time = Now();
    }
    match_state.updated_at = util::FormatUtcTimestamp(std::time(nullptr));
}

}  // namespace courtops::core::lifecycle
