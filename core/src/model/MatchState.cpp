#include "courtops/core/model/MatchState.h"

namespace courtops::core::model {

const char* ToString(MatchStatus status) {
    switch (status) {
        case MatchStatus::Scheduled:
            return "scheduled";
        case MatchStatus::Called:
            return "called";
        case MatchStatus::Started:
            return "started";
        case MatchStatus::Finished:
            return "finished";
    }
    return "scheduled";
}

bool ParseMatchStatus(const std::string& text, MatchStatus& out) {
    if (text == "scheduled") {
        out = MatchStatus::Scheduled;
    } else if (text == "called") {
        out = MatchStatus::Called;
    } else if (text == "started") {
        out = MatchStatus::Started;
    } else if (text == "finished") {
        out = MatchStatus::Finished;
    } else {
        return false;
    }
    return true;
}

void ApplyPatch(MatchState& state, const MatchStatePatch& patch) {
    if (patch.actual_start_time) {
        state.actual_start_time = patch.actual_start_time;
    }
    if (patch.actual_end_time) {
        state.actual_end_time = patch.actual_end_time;
    }
    if (patch.actual_court_id) {
        state.actual_court_id = patch.actual_court_id;
    }
    if (patch.delayed) {
        state.delayed = *patch.delayed;
        if (!state.delayed) {
            state.delay_reason.clear();
        }
    }
    if (patch.delay_reason) {
        state.delay_reason = *patch.delay_reason;
    }
    if (patch.pinned) {
        state.pinned = *patch.pinned;
    }
    if (patch.postponed) {
        state.postponed = *patch.postponed;
    }
    for (const auto& [player_id, confirmed] : patch.player_confirmations) {
        state.player_confirmations[player_id] = confirmed;
    }
    if (patch.score) {
        state.score = patch.score;
    }
    if (patch.set_scores) {
        state.set_scores = *patch.set_scores;
    }
    if (patch.notes) {
        state.notes = *patch.notes;
    }
}

}  // namespace courtops::core::model
