#pragma once

#include "courtops/core/errors/LiveOpsError.h"
#include "courtops/core/model/TournamentState.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace courtops::core::lifecycle {

using ClockFn = std::function<std::string()>;

const std::vector<model::MatchStatus>& ValidNextStatuses(model::MatchStatus from);
bool IsValidTransition(model::MatchStatus from, model::MatchStatus to);
std::optional<model::MatchStatus> UndoTarget(model::MatchStatus from);

class MatchLifecycle {
public:
    // clock returns the local wall time as "HH:MM"; defaults to the system clock.
    explicit MatchLifecycle(ClockFn clock = {});

    bool Transition(model::TournamentState& state,
                    const std::string& match_id,
                    model::MatchStatus next,
                    const model::MatchStatePatch& patch,
                    model::MatchState* out,
                    errors::LiveOpsError* error) const;

    bool Undo(model::TournamentState& state,
              const std::string& match_id,
              model::MatchState* out,
              errors::LiveOpsError* error) const;

    bool Patch(model::TournamentState& state,
               const std::string& match_id,
               const model::MatchStatePatch& patch,
               model::MatchState* out,
               errors::LiveOpsError* error) const;

    std::string Now() const;

private:
    void Enter(model::MatchState& match_state, model::MatchStatus next) const;

    ClockFn clock_;
};

}  // namespace courtops::core::lifecycle
