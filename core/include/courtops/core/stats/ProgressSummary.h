#pragma once

#include "courtops/core/model/TournamentState.h"

namespace courtops::core::stats {

struct ProgressSummary {
    int total = 0;
    int scheduled = 0;
    int called = 0;
    int in_progress = 0;
    int finished = 0;

    int remaining() const { return total - finished; }
    int percentage() const;
};

ProgressSummary SummarizeProgress(const model::TournamentState& state);

}  // namespace courtops::core::stats
