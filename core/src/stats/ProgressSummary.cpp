#include "courtops/core/stats/ProgressSummary.h"

#include <cmath>

namespace courtops::core::stats {

int ProgressSummary::percentage() const {
    if (total == 0) {
        return 0;
    }
    return static_cast<int>(std::lround(static_cast<double>(finished) * 100.0 / static_cast<double>(total)));
}

ProgressSummary SummarizeProgress(const model::TournamentState& state) {
    ProgressSummary summary;
    for (const auto& assignment : state.schedule.assignments) {
        ++summary.total;
        switch (state.StatusOf(assignment.match_id)) {
            case model::MatchStatus::Scheduled:
                ++summary.scheduled;
                break;
            case model::MatchStatus::Called:
                ++summary.called;
                break;
            case model::MatchStatus::Started:
                ++summary.in_progress;
                break;
            case model::MatchStatus::Finished:
                ++summary.finished;
                break;
        }
    }
    return summary;
}

}  // namespace courtops::core::stats
