#include "courtops/core/sync/FileSyncTarget.h"

#include "courtops/core/persist/TournamentFile.h"
#include "courtops/core/util/TimeSlots.h"

#include <ctime>
#include <iostream>

namespace courtops::core::sync {

bool FileSyncTarget::Configure(const std::string& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (location.empty()) {
        std::cerr << "[sync] No state path configured" << '\n';
        return false;
    }
    path_ = location;
    return true;
}

bool FileSyncTarget::PublishMatchState(const model::MatchState& state, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        if (error) {
            *error = "File sync target is not configured";
        }
        return false;
    }
    persist::MatchStateFile file;
    if (!persist::LoadMatchStateFile(path_, file, error)) {
        return false;
    }
    file.match_states[state.match_id] = state;
    file.last_updated = util::FormatUtcTimestamp(std::time(nullptr));
    return persist::SaveMatchStateFile(path_, file, error);
}

}  // namespace courtops::core::sync
