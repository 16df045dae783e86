#pragma once

#include "courtops/core/sync/ISyncTarget.h"

#include <mutex>
#include <string>

namespace courtops::core::sync {

// Mirrors match states into a tournament_state.json style file.
class FileSyncTarget : public ISyncTarget {
public:
    bool Configure(const std::string& location) override;
    bool PublishMatchState(const model::MatchState& state, std::string* error) override;

    const std::string& path() const { return path_; }

private:
    std::mutex mutex_;
    std::string path_;
};

}  // namespace courtops::core::sync
