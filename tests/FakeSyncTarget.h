#pragma once

#include "courtops/core/sync/ISyncTarget.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace courtops::test {

// Records what it receives; the first `failures` publishes fail.
class FakeSyncTarget : public core::sync::ISyncTarget {
public:
    explicit FakeSyncTarget(int failures = 0) : failures_(failures) {}

    bool Configure(const std::string& location) override {
        std::lock_guard<std::mutex> lock(mutex_);
        location_ = location;
        return true;
    }

    bool PublishMatchState(const core::model::MatchState& state, std::string* error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (failures_ != 0) {
            if (failures_ > 0) {
                --failures_;
            }
            if (error) {
                *error = "backend unavailable";
            }
            return false;
        }
        received_[state.match_id] = state;
        order_.push_back(state.match_id);
        return true;
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    std::map<std::string, core::model::MatchState> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::vector<std::string> order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

private:
    mutable std::mutex mutex_;
    // Negative fails forever.
    int failures_ = 0;
    int attempts_ = 0;
    std::string location_;
    std::map<std::string, core::model::MatchState> received_;
    std::vector<std::string> order_;
};

// Thread-safe log sink for components that log from worker threads.
class LogCollector {
public:
    void operator()(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(line);
    }

    bool Contains(const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& line : lines_) {
            if (line.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

}  // namespace courtops::test
