#pragma once

#include "courtops/core/model/TournamentState.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace courtops::core::conflicts {

enum class TrafficLight {
    Green,
    Yellow,
    Red,
};

const char* ToString(TrafficLight light);

enum class PlayerAvailability {
    Available,
    Active,
    Resting,
};

struct PlayerStatus {
    std::string player_id;
    std::string player_name;
    PlayerAvailability availability = PlayerAvailability::Available;
    std::string reason;
    std::string match_id;
    std::optional<int> available_at_slot;
};

struct ConflictVerdict {
    TrafficLight status = TrafficLight::Green;
    std::string reason;
    std::vector<std::string> blocked_by;
    std::vector<std::string> players_blocked;
    std::vector<std::string> players_resting;
    int available_in_slots = 0;
};

struct EvaluatorOptions {
    // A player already called to another court blocks as well as one playing.
    bool block_on_called = true;
};

using VerdictMap = std::map<std::string, ConflictVerdict>;

std::vector<PlayerStatus> PlayerStatuses(const model::TournamentState& state,
                                         const std::string& match_id,
                                         int current_slot,
                                         const EvaluatorOptions& options = {});

ConflictVerdict EvaluateMatch(const model::TournamentState& state,
                              const std::string& match_id,
                              int current_slot,
                              const EvaluatorOptions& options = {});

// Verdicts for every scheduled match in the schedule. Pure; safe to re-run on a timer.
VerdictMap EvaluateConflicts(const model::TournamentState& state,
                             int current_slot,
                             const EvaluatorOptions& options = {});

}  // namespace courtops::core::conflicts
