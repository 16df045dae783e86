#pragma once

#include <map>
#include <optional>
#include <string>

namespace courtops::core::model {

enum class MatchStatus {
    Scheduled,
    Called,
    Started,
    Finished,
};

const char* ToString(MatchStatus status);
bool ParseMatchStatus(const std::string& text, MatchStatus& out);

struct MatchScore {
    int side_a = 0;
    int side_b = 0;
};

struct SlotPlacement {
    int slot_id = 0;
    int court_id = 0;
};

struct MatchState {
    std::string match_id;
    MatchStatus status = MatchStatus::Scheduled;
    std::optional<std::string> actual_start_time;
    std::optional<std::string> actual_end_time;
    std::optional<int> actual_court_id;
    bool delayed = false;
    std::string delay_reason;
    bool pinned = false;
    bool postponed = false;
    std::map<std::string, bool> player_confirmations;
    std::optional<MatchScore> score;
    std::string set_scores;
    std::string notes;
    std::string updated_at;
    // Pre-displacement placement; present only while the match is displaced.
    std::optional<SlotPlacement> original;
};

// Side-channel fields settable from any status through a transition.
struct MatchStatePatch {
    std::optional<std::string> actual_start_time;
    std::optional<std::string> actual_end_time;
    std::optional<int> actual_court_id;
    std::optional<bool> delayed;
    std::optional<std::string> delay_reason;
    std::optional<bool> pinned;
    std::optional<bool> postponed;
    std::map<std::string, bool> player_confirmations;
    std::optional<MatchScore> score;
    std::optional<std::string> set_scores;
    std::optional<std::string> notes;
};

void ApplyPatch(MatchState& state, const MatchStatePatch& patch);

}  // namespace courtops::core::model
