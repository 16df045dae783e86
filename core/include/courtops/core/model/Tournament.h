#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace courtops::core::model {

struct TimeWindow {
    std::string start;
    std::string end;
};

struct TournamentConfig {
    int interval_minutes = 30;
    std::string day_start = "09:00";
    std::string day_end = "18:00";
    std::string tournament_date;
    std::vector<TimeWindow> breaks;
    int court_count = 4;
    int default_rest_minutes = 30;
    int freeze_horizon_slots = 0;
    std::map<std::string, int> rank_counts;
    bool enable_court_utilization = false;
    double court_utilization_penalty = 0.0;
};

struct Player {
    std::string id;
    std::string name;
    std::string group_id;
    std::vector<std::string> ranks;
    std::vector<TimeWindow> availability;
    std::optional<int> min_rest_minutes;
    std::string notes;
};

struct Match {
    std::string id;
    std::optional<int> match_number;
    std::string event_rank;
    std::vector<std::string> side_a;
    std::vector<std::string> side_b;
    std::vector<std::string> side_c;
    int duration_slots = 1;
    std::optional<int> preferred_court;
    std::vector<std::string> tags;

    std::vector<std::string> PlayerIds() const;
    bool HasPlayer(const std::string& player_id) const;
    std::string Label() const;
};

struct Assignment {
    std::string match_id;
    int court_id = 0;
    int slot_id = 0;
    int duration_slots = 1;

    int end_slot() const { return slot_id + duration_slots; }
    bool Overlaps(int start, int end) const { return slot_id < end && end_slot() > start; }
};

struct SoftViolation {
    std::string type;
    std::string match_id;
    std::string player_id;
    std::string description;
    double penalty_incurred = 0.0;
};

struct Schedule {
    std::vector<Assignment> assignments;
    std::vector<std::string> unscheduled_matches;
    std::vector<SoftViolation> soft_violations;
    std::vector<std::string> infeasible_reasons;
    std::optional<double> objective_score;
    std::string status = "unknown";
};

bool SharesPlayer(const Match& lhs, const Match& rhs);

}  // namespace courtops::core::model
