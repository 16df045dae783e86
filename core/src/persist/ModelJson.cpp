#include "courtops/core/persist/ModelJson.h"

namespace courtops::core::persist {

namespace {

nlohmann::json WriteWindows(const std::vector<model::TimeWindow>& windows) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& window : windows) {
        list.push_back({{"start", window.start}, {"end", window.end}});
    }
    return list;
}

std::vector<model::TimeWindow> ParseWindows(const nlohmann::json& node, const char* key) {
    std::vector<model::TimeWindow> windows;
    if (!node.contains(key) || !node.at(key).is_array()) {
        return windows;
    }
    for (const auto& item : node.at(key)) {
        model::TimeWindow window;
        window.start = item.value("start", "");
        window.end = item.value("end", "");
        windows.push_back(std::move(window));
    }
    return windows;
}

std::vector<std::string> ParseStrings(const nlohmann::json& node, const char* key) {
    std::vector<std::string> values;
    if (!node.contains(key) || !node.at(key).is_array()) {
        return values;
    }
    for (const auto& item : node.at(key)) {
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::optional<int> ParseOptionalInt(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<int>();
}

std::optional<std::string> ParseOptionalString(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<std::string>();
}

}  // namespace

nlohmann::json WriteConfig(const model::TournamentConfig& config) {
    nlohmann::json node;
    node["intervalMinutes"] = config.interval_minutes;
    node["dayStart"] = config.day_start;
    node["dayEnd"] = config.day_end;
    if (!config.tournament_date.empty()) {
        node["tournamentDate"] = config.tournament_date;
    }
    node["breaks"] = WriteWindows(config.breaks);
    node["courtCount"] = config.court_count;
    node["defaultRestMinutes"] = config.default_rest_minutes;
    node["freezeHorizonSlots"] = config.freeze_horizon_slots;
    if (!config.rank_counts.empty()) {
        node["rankCounts"] = config.rank_counts;
    }
    node["enableCourtUtilization"] = config.enable_court_utilization;
    node["courtUtilizationPenalty"] = config.court_utilization_penalty;
    return node;
}

model::TournamentConfig ParseConfig(const nlohmann::json& node) {
    model::TournamentConfig config;
    config.interval_minutes = node.value("intervalMinutes", config.interval_minutes);
    config.day_start = node.value("dayStart", config.day_start);
    config.day_end = node.value("dayEnd", config.day_end);
    config.tournament_date = node.value("tournamentDate", config.tournament_date);
    config.breaks = ParseWindows(node, "breaks");
    config.court_count = node.value("courtCount", config.court_count);
    config.default_rest_minutes = node.value("defaultRestMinutes", config.default_rest_minutes);
    config.freeze_horizon_slots = node.value("freezeHorizonSlots", config.freeze_horizon_slots);
    if (node.contains("rankCounts") && node.at("rankCounts").is_object()) {
        config.rank_counts = node.at("rankCounts").get<std::map<std::string, int>>();
    }
    config.enable_court_utilization = node.value("enableCourtUtilization", config.enable_court_utilization);
    config.court_utilization_penalty = node.value("courtUtilizationPenalty", config.court_utilization_penalty);
    return config;
}

nlohmann::json WritePlayer(const model::Player& player) {
    nlohmann::json node;
    node["id"] = player.id;
    node["name"] = player.name;
    node["groupId"] = player.group_id;
    node["ranks"] = player.ranks;
    node["availability"] = WriteWindows(player.availability);
    node["minRestMinutes"] = player.min_rest_minutes ? nlohmann::json(*player.min_rest_minutes) : nlohmann::json();
    if (!player.notes.empty()) {
        node["notes"] = player.notes;
    }
    return node;
}

model::Player ParsePlayer(const nlohmann::json& node) {
    model::Player player;
    player.id = node.value("id", "");
    player.name = node.value("name", "");
    player.group_id = node.value("groupId", "");
    player.ranks = ParseStrings(node, "ranks");
    player.availability = ParseWindows(node, "availability");
    player.min_rest_minutes = ParseOptionalInt(node, "minRestMinutes");
    player.notes = node.value("notes", "");
    return player;
}

nlohmann::json WriteMatch(const model::Match& match) {
    nlohmann::json node;
    node["id"] = match.id;
    if (match.match_number) {
        node["matchNumber"] = *match.match_number;
    }
    node["eventRank"] = match.event_rank.empty() ? nlohmann::json() : nlohmann::json(match.event_rank);
    node["sideA"] = match.side_a;
    node["sideB"] = match.side_b;
    if (!match.side_c.empty()) {
        node["sideC"] = match.side_c;
        node["matchType"] = "tri";
    }
    node["durationSlots"] = match.duration_slots;
    node["preferredCourt"] = match.preferred_court ? nlohmann::json(*match.preferred_court) : nlohmann::json();
    if (!match.tags.empty()) {
        node["tags"] = match.tags;
    }
    return node;
}

model::Match ParseMatch(const nlohmann::json& node) {
    model::Match match;
    match.id = node.value("id", "");
    match.match_number = ParseOptionalInt(node, "matchNumber");
    match.event_rank = ParseOptionalString(node, "eventRank").value_or("");
    match.side_a = ParseStrings(node, "sideA");
    match.side_b = ParseStrings(node, "sideB");
    match.side_c = ParseStrings(node, "sideC");
    match.duration_slots = node.value("durationSlots", match.duration_slots);
    match.preferred_court = ParseOptionalInt(node, "preferredCourt");
    match.tags = ParseStrings(node, "tags");
    return match;
}

nlohmann::json WriteAssignment(const model::Assignment& assignment) {
    return {
        {"matchId", assignment.match_id},
        {"slotId", assignment.slot_id},
        {"courtId", assignment.court_id},
        {"durationSlots", assignment.duration_slots},
    };
}

model::Assignment ParseAssignment(const nlohmann::json& node) {
    model::Assignment assignment;
    assignment.match_id = node.value("matchId", "");
    assignment.slot_id = node.value("slotId", 0);
    assignment.court_id = node.value("courtId", 0);
    assignment.duration_slots = node.value("durationSlots", 1);
    return assignment;
}

nlohmann::json WriteSchedule(const model::Schedule& schedule) {
    nlohmann::json node;
    node["assignments"] = nlohmann::json::array();
    for (const auto& assignment : schedule.assignments) {
        node["assignments"].push_back(WriteAssignment(assignment));
    }
    node["unscheduledMatches"] = schedule.unscheduled_matches;
    node["softViolations"] = nlohmann::json::array();
    for (const auto& violation : schedule.soft_violations) {
        node["softViolations"].push_back({
            {"type", violation.type},
            {"matchId", violation.match_id.empty() ? nlohmann::json() : nlohmann::json(violation.match_id)},
            {"playerId", violation.player_id.empty() ? nlohmann::json() : nlohmann::json(violation.player_id)},
            {"description", violation.description},
            {"penaltyIncurred", violation.penalty_incurred},
        });
    }
    node["objectiveScore"] = schedule.objective_score ? nlohmann::json(*schedule.objective_score) : nlohmann::json();
    node["infeasibleReasons"] = schedule.infeasible_reasons;
    node["status"] = schedule.status;
    return node;
}

model::Schedule ParseSchedule(const nlohmann::json& node) {
    model::Schedule schedule;
    if (node.contains("assignments")) {
        for (const auto& item : node.at("assignments")) {
            schedule.assignments.push_back(ParseAssignment(item));
        }
    }
    schedule.unscheduled_matches = ParseStrings(node, "unscheduledMatches");
    if (node.contains("softViolations")) {
        for (const auto& item : node.at("softViolations")) {
            model::SoftViolation violation;
            violation.type = item.value("type", "");
            violation.match_id = ParseOptionalString(item, "matchId").value_or("");
            violation.player_id = ParseOptionalString(item, "playerId").value_or("");
            violation.description = item.value("description", "");
            violation.penalty_incurred = item.value("penaltyIncurred", 0.0);
            schedule.soft_violations.push_back(std::move(violation));
        }
    }
    if (node.contains("objectiveScore") && !node.at("objectiveScore").is_null()) {
        schedule.objective_score = node.at("objectiveScore").get<double>();
    }
    schedule.infeasible_reasons = ParseStrings(node, "infeasibleReasons");
    schedule.status = node.value("status", schedule.status);
    return schedule;
}

nlohmann::json WriteMatchState(const model::MatchState& state) {
    nlohmann::json node;
    node["matchId"] = state.match_id;
    node["status"] = model::ToString(state.status);
    if (state.actual_start_time) {
        node["actualStartTime"] = *state.actual_start_time;
    }
    if (state.actual_end_time) {
        node["actualEndTime"] = *state.actual_end_time;
    }
    if (state.actual_court_id) {
        node["actualCourtId"] = *state.actual_court_id;
    }
    node["delayed"] = state.delayed;
    if (!state.delay_reason.empty()) {
        node["delayReason"] = state.delay_reason;
    }
    node["pinned"] = state.pinned;
    node["postponed"] = state.postponed;
    if (!state.player_confirmations.empty()) {
        node["playerConfirmations"] = state.player_confirmations;
    }
    if (state.score) {
        node["score"] = {{"sideA", state.score->side_a}, {"sideB", state.score->side_b}};
    }
    if (!state.set_scores.empty()) {
        node["setScores"] = state.set_scores;
    }
    if (!state.notes.empty()) {
        node["notes"] = state.notes;
    }
    if (!state.updated_at.empty()) {
        node["updatedAt"] = state.updated_at;
    }
    if (state.original) {
        node["originalSlotId"] = state.original->slot_id;
        node["originalCourtId"] = state.original->court_id;
    }
    return node;
}

model::MatchState ParseMatchState(const nlohmann::json& node) {
    model::MatchState state;
    state.match_id = node.value("matchId", "");
    if (!model::ParseMatchStatus(node.value("status", "scheduled"), state.status)) {
        state.status = model::MatchStatus::Scheduled;
    }
    state.actual_start_time = ParseOptionalString(node, "actualStartTime");
    state.actual_end_time = ParseOptionalString(node, "actualEndTime");
    state.actual_court_id = ParseOptionalInt(node, "actualCourtId");
    state.delayed = node.value("delayed", false);
    state.delay_reason = node.value("delayReason", "");
    state.pinned = node.value("pinned", false);
    state.postponed = node.value("postponed", false);
    if (node.contains("playerConfirmations") && node.at("playerConfirmations").is_object()) {
        state.player_confirmations = node.at("playerConfirmations").get<std::map<std::string, bool>>();
    }
    if (node.contains("score") && node.at("score").is_object()) {
        const auto& score = node.at("score");
        state.score = model::MatchScore{score.value("sideA", 0), score.value("sideB", 0)};
    }
    state.set_scores = node.value("setScores", "");
    state.notes = node.value("notes", "");
    state.updated_at = node.value("updatedAt", "");
    const auto original_slot = ParseOptionalInt(node, "originalSlotId");
    const auto original_court = ParseOptionalInt(node, "originalCourtId");
    if (original_slot && original_court) {
        state.original = model::SlotPlacement{*original_slot, *original_court};
    }
    return state;
}

nlohmann::json WriteMatchStates(const std::map<std::string, model::MatchState>& states) {
    nlohmann::json node = nlohmann::json::object();
    for (const auto& [match_id, state] : states) {
        node[match_id] = WriteMatchState(state);
    }
    return node;
}

std::map<std::string, model::MatchState> ParseMatchStates(const nlohmann::json& node) {
    std::map<std::string, model::MatchState> states;
    if (!node.is_object()) {
        return states;
    }
    for (const auto& item : node.items()) {
        auto state = ParseMatchState(item.value());
        if (state.match_id.empty()) {
            state.match_id = item.key();
        }
        states[item.key()] = std::move(state);
    }
    return states;
}

}  // namespace courtops::core::persist
