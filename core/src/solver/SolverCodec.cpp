#include "courtops/core/solver/SolverCodec.h"

#include "courtops/core/persist/ModelJson.h"

namespace courtops::core::solver {

namespace {

struct StatusName {
    SolverStatus status;
    const char* name;
};

constexpr StatusName kStatusNames[] = {
    {SolverStatus::Optimal, "optimal"},
    {SolverStatus::Feasible, "feasible"},
    {SolverStatus::Infeasible, "infeasible"},
    {SolverStatus::Unknown, "unknown"},
    {SolverStatus::ModelInvalid, "model_invalid"},
};

std::optional<int> OptionalInt(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return node.at(key).get<int>();
}

}  // namespace

const char* ToString(SolverStatus status) {
    for (const auto& entry : kStatusNames) {
        if (entry.status == status) {
            return entry.name;
        }
    }
    return "unknown";
}

bool ParseSolverStatus(const std::string& text, SolverStatus& out) {
    for (const auto& entry : kStatusNames) {
        if (text == entry.name) {
            out = entry.status;
            return true;
        }
    }
    return false;
}

nlohmann::json EncodeRequest(const SolveRequest& request) {
    nlohmann::json node;
    node["config"] = persist::WriteConfig(request.config);
    node["players"] = nlohmann::json::array();
    for (const auto& player : request.players) {
        node["players"].push_back(persist::WritePlayer(player));
    }
    node["matches"] = nlohmann::json::array();
    for (const auto& match : request.matches) {
        node["matches"].push_back(persist::WriteMatch(match));
    }
    if (!request.previous_assignments.empty()) {
        nlohmann::json previous = nlohmann::json::array();
        for (const auto& item : request.previous_assignments) {
            nlohmann::json entry{
                {"matchId", item.match_id},
                {"slotId", item.slot_id},
                {"courtId", item.court_id},
                {"locked", item.locked},
            };
            if (item.pinned_slot_id) {
                entry["pinnedSlotId"] = *item.pinned_slot_id;
            }
            if (item.pinned_court_id) {
                entry["pinnedCourtId"] = *item.pinned_court_id;
            }
            previous.push_back(std::move(entry));
        }
        node["previousAssignments"] = std::move(previous);
    }
    node["timeLimitSeconds"] = request.time_limit_seconds;
    return node;
}

bool DecodeRequest(const std::string& text, SolveRequest& out, std::string* error) {
    try {
        const auto node = nlohmann::json::parse(text);
        SolveRequest request;
        if (node.contains("config")) {
            request.config = persist::ParseConfig(node.at("config"));
        }
        if (node.contains("players")) {
            for (const auto& item : node.at("players")) {
                request.players.push_back(persist::ParsePlayer(item));
            }
        }
        if (node.contains("matches")) {
            for (const auto& item : node.at("matches")) {
                request.matches.push_back(persist::ParseMatch(item));
            }
        }
        if (node.contains("previousAssignments")) {
            for (const auto& item : node.at("previousAssignments")) {
                PreviousAssignment previous;
                previous.match_id = item.value("matchId", "");
                previous.slot_id = item.value("slotId", 0);
                previous.court_id = item.value("courtId", 0);
                previous.locked = item.value("locked", false);
                previous.pinned_slot_id = OptionalInt(item, "pinnedSlotId");
                previous.pinned_court_id = OptionalInt(item, "pinnedCourtId");
                request.previous_assignments.push_back(std::move(previous));
            }
        }
        request.time_limit_seconds = node.value("timeLimitSeconds", request.time_limit_seconds);
        out = std::move(request);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse solve request: ") + ex.what();
        }
        return false;
    }
    return true;
}

nlohmann::json EncodeResult(const SolveResult& result) {
    model::Schedule schedule;
    schedule.assignments = result.assignments;
    schedule.soft_violations = result.soft_violations;
    schedule.infeasible_reasons = result.infeasible_reasons;
    schedule.unscheduled_matches = result.unscheduled_matches;
    schedule.objective_score = result.objective_score;
    schedule.status = ToString(result.status);
    return persist::WriteSchedule(schedule);
}

bool DecodeResult(const std::string& text, SolveResult& out, std::string* error) {
    try {
        const auto node = nlohmann::json::parse(text);
        if (!node.is_object()) {
            if (error) {
                *error = "Solver reply is not a JSON object";
            }
            return false;
        }
        const model::Schedule schedule = persist::ParseSchedule(node);
        SolveResult result;
        if (!ParseSolverStatus(schedule.status, result.status)) {
            if (error) {
                *error = "Unknown solver status: " + schedule.status;
            }
            return false;
        }
        result.assignments = schedule.assignments;
        result.soft_violations = schedule.soft_violations;
        result.infeasible_reasons = schedule.infeasible_reasons;
        result.unscheduled_matches = schedule.unscheduled_matches;
        result.objective_score = schedule.objective_score;
        out = std::move(result);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse solver reply: ") + ex.what();
        }
        return false;
    }
    return true;
}

}  // namespace courtops::core::solver
