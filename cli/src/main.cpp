#include "courtops/core/api/LiveOpsService.h"
#include "courtops/core/api/OpsConfig.h"
#include "courtops/core/solver/ProcessSolver.h"
#include "courtops/core/sync/FileSyncTarget.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using courtops::core::api::LiveOpsService;
using courtops::core::api::OpsConfig;
using courtops::core::errors::LiveOpsError;
using courtops::core::model::MatchStatus;

constexpr const char* kUsage =
    "Usage: courtopscli <ops_config.json> <command> [args]\n"
    "  lights [slot]            traffic light for every scheduled match\n"
    "  suggest [slot]           court fill suggestions\n"
    "  call|start|finish <id>   advance a match\n"
    "  undo <id>                step a match back\n"
    "  score <id> <a> <b> [sets]\n"
    "  time <id> start|end <HH:MM>\n"
    "  start-on <id> <court>    start a called match on another court\n"
    "  undo-start <id>\n"
    "  delay <id> <reason>\n"
    "  pin|unpin|postpone|unpostpone <id>\n"
    "  substitute <id> <old player> <new player>\n"
    "  withdraw <player>\n"
    "  impact <id> [end slot]\n"
    "  overruns\n"
    "  reoptimize\n"
    "  progress\n"
    "  export <path>";

struct Invocation {
    std::string command;
    std::vector<std::string> args;
    bool mutates = false;
};

bool ParseInt(const std::string& text, int& out) {
    std::size_t consumed = 0;
    try {
        out = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == text.size();
}

std::string JoinArgs(const std::vector<std::string>& args, std::size_t from) {
    std::ostringstream out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (i > from) {
            out << ' ';
        }
        out << args[i];
    }
    return out.str();
}

std::string ResolvePath(const std::string& base_file, const std::string& path) {
    const std::filesystem::path fs_path(path);
    if (fs_path.is_absolute()) {
        return path;
    }
    return (std::filesystem::path(base_file).parent_path() / fs_path).string();
}

int Fail(const LiveOpsError& error) {
    std::cerr << "[courtopscli] " << error.Describe() << '\n';
    return 1;
}

int Usage(const std::string& message) {
    std::cerr << "[courtopscli] " << message << '\n' << kUsage << '\n';
    return 1;
}

std::optional<int> OptionalSlot(const Invocation& call, std::size_t index, bool* ok) {
    *ok = true;
    if (call.args.size() <= index) {
        return std::nullopt;
    }
    int slot = 0;
    if (!ParseInt(call.args[index], slot) || slot < 0) {
        *ok = false;
        return std::nullopt;
    }
    return slot;
}

int RunLights(LiveOpsService& service, const Invocation& call) {
    bool ok = true;
    const auto slot = OptionalSlot(call, 0, &ok);
    if (!ok) {
        return Usage("Invalid slot: " + call.args[0]);
    }
    const int current = slot.value_or(service.currentSlot());
    std::cout << "Slot " << current << '\n';
    for (const auto& [match_id, verdict] : service.evaluateConflicts(current)) {
        std::cout << "  " << match_id << "  " << courtops::core::conflicts::ToString(verdict.status) << "  "
                  << verdict.reason << '\n';
    }
    return 0;
}

int RunSuggest(LiveOpsService& service, const Invocation& call) {
    bool ok = true;
    const auto slot = OptionalSlot(call, 0, &ok);
    if (!ok) {
        return Usage("Invalid slot: " + call.args[0]);
    }
    const auto suggestions = service.suggestCourtFills(slot);
    if (suggestions.empty()) {
        std::cout << "No free courts to fill" << '\n';
    }
    for (const auto& suggestion : suggestions) {
        std::cout << "Court " << suggestion.court_id << ": " << suggestion.match_label << " ("
                  << suggestion.suggested_match_id << ", planned court " << suggestion.original_court << " at "
                  << suggestion.original_time << ") " << suggestion.players << " - " << suggestion.reason << '\n';
    }
    return 0;
}

int RunImpact(LiveOpsService& service, const Invocation& call) {
    if (call.args.empty()) {
        return Usage("impact needs a match id");
    }
    bool ok = true;
    const auto projected = OptionalSlot(call, 1, &ok);
    if (!ok) {
        return Usage("Invalid end slot: " + call.args[1]);
    }
    const auto analysis = service.analyzeImpact(call.args[0], projected);
    if (!analysis) {
        std::cerr << "[courtopscli] Unknown or unscheduled match: " << call.args[0] << '\n';
        return 1;
    }
    std::cout << analysis->match_id << ": overrun " << analysis->overrun_slots << " slots (ends "
              << analysis->actual_end_slot << ", planned " << analysis->scheduled_end_slot << ")\n";
    std::cout << "  directly impacted: " << JoinArgs(analysis->directly_impacted, 0) << '\n';
    std::cout << "  cascade impacted: " << JoinArgs(analysis->cascade_impacted, 0) << '\n';
    std::cout << "  suggested action: " << courtops::core::impact::ToString(analysis->suggested_action) << '\n';
    return 0;
}

int RunCommand(LiveOpsService& service, const OpsConfig& config, const Invocation& call) {
    LiveOpsError error;
    const auto need = [&](std::size_t count) { return call.args.size() >= count; };

    static const std::map<std::string, MatchStatus> kTransitions{
        {"call", MatchStatus::Called},
        {"start", MatchStatus::Started},
        {"finish", MatchStatus::Finished},
    };
    const auto transition = kTransitions.find(call.command);
    if (transition != kTransitions.end()) {
        if (!need(1)) {
            return Usage(call.command + " needs a match id");
        }
        courtops::core::model::MatchState updated;
        if (!service.transition(call.args[0], transition->second, {}, &updated, &error)) {
            return Fail(error);
        }
        std::cout << call.args[0] << " is now " << courtops::core::model::ToString(updated.status) << '\n';
        return 0;
    }

    if (call.command == "lights") {
        return RunLights(service, call);
    }
    if (call.command == "suggest") {
        return RunSuggest(service, call);
    }
    if (call.command == "undo") {
        if (!need(1)) {
            return Usage("undo needs a match id");
        }
        courtops::core::model::MatchState updated;
        if (!service.undoStatus(call.args[0], &updated, &error)) {
            return Fail(error);
        }
        std::cout << call.args[0] << " is back to " << courtops::core::model::ToString(updated.status) << '\n';
        return 0;
    }
    if (call.command == "score") {
        int side_a = 0;
        int side_b = 0;
        if (!need(3) || !ParseInt(call.args[1], side_a) || !ParseInt(call.args[2], side_b)) {
            return Usage("score needs <id> <a> <b>");
        }
        return service.recordScore(call.args[0], side_a, side_b, JoinArgs(call.args, 3), &error) ? 0 : Fail(error);
    }
    if (call.command == "time") {
        if (!need(3) || (call.args[1] != "start" && call.args[1] != "end")) {
            return Usage("time needs <id> start|end <HH:MM>");
        }
        const auto field = call.args[1] == "start" ? courtops::core::api::TimeField::Start
                                                   : courtops::core::api::TimeField::End;
        return service.updateActualTime(call.args[0], field, call.args[2], &error) ? 0 : Fail(error);
    }
    if (call.command == "start-on") {
        int court = 0;
        if (!need(2) || !ParseInt(call.args[1], court) || court < 1) {
            return Usage("start-on needs <id> <court>");
        }
        courtops::core::reassign::StartOnCourtResult result;
        if (!service.startOnCourt(call.args[0], court, &result, &error)) {
            return Fail(error);
        }
        for (const auto& moved : result.moved_assignments) {
            std::cout << moved.match_id << ": court " << moved.from_court << " slot " << moved.from_slot
                      << " -> court " << moved.to_court << " slot " << moved.to_slot << '\n';
        }
        return 0;
    }
    if (call.command == "undo-start") {
        if (!need(1)) {
            return Usage("undo-start needs a match id");
        }
        courtops::core::reassign::UndoStartResult result;
        if (!service.undoStart(call.args[0], &result, &error)) {
            return Fail(error);
        }
        if (!result.match_state) {
            std::cout << call.args[0] << " was not moved; nothing to undo" << '\n';
        }
        for (const auto& restored : result.restored_assignments) {
            std::cout << restored.match_id << ": back to court " << restored.to_court << " slot "
                      << restored.to_slot << '\n';
        }
        return 0;
    }
    if (call.command == "delay") {
        if (!need(1)) {
            return Usage("delay needs a match id");
        }
        return service.setDelayed(call.args[0], true, JoinArgs(call.args, 1), &error) ? 0 : Fail(error);
    }
    if (call.command == "pin" || call.command == "unpin") {
        if (!need(1)) {
            return Usage(call.command + " needs a match id");
        }
        return service.setPinned(call.args[0], call.command == "pin", &error) ? 0 : Fail(error);
    }
    if (call.command == "postpone" || call.command == "unpostpone") {
        if (!need(1)) {
            return Usage(call.command + " needs a match id");
        }
        return service.setPostponed(call.args[0], call.command == "postpone", &error) ? 0 : Fail(error);
    }
    if (call.command == "substitute") {
        if (!need(3)) {
            return Usage("substitute needs <id> <old player> <new player>");
        }
        return service.substitutePlayer(call.args[0], call.args[1], call.args[2], &error) ? 0 : Fail(error);
    }
    if (call.command == "withdraw") {
        if (!need(1)) {
            return Usage("withdraw needs a player id");
        }
        std::vector<std::string> affected;
        if (!service.withdrawPlayer(call.args[0], &affected, &error)) {
            return Fail(error);
        }
        std::cout << "Removed " << call.args[0] << " from: " << JoinArgs(affected, 0) << '\n';
        return 0;
    }
    if (call.command == "impact") {
        return RunImpact(service, call);
    }
    if (call.command == "overruns") {
        for (const auto& assignment : service.overrunMatches()) {
            std::cout << assignment.match_id << " (court " << assignment.court_id << ", slot " << assignment.slot_id
                      << ")" << '\n';
        }
        for (const auto& assignment : service.impactedMatches()) {
            std::cout << "  impacted: " << assignment.match_id << '\n';
        }
        return 0;
    }
    if (call.command == "reoptimize") {
        courtops::core::solver::ProcessSolverOptions options;
        options.cmd = config.solver.cmd;
        options.args = config.solver.args;
        options.working_dir = config.solver.working_dir;
        options.grace_ms = config.solver.grace_ms;
        service.setSolver(std::make_unique<courtops::core::solver::ProcessSolver>(options));
        courtops::core::model::Schedule applied;
        if (!service.triggerReoptimize(&applied, &error)) {
            return Fail(error);
        }
        std::cout << "Reoptimized: " << applied.status << ", " << applied.assignments.size() << " assignments, "
                  << applied.unscheduled_matches.size() << " unscheduled" << '\n';
        return 0;
    }
    if (call.command == "progress") {
        const auto summary = service.progress();
        std::cout << summary.finished << "/" << summary.total << " finished (" << summary.percentage() << "%), "
                  << summary.in_progress << " in progress, " << summary.called << " called, " << summary.remaining()
                  << " remaining" << '\n';
        return 0;
    }
    if (call.command == "export") {
        const std::string path = need(1) ? call.args[0] : config.output.export_path;
        if (path.empty()) {
            return Usage("export needs a path");
        }
        LiveOpsError io_error;
        if (!service.saveTournament(path, &io_error)) {
            std::cerr << "[courtopscli] " << io_error.Describe() << '\n';
            return 1;
        }
        std::cout << "Exported to " << path << '\n';
        return 0;
    }
    return Usage("Unknown command: " + call.command);
}

bool IsMutating(const std::string& command) {
    static const std::vector<std::string> kReadOnly{"lights", "suggest", "impact", "overruns", "progress", "export"};
    for (const auto& name : kReadOnly) {
        if (name == command) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << kUsage << '\n';
        return 1;
    }

    const std::string config_path = argv[1];
    Invocation call;
    call.command = argv[2];
    for (int i = 3; i < argc; ++i) {
        call.args.emplace_back(argv[i]);
    }
    call.mutates = IsMutating(call.command);

    OpsConfig config;
    std::string config_error;
    if (!OpsConfig::LoadFromFile(config_path, config, &config_error)) {
        std::cerr << "[courtopscli] " << config_error << '\n';
        return 1;
    }
    config.tournament_file = ResolvePath(config_path, config.tournament_file);
    if (!config.sync.state_path.empty()) {
        config.sync.state_path = ResolvePath(config_path, config.sync.state_path);
    }
    if (!config.output.progress_log.empty()) {
        config.output.progress_log = ResolvePath(config_path, config.output.progress_log);
    }

    LiveOpsService service;
    service.setConfig(config);

    LiveOpsError io_error;
    if (!service.loadTournament(config.tournament_file, &io_error)) {
        std::cerr << "[courtopscli] " << io_error.Describe() << '\n';
        return 1;
    }

    if (config.sync.adapter == "file") {
        auto target = std::make_unique<courtops::core::sync::FileSyncTarget>();
        if (!target->Configure(config.sync.state_path)) {
            std::cerr << "[courtopscli] Failed to configure file sync." << '\n';
            return 1;
        }
        service.setSyncTarget(std::move(target));
    } else if (!config.sync.adapter.empty()) {
        std::cerr << "[courtopscli] Unknown sync adapter: " << config.sync.adapter << '\n';
        return 1;
    }

    const int status = RunCommand(service, config, call);

    if (status == 0 && call.mutates) {
        if (!service.saveTournament(config.tournament_file, &io_error)) {
            std::cerr << "[courtopscli] " << io_error.Describe() << '\n';
            return 1;
        }
    }
    service.flushSync();
    const auto sync_error = service.lastSyncError();
    if (sync_error.code != courtops::core::errors::ErrorCode::None) {
        std::cerr << "[courtopscli] " << sync_error.Describe() << '\n';
    }

    const std::string log = service.getLastLogLines(20);
    if (!log.empty()) {
        std::cerr << log << '\n';
    }
    return status;
}
