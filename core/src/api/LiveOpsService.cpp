#include "courtops/core/api/LiveOpsService.h"

#include "courtops/core/persist/TournamentFile.h"
#include "courtops/core/util/TimeSlots.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace courtops::core::api {

namespace {

using model::MatchStatus;

std::string TransitionVerb(MatchStatus from, MatchStatus to) {
    if (from == MatchStatus::Scheduled && to == MatchStatus::Scheduled) {
        return "DELAY";
    }
    switch (to) {
        case MatchStatus::Called:
            return from == MatchStatus::Started ? "UNDO" : "CALL";
        case MatchStatus::Started:
            return from == MatchStatus::Finished ? "UNDO" : "START";
        case MatchStatus::Finished:
            return "FINISH";
        case MatchStatus::Scheduled:
            return "UNDO";
    }
    return "TRANSITION";
}

bool ReplacePlayer(std::vector<std::string>& side, const std::string& from, const std::string& to) {
    bool replaced = false;
    for (auto& id : side) {
        if (id == from) {
            id = to;
            replaced = true;
        }
    }
    return replaced;
}

bool RemovePlayer(std::vector<std::string>& side, const std::string& player_id) {
    const auto before = side.size();
    side.erase(std::remove(side.begin(), side.end(), player_id), side.end());
    return side.size() != before;
}

}  // namespace

LiveOpsService::LiveOpsService()
    : lifecycle_([this]() { return util::FormatClock(now_ ? now_() : std::time(nullptr)); }),
      reassigner_(lifecycle_) {}

LiveOpsService::~LiveOpsService() {
    cancelReoptimize();
    if (reoptimize_worker_.joinable()) {
        reoptimize_worker_.join();
    }
    if (sync_queue_) {
        sync_queue_->Stop();
    }
}

bool LiveOpsService::loadConfig(const std::string& path) {
    OpsConfig config;
    std::string error;
    if (!OpsConfig::LoadFromFile(path, config, &error)) {
        AppendLogLine(error);
        return false;
    }
    setConfig(config);
    return true;
}

void LiveOpsService::setConfig(const OpsConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

OpsConfig LiveOpsService::getConfigSnapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

bool LiveOpsService::loadTournament(const std::string& path, errors::LiveOpsError* error) {
    model::TournamentState loaded;
    std::string io_error;
    if (!persist::LoadTournament(path, loaded, &io_error)) {
        AppendLogLine("[courtops] " + io_error);
        return errors::Fail(error, errors::ErrorCode::IoFailure, io_error);
    }
    setState(std::move(loaded));
    AppendLogLine("[courtops] Loaded tournament from " + path);
    return true;
}

bool LiveOpsService::saveTournament(const std::string& path, errors::LiveOpsError* error) const {
    std::string io_error;
    if (!persist::SaveTournament(path, getStateSnapshot(), &io_error)) {
        return errors::Fail(error, errors::ErrorCode::IoFailure, io_error);
    }
    return true;
}

void LiveOpsService::setState(model::TournamentState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(state);
    suggestions_ = conflicts::SuggestionTracker{};
}

model::TournamentState LiveOpsService::getStateSnapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void LiveOpsService::setTimeSource(TimeSource now) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    now_ = std::move(now);
}

void LiveOpsService::setSolver(std::unique_ptr<solver::ISolver> solver) {
    if (reoptimizer_ && reoptimizer_->InFlight()) {
        AppendLogLine("[courtops] Solver change ignored while a reoptimization is running");
        return;
    }
    if (reoptimize_worker_.joinable()) {
        reoptimize_worker_.join();
    }
    reoptimizer_.reset();
    solver_ = std::move(solver);
    if (solver_) {
        reoptimizer_ = std::make_unique<impact::Reoptimizer>(*solver_);
    }
}

void LiveOpsService::setSyncTarget(std::unique_ptr<sync::ISyncTarget> target) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (sync_queue_) {
        sync_queue_->Stop();
        sync_queue_.reset();
    }
    sync_target_ = std::move(target);
    if (!sync_target_) {
        return;
    }
    const auto config = getConfigSnapshot();
    sync::SyncOptions options;
    options.max_attempts = config.sync.max_attempts;
    options.retry_backoff_ms = config.sync.retry_backoff_ms;
    sync_queue_ = std::make_unique<sync::SyncQueue>(
        *sync_target_, options, [this](const std::string& line) { RecordCommand("[sync] " + line); });
    sync_queue_->SetFailureHandler([this](const std::string& match_id, const std::string& message) {
        std::lock_guard<std::mutex> lock(sync_error_mutex_);
        last_sync_error_.code = errors::ErrorCode::SyncFailure;
        last_sync_error_.message = "Sync failed for " + match_id;
        last_sync_error_.reasons = {message};
    });
    sync_queue_->Start();
}

void LiveOpsService::flushSync() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (sync_queue_) {
        sync_queue_->Flush();
    }
}

errors::LiveOpsError LiveOpsService::lastSyncError() const {
    std::lock_guard<std::mutex> lock(sync_error_mutex_);
    return last_sync_error_;
}

bool LiveOpsService::transition(const std::string& matchId,
                                MatchStatus next,
                                const model::MatchStatePatch& patch,
                                model::MatchState* out,
                                errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const MatchStatus previous = state_.StatusOf(matchId);
    model::MatchState updated;
    if (!lifecycle_.Transition(state_, matchId, next, patch, &updated, error)) {
        return false;
    }
    RecordCommand(TransitionVerb(previous, next) + " " + matchId + " -> " + model::ToString(next));
    Mirror({matchId});
    if (out) {
        *out = updated;
    }
    return true;
}

bool LiveOpsService::undoStatus(const std::string& matchId, model::MatchState* out, errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    model::MatchState updated;
    if (!lifecycle_.Undo(state_, matchId, &updated, error)) {
        return false;
    }
    RecordCommand("UNDO " + matchId + " -> " + model::ToString(updated.status));
    Mirror({matchId});
    if (out) {
        *out = updated;
    }
    return true;
}

bool LiveOpsService::setDelayed(const std::string& matchId,
                                bool delayed,
                                const std::string& reason,
                                errors::LiveOpsError* error) {
    model::MatchStatePatch patch;
    patch.delayed = delayed;
    patch.delay_reason = delayed ? reason : std::string();
    std::lock_guard<std::mutex> lock(state_mutex_);
    return PatchLocked(matchId, patch, (delayed ? "DELAY " : "RESUME ") + matchId + (reason.empty() ? "" : ": " + reason),
                       error);
}

bool LiveOpsService::setPinned(const std::string& matchId, bool pinned, errors::LiveOpsError* error) {
    model::MatchStatePatch patch;
    patch.pinned = pinned;
    std::lock_guard<std::mutex> lock(state_mutex_);
    return PatchLocked(matchId, patch, (pinned ? "PIN " : "UNPIN ") + matchId, error);
}

bool LiveOpsService::setPostponed(const std::string& matchId, bool postponed, errors::LiveOpsError* error) {
    model::MatchStatePatch patch;
    patch.postponed = postponed;
    std::lock_guard<std::mutex> lock(state_mutex_);
    return PatchLocked(matchId, patch, (postponed ? "POSTPONE " : "UNPOSTPONE ") + matchId, error);
}

bool LiveOpsService::confirmPlayer(const std::string& matchId,
                                   const std::string& playerId,
                                   bool confirmed,
                                   errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto* match = state_.FindMatch(matchId);
    if (!match) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown match: " + matchId);
    }
    if (!match->HasPlayer(playerId)) {
        return errors::Fail(error, errors::ErrorCode::InvalidArgument,
                            "Player " + playerId + " does not play in " + matchId);
    }
    model::MatchStatePatch patch;
    patch.player_confirmations[playerId] = confirmed;
    return PatchLocked(matchId, patch, (confirmed ? "CONFIRM " : "UNCONFIRM ") + playerId + " for " + matchId, error);
}

bool LiveOpsService::recordScore(const std::string& matchId,
                                 int sideA,
                                 int sideB,
                                 const std::string& setScores,
                                 errors::LiveOpsError* error) {
    if (sideA < 0 || sideB < 0) {
        return errors::Fail(error, errors::ErrorCode::InvalidArgument, "Scores must not be negative");
    }
    model::MatchStatePatch patch;
    patch.score = model::MatchScore{sideA, sideB};
    if (!setScores.empty()) {
        patch.set_scores = setScores;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    return PatchLocked(matchId, patch,
                       "SCORE " + matchId + " " + std::to_string(sideA) + "-" + std::to_string(sideB), error);
}

bool LiveOpsService::updateActualTime(const std::string& matchId,
                                      TimeField field,
                                      const std::string& clock,
                                      errors::LiveOpsError* error) {
    int minutes = 0;
    if (!util::ParseClock(clock, minutes)) {
        return errors::Fail(error, errors::ErrorCode::InvalidArgument, "Expected HH:MM, got '" + clock + "'");
    }
    model::MatchStatePatch patch;
    if (field == TimeField::Start) {
        patch.actual_start_time = clock;
    } else {
        patch.actual_end_time = clock;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    return PatchLocked(matchId, patch,
                       "TIME " + matchId + (field == TimeField::Start ? " start=" : " end=") + clock, error);
}

bool LiveOpsService::startOnCourt(const std::string& matchId,
                                  int courtId,
                                  reassign::StartOnCourtResult* result,
                                  errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    reassign::StartOnCourtResult outcome;
    if (!reassigner_.StartOnCourt(state_, matchId, courtId, &outcome, error)) {
        return false;
    }
    std::ostringstream line;
    line << "START ON COURT " << matchId << " court " << courtId;
    std::vector<std::string> touched;
    for (const auto& moved : outcome.moved_assignments) {
        touched.push_back(moved.match_id);
        if (moved.match_id != matchId) {
            line << " | " << moved.match_id << " " << moved.from_slot << "->" << moved.to_slot;
        }
    }
    RecordCommand(line.str());
    Mirror(touched);
    if (result) {
        *result = std::move(outcome);
    }
    return true;
}

bool LiveOpsService::undoStart(const std::string& matchId,
                               reassign::UndoStartResult* result,
                               errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    reassign::UndoStartResult outcome;
    if (!reassigner_.UndoStart(state_, matchId, &outcome, error)) {
        return false;
    }
    if (outcome.match_state) {
        std::vector<std::string> touched;
        for (const auto& restored : outcome.restored_assignments) {
            touched.push_back(restored.match_id);
        }
        RecordCommand("UNDO START ON COURT " + matchId + " (" + std::to_string(touched.size()) + " restored)");
        Mirror(touched);
    }
    if (result) {
        *result = std::move(outcome);
    }
    return true;
}

bool LiveOpsService::substitutePlayer(const std::string& matchId,
                                      const std::string& oldPlayerId,
                                      const std::string& newPlayerId,
                                      errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto* match = state_.FindMatch(matchId);
    if (!match) {
        return errors::Fail(error, errors::ErrorCode::UnknownMatch, "Unknown match: " + matchId);
    }
    if (!state_.FindPlayer(newPlayerId)) {
        return errors::Fail(error, errors::ErrorCode::UnknownPlayer, "Unknown player: " + newPlayerId);
    }
    if (state_.StatusOf(matchId) == MatchStatus::Finished) {
        return errors::Fail(error, errors::ErrorCode::InvalidTransition, "Match " + matchId + " has already finished");
    }
    if (match->HasPlayer(newPlayerId)) {
        return errors::Fail(error, errors::ErrorCode::InvalidArgument,
                            "Player " + newPlayerId + " already plays in " + matchId);
    }
    bool replaced = ReplacePlayer(match->side_a, oldPlayerId, newPlayerId);
    replaced = ReplacePlayer(match->side_b, oldPlayerId, newPlayerId) || replaced;
    replaced = ReplacePlayer(match->side_c, oldPlayerId, newPlayerId) || replaced;
    if (!replaced) {
        return errors::Fail(error, errors::ErrorCode::InvalidArgument,
                            "Player " + oldPlayerId + " does not play in " + matchId);
    }
    RecordCommand("SUBSTITUTE " + matchId + " " + oldPlayerId + " -> " + newPlayerId);
    return true;
}

bool LiveOpsService::withdrawPlayer(const std::string& playerId,
                                    std::vector<std::string>* affected,
                                    errors::LiveOpsError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.FindPlayer(playerId)) {
        return errors::Fail(error, errors::ErrorCode::UnknownPlayer, "Unknown player: " + playerId);
    }
    std::vector<std::string> edited;
    for (auto& match : state_.matches) {
        if (state_.StatusOf(match.id) == MatchStatus::Finished) {
            continue;
        }
        bool removed = RemovePlayer(match.side_a, playerId);
        removed = RemovePlayer(match.side_b, playerId) || removed;
        removed = RemovePlayer(match.side_c, playerId) || removed;
        if (removed) {
            edited.push_back(match.id);
        }
    }
    RecordCommand("WITHDRAW " + playerId + " from " + std::to_string(edited.size()) + " matches");
    if (affected) {
        *affected = std::move(edited);
    }
    return true;
}

void LiveOpsService::skipSuggestion(int courtId) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    suggestions_.Skip(courtId);
    AppendLogLine("SKIP SUGGESTION court " + std::to_string(courtId));
}

bool LiveOpsService::triggerReoptimize(model::Schedule* applied, errors::LiveOpsError* error) {
    if (!reoptimizer_) {
        return errors::Fail(error, errors::ErrorCode::SolverFailure, "No solver configured");
    }
    if (!reoptimizer_->TryBegin()) {
        RecordCommand("REOPTIMIZE rejected: already running");
        return errors::Fail(error, errors::ErrorCode::ReoptimizeInProgress, "A reoptimization is already running");
    }
    cancel_reoptimize_.store(false);
    const bool ok = RunReoptimize(applied, error);
    {
        std::lock_guard<std::mutex> lock(reoptimize_mutex_);
        reoptimizer_->End();
    }
    reoptimize_cv_.notify_all();
    return ok;
}

bool LiveOpsService::startReoptimize(errors::LiveOpsError* error) {
    if (!reoptimizer_) {
        return errors::Fail(error, errors::ErrorCode::SolverFailure, "No solver configured");
    }
    if (!reoptimizer_->TryBegin()) {
        RecordCommand("REOPTIMIZE rejected: already running");
        return errors::Fail(error, errors::ErrorCode::ReoptimizeInProgress, "A reoptimization is already running");
    }
    if (reoptimize_worker_.joinable()) {
        reoptimize_worker_.join();
    }
    cancel_reoptimize_.store(false);
    {
        std::lock_guard<std::mutex> lock(reoptimize_mutex_);
        reoptimize_status_ = ReoptimizeStatus{};
        reoptimize_status_.running = true;
    }
    reoptimize_worker_ = std::thread([this]() {
        errors::LiveOpsError failure;
        model::Schedule applied;
        const bool ok = RunReoptimize(&applied, &failure);
        {
            std::lock_guard<std::mutex> lock(reoptimize_mutex_);
            reoptimize_status_.running = false;
            reoptimize_status_.finished = true;
            reoptimize_status_.succeeded = ok;
            reoptimize_status_.error = failure;
            reoptimize_status_.assignments = ok ? static_cast<int>(applied.assignments.size()) : 0;
            reoptimize_status_.finishedAt = util::FormatUtcTimestamp(std::time(nullptr));
            reoptimizer_->End();
        }
        reoptimize_cv_.notify_all();
    });
    return true;
}

void LiveOpsService::cancelReoptimize() {
    cancel_reoptimize_.store(true);
}

bool LiveOpsService::waitForReoptimize(int timeoutMs) {
    if (!reoptimizer_) {
        return true;
    }
    std::unique_lock<std::mutex> lock(reoptimize_mutex_);
    auto done = [this]() { return !reoptimize_status_.running && !reoptimizer_->InFlight(); };
    if (timeoutMs < 0) {
        reoptimize_cv_.wait(lock, done);
        return true;
    }
    return reoptimize_cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs), done);
}

ReoptimizeStatus LiveOpsService::reoptimizeStatus() const {
    std::lock_guard<std::mutex> lock(reoptimize_mutex_);
    return reoptimize_status_;
}

bool LiveOpsService::RunReoptimize(model::Schedule* applied, errors::LiveOpsError* error) {
    const auto config = getConfigSnapshot();
    solver::SolveRequest request;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        request = impact::BuildReoptimizeRequest(state_, config.solver.time_limit_seconds);
    }
    RecordCommand("REOPTIMIZE started: " + std::to_string(request.previous_assignments.size()) + " locked, horizon " +
                  std::to_string(request.config.freeze_horizon_slots));

    // The solver runs without the state lock; commands issued meanwhile are honoured at apply time.
    solver::SolveResult result;
    errors::LiveOpsError failure;
    if (!reoptimizer_->Solve(request, &cancel_reoptimize_, &result, &failure)) {
        RecordCommand("REOPTIMIZE FAILED: " + failure.Describe());
        if (error) {
            *error = failure;
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    const std::set<std::string> frozen = impact::FrozenMatches(state_);
    std::vector<std::string> unstashed;
    for (const auto& [match_id, match_state] : state_.match_states) {
        if (match_state.original && frozen.count(match_id) == 0) {
            unstashed.push_back(match_id);
        }
    }
    model::Schedule schedule;
    if (!impact::ApplySolveResult(state_, result, &schedule, &failure)) {
        RecordCommand("REOPTIMIZE FAILED: " + failure.Describe());
        if (error) {
            *error = failure;
        }
        return false;
    }
    RecordCommand("REOPTIMIZE applied: " + schedule.status + ", " + std::to_string(schedule.assignments.size()) +
                  " assignments, " + std::to_string(schedule.unscheduled_matches.size()) + " unscheduled");
    Mirror(unstashed);
    if (applied) {
        *applied = std::move(schedule);
    }
    return true;
}

int LiveOpsService::currentSlot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return CurrentSlotLocked();
}

conflicts::VerdictMap LiveOpsService::evaluateConflicts(std::optional<int> slot) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return conflicts::EvaluateConflicts(state_, slot.value_or(CurrentSlotLocked()), EvaluatorOptionsLocked());
}

std::vector<conflicts::CourtFillSuggestion> LiveOpsService::suggestCourtFills(std::optional<int> slot) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const int current = slot.value_or(CurrentSlotLocked());
    const auto verdicts = conflicts::EvaluateConflicts(state_, current, EvaluatorOptionsLocked());
    return suggestions_.Suggest(state_, verdicts, current);
}

std::vector<model::Assignment> LiveOpsService::overrunMatches() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return impact::OverrunMatches(state_);
}

std::vector<model::Assignment> LiveOpsService::impactedMatches() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return impact::ImpactedMatches(state_);
}

std::optional<impact::ImpactAnalysis> LiveOpsService::analyzeImpact(const std::string& matchId,
                                                                    std::optional<int> projectedEndSlot) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return impact::AnalyzeImpact(state_, matchId, projectedEndSlot);
}

stats::ProgressSummary LiveOpsService::progress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats::SummarizeProgress(state_);
}

std::string LiveOpsService::getLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

int LiveOpsService::CurrentSlotLocked() const {
    const int override_slot = getConfigSnapshot().live.current_slot_override;
    if (override_slot >= 0) {
        return override_slot;
    }
    return util::CurrentSlot(state_.config, now_ ? now_() : std::time(nullptr));
}

conflicts::EvaluatorOptions LiveOpsService::EvaluatorOptionsLocked() const {
    conflicts::EvaluatorOptions options;
    options.block_on_called = getConfigSnapshot().live.block_on_called;
    return options;
}

bool LiveOpsService::PatchLocked(const std::string& matchId,
                                 const model::MatchStatePatch& patch,
                                 const std::string& logLine,
                                 errors::LiveOpsError* error) {
    if (!lifecycle_.Patch(state_, matchId, patch, nullptr, error)) {
        return false;
    }
    RecordCommand(logLine);
    Mirror({matchId});
    return true;
}

void LiveOpsService::Mirror(const std::vector<std::string>& matchIds) {
    if (!sync_queue_) {
        return;
    }
    for (const auto& id : matchIds) {
        const auto* match_state = state_.FindState(id);
        if (match_state) {
            sync_queue_->Enqueue(*match_state);
        }
    }
}

void LiveOpsService::RecordCommand(const std::string& line) {
    AppendLogLine(line);
    const auto path = getConfigSnapshot().output.progress_log;
    if (path.empty()) {
        return;
    }
    std::ofstream log_out(path, std::ios::binary | std::ios::app);
    if (log_out) {
        log_out << line << "\n";
    } else {
        std::cerr << "[courtops] Failed to append to " << path << '\n';
    }
}

void LiveOpsService::AppendLogLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);
}

}  // namespace courtops::core::api
