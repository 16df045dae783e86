#pragma once

#include "courtops/core/api/OpsConfig.h"
#include "courtops/core/conflicts/ConflictEvaluator.h"
#include "courtops/core/conflicts/CourtFillSuggester.h"
#include "courtops/core/errors/LiveOpsError.h"
#include "courtops/core/impact/ImpactAnalyzer.h"
#include "courtops/core/impact/Reoptimizer.h"
#include "courtops/core/lifecycle/MatchLifecycle.h"
#include "courtops/core/model/TournamentState.h"
#include "courtops/core/reassign/CascadingReassigner.h"
#include "courtops/core/solver/ISolver.h"
#include "courtops/core/stats/ProgressSummary.h"
#include "courtops/core/sync/ISyncTarget.h"
#include "courtops/core/sync/SyncQueue.h"

#include <atomic>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace courtops::core::api {

enum class TimeField {
    Start,
    End,
};

struct ReoptimizeStatus {
    bool running = false;
    bool finished = false;
    bool succeeded = false;
    errors::LiveOpsError error;
    int assignments = 0;
    std::string finishedAt;
};

class LiveOpsService {
public:
    using TimeSource = std::function<std::time_t()>;

    LiveOpsService();
    ~LiveOpsService();

    LiveOpsService(const LiveOpsService&) = delete;
    LiveOpsService& operator=(const LiveOpsService&) = delete;

    bool loadConfig(const std::string& path);
    void setConfig(const OpsConfig& config);
    OpsConfig getConfigSnapshot() const;

    bool loadTournament(const std::string& path, errors::LiveOpsError* error);
    bool saveTournament(const std::string& path, errors::LiveOpsError* error) const;
    void setState(model::TournamentState state);
    model::TournamentState getStateSnapshot() const;

    // Wall clock used for actual start/end stamps and the current slot.
    void setTimeSource(TimeSource now);
    // Setup call: must not race triggerReoptimize or startReoptimize. Ignored while a run is in flight.
    void setSolver(std::unique_ptr<solver::ISolver> solver);
    // Starts mirroring every match-state change to target on a worker thread.
    // May be called while commands run; the swap is serialized with them.
    void setSyncTarget(std::unique_ptr<sync::ISyncTarget> target);
    // Commands wait while the queue drains.
    void flushSync();
    // Most recent state the sync worker gave up on; code None when every publish succeeded.
    errors::LiveOpsError lastSyncError() const;

    bool transition(const std::string& matchId,
                    model::MatchStatus next,
                    const model::MatchStatePatch& patch,
                    model::MatchState* out,
                    errors::LiveOpsError* error);
    bool undoStatus(const std::string& matchId, model::MatchState* out, errors::LiveOpsError* error);

    bool setDelayed(const std::string& matchId, bool delayed, const std::string& reason, errors::LiveOpsError* error);
    bool setPinned(const std::string& matchId, bool pinned, errors::LiveOpsError* error);
    bool setPostponed(const std::string& matchId, bool postponed, errors::LiveOpsError* error);
    bool confirmPlayer(const std::string& matchId,
                       const std::string& playerId,
                       bool confirmed,
                       errors::LiveOpsError* error);
    bool recordScore(const std::string& matchId,
                     int sideA,
                     int sideB,
                     const std::string& setScores,
                     errors::LiveOpsError* error);
    bool updateActualTime(const std::string& matchId,
                          TimeField field,
                          const std::string& clock,
                          errors::LiveOpsError* error);

    bool startOnCourt(const std::string& matchId,
                      int courtId,
                      reassign::StartOnCourtResult* result,
                      errors::LiveOpsError* error);
    bool undoStart(const std::string& matchId, reassign::UndoStartResult* result, errors::LiveOpsError* error);

    bool substitutePlayer(const std::string& matchId,
                          const std::string& oldPlayerId,
                          const std::string& newPlayerId,
                          errors::LiveOpsError* error);
    // Removes the player from every match that has not finished; returns the edited match ids.
    bool withdrawPlayer(const std::string& playerId,
                        std::vector<std::string>* affected,
                        errors::LiveOpsError* error);

    void skipSuggestion(int courtId);

    // Blocks until the solver answers; other commands keep running meanwhile.
    bool triggerReoptimize(model::Schedule* applied, errors::LiveOpsError* error);
    bool startReoptimize(errors::LiveOpsError* error);
    void cancelReoptimize();
    // Waits for the running reoptimization, synchronous or background, to finish.
    bool waitForReoptimize(int timeoutMs);
    ReoptimizeStatus reoptimizeStatus() const;

    int currentSlot() const;
    conflicts::VerdictMap evaluateConflicts(std::optional<int> slot = std::nullopt) const;
    std::vector<conflicts::CourtFillSuggestion> suggestCourtFills(std::optional<int> slot = std::nullopt);
    std::vector<model::Assignment> overrunMatches() const;
    std::vector<model::Assignment> impactedMatches() const;
    std::optional<impact::ImpactAnalysis> analyzeImpact(const std::string& matchId,
                                                        std::optional<int> projectedEndSlot = std::nullopt) const;
    stats::ProgressSummary progress() const;

    std::string getLastLogLines(int n) const;

private:
    bool RunReoptimize(model::Schedule* applied, errors::LiveOpsError* error);
    int CurrentSlotLocked() const;
    conflicts::EvaluatorOptions EvaluatorOptionsLocked() const;
    bool PatchLocked(const std::string& matchId,
                     const model::MatchStatePatch& patch,
                     const std::string& logLine,
                     errors::LiveOpsError* error);
    void Mirror(const std::vector<std::string>& matchIds);
    void RecordCommand(const std::string& line);
    void AppendLogLine(const std::string& line);

    mutable std::mutex config_mutex_;
    OpsConfig config_{};

    mutable std::mutex state_mutex_;
    model::TournamentState state_{};
    TimeSource now_{};
    lifecycle::MatchLifecycle lifecycle_;
    reassign::CascadingReassigner reassigner_;
    conflicts::SuggestionTracker suggestions_{};

    std::unique_ptr<solver::ISolver> solver_{};
    std::unique_ptr<impact::Reoptimizer> reoptimizer_{};
    std::atomic<bool> cancel_reoptimize_{false};
    std::thread reoptimize_worker_{};
    mutable std::mutex reoptimize_mutex_;
    std::condition_variable reoptimize_cv_{};
    ReoptimizeStatus reoptimize_status_{};

    std::unique_ptr<sync::ISyncTarget> sync_target_{};
    std::unique_ptr<sync::SyncQueue> sync_queue_{};
    mutable std::mutex sync_error_mutex_;
    errors::LiveOpsError last_sync_error_{};

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_{};
    size_t max_log_lines_ = 2000;
};

}  // namespace courtops::core::api
