#pragma once

#include "courtops/core/model/MatchState.h"
#include "courtops/core/sync/ISyncTarget.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace courtops::core::sync {

struct SyncOptions {
    int max_attempts = 3;
    int retry_backoff_ms = 200;
};

// Outbound match-state mirror. Enqueue never blocks on the target; retries and
// failures stay on the worker thread.
class SyncQueue {
public:
    using LogFn = std::function<void(const std::string&)>;
    using FailureFn = std::function<void(const std::string& match_id, const std::string& error)>;

    SyncQueue(ISyncTarget& target, SyncOptions options, LogFn log = {});
    ~SyncQueue();

    SyncQueue(const SyncQueue&) = delete;
    SyncQueue& operator=(const SyncQueue&) = delete;

    // Called on the worker thread once a state is given up on. Set before Start().
    void SetFailureHandler(FailureFn on_failure);
    void Start();
    void Enqueue(const model::MatchState& state);
    // Blocks until everything queued so far has been published or given up on.
    void Flush();
    void Stop();

    int published() const { return published_.load(); }
    int failed() const { return failed_.load(); }

private:
    void Run();
    bool Publish(const model::MatchState& state);
    void Log(const std::string& line) const;

    ISyncTarget& target_;
    SyncOptions options_;
    LogFn log_;
    FailureFn on_failure_{};

    std::thread worker_{};
    std::mutex mutex_{};
    std::condition_variable cv_{};
    std::condition_variable idle_cv_{};
    std::deque<model::MatchState> pending_{};
    bool busy_ = false;
    bool stop_requested_ = false;

    std::atomic<int> published_{0};
    std::atomic<int> failed_{0};
};

}  // namespace courtops::core::sync
