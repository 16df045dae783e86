#include "courtops/core/sync/SyncQueue.h"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace courtops::core::sync {

SyncQueue::SyncQueue(ISyncTarget& target, SyncOptions options, LogFn log)
    : target_(target), options_(options), log_(std::move(log)) {}

SyncQueue::~SyncQueue() {
    Stop();
}

void SyncQueue::SetFailureHandler(FailureFn on_failure) {
    on_failure_ = std::move(on_failure);
}

void SyncQueue::Start() {
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this]() { Run(); });
}

void SyncQueue::Enqueue(const model::MatchState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(state);
    }
    cv_.notify_all();
}

void SyncQueue::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!worker_.joinable()) {
        return;
    }
    idle_cv_.wait(lock, [this]() { return (pending_.empty() && !busy_) || stop_requested_; });
}

void SyncQueue::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    idle_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SyncQueue::Run() {
    for (;;) {
        model::MatchState next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_requested_ || !pending_.empty(); });
            // Drain what is queued before honouring a stop.
            if (pending_.empty()) {
                break;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
            busy_ = true;
        }

        if (Publish(next)) {
            published_.fetch_add(1);
        } else {
            failed_.fetch_add(1);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

bool SyncQueue::Publish(const model::MatchState& state) {
    const int attempts = std::max(1, options_.max_attempts);
    std::string error;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        error.clear();
        if (target_.PublishMatchState(state, &error)) {
            return true;
        }
        if (attempt < attempts) {
            std::unique_lock<std::mutex> lock(mutex_);
            const auto backoff = std::chrono::milliseconds(options_.retry_backoff_ms * attempt);
            if (cv_.wait_for(lock, backoff, [this]() { return stop_requested_; })) {
                break;
            }
        }
    }
    Log("SYNC FAILED " + state.match_id + ": " + error);
    if (on_failure_) {
        on_failure_(state.match_id, error);
    }
    return false;
}

void SyncQueue::Log(const std::string& line) const {
    if (log_) {
        log_(line);
    } else {
        std::cerr << "[sync] " << line << '\n';
    }
}

}  // namespace courtops::core::sync
