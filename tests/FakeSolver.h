#pragma once

#include "courtops/core/solver/ISolver.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace courtops::test {

// Replies with a canned result and remembers the last request.
class FakeSolver : public core::solver::ISolver {
public:
    explicit FakeSolver(core::solver::SolveResult reply) : reply_(std::move(reply)) {}

    core::solver::SolveResult Solve(const core::solver::SolveRequest& request,
                                    const std::atomic<bool>* cancel) override {
        last_request = request;
        ++calls;
        if (during_solve) {
            during_solve();
        }
        while (hold.load()) {
            if (cancel && cancel->load()) {
                core::solver::SolveResult cancelled;
                cancelled.error = "Solver run cancelled";
                return cancelled;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return reply_;
    }

    core::solver::SolveRequest last_request{};
    std::atomic<int> calls{0};
    // While true, Solve blocks until cancelled or released.
    std::atomic<bool> hold{false};
    std::function<void()> during_solve{};

private:
    core::solver::SolveResult reply_;
};

inline core::model::Assignment Placed(const std::string& id, int court, int slot, int duration = 1) {
    core::model::Assignment assignment;
    assignment.match_id = id;
    assignment.court_id = court;
    assignment.slot_id = slot;
    assignment.duration_slots = duration;
    return assignment;
}

}  // namespace courtops::test
