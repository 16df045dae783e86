#include "courtops/core/solver/ProcessSolver.h"

#include "courtops/core/process/ChildProcess.h"
#include "courtops/core/solver/SolverCodec.h"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace courtops::core::solver {

namespace {

SolveResult Failed(std::string message) {
    SolveResult result;
    result.status = SolverStatus::Unknown;
    result.error = std::move(message);
    return result;
}

}  // namespace

ProcessSolver::ProcessSolver(ProcessSolverOptions options, LogFn log)
    : options_(std::move(options)), log_(std::move(log)) {}

SolveResult ProcessSolver::Solve(const SolveRequest& request, const std::atomic<bool>* cancel) {
    if (options_.cmd.empty()) {
        return Failed("No solver command configured");
    }

    process::ChildProcess child;
    std::string error;
    if (!child.Start(options_.cmd, options_.args, options_.working_dir, EncodeRequest(request).dump(), &error)) {
        Log("[solver] Failed to start " + options_.cmd + ": " + error);
        return Failed("Failed to start solver: " + error);
    }

    const auto budget = std::chrono::milliseconds(
        static_cast<long long>(request.time_limit_seconds * 1000.0) + std::max(0, options_.grace_ms));
    const auto deadline = std::chrono::steady_clock::now() + budget;
    const int poll_ms = std::max(1, options_.poll_interval_ms);

    bool exited = false;
    bool cancelled = false;
    while (!exited) {
        if (cancel && cancel->load()) {
            cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        exited = child.WaitForExit(poll_ms);
    }

    if (!exited) {
        child.Kill();
        child.WaitForExit(-1);
        if (cancelled) {
            Log("[solver] Cancelled, child killed");
            return Failed("Solver run cancelled");
        }
        Log("[solver] Time limit exceeded, child killed");
        return Failed("Solver timed out after " + std::to_string(budget.count()) + " ms");
    }

    if (child.ExitCode() != 0) {
        Log("[solver] Exit code " + std::to_string(child.ExitCode()));
        return Failed("Solver exited with code " + std::to_string(child.ExitCode()));
    }

    SolveResult result;
    if (!DecodeResult(child.Output(), result, &error)) {
        Log("[solver] " + error);
        return Failed(error);
    }
    Log(std::string("[solver] Status ") + ToString(result.status) + ", " +
        std::to_string(result.assignments.size()) + " assignments");
    return result;
}

void ProcessSolver::Log(const std::string& line) const {
    if (log_) {
        log_(line);
    } else {
        std::cerr << line << '\n';
    }
}

}  // namespace courtops::core::solver
