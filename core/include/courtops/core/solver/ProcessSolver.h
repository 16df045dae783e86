#pragma once

#include "courtops/core/solver/ISolver.h"

#include <functional>
#include <string>
#include <vector>

namespace courtops::core::solver {

struct ProcessSolverOptions {
    std::string cmd;
    std::vector<std::string> args;
    std::string working_dir;
    // Extra time granted past the request's own limit before the child is killed.
    int grace_ms = 5000;
    int poll_interval_ms = 50;
};

// Runs an external solver: request JSON on stdin, result JSON on stdout.
class ProcessSolver : public ISolver {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit ProcessSolver(ProcessSolverOptions options, LogFn log = {});

    SolveResult Solve(const SolveRequest& request, const std::atomic<bool>* cancel) override;

private:
    void Log(const std::string& line) const;

    ProcessSolverOptions options_;
    LogFn log_;
};

}  // namespace courtops::core::solver
