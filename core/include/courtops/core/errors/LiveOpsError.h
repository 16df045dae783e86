#pragma once

#include <string>
#include <vector>

namespace courtops::core::errors {

enum class ErrorCode {
    None,
    UnknownMatch,
    UnknownPlayer,
    InvalidArgument,
    InvalidTransition,
    TargetOccupied,
    ReoptimizeInProgress,
    SolverFailure,
    SolverInfeasible,
    SyncFailure,
    IoFailure,
};

const char* ToString(ErrorCode code);

struct LiveOpsError {
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::vector<std::string> reasons;

    std::string Describe() const;
};

// Fills *error when the caller asked for it; always returns false.
bool Fail(LiveOpsError* error, ErrorCode code, std::string message,
          std::vector<std::string> reasons = {});

}  // namespace courtops::core::errors
