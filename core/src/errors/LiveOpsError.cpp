#include "courtops/core/errors/LiveOpsError.h"

#include <sstream>

namespace courtops::core::errors {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::UnknownMatch:
            return "unknown_match";
        case ErrorCode::UnknownPlayer:
            return "unknown_player";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::InvalidTransition:
            return "invalid_transition";
        case ErrorCode::TargetOccupied:
            return "target_occupied";
        case ErrorCode::ReoptimizeInProgress:
            return "reoptimize_in_progress";
        case ErrorCode::SolverFailure:
            return "solver_failure";
        case ErrorCode::SolverInfeasible:
            return "solver_infeasible";
        case ErrorCode::SyncFailure:
            return "sync_failure";
        case ErrorCode::IoFailure:
            return "io_failure";
    }
    return "none";
}

std::string LiveOpsError::Describe() const {
    std::ostringstream out;
    out << ToString(code) << ": " << message;
    for (const auto& reason : reasons) {
        out << "\n  - " << reason;
    }
    return out.str();
}

bool Fail(LiveOpsError* error, ErrorCode code, std::string message, std::vector<std::string> reasons) {
    if (error) {
        error->code = code;
        error->message = std::move(message);
        error->reasons = std::move(reasons);
    }
    return false;
}

}  // namespace courtops::core::errors
