#pragma once

#include "courtops/core/model/MatchState.h"

#include <string>

namespace courtops::core::sync {

class ISyncTarget {
public:
    virtual ~ISyncTarget() = default;
    virtual bool Configure(const std::string& location) = 0;
    virtual bool PublishMatchState(const model::MatchState& state, std::string* error) = 0;
};

}  // namespace courtops::core::sync
