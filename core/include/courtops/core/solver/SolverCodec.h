#pragma once

#include "courtops/core/solver/ISolver.h"

#include <nlohmann/json.hpp>

#include <string>

namespace courtops::core::solver {

nlohmann::json EncodeRequest(const SolveRequest& request);
bool DecodeRequest(const std::string& text, SolveRequest& out, std::string* error);

nlohmann::json EncodeResult(const SolveResult& result);
bool DecodeResult(const std::string& text, SolveResult& out, std::string* error);

}  // namespace courtops::core::solver
