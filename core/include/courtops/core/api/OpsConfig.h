#pragma once

#include <string>
#include <vector>

namespace courtops::core::api {

struct LiveConfig {
    bool block_on_called = true;
    // -1 derives the current slot from the wall clock.
    int current_slot_override = -1;
};

struct SolverConfig {
    std::string cmd;
    std::vector<std::string> args;
    std::string working_dir;
    double time_limit_seconds = 30.0;
    int grace_ms = 5000;
};

struct SyncConfig {
    // "" disables mirroring; "file" mirrors into state_path.
    std::string adapter;
    std::string state_path = "out/tournament_state.json";
    int max_attempts = 3;
    int retry_backoff_ms = 200;
};

struct OutputConfig {
    std::string export_path;
    std::string progress_log;
};

struct OpsConfig {
    std::string tournament_file = "tournament.json";
    LiveConfig live;
    SolverConfig solver;
    SyncConfig sync;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, OpsConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const OpsConfig& config, std::string* error);
    static bool FromJsonString(const std::string& text, OpsConfig& config, std::string* error);
    static std::string ToJsonString(const OpsConfig& config);
};

}  // namespace courtops::core::api
