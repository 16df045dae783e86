#include "courtops/core/api/OpsConfig.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace courtops::core::api {

namespace {

bool LoadJson(const std::string& path, std::string& text, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    text = buffer.str();
    return true;
}

void ParseRoot(const nlohmann::json& root, OpsConfig& config) {
    config.tournament_file = root.value("tournament_file", config.tournament_file);

    if (root.contains("live")) {
        const auto& live = root.at("live");
        config.live.block_on_called = live.value("block_on_called", config.live.block_on_called);
        config.live.current_slot_override = live.value("current_slot_override", config.live.current_slot_override);
    }

    if (root.contains("solver")) {
        const auto& solver = root.at("solver");
        config.solver.cmd = solver.value("cmd", config.solver.cmd);
        if (solver.contains("args")) {
            for (const auto& arg : solver.at("args")) {
                config.solver.args.push_back(arg.get<std::string>());
            }
        }
        config.solver.working_dir = solver.value("working_dir", config.solver.working_dir);
        config.solver.time_limit_seconds = solver.value("time_limit_seconds", config.solver.time_limit_seconds);
        config.solver.grace_ms = solver.value("grace_ms", config.solver.grace_ms);
    }

    if (root.contains("sync")) {
        const auto& sync = root.at("sync");
        config.sync.adapter = sync.value("adapter", config.sync.adapter);
        config.sync.state_path = sync.value("state_path", config.sync.state_path);
        config.sync.max_attempts = sync.value("max_attempts", config.sync.max_attempts);
        config.sync.retry_backoff_ms = sync.value("retry_backoff_ms", config.sync.retry_backoff_ms);
    }

    if (root.contains("output")) {
        const auto& output = root.at("output");
        config.output.export_path = output.value("export_path", config.output.export_path);
        config.output.progress_log = output.value("progress_log", config.output.progress_log);
    }
}

nlohmann::json WriteRoot(const OpsConfig& config) {
    nlohmann::json root;
    root["tournament_file"] = config.tournament_file;
    root["live"] = {
        {"block_on_called", config.live.block_on_called},
        {"current_slot_override", config.live.current_slot_override},
    };
    root["solver"] = {
        {"cmd", config.solver.cmd},
        {"args", config.solver.args},
        {"working_dir", config.solver.working_dir},
        {"time_limit_seconds", config.solver.time_limit_seconds},
        {"grace_ms", config.solver.grace_ms},
    };
    root["sync"] = {
        {"adapter", config.sync.adapter},
        {"state_path", config.sync.state_path},
        {"max_attempts", config.sync.max_attempts},
        {"retry_backoff_ms", config.sync.retry_backoff_ms},
    };
    root["output"] = {
        {"export_path", config.output.export_path},
        {"progress_log", config.output.progress_log},
    };
    return root;
}

}  // namespace

bool OpsConfig::FromJsonString(const std::string& text, OpsConfig& config, std::string* error) {
    OpsConfig parsed;
    try {
        ParseRoot(nlohmann::json::parse(text), parsed);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    config = std::move(parsed);
    return true;
}

bool OpsConfig::LoadFromFile(const std::string& path, OpsConfig& config, std::string* error) {
    std::string text;
    if (!LoadJson(path, text, error)) {
        return false;
    }
    return FromJsonString(text, config, error);
}

bool OpsConfig::SaveToFile(const std::string& path, const OpsConfig& config, std::string* error) {
    const std::filesystem::path fs_path(path);
    std::error_code ec;
    if (!fs_path.parent_path().empty()) {
        std::filesystem::create_directories(fs_path.parent_path(), ec);
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        if (error) {
            *error = "Failed to write config: " + path;
        }
        return false;
    }

    output << ToJsonString(config);
    return true;
}

std::string OpsConfig::ToJsonString(const OpsConfig& config) {
    return WriteRoot(config).dump(2);
}

}  // namespace courtops::core::api
