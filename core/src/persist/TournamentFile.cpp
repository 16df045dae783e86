#include "courtops/core/persist/TournamentFile.h"

#include "courtops/core/persist/ModelJson.h"
#include "courtops/core/util/AtomicFileWriter.h"
#include "courtops/core/util/TimeSlots.h"

#include <nlohmann/json.hpp>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace courtops::core::persist {

namespace {

bool ReadFile(const std::string& path, std::string& contents, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open file: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    contents = buffer.str();
    return true;
}

bool WriteFile(const std::string& path, const std::string& contents, bool keep_backup, std::string* error) {
    if (!util::AtomicFileWriter::Write(path, contents, keep_backup)) {
        if (error) {
            *error = "Failed to write file: " + path;
        }
        return false;
    }
    return true;
}

}  // namespace

std::string ToExportJson(const model::TournamentState& state, const std::string& exported_at) {
    nlohmann::json root;
    root["version"] = kTournamentFileVersion;
    root["exportedAt"] = exported_at;
    root["config"] = WriteConfig(state.config);
    root["players"] = nlohmann::json::array();
    for (const auto& player : state.players) {
        root["players"].push_back(WritePlayer(player));
    }
    root["matches"] = nlohmann::json::array();
    for (const auto& match : state.matches) {
        root["matches"].push_back(WriteMatch(match));
    }
    root["schedule"] = WriteSchedule(state.schedule);
    root["matchStates"] = WriteMatchStates(state.match_states);
    return root.dump(2);
}

bool ParseExportJson(const std::string& text, model::TournamentState& state, std::string* error) {
    try {
        const auto root = nlohmann::json::parse(text);
        const std::string version = root.value("version", "");
        if (version != kTournamentFileVersion) {
            if (error) {
                *error = "Unsupported tournament file version: '" + version + "'";
            }
            return false;
        }
        model::TournamentState loaded;
        if (root.contains("config")) {
            loaded.config = ParseConfig(root.at("config"));
        }
        if (root.contains("players")) {
            for (const auto& item : root.at("players")) {
                loaded.players.push_back(ParsePlayer(item));
            }
        }
        if (root.contains("matches")) {
            for (const auto& item : root.at("matches")) {
                loaded.matches.push_back(ParseMatch(item));
            }
        }
        if (root.contains("schedule") && root.at("schedule").is_object()) {
            loaded.schedule = ParseSchedule(root.at("schedule"));
        }
        if (root.contains("matchStates")) {
            loaded.match_states = ParseMatchStates(root.at("matchStates"));
        }
        state = std::move(loaded);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse tournament file: ") + ex.what();
        }
        return false;
    }
    return true;
}

bool SaveTournament(const std::string& path, const model::TournamentState& state, std::string* error) {
    return WriteFile(path, ToExportJson(state, util::FormatUtcTimestamp(std::time(nullptr))), false, error);
}

bool LoadTournament(const std::string& path, model::TournamentState& state, std::string* error) {
    std::string contents;
    if (!ReadFile(path, contents, error)) {
        return false;
    }
    return ParseExportJson(contents, state, error);
}

bool SaveMatchStateFile(const std::string& path, const MatchStateFile& file, std::string* error) {
    nlohmann::json root;
    root["matchStates"] = WriteMatchStates(file.match_states);
    root["lastUpdated"] = file.last_updated.empty() ? util::FormatUtcTimestamp(std::time(nullptr)) : file.last_updated;
    root["version"] = file.version;
    return WriteFile(path, root.dump(2), true, error);
}

bool LoadMatchStateFile(const std::string& path, MatchStateFile& file, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        file = MatchStateFile{};
        return true;
    }
    std::string contents;
    if (!ReadFile(path, contents, error)) {
        return false;
    }
    try {
        const auto root = nlohmann::json::parse(contents);
        MatchStateFile loaded;
        if (root.contains("matchStates")) {
            loaded.match_states = ParseMatchStates(root.at("matchStates"));
        }
        loaded.last_updated = root.value("lastUpdated", "");
        loaded.version = root.value("version", loaded.version);
        file = std::move(loaded);
    } catch (const std::exception& ex) {
        if (error) {
            *error = "Match state file is corrupted (restore from " + util::AtomicFileWriter::BackupPathFor(path) +
                     "): " + ex.what();
        }
        return false;
    }
    return true;
}

void MergeMatchStates(std::map<std::string, model::MatchState>& into,
                      const std::map<std::string, model::MatchState>& imported) {
    for (const auto& [match_id, state] : imported) {
        into[match_id] = state;
    }
}

}  // namespace courtops::core::persist
