#include <catch2/catch.hpp>

#include "TestFixtures.h"

#include "courtops/core/api/OpsConfig.h"

using namespace courtops::core;
using courtops::test::TempDir;

TEST_CASE("missing keys keep their defaults", "[config]") {
    api::OpsConfig config;
    std::string error;
    REQUIRE(api::OpsConfig::FromJsonString(R"({"solver":{"cmd":"python3","args":["-m","solver"]}})", config, &error));

    REQUIRE(config.solver.cmd == "python3");
    REQUIRE(config.solver.args == std::vector<std::string>{"-m", "solver"});
    REQUIRE(config.solver.time_limit_seconds == 30.0);
    REQUIRE(config.solver.grace_ms == 5000);
    REQUIRE(config.tournament_file == "tournament.json");
    REQUIRE(config.live.block_on_called);
    REQUIRE(config.live.current_slot_override == -1);
    REQUIRE(config.sync.adapter.empty());
    REQUIRE(config.sync.state_path == "out/tournament_state.json");
    REQUIRE(config.sync.max_attempts == 3);
}

TEST_CASE("malformed config is rejected and leaves the target alone", "[config]") {
    api::OpsConfig config;
    config.tournament_file = "keep.json";
    std::string error;
    REQUIRE_FALSE(api::OpsConfig::FromJsonString("{\"live\": ", config, &error));
    REQUIRE(error.find("Failed to parse JSON") != std::string::npos);
    REQUIRE(config.tournament_file == "keep.json");

    REQUIRE_FALSE(api::OpsConfig::LoadFromFile("/nonexistent/courtops.json", config, &error));
    REQUIRE(error.find("Failed to open config") != std::string::npos);
}

TEST_CASE("config survives a save and load", "[config]") {
    api::OpsConfig config;
    config.tournament_file = "day2.json";
    config.live.block_on_called = false;
    config.live.current_slot_override = 7;
    config.solver.cmd = "/usr/bin/solver";
    config.solver.time_limit_seconds = 12.5;
    config.sync.adapter = "file";
    config.sync.retry_backoff_ms = 50;
    config.output.progress_log = "out/ops.log";

    const auto path = (TempDir("ops_config") / "ops.json").string();
    std::string error;
    REQUIRE(api::OpsConfig::SaveToFile(path, config, &error));

    api::OpsConfig loaded;
    REQUIRE(api::OpsConfig::LoadFromFile(path, loaded, &error));
    REQUIRE(api::OpsConfig::ToJsonString(loaded) == api::OpsConfig::ToJsonString(config));
    REQUIRE(loaded.live.current_slot_override == 7);
    REQUIRE_FALSE(loaded.live.block_on_called);
}
