#include <catch2/catch.hpp>

#include "FakeSyncTarget.h"
#include "TestFixtures.h"

#include "courtops/core/persist/TournamentFile.h"
#include "courtops/core/sync/FileSyncTarget.h"
#include "courtops/core/sync/SyncQueue.h"

using namespace courtops::core;
using courtops::test::FakeSyncTarget;
using courtops::test::LogCollector;
using courtops::test::TempDir;
using model::MatchStatus;

namespace {

model::MatchState StateOf(const std::string& id, MatchStatus status) {
    model::MatchState state;
    state.match_id = id;
    state.status = status;
    return state;
}

sync::SyncOptions FastRetry(int attempts) {
    sync::SyncOptions options;
    options.max_attempts = attempts;
    options.retry_backoff_ms = 1;
    return options;
}

}  // namespace

TEST_CASE("queued states reach the target in order", "[sync]") {
    FakeSyncTarget target;
    LogCollector log;
    sync::SyncQueue queue(target, FastRetry(3), [&log](const std::string& line) { log(line); });
    queue.Start();

    queue.Enqueue(StateOf("M1", MatchStatus::Called));
    queue.Enqueue(StateOf("M2", MatchStatus::Called));
    queue.Enqueue(StateOf("M1", MatchStatus::Started));
    queue.Flush();

    REQUIRE(queue.published() == 3);
    REQUIRE(queue.failed() == 0);
    REQUIRE(target.order() == std::vector<std::string>{"M1", "M2", "M1"});
    REQUIRE(target.received().at("M1").status == MatchStatus::Started);
}

TEST_CASE("transient failures are retried", "[sync]") {
    FakeSyncTarget target(2);
    LogCollector log;
    sync::SyncQueue queue(target, FastRetry(3), [&log](const std::string& line) { log(line); });
    queue.Start();

    queue.Enqueue(StateOf("M1", MatchStatus::Finished));
    queue.Flush();

    REQUIRE(queue.published() == 1);
    REQUIRE(target.attempts() == 3);
    REQUIRE_FALSE(log.Contains("SYNC FAILED"));
}

TEST_CASE("a target that keeps failing is logged and skipped", "[sync]") {
    FakeSyncTarget target(-1);
    LogCollector log;
    sync::SyncQueue queue(target, FastRetry(2), [&log](const std::string& line) { log(line); });
    queue.Start();

    queue.Enqueue(StateOf("M1", MatchStatus::Called));
    queue.Enqueue(StateOf("M2", MatchStatus::Called));
    queue.Flush();

    REQUIRE(queue.published() == 0);
    REQUIRE(queue.failed() == 2);
    REQUIRE(target.attempts() == 4);
    REQUIRE(log.Contains("SYNC FAILED M1: backend unavailable"));
    REQUIRE(log.Contains("SYNC FAILED M2: backend unavailable"));
}

TEST_CASE("stopping drains what is already queued", "[sync]") {
    FakeSyncTarget target;
    sync::SyncQueue queue(target, FastRetry(1), [](const std::string&) {});
    queue.Start();
    for (int i = 0; i < 20; ++i) {
        queue.Enqueue(StateOf("M" + std::to_string(i), MatchStatus::Called));
    }
    queue.Stop();
    REQUIRE(queue.published() == 20);
}

TEST_CASE("the file target upserts into the state file", "[sync]") {
    const auto dir = TempDir("file_sync");
    const auto path = (dir / "tournament_state.json").string();

    sync::FileSyncTarget target;
    std::string error;
    REQUIRE_FALSE(target.PublishMatchState(StateOf("M1", MatchStatus::Called), &error));
    REQUIRE_FALSE(target.Configure(""));
    REQUIRE(target.Configure(path));

    REQUIRE(target.PublishMatchState(StateOf("M1", MatchStatus::Called), &error));
    REQUIRE(target.PublishMatchState(StateOf("M2", MatchStatus::Started), &error));
    REQUIRE(target.PublishMatchState(StateOf("M1", MatchStatus::Started), &error));

    persist::MatchStateFile file;
    REQUIRE(persist::LoadMatchStateFile(path, file, &error));
    REQUIRE(file.match_states.size() == 2);
    REQUIRE(file.match_states.at("M1").status == MatchStatus::Started);
    REQUIRE(file.match_states.at("M2").status == MatchStatus::Started);
    REQUIRE_FALSE(file.last_updated.empty());
}
