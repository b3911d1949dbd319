#include <catch2/catch_test_macros.hpp>
#include "load/load_orchestrator.hpp"
#include "mocks/mock_chunk_executor.hpp"

#include <chrono>
#include <thread>

using namespace mysql2pg;
using namespace mysql2pg::testing;

namespace {

std::vector<ChunkRef> make_chunks(uint32_t n) {
    std::vector<ChunkRef> chunks;
    for (uint32_t i = 1; i <= n; ++i) {
        chunks.push_back(ChunkRef{i, std::format("chunk_{:03d}.sql", i)});
    }
    return chunks;
}

} // anonymous namespace

TEST_CASE("LoadOrchestrator: all chunks succeed", "[load]") {
    MockChunkExecutor executor;
    LoadOrchestrator orchestrator(executor, {4, 3});

    const auto chunks = make_chunks(10);
    const auto summary = orchestrator.run(chunks);

    CHECK(summary.all_succeeded());
    CHECK(summary.succeeded == 10);
    CHECK(summary.failed == 0);
    CHECK(summary.permanent_failures.empty());
    REQUIRE(summary.results.size() == 10);
    for (size_t i = 0; i < chunks.size(); ++i) {
        CHECK(summary.results[i].chunk.path == chunks[i].path);
        CHECK(summary.results[i].attempts == 1);
    }
    CHECK(executor.total_calls() == 10);
}

TEST_CASE("LoadOrchestrator: transient failure retried", "[load]") {
    MockChunkExecutor executor;
    executor.fail_times("chunk_002.sql", 2);
    LoadOrchestrator orchestrator(executor, {2, 3});

    const auto summary = orchestrator.run(make_chunks(3));

    CHECK(summary.all_succeeded());
    CHECK(summary.results[1].success);
    CHECK(summary.results[1].attempts == 3);
    CHECK(summary.results[1].last_error.empty());
    CHECK(executor.attempts("chunk_002.sql") == 3);
}

TEST_CASE("LoadOrchestrator: permanent failure after exactly max attempts", "[load]") {
    MockChunkExecutor executor;
    executor.fail_times("chunk_001.sql", -1);
    LoadOrchestrator orchestrator(executor, {3, 4});

    const auto summary = orchestrator.run(make_chunks(5));

    CHECK_FALSE(summary.all_succeeded());
    CHECK(summary.succeeded == 4);
    CHECK(summary.failed == 1);
    REQUIRE(summary.permanent_failures.size() == 1);
    const auto& failure = summary.permanent_failures[0];
    CHECK(failure.chunk.path == "chunk_001.sql");
    CHECK(failure.attempts == 4);
    CHECK(failure.last_error == "Mock failure 4 on chunk_001.sql");
    CHECK(executor.attempts("chunk_001.sql") == 4);
}

TEST_CASE("LoadOrchestrator: executor exception counts as failed attempt", "[load]") {
    MockChunkExecutor executor;
    executor.throw_on("chunk_002.sql");
    LoadOrchestrator orchestrator(executor, {2, 2});

    const auto summary = orchestrator.run(make_chunks(2));

    CHECK(summary.succeeded == 1);
    REQUIRE(summary.permanent_failures.size() == 1);
    CHECK(summary.permanent_failures[0].attempts == 2);
    CHECK(summary.permanent_failures[0].last_error == "connection reset");
}

TEST_CASE("LoadOrchestrator: concurrency bounded by worker count", "[load]") {
    MockChunkExecutor executor;
    executor.set_on_execute([](const ChunkRef&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    });
    LoadOrchestrator orchestrator(executor, {3, 1});

    const auto summary = orchestrator.run(make_chunks(12));
    CHECK(summary.all_succeeded());
    CHECK(executor.max_in_flight() <= 3);
    CHECK(executor.max_in_flight() >= 1);
}

TEST_CASE("LoadOrchestrator: empty input", "[load]") {
    MockChunkExecutor executor;
    LoadOrchestrator orchestrator(executor, {4, 3});
    const auto summary = orchestrator.run({});
    CHECK(summary.results.empty());
    CHECK(summary.all_succeeded());
    CHECK(executor.total_calls() == 0);
}

TEST_CASE("LoadOrchestrator: zero settings clamped to one", "[load]") {
    MockChunkExecutor executor;
    LoadOrchestrator orchestrator(executor, {0, 0});
    CHECK(orchestrator.config().workers == 1);
    CHECK(orchestrator.config().max_attempts == 1);

    executor.fail_times("chunk_001.sql", -1);
    const auto summary = orchestrator.run(make_chunks(1));
    CHECK(summary.results[0].attempts == 1);
}
