#pragma once

#include "load/chunk_executor.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mysql2pg {

struct LoadTask {
    size_t slot = 0;            // position in the input list
    ChunkRef chunk;
};

struct LoadResult {
    ChunkRef chunk;
    bool success = false;
    uint32_t attempts = 0;
    std::string last_error;
};

struct LoadSummary {
    std::vector<LoadResult> results;        // input order
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<LoadResult> permanent_failures;

    [[nodiscard]] bool all_succeeded() const { return failed == 0; }
};

/**
 * @brief Loads chunks concurrently with bounded retry
 *
 * A fixed pool of workers drains a shared queue of LoadTasks. A worker runs
 * one task at a time; a failed attempt is retried immediately on the same
 * worker until max_attempts is reached, then the task is recorded as
 * permanently failed and the worker moves on. An exception thrown by the
 * executor counts as a failed attempt. run() returns when every task has
 * resolved.
 */
class LoadOrchestrator {
public:
    struct Config {
        uint32_t workers = 4;
        uint32_t max_attempts = 3;
    };

    LoadOrchestrator(IChunkExecutor& executor, Config config);

    [[nodiscard]] LoadSummary run(const std::vector<ChunkRef>& chunks);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    LoadResult execute_with_retry(const ChunkRef& chunk);

    IChunkExecutor& executor_;
    Config config_;
};

} // namespace mysql2pg
