#include "load/load_orchestrator.hpp"
#include "core/utils.hpp"
#include "core/work_queue.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <thread>

namespace mysql2pg {

LoadOrchestrator::LoadOrchestrator(IChunkExecutor& executor, Config config)
    : executor_(executor),
      config_(config) {
    config_.workers = std::max<uint32_t>(config_.workers, 1);
    config_.max_attempts = std::max<uint32_t>(config_.max_attempts, 1);
}

LoadResult LoadOrchestrator::execute_with_retry(const ChunkRef& chunk) {
    LoadResult result;
    result.chunk = chunk;

    while (result.attempts < config_.max_attempts) {
        ++result.attempts;
        ExecutionOutcome outcome;
        try {
            outcome = executor_.execute(chunk);
        } catch (const std::exception& e) {
            outcome = ExecutionOutcome::failure(e.what());
        }

        if (outcome.success) {
            result.success = true;
            result.last_error.clear();
            return result;
        }

        result.last_error = std::move(outcome.error_message);
        utils::log::warn(std::format("Chunk {} attempt {}/{} failed: {}",
            chunk.path, result.attempts, config_.max_attempts, result.last_error));
    }
    return result;
}

LoadSummary LoadOrchestrator::run(const std::vector<ChunkRef>& chunks) {
    LoadSummary summary;
    summary.results.resize(chunks.size());
    if (chunks.empty()) return summary;

    WorkQueue<LoadTask> queue;
    for (size_t i = 0; i < chunks.size(); ++i) {
        (void)queue.push(LoadTask{i, chunks[i]});
    }
    queue.close();

    const auto worker_count = std::min<size_t>(config_.workers, chunks.size());
    utils::log::info(std::format("Loading {} chunks with {} workers (max {} attempts each)",
        chunks.size(), worker_count, config_.max_attempts));

    std::atomic<size_t> finished{0};
    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back([this, &queue, &summary, &finished, total = chunks.size()]() {
                while (auto task = queue.pop()) {
                    // Each slot is written by exactly one worker
                    summary.results[task->slot] = execute_with_retry(task->chunk);
                    const auto& r = summary.results[task->slot];
                    const auto done = finished.fetch_add(1) + 1;
                    if (r.success) {
                        utils::log::info(std::format("[{}/{}] Loaded {} ({} attempt{})",
                            done, total, r.chunk.path, r.attempts, r.attempts == 1 ? "" : "s"));
                    } else {
                        utils::log::error(std::format("[{}/{}] Gave up on {} after {} attempts: {}",
                            done, total, r.chunk.path, r.attempts, r.last_error));
                    }
                }
            });
        }
    }   // jthreads join here

    for (const auto& r : summary.results) {
        if (r.success) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
            summary.permanent_failures.push_back(r);
        }
    }
    return summary;
}

} // namespace mysql2pg
