#pragma once

#include <cstdint>
#include <string>

namespace mysql2pg {

/**
 * @brief What a load worker needs to run one unit
 */
struct ChunkRef {
    uint32_t sequence = 0;
    std::string path;
};

struct ExecutionOutcome {
    bool success = false;
    std::string error_message;

    static ExecutionOutcome ok() { return {true, {}}; }
    static ExecutionOutcome failure(std::string message) { return {false, std::move(message)}; }
};

/**
 * @brief Runs one chunk against the target database
 *
 * Called concurrently from several workers; implementations must not share
 * per-call state (one connection per call).
 */
class IChunkExecutor {
public:
    virtual ~IChunkExecutor() = default;

    [[nodiscard]] virtual ExecutionOutcome execute(const ChunkRef& chunk) = 0;
};

} // namespace mysql2pg
