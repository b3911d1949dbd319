#include "load/pg_chunk_executor.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace mysql2pg {

PgChunkExecutor::PgChunkExecutor(IConnectionFactory& factory, Config config)
    : factory_(factory),
      config_(std::move(config)) {}

ExecutionOutcome PgChunkExecutor::execute(const ChunkRef& chunk) {
    std::ifstream file(chunk.path, std::ios::binary);
    if (!file.is_open()) {
        return ExecutionOutcome::failure("Cannot open chunk file: " + chunk.path);
    }
    std::ostringstream script;
    script << file.rdbuf();
    if (file.bad()) {
        return ExecutionOutcome::failure("Failed reading chunk file: " + chunk.path);
    }

    auto conn_result = factory_.create(config_.connection_string);
    if (conn_result.is_error()) {
        return ExecutionOutcome::failure(conn_result.error_message());
    }
    auto conn = std::move(conn_result.value());

    if (config_.statement_timeout_ms > 0 && !conn->set_query_timeout(config_.statement_timeout_ms)) {
        return ExecutionOutcome::failure(std::format(
            "Failed to set statement_timeout = {}", config_.statement_timeout_ms));
    }

    const auto timer = utils::Timer();
    const auto result = conn->execute_script(script.str());
    conn->close();

    if (!result.success) {
        return ExecutionOutcome::failure(result.error_message);
    }
    utils::log::debug(std::format("Chunk {}: {} statements, {} rows in {} ms",
        chunk.path, result.statements, result.affected_rows, timer.elapsed_ms().count()));
    return ExecutionOutcome::ok();
}

} // namespace mysql2pg
