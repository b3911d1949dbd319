#pragma once

#include "db/iconnection_factory.hpp"
#include "load/chunk_executor.hpp"

#include <cstdint>
#include <string>

namespace mysql2pg {

/**
 * @brief Runs a chunk file through a fresh database connection
 *
 * Every call opens its own connection, so concurrent workers never share
 * one. The file is sent as a single script: its statements commit or roll
 * back together, which makes a retried attempt safe.
 */
class PgChunkExecutor : public IChunkExecutor {
public:
    struct Config {
        std::string connection_string;
        uint32_t statement_timeout_ms = 0;      // 0 = server default
    };

    PgChunkExecutor(IConnectionFactory& factory, Config config);

    [[nodiscard]] ExecutionOutcome execute(const ChunkRef& chunk) override;

private:
    IConnectionFactory& factory_;
    Config config_;
};

} // namespace mysql2pg
