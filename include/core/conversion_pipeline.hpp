#pragma once

#include "chunk/chunk_splitter.hpp"
#include "config/config_loader.hpp"
#include "core/warning.hpp"
#include "load/chunk_executor.hpp"
#include "load/load_orchestrator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mysql2pg {

struct DdlStageReport {
    bool ran = false;
    bool success = false;
    std::string error_message;
    std::string output_file;
    size_t tables = 0;
    size_t sequences = 0;
    size_t indexes = 0;
    size_t foreign_keys = 0;
    WarningList warnings;
};

struct DataStageReport {
    bool ran = false;
    bool success = false;
    std::string error_message;
    std::vector<ChunkFile> chunks;
    uint64_t statements = 0;
    uint64_t bytes = 0;
    uint64_t skipped_statements = 0;
    uint64_t skipped_replace = 0;
    uint64_t dropped_upserts = 0;
    WarningList warnings;
};

/**
 * @brief Outcome of one converter run
 */
struct PipelineReport {
    DdlStageReport ddl;
    DataStageReport data;
    std::optional<LoadSummary> load;        // set only when the load stage ran

    [[nodiscard]] bool success() const {
        if (ddl.ran && !ddl.success) return false;
        if (data.ran && !data.success) return false;
        if (load && !load->all_succeeded()) return false;
        return true;
    }
};

/**
 * @brief Runs DDL conversion, chunk splitting and the parallel load
 *
 * The DDL and data stages read the dump independently; a failure in one
 * does not stop the other. The load stage runs only after a successful data
 * stage. Without an injected executor the load stage connects through
 * libpq with the configured connection string.
 */
class ConversionPipeline {
public:
    explicit ConversionPipeline(ConverterConfig config, IChunkExecutor* executor = nullptr);

    [[nodiscard]] PipelineReport run();

    [[nodiscard]] const ConverterConfig& config() const { return config_; }

private:
    void run_ddl_stage(DdlStageReport& report);
    void run_data_stage(DataStageReport& report);
    LoadSummary run_load_stage(const std::vector<ChunkFile>& chunks);

    ConverterConfig config_;
    IChunkExecutor* executor_;
};

} // namespace mysql2pg
