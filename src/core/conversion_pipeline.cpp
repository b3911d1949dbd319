#include "core/conversion_pipeline.hpp"
#include "chunk/chunk_sink.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "dump/statement_extractor.hpp"
#include "load/pg_chunk_executor.hpp"
#include "schema/ddl_emitter.hpp"
#include "schema/ddl_parser.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

namespace mysql2pg {

namespace {

void log_warnings(std::string_view stage, const WarningList& warnings) {
    for (const auto& w : warnings) {
        utils::log::warn(std::format("[{}] {} {}: {}",
            stage, warning_kind_to_string(w.kind), w.construct, w.message));
    }
}

} // anonymous namespace

ConversionPipeline::ConversionPipeline(ConverterConfig config, IChunkExecutor* executor)
    : config_(std::move(config)),
      executor_(executor) {}

PipelineReport ConversionPipeline::run() {
    PipelineReport report;
    utils::Timer timer;

    if (config_.ddl.enabled) {
        run_ddl_stage(report.ddl);
    }

    if (config_.split.enabled) {
        run_data_stage(report.data);
    }

    if (config_.load.enabled) {
        if (report.data.success) {
            report.load = run_load_stage(report.data.chunks);
        } else {
            utils::log::error("Skipping load: data stage did not complete");
        }
    }

    utils::log::info(std::format("Conversion finished in {} ms: {}",
        timer.elapsed_ms().count(), report.success() ? "success" : "FAILED"));
    return report;
}

// ============================================================================
// DDL stage: dump -> SchemaModel -> schema file
// ============================================================================

void ConversionPipeline::run_ddl_stage(DdlStageReport& report) {
    report.ran = true;
    report.output_file = config_.ddl.output_file;

    std::ifstream input(config_.input.dump_file, std::ios::binary);
    if (!input) {
        report.error_message = std::format("Cannot open dump file: {}", config_.input.dump_file);
        utils::log::error(report.error_message);
        return;
    }

    utils::log::info(std::format("Converting schema from {}", config_.input.dump_file));
    auto parsed = DdlParser::parse_dump(input);
    if (parsed.is_error()) {
        report.error_message = parsed.error_message();
        utils::log::error(std::format("Schema conversion failed: {}", report.error_message));
        return;
    }

    const auto& model = parsed.value();
    report.tables = model.tables().size();
    report.sequences = model.sequences().size();
    report.indexes = model.index_count();
    report.foreign_keys = model.foreign_keys().size();
    report.warnings = model.warnings();
    log_warnings("ddl", report.warnings);

    std::ofstream out(config_.ddl.output_file, std::ios::binary | std::ios::trunc);
    if (!out) {
        report.error_message = std::format("Cannot write schema file: {}", config_.ddl.output_file);
        utils::log::error(report.error_message);
        return;
    }
    DdlEmitter::emit(model, out);
    out.flush();
    if (!out) {
        report.error_message = std::format("Write failed for schema file: {}", config_.ddl.output_file);
        utils::log::error(report.error_message);
        return;
    }

    report.success = true;
    utils::log::info(std::format(
        "Schema written to {}: {} tables, {} sequences, {} indexes, {} foreign keys, {} warnings",
        report.output_file, report.tables, report.sequences, report.indexes,
        report.foreign_keys, report.warnings.size()));
}

// ============================================================================
// Data stage: dump -> rewritten INSERTs -> chunk files
// ============================================================================

void ConversionPipeline::run_data_stage(DataStageReport& report) {
    report.ran = true;

    std::ifstream input(config_.input.dump_file, std::ios::binary);
    if (!input) {
        report.error_message = std::format("Cannot open dump file: {}", config_.input.dump_file);
        utils::log::error(report.error_message);
        return;
    }

    std::optional<FileChunkSink> sink;
    try {
        sink.emplace(FileChunkSink::Config{
            config_.split.output_dir, config_.split.prefix, config_.split.session_settings});
    } catch (const std::runtime_error& e) {
        report.error_message = e.what();
        utils::log::error(report.error_message);
        return;
    }

    utils::log::info(std::format("Splitting INSERT data into {} (budget {})",
        config_.split.output_dir, utils::format_bytes(config_.split.chunk_size_bytes())));

    StatementExtractor extractor(input);
    ChunkSplitter splitter(*sink, config_.split.chunk_size_bytes());
    auto result = splitter.split(extractor);

    const auto stats = extractor.stats();
    report.skipped_statements = stats.skipped_statements;
    report.skipped_replace = stats.skipped_replace;
    if (stats.skipped_replace > 0) {
        report.warnings.push_back(Warning{
            WarningKind::DROPPED_CONSTRUCT, "REPLACE",
            std::format("{} REPLACE statements skipped", stats.skipped_replace)});
    }
    report.dropped_upserts = stats.dropped_upserts;
    if (stats.dropped_upserts > 0) {
        report.warnings.push_back(Warning{
            WarningKind::DROPPED_CONSTRUCT, "ON DUPLICATE KEY UPDATE",
            std::format("{} INSERT statements loaded with ON CONFLICT DO NOTHING instead",
                        stats.dropped_upserts)});
    }

    if (result.is_error()) {
        report.error_message = result.error_message();
        log_warnings("data", report.warnings);
        utils::log::error(std::format("Data split failed: {}", result.describe()));
        return;
    }

    auto& summary = result.value();
    report.chunks = std::move(summary.chunks);
    report.statements = summary.statements;
    report.bytes = summary.bytes;
    for (auto& w : summary.warnings) report.warnings.push_back(std::move(w));
    log_warnings("data", report.warnings);

    report.success = true;
    utils::log::info(std::format(
        "Split {} INSERT statements ({}) into {} chunks; {} other statements skipped",
        report.statements, utils::format_bytes(report.bytes), report.chunks.size(),
        report.skipped_statements));
}

// ============================================================================
// Load stage
// ============================================================================

LoadSummary ConversionPipeline::run_load_stage(const std::vector<ChunkFile>& chunks) {
    std::vector<ChunkRef> refs;
    refs.reserve(chunks.size());
    for (const auto& c : chunks) {
        refs.push_back(ChunkRef{c.sequence, c.path});
    }

    const LoadOrchestrator::Config orchestrator_config{
        static_cast<uint32_t>(config_.load.workers),
        static_cast<uint32_t>(config_.load.max_attempts)
    };

    LoadSummary summary;
    if (executor_) {
        LoadOrchestrator orchestrator(*executor_, orchestrator_config);
        summary = orchestrator.run(refs);
    } else {
        PgConnectionFactory factory;
        PgChunkExecutor executor(factory, PgChunkExecutor::Config{
            config_.load.connection_string,
            static_cast<uint32_t>(config_.load.statement_timeout_ms)});
        LoadOrchestrator orchestrator(executor, orchestrator_config);
        summary = orchestrator.run(refs);
    }

    utils::log::info(std::format("Load finished: {} succeeded, {} failed",
        summary.succeeded, summary.failed));
    for (const auto& f : summary.permanent_failures) {
        utils::log::error(std::format("Permanently failed: {} after {} attempts: {}",
            f.chunk.path, f.attempts, f.last_error));
    }
    return summary;
}

} // namespace mysql2pg
