#include "chunk/chunk_splitter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace mysql2pg {

ChunkSplitter::ChunkSplitter(IChunkSink& sink, uint64_t budget_bytes)
    : sink_(sink),
      budget_bytes_(std::max<uint64_t>(budget_bytes, 1)) {}

void ChunkSplitter::open_unit(SplitSummary& summary, uint64_t first_index) {
    ChunkFile chunk;
    chunk.sequence = static_cast<uint32_t>(summary.chunks.size() + 1);
    chunk.first_index = first_index;
    chunk.last_index = first_index;
    chunk.path = sink_.open_chunk(chunk.sequence);
    summary.chunks.push_back(std::move(chunk));
    unit_open_ = true;
}

void ChunkSplitter::close_unit(SplitSummary& summary) {
    unit_open_ = false;
    sink_.close_chunk();
    const auto& chunk = summary.chunks.back();
    utils::log::info(std::format("Chunk {} closed: {} ({} statements, {})",
        chunk.sequence, chunk.path, chunk.statement_count, utils::format_bytes(chunk.bytes)));
}

Result<SplitSummary> ChunkSplitter::split(IStatementSource& source) {
    SplitSummary summary;
    unit_open_ = false;

    try {
        for (;;) {
            auto step = source.next();
            if (step.status == StepStatus::END_OF_INPUT) break;

            if (step.status == StepStatus::PARSE_ERROR) {
                if (unit_open_) close_unit(summary);
                return Result<SplitSummary>::error(ErrorCategory::PARSE_ERROR,
                                                   std::move(step.error_message));
            }

            const auto& stmt = step.statement;
            const uint64_t size = stmt.text.size() + 1;
            const bool oversized = size > budget_bytes_;

            if (oversized) {
                if (unit_open_) close_unit(summary);
                auto message = std::format("Statement of {} exceeds the chunk budget of {}",
                    utils::format_bytes(size), utils::format_bytes(budget_bytes_));
                utils::log::warn(std::format("INSERT #{} (line {}): {}",
                    stmt.index, stmt.line, message));
                summary.warnings.push_back(Warning{
                    WarningKind::OVERSIZED_STATEMENT,
                    std::format("statement #{} (line {})", stmt.index, stmt.line),
                    std::move(message)
                });
            }

            if (!unit_open_) open_unit(summary, stmt.index);
            auto& chunk = summary.chunks.back();

            if (!sink_.append(stmt.text) || !sink_.append("\n")) {
                unit_open_ = false;
                return Result<SplitSummary>::error(ErrorCategory::IO_ERROR,
                    std::format("Failed writing INSERT #{} to chunk {}", stmt.index, chunk.path));
            }

            chunk.bytes += size;
            ++chunk.statement_count;
            chunk.last_index = stmt.index;
            chunk.oversized = chunk.oversized || oversized;
            ++summary.statements;
            summary.bytes += size;

            if (chunk.bytes >= budget_bytes_) close_unit(summary);
        }

        if (unit_open_) close_unit(summary);
    } catch (const std::runtime_error& e) {
        unit_open_ = false;
        return Result<SplitSummary>::error(ErrorCategory::IO_ERROR, e.what());
    }

    return Result<SplitSummary>::ok(std::move(summary));
}

} // namespace mysql2pg
