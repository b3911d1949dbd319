#pragma once

#include "chunk/chunk_sink.hpp"
#include "core/error.hpp"
#include "core/warning.hpp"
#include "dump/statement_source.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mysql2pg {

/**
 * @brief One closed output unit
 *
 * bytes counts statement text plus one newline per statement; sink framing
 * (session header/footer) is not included.
 */
struct ChunkFile {
    uint32_t sequence = 0;          // 1-based
    std::string path;
    uint64_t bytes = 0;
    uint64_t statement_count = 0;
    uint64_t first_index = 0;       // source-order index of the first statement
    uint64_t last_index = 0;
    bool oversized = false;         // a single statement larger than the budget
};

struct SplitSummary {
    std::vector<ChunkFile> chunks;
    uint64_t statements = 0;
    uint64_t bytes = 0;
    WarningList warnings;
};

/**
 * @brief Packs whole statements into size-bounded units
 *
 * A unit is closed as soon as its size reaches the budget, after the
 * statement that crossed it. The next unit is opened by the next statement,
 * so no unit is empty. A statement larger than the budget gets a unit of its
 * own and an OVERSIZED_STATEMENT warning. Statements are never split.
 *
 * An extractor error closes the unit in progress and ends the split with
 * PARSE_ERROR; sink failures end it with IO_ERROR.
 */
class ChunkSplitter {
public:
    static constexpr uint64_t kDefaultBudgetBytes = 200ULL * 1024 * 1024;

    ChunkSplitter(IChunkSink& sink, uint64_t budget_bytes = kDefaultBudgetBytes);

    [[nodiscard]] Result<SplitSummary> split(IStatementSource& source);

    [[nodiscard]] uint64_t budget_bytes() const { return budget_bytes_; }

private:
    void open_unit(SplitSummary& summary, uint64_t first_index);
    void close_unit(SplitSummary& summary);

    IChunkSink& sink_;
    uint64_t budget_bytes_;
    bool unit_open_ = false;
};

} // namespace mysql2pg
