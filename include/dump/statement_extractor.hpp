#pragma once

#include "dump/statement_scanner.hpp"
#include "dump/statement_source.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace mysql2pg {

/**
 * @brief Raw INSERT statement span before rewriting
 */
struct RawInsertUnit {
    std::string_view text;
    uint64_t index = 0;
    uint64_t line = 0;
};

/**
 * @brief Streams rewritten INSERT statements out of a MySQL dump
 *
 * Non-INSERT statements are skipped (the DDL pipeline reads them from its
 * own pass). Each INSERT is rewritten for PostgreSQL: identifiers, string
 * escapes, \N, bit and hex literals. INSERT IGNORE becomes
 * INSERT ... ON CONFLICT DO NOTHING. An ON DUPLICATE KEY UPDATE clause is
 * dropped the same way: the row is inserted or left alone, never updated.
 * REPLACE statements have no keyless PostgreSQL equivalent and are counted
 * and skipped.
 *
 * An INSERT left unterminated at end of input yields PARSE_ERROR naming its
 * source-order index and line; the extractor stops after that.
 */
class StatementExtractor : public IStatementSource {
public:
    struct Stats {
        uint64_t statements_scanned = 0;
        uint64_t inserts_extracted = 0;
        uint64_t skipped_statements = 0;
        uint64_t skipped_replace = 0;
        uint64_t dropped_upserts = 0;     // ON DUPLICATE KEY UPDATE clauses dropped
        uint64_t bytes_consumed = 0;
    };

    explicit StatementExtractor(std::istream& input);

    [[nodiscard]] ExtractStep next() override;

    [[nodiscard]] Stats stats() const;

    [[nodiscard]] static bool is_insert(std::string_view statement);
    [[nodiscard]] static bool is_replace(std::string_view statement);

    /**
     * @brief Rewrite one raw INSERT into PostgreSQL syntax, ";"-terminated
     * @param upsert_dropped Set when an ON DUPLICATE KEY UPDATE clause was dropped
     */
    [[nodiscard]] static std::string rewrite(const RawInsertUnit& unit,
                                             bool* upsert_dropped = nullptr);

    // Offset of a top-level ON DUPLICATE KEY UPDATE clause in a MySQL INSERT
    [[nodiscard]] static std::optional<size_t> find_upsert_clause(std::string_view statement);

private:
    StatementScanner scanner_;
    uint64_t next_index_ = 0;
    uint64_t skipped_statements_ = 0;
    uint64_t skipped_replace_ = 0;
    uint64_t dropped_upserts_ = 0;
    bool stopped_ = false;
};

} // namespace mysql2pg
