#pragma once

#include "core/error.hpp"
#include "core/sql_lexer.hpp"
#include "schema/schema_model.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace mysql2pg {

class StatementScanner;

enum class DdlStatementKind {
    CREATE_TABLE,
    ALTER_TABLE,
    CREATE_INDEX,
    DATA,           // INSERT / REPLACE, handled by the data pipeline
    IGNORED,        // no meaning for the target (SET, LOCK TABLES, DROP TABLE, ...)
    UNSUPPORTED,    // recognized but not converted; a warning was recorded
};

/**
 * @brief Builds a SchemaModel from MySQL DDL statements
 *
 * Recognizes CREATE TABLE (columns, PRIMARY KEY, UNIQUE/KEY/INDEX, FOREIGN
 * KEY, CHECK, table options), ALTER TABLE ... ADD/COMMENT/AUTO_INCREMENT and
 * CREATE INDEX. Clauses that cannot be classified are skipped with a warning
 * recorded on the model. Foreign keys are collected into the model's pending
 * set and validated by finish() once every table is known.
 */
class DdlParser {
public:
    explicit DdlParser(SchemaModel& model);

    /**
     * @brief Apply one complete statement (delimiter excluded)
     * @param line Source line, used in warnings only
     */
    DdlStatementKind parse_statement(std::string_view statement, uint64_t line = 0);

    /**
     * @brief Handle a statement cut off by end of input
     *
     * Fatal (PARSE_ERROR naming the table) for CREATE TABLE; anything else is
     * dropped with a warning.
     */
    [[nodiscard]] Result<DdlStatementKind> parse_unterminated(std::string_view statement,
                                                              uint64_t line);

    /**
     * @brief Drain a scanner, then finish()
     * @return Number of DDL statements applied
     */
    [[nodiscard]] Result<uint64_t> parse_stream(StatementScanner& scanner);

    /**
     * @brief Resolve cross-table state after the last statement
     *
     * Drops foreign keys whose tables are missing, gives colliding index
     * names a "<table>_" prefix (PostgreSQL index names are schema-wide).
     */
    void finish();

    /**
     * @brief Scan a whole dump and return the finished model
     */
    [[nodiscard]] static Result<SchemaModel> parse_dump(std::istream& input);

private:
    using Tokens = std::vector<sql::Token>;

    DdlStatementKind parse_create_table(const Tokens& tokens, uint64_t line);
    DdlStatementKind parse_alter_table(const Tokens& tokens, uint64_t line);
    DdlStatementKind parse_create_index(const Tokens& tokens, uint64_t line);

    // One clause of a CREATE TABLE body or an ALTER TABLE ADD action
    void parse_table_clause(Table& table, const Tokens& clause);
    void parse_column(Table& table, const Tokens& clause);
    void parse_primary_key(Table& table, const Tokens& clause, size_t pos);
    void parse_index(Table& table, const Tokens& clause, size_t pos, bool unique,
                     std::string name);
    void parse_foreign_key(Table& table, const Tokens& clause, size_t pos,
                           std::string name);
    void apply_table_options(Table& table, const Tokens& tokens, size_t pos);

    void set_table_comment(Table& table, std::string text);
    void seed_sequences(const Table& table, int64_t start);

    void warn(WarningKind kind, std::string construct, std::string message);

    SchemaModel& model_;
};

} // namespace mysql2pg
