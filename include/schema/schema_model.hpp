#pragma once

#include "core/warning.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mysql2pg {

// ============================================================================
// Schema entities
// ============================================================================

struct Column {
    std::string name;
    std::string source_type;                    // as declared: "int(11)", "enum('a','b')"
    std::string target_type;                    // mapped PostgreSQL type
    std::string check_constraint;               // enum-derived CHECK, or empty
    bool nullable = true;
    std::optional<std::string> raw_default;     // MySQL DEFAULT expression
    std::optional<std::string> default_value;   // PostgreSQL DEFAULT expression
    bool auto_increment = false;
    std::string comment;
};

struct Index {
    std::string name;
    std::string table;
    std::vector<std::string> columns;
    bool unique = false;
};

struct ForeignKey {
    std::string name;
    std::string table;
    std::vector<std::string> columns;
    std::string ref_table;
    std::vector<std::string> ref_columns;
    std::string on_delete;                      // "CASCADE", "SET NULL", ... or empty
    std::string on_update;
};

struct Sequence {
    std::string name;                           // <table>_<column>_seq
    std::string table;
    std::string column;
    std::optional<int64_t> start;               // table option AUTO_INCREMENT=N
};

enum class CommentTarget {
    TABLE,
    COLUMN,
};

struct CommentEntry {
    CommentTarget target = CommentTarget::TABLE;
    std::string table;
    std::string column;                         // empty for TABLE
    std::string text;
};

struct Table {
    std::string name;
    std::vector<Column> columns;                // physical order
    std::vector<std::string> primary_key;
    std::vector<Index> indexes;
    std::vector<std::string> checks;            // rendered table-level CHECK constraints
    std::string comment;

    [[nodiscard]] Column* find_column(std::string_view column_name);
    [[nodiscard]] const Column* find_column(std::string_view column_name) const;
    [[nodiscard]] const Index* find_index(std::string_view index_name) const;
};

// ============================================================================
// SchemaModel
// ============================================================================

/**
 * @brief Everything the DDL parser learned about the source schema
 *
 * Tables and sequences keep declaration order for emission and are also
 * indexed by name. Foreign keys are held apart from their tables until
 * every table is known. Pointers returned by add/find stay valid for the
 * lifetime of the model.
 */
class SchemaModel {
public:
    /**
     * @return The stored table, or nullptr if a table of that name exists
     */
    Table* add_table(Table table);
    [[nodiscard]] Table* find_table(std::string_view name);
    [[nodiscard]] const Table* find_table(std::string_view name) const;
    [[nodiscard]] const std::deque<Table>& tables() const { return tables_; }
    [[nodiscard]] std::deque<Table>& tables() { return tables_; }

    /**
     * @return The stored sequence, or nullptr if the name is taken
     */
    Sequence* add_sequence(Sequence sequence);
    [[nodiscard]] Sequence* find_sequence(std::string_view name);
    [[nodiscard]] const std::deque<Sequence>& sequences() const { return sequences_; }
    [[nodiscard]] std::deque<Sequence>& sequences() { return sequences_; }

    void add_foreign_key(ForeignKey fk) { foreign_keys_.push_back(std::move(fk)); }
    [[nodiscard]] const std::vector<ForeignKey>& foreign_keys() const { return foreign_keys_; }
    [[nodiscard]] std::vector<ForeignKey>& foreign_keys() { return foreign_keys_; }

    void add_comment(CommentEntry entry) { comments_.push_back(std::move(entry)); }
    [[nodiscard]] const std::vector<CommentEntry>& comments() const { return comments_; }

    void add_warning(WarningKind kind, std::string construct, std::string message) {
        warnings_.push_back(Warning{kind, std::move(construct), std::move(message)});
    }
    [[nodiscard]] const WarningList& warnings() const { return warnings_; }

    [[nodiscard]] size_t index_count() const;

private:
    std::deque<Table> tables_;
    std::unordered_map<std::string, size_t> table_index_;
    std::deque<Sequence> sequences_;
    std::unordered_map<std::string, size_t> sequence_index_;
    std::vector<ForeignKey> foreign_keys_;
    std::vector<CommentEntry> comments_;
    WarningList warnings_;
};

} // namespace mysql2pg
