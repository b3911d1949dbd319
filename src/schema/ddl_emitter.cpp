#include "schema/ddl_emitter.hpp"
#include "core/sql_lexer.hpp"

#include <format>
#include <sstream>

namespace mysql2pg {

namespace {

std::string column_list(const std::vector<std::string>& columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += sql::quote_identifier(columns[i]);
    }
    return out;
}

std::string render_column(const Column& column) {
    std::string line = std::format("{} {}", sql::quote_identifier(column.name), column.target_type);
    if (column.default_value) {
        line += " DEFAULT ";
        line += *column.default_value;
    }
    if (!column.nullable) {
        line += " NOT NULL";
    }
    if (!column.check_constraint.empty()) {
        line += ' ';
        line += column.check_constraint;
    }
    return line;
}

} // anonymous namespace

std::string DdlEmitter::phase_marker(std::string_view phase) {
    return std::format("-- ===== {} =====", phase);
}

std::string DdlEmitter::render_sequence(const Sequence& seq) {
    if (seq.start) {
        return std::format("CREATE SEQUENCE {} START WITH {};",
            sql::maybe_quote_identifier(seq.name), *seq.start);
    }
    return std::format("CREATE SEQUENCE {};", sql::maybe_quote_identifier(seq.name));
}

std::string DdlEmitter::render_table(const Table& table) {
    std::vector<std::string> lines;
    lines.reserve(table.columns.size() + table.checks.size() + 1);
    for (const auto& column : table.columns) {
        lines.push_back(render_column(column));
    }
    if (!table.primary_key.empty()) {
        lines.push_back(std::format("PRIMARY KEY ({})", column_list(table.primary_key)));
    }
    for (const auto& check : table.checks) {
        lines.push_back(check);
    }

    std::string out = std::format("CREATE TABLE {} (\n", sql::quote_identifier(table.name));
    for (size_t i = 0; i < lines.size(); ++i) {
        out += "    ";
        out += lines[i];
        out += (i + 1 < lines.size()) ? ",\n" : "\n";
    }
    out += ");";
    return out;
}

std::string DdlEmitter::render_index(const Index& index) {
    return std::format("CREATE {}INDEX {} ON {} ({});",
        index.unique ? "UNIQUE " : "",
        sql::quote_identifier(index.name),
        sql::quote_identifier(index.table),
        column_list(index.columns));
}

std::string DdlEmitter::render_foreign_key(const ForeignKey& fk) {
    std::string out = std::format("ALTER TABLE {} ADD CONSTRAINT {} FOREIGN KEY ({}) REFERENCES {} ({})",
        sql::quote_identifier(fk.table),
        sql::quote_identifier(fk.name),
        column_list(fk.columns),
        sql::quote_identifier(fk.ref_table),
        column_list(fk.ref_columns));
    if (!fk.on_delete.empty()) out += " ON DELETE " + fk.on_delete;
    if (!fk.on_update.empty()) out += " ON UPDATE " + fk.on_update;
    out += ';';
    return out;
}

std::string DdlEmitter::render_comment(const CommentEntry& entry) {
    if (entry.target == CommentTarget::TABLE) {
        return std::format("COMMENT ON TABLE {} IS {};",
            sql::quote_identifier(entry.table), sql::quote_literal(entry.text));
    }
    return std::format("COMMENT ON COLUMN {}.{} IS {};",
        sql::quote_identifier(entry.table), sql::quote_identifier(entry.column),
        sql::quote_literal(entry.text));
}

void DdlEmitter::emit(const SchemaModel& model, std::ostream& out) {
    out << phase_marker(kSequencesPhase) << "\n";
    for (const auto& seq : model.sequences()) {
        out << render_sequence(seq) << "\n";
    }

    out << "\n" << phase_marker(kTablesPhase) << "\n";
    for (const auto& table : model.tables()) {
        out << render_table(table) << "\n\n";
    }
    for (const auto& seq : model.sequences()) {
        if (!model.find_table(seq.table)) continue;
        out << std::format("ALTER SEQUENCE {} OWNED BY {}.{};\n",
            sql::maybe_quote_identifier(seq.name),
            sql::quote_identifier(seq.table), sql::quote_identifier(seq.column));
    }

    out << "\n" << phase_marker(kIndexesPhase) << "\n";
    for (const auto& table : model.tables()) {
        for (const auto& index : table.indexes) {
            out << render_index(index) << "\n";
        }
    }

    out << "\n" << phase_marker(kForeignKeysPhase) << "\n";
    for (const auto& fk : model.foreign_keys()) {
        if (!model.find_table(fk.table) || !model.find_table(fk.ref_table)) continue;
        out << render_foreign_key(fk) << "\n";
    }

    out << "\n" << phase_marker(kCommentsPhase) << "\n";
    for (const auto& entry : model.comments()) {
        out << render_comment(entry) << "\n";
    }
}

std::string DdlEmitter::emit(const SchemaModel& model) {
    std::ostringstream out;
    emit(model, out);
    return out.str();
}

} // namespace mysql2pg
