#include "schema/ddl_parser.hpp"
#include "schema/type_mapper.hpp"
#include "dump/statement_scanner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_set>

namespace mysql2pg {

namespace {

using Tokens = std::vector<sql::Token>;

const sql::Token& at(const Tokens& tokens, size_t i) {
    static const sql::Token kNone{sql::TokenKind::SYMBOL, ""};
    return i < tokens.size() ? tokens[i] : kNone;
}

bool word_at(const Tokens& tokens, size_t i, std::string_view keyword) {
    return at(tokens, i).is_word(keyword);
}

bool is_keyword_statement(const Tokens& tokens, std::string_view keyword) {
    return word_at(tokens, 0, keyword);
}

// [db.]name; advances pos, empty string if no identifier at pos
std::string take_qualified_name(const Tokens& tokens, size_t& pos) {
    if (!at(tokens, pos).is_identifier()) return {};
    std::string name = sql::unquote_identifier(tokens[pos].text);
    ++pos;
    while (at(tokens, pos).is_symbol('.') && at(tokens, pos + 1).is_identifier()) {
        name = sql::unquote_identifier(tokens[pos + 1].text);
        pos += 2;
    }
    return name;
}

// DEFAULT / ON UPDATE operand; advances pos
std::string take_expression(const Tokens& tokens, size_t& pos) {
    const auto& tok = at(tokens, pos);
    const auto& next = at(tokens, pos + 1);

    if ((tok.is_symbol('-') || tok.is_symbol('+')) && next.kind == sql::TokenKind::WORD) {
        pos += 2;
        return tok.text + next.text;
    }
    if (tok.kind == sql::TokenKind::WORD && !tok.text.empty() && tok.text[0] == '_' &&
        next.kind == sql::TokenKind::STRING) {
        pos += 2;   // charset introducer
        return next.text;
    }
    if (tok.kind == sql::TokenKind::WORD && next.kind == sql::TokenKind::PAREN_GROUP) {
        pos += 2;
        return std::format("{}({})", tok.text, next.text);
    }
    ++pos;
    if (tok.kind == sql::TokenKind::PAREN_GROUP) {
        return std::format("({})", tok.text);
    }
    return tok.text;
}

std::string qualified(std::string_view table, std::string_view column) {
    return std::format("{}.{}", table, column);
}

std::string statement_construct(uint64_t line) {
    return std::format("statement at line {}", line);
}

std::string take_referential_action(const Tokens& tokens, size_t& pos) {
    if (word_at(tokens, pos, "SET") &&
        (word_at(tokens, pos + 1, "NULL") || word_at(tokens, pos + 1, "DEFAULT"))) {
        const auto action = "SET " + utils::to_upper(tokens[pos + 1].text);
        pos += 2;
        return action;
    }
    if (word_at(tokens, pos, "NO") && word_at(tokens, pos + 1, "ACTION")) {
        pos += 2;
        return "NO ACTION";
    }
    if (word_at(tokens, pos, "CASCADE") || word_at(tokens, pos, "RESTRICT")) {
        return utils::to_upper(tokens[pos++].text);
    }
    return {};
}

bool is_data_statement(std::string_view statement) {
    for (const std::string_view kw : {"INSERT", "REPLACE"}) {
        if (utils::istarts_with(statement, kw) &&
            (statement.size() == kw.size() ||
             std::isspace(static_cast<unsigned char>(statement[kw.size()])))) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

DdlParser::DdlParser(SchemaModel& model)
    : model_(model) {}

void DdlParser::warn(WarningKind kind, std::string construct, std::string message) {
    utils::log::debug(std::format("DDL warning [{}] {}: {}",
        warning_kind_to_string(kind), construct, message));
    model_.add_warning(kind, std::move(construct), std::move(message));
}

// ============================================================================
// Statements
// ============================================================================

DdlStatementKind DdlParser::parse_statement(std::string_view statement, uint64_t line) {
    if (is_data_statement(statement)) {
        return DdlStatementKind::DATA;
    }

    const Tokens tokens = sql::tokenize(statement);
    if (tokens.empty()) {
        return DdlStatementKind::IGNORED;
    }

    if (is_keyword_statement(tokens, "CREATE")) {
        size_t pos = 1;
        if (word_at(tokens, pos, "TEMPORARY")) ++pos;
        if (word_at(tokens, pos, "TABLE")) {
            return parse_create_table(tokens, line);
        }
        if (word_at(tokens, 1, "INDEX") ||
            ((word_at(tokens, 1, "UNIQUE") || word_at(tokens, 1, "FULLTEXT") ||
              word_at(tokens, 1, "SPATIAL")) && word_at(tokens, 2, "INDEX"))) {
            return parse_create_index(tokens, line);
        }
        if (word_at(tokens, 1, "DATABASE") || word_at(tokens, 1, "SCHEMA")) {
            return DdlStatementKind::IGNORED;
        }
        warn(WarningKind::DROPPED_CONSTRUCT, statement_construct(line),
             std::format("CREATE {} is not converted", utils::to_upper(at(tokens, 1).text)));
        return DdlStatementKind::UNSUPPORTED;
    }

    if (is_keyword_statement(tokens, "ALTER")) {
        if (word_at(tokens, 1, "TABLE") || word_at(tokens, 2, "TABLE")) {
            return parse_alter_table(tokens, line);
        }
        if (word_at(tokens, 1, "DATABASE") || word_at(tokens, 1, "SCHEMA")) {
            return DdlStatementKind::IGNORED;
        }
    }

    static constexpr std::string_view kIgnored[] = {
        "DROP", "LOCK", "UNLOCK", "SET", "USE", "START", "BEGIN", "COMMIT", "ROLLBACK",
        "FLUSH", "ANALYZE", "OPTIMIZE",
    };
    for (const auto kw : kIgnored) {
        if (is_keyword_statement(tokens, kw)) return DdlStatementKind::IGNORED;
    }

    warn(WarningKind::UNCLASSIFIED_CLAUSE, statement_construct(line),
         std::format("Unrecognized statement '{}' skipped", utils::to_upper(tokens[0].text)));
    return DdlStatementKind::UNSUPPORTED;
}

Result<DdlStatementKind> DdlParser::parse_unterminated(std::string_view statement,
                                                      uint64_t line) {
    if (is_data_statement(statement)) {
        return Result<DdlStatementKind>::ok(DdlStatementKind::DATA);
    }

    const Tokens tokens = sql::tokenize(statement);
    size_t pos = 1;
    if (word_at(tokens, pos, "TEMPORARY")) ++pos;
    if (is_keyword_statement(tokens, "CREATE") && word_at(tokens, pos, "TABLE")) {
        ++pos;
        if (word_at(tokens, pos, "IF") && word_at(tokens, pos + 1, "NOT") &&
            word_at(tokens, pos + 2, "EXISTS")) {
            pos += 3;
        }
        const std::string name = take_qualified_name(tokens, pos);
        return Result<DdlStatementKind>::error(ErrorCategory::PARSE_ERROR,
            std::format("Unterminated CREATE TABLE \"{}\" starting at line {}: "
                        "no closing parenthesis before end of input",
                        name.empty() ? "<unnamed>" : name, line));
    }

    warn(WarningKind::UNCLASSIFIED_CLAUSE, statement_construct(line),
         "Statement unterminated at end of input, skipped");
    return Result<DdlStatementKind>::ok(DdlStatementKind::UNSUPPORTED);
}

Result<uint64_t> DdlParser::parse_stream(StatementScanner& scanner) {
    uint64_t applied = 0;
    for (;;) {
        auto step = scanner.next();
        if (step.status == ScanStatus::END_OF_INPUT) break;

        if (step.status == ScanStatus::UNTERMINATED) {
            auto r = parse_unterminated(step.statement.text, step.statement.line);
            if (r.is_error()) {
                return Result<uint64_t>::from_error(r);
            }
            break;
        }

        const auto kind = parse_statement(step.statement.text, step.statement.line);
        if (kind == DdlStatementKind::CREATE_TABLE || kind == DdlStatementKind::ALTER_TABLE ||
            kind == DdlStatementKind::CREATE_INDEX) {
            ++applied;
        }
    }
    finish();
    return Result<uint64_t>::ok(applied);
}

Result<SchemaModel> DdlParser::parse_dump(std::istream& input) {
    SchemaModel model;
    DdlParser parser(model);
    StatementScanner scanner(input);
    auto r = parser.parse_stream(scanner);
    if (r.is_error()) {
        return Result<SchemaModel>::from_error(r);
    }
    return Result<SchemaModel>::ok(std::move(model));
}

DdlStatementKind DdlParser::parse_create_table(const Tokens& tokens, uint64_t line) {
    size_t pos = 1;
    if (word_at(tokens, pos, "TEMPORARY")) ++pos;
    ++pos;  // TABLE
    if (word_at(tokens, pos, "IF") && word_at(tokens, pos + 1, "NOT") &&
        word_at(tokens, pos + 2, "EXISTS")) {
        pos += 3;
    }

    std::string name = take_qualified_name(tokens, pos);
    if (name.empty()) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, statement_construct(line),
             "CREATE TABLE without a table name skipped");
        return DdlStatementKind::UNSUPPORTED;
    }
    if (at(tokens, pos).kind != sql::TokenKind::PAREN_GROUP) {
        warn(WarningKind::DROPPED_CONSTRUCT, name,
             "CREATE TABLE without a column list (LIKE / AS SELECT) is not converted");
        return DdlStatementKind::UNSUPPORTED;
    }
    if (model_.find_table(name)) {
        warn(WarningKind::DROPPED_CONSTRUCT, name,
             "Duplicate CREATE TABLE skipped; first definition kept");
        return DdlStatementKind::UNSUPPORTED;
    }

    Table table;
    table.name = std::move(name);
    for (const auto& clause : sql::split_top_level(tokens[pos].text)) {
        parse_table_clause(table, sql::tokenize(clause));
    }
    apply_table_options(table, tokens, pos + 1);

    utils::log::debug(std::format("Parsed table {} ({} columns, {} indexes)",
        table.name, table.columns.size(), table.indexes.size()));
    model_.add_table(std::move(table));
    return DdlStatementKind::CREATE_TABLE;
}

DdlStatementKind DdlParser::parse_alter_table(const Tokens& tokens, uint64_t line) {
    size_t pos = 1;
    while (pos < tokens.size() && !word_at(tokens, pos, "TABLE")) ++pos;
    ++pos;

    const std::string name = take_qualified_name(tokens, pos);
    Table* table = model_.find_table(name);
    if (!table) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, name.empty() ? statement_construct(line) : name,
             "ALTER TABLE on a table with no CREATE TABLE skipped");
        return DdlStatementKind::UNSUPPORTED;
    }

    // Actions are comma-separated; parenthesized groups are single tokens
    std::vector<Tokens> actions(1);
    for (; pos < tokens.size(); ++pos) {
        if (tokens[pos].is_symbol(',')) {
            actions.emplace_back();
        } else {
            actions.back().push_back(tokens[pos]);
        }
    }

    for (const auto& action : actions) {
        if (action.empty()) continue;

        if (word_at(action, 0, "ADD")) {
            size_t start = 1;
            if (word_at(action, start, "COLUMN")) ++start;
            if (at(action, start).kind == sql::TokenKind::PAREN_GROUP) {
                for (const auto& clause : sql::split_top_level(action[start].text)) {
                    parse_table_clause(*table, sql::tokenize(clause));
                }
            } else {
                parse_table_clause(*table, Tokens(action.begin() + static_cast<ptrdiff_t>(start),
                                                  action.end()));
            }
        } else if (word_at(action, 0, "COMMENT") || word_at(action, 0, "AUTO_INCREMENT") ||
                   word_at(action, 0, "ENGINE") || word_at(action, 0, "DEFAULT") ||
                   word_at(action, 0, "CHARSET") || word_at(action, 0, "CHARACTER") ||
                   word_at(action, 0, "COLLATE") || word_at(action, 0, "ROW_FORMAT")) {
            apply_table_options(*table, action, 0);
        } else if ((word_at(action, 0, "DISABLE") || word_at(action, 0, "ENABLE")) &&
                   word_at(action, 1, "KEYS")) {
            // index maintenance toggles only
        } else {
            warn(WarningKind::UNCLASSIFIED_CLAUSE, table->name,
                 std::format("Unsupported ALTER TABLE action '{}' skipped",
                             utils::to_upper(action[0].text)));
        }
    }
    return DdlStatementKind::ALTER_TABLE;
}

DdlStatementKind DdlParser::parse_create_index(const Tokens& tokens, uint64_t line) {
    size_t pos = 1;
    bool unique = false;
    if (word_at(tokens, pos, "UNIQUE")) {
        unique = true;
        ++pos;
    } else if (word_at(tokens, pos, "FULLTEXT") || word_at(tokens, pos, "SPATIAL")) {
        warn(WarningKind::DROPPED_CONSTRUCT, statement_construct(line),
             std::format("{} index is not converted", utils::to_upper(tokens[pos].text)));
        return DdlStatementKind::UNSUPPORTED;
    }
    ++pos;  // INDEX

    std::string index_name;
    if (at(tokens, pos).is_identifier() && !word_at(tokens, pos, "ON")) {
        index_name = sql::unquote_identifier(tokens[pos++].text);
    }
    if (word_at(tokens, pos, "USING")) pos += 2;
    if (!word_at(tokens, pos, "ON")) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, statement_construct(line),
             "CREATE INDEX without ON clause skipped");
        return DdlStatementKind::UNSUPPORTED;
    }
    ++pos;

    const std::string table_name = take_qualified_name(tokens, pos);
    Table* table = model_.find_table(table_name);
    if (!table) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE,
             table_name.empty() ? statement_construct(line) : table_name,
             "CREATE INDEX on a table with no CREATE TABLE skipped");
        return DdlStatementKind::UNSUPPORTED;
    }
    parse_index(*table, tokens, pos, unique, std::move(index_name));
    return DdlStatementKind::CREATE_INDEX;
}

// ============================================================================
// Table clauses
// ============================================================================

void DdlParser::parse_table_clause(Table& table, const Tokens& clause) {
    if (clause.empty()) return;

    if (word_at(clause, 0, "CONSTRAINT")) {
        size_t pos = 1;
        std::string name;
        const bool named = at(clause, pos).is_identifier() &&
            !word_at(clause, pos, "PRIMARY") && !word_at(clause, pos, "UNIQUE") &&
            !word_at(clause, pos, "FOREIGN") && !word_at(clause, pos, "CHECK");
        if (named) {
            name = sql::unquote_identifier(clause[pos++].text);
        }

        if (word_at(clause, pos, "PRIMARY")) {
            parse_primary_key(table, clause, pos + 1);
        } else if (word_at(clause, pos, "UNIQUE")) {
            ++pos;
            if (word_at(clause, pos, "KEY") || word_at(clause, pos, "INDEX")) ++pos;
            parse_index(table, clause, pos, true, std::move(name));
        } else if (word_at(clause, pos, "FOREIGN")) {
            parse_foreign_key(table, clause, pos + 2, std::move(name));
        } else if (word_at(clause, pos, "CHECK") &&
                   at(clause, pos + 1).kind == sql::TokenKind::PAREN_GROUP) {
            const auto expr = sql::rewrite_literals(clause[pos + 1].text);
            table.checks.push_back(name.empty()
                ? std::format("CHECK ({})", expr)
                : std::format("CONSTRAINT {} CHECK ({})", sql::quote_identifier(name), expr));
        } else {
            warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
                 std::format("Unrecognized constraint '{}' skipped", name));
        }
        return;
    }

    if (word_at(clause, 0, "PRIMARY")) {
        parse_primary_key(table, clause, 1);
    } else if (word_at(clause, 0, "UNIQUE")) {
        size_t pos = 1;
        if (word_at(clause, pos, "KEY") || word_at(clause, pos, "INDEX")) ++pos;
        parse_index(table, clause, pos, true, {});
    } else if (word_at(clause, 0, "KEY") || word_at(clause, 0, "INDEX")) {
        parse_index(table, clause, 1, false, {});
    } else if (word_at(clause, 0, "FULLTEXT") || word_at(clause, 0, "SPATIAL")) {
        warn(WarningKind::DROPPED_CONSTRUCT, table.name,
             std::format("{} index is not converted", utils::to_upper(clause[0].text)));
    } else if (word_at(clause, 0, "FOREIGN")) {
        parse_foreign_key(table, clause, 2, {});
    } else if (word_at(clause, 0, "CHECK") &&
               at(clause, 1).kind == sql::TokenKind::PAREN_GROUP) {
        table.checks.push_back(std::format("CHECK ({})", sql::rewrite_literals(clause[1].text)));
    } else if (clause[0].is_identifier()) {
        parse_column(table, clause);
    } else {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
             std::format("Unrecognized table clause starting with '{}' skipped", clause[0].text));
    }
}

void DdlParser::parse_column(Table& table, const Tokens& clause) {
    Column column;
    column.name = sql::unquote_identifier(clause[0].text);
    const std::string construct = qualified(table.name, column.name);

    if (at(clause, 1).kind != sql::TokenKind::WORD) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, construct, "Column without a type skipped");
        return;
    }

    ColumnTypeSpec spec;
    spec.column = column.name;
    spec.type_name = utils::to_lower(clause[1].text);
    size_t pos = 2;
    if (spec.type_name == "double" && word_at(clause, pos, "PRECISION")) {
        spec.type_name = "double precision";
        ++pos;
    }
    column.source_type = spec.type_name;
    if (at(clause, pos).kind == sql::TokenKind::PAREN_GROUP) {
        const auto& raw_args = clause[pos++].text;
        column.source_type += std::format("({})", raw_args);
        const bool member_list = spec.type_name == "enum" || spec.type_name == "set";
        for (auto& arg : sql::split_top_level(raw_args)) {
            if (member_list) {
                auto value = sql::parse_string_literal(arg);
                spec.enum_values.push_back(value ? std::move(*value) : std::move(arg));
            } else {
                spec.args.push_back(std::move(arg));
            }
        }
    }

    bool primary = false;
    bool unique = false;
    bool has_comment = false;

    while (pos < clause.size()) {
        const auto& tok = clause[pos];

        if (tok.is_word("NOT") && word_at(clause, pos + 1, "NULL")) {
            column.nullable = false;
            pos += 2;
        } else if (tok.is_word("NULL")) {
            column.nullable = true;
            ++pos;
        } else if (tok.is_word("DEFAULT")) {
            ++pos;
            column.raw_default = take_expression(clause, pos);
        } else if (tok.is_word("AUTO_INCREMENT")) {
            column.auto_increment = true;
            ++pos;
        } else if (tok.is_word("COMMENT")) {
            ++pos;
            if (auto text = sql::parse_string_literal(at(clause, pos).text)) {
                column.comment = std::move(*text);
                has_comment = true;
                ++pos;
            }
        } else if (tok.is_word("PRIMARY") || tok.is_word("KEY")) {
            primary = true;
            pos += (tok.is_word("PRIMARY") && word_at(clause, pos + 1, "KEY")) ? 2 : 1;
        } else if (tok.is_word("UNIQUE")) {
            unique = true;
            pos += word_at(clause, pos + 1, "KEY") ? 2 : 1;
        } else if (tok.is_word("ON") && word_at(clause, pos + 1, "UPDATE")) {
            pos += 2;
            const auto expr = take_expression(clause, pos);
            warn(WarningKind::DROPPED_CONSTRUCT, construct,
                 std::format("ON UPDATE {} has no column-level equivalent, dropped", expr));
        } else if (tok.is_word("GENERATED") || tok.is_word("AS")) {
            while (pos < clause.size() && clause[pos].kind != sql::TokenKind::PAREN_GROUP) ++pos;
            ++pos;
            warn(WarningKind::DROPPED_CONSTRUCT, construct,
                 "Generated column expression dropped; column kept as a plain column");
        } else if (tok.is_word("CHECK") && at(clause, pos + 1).kind == sql::TokenKind::PAREN_GROUP) {
            table.checks.push_back(std::format("CHECK ({})",
                sql::rewrite_literals(clause[pos + 1].text)));
            pos += 2;
        } else if (tok.is_word("REFERENCES")) {
            warn(WarningKind::DROPPED_CONSTRUCT, construct,
                 "Inline REFERENCES is ignored by MySQL and dropped");
            break;
        } else if (tok.is_word("CHARACTER") && word_at(clause, pos + 1, "SET")) {
            pos += 3;
        } else if (tok.is_word("CHARSET") || tok.is_word("COLLATE") ||
                   tok.is_word("COLUMN_FORMAT") || tok.is_word("STORAGE") ||
                   tok.is_word("SRID")) {
            pos += 2;
        } else if (tok.is_word("UNSIGNED") || tok.is_word("SIGNED") || tok.is_word("ZEROFILL") ||
                   tok.is_word("BINARY") || tok.is_word("ASCII") || tok.is_word("UNICODE") ||
                   tok.is_word("VIRTUAL") || tok.is_word("STORED") ||
                   tok.is_word("VISIBLE") || tok.is_word("INVISIBLE") || tok.is_word("ALWAYS")) {
            ++pos;
        } else {
            warn(WarningKind::UNCLASSIFIED_CLAUSE, construct,
                 std::format("Unrecognized column modifier '{}' skipped", tok.text));
            ++pos;
        }
    }

    if (table.find_column(column.name)) {
        warn(WarningKind::DROPPED_CONSTRUCT, construct, "Duplicate column definition skipped");
        return;
    }

    spec.default_literal = column.raw_default;
    auto mapped = TypeMapper::map(spec);
    if (mapped.warning) {
        warn(mapped.warning->kind, construct, std::move(mapped.warning->message));
    }
    column.target_type = std::move(mapped.type);
    column.check_constraint = std::move(mapped.constraint);

    if (column.auto_increment) {
        const std::string base = std::format("{}_{}_seq", table.name, column.name);
        std::string seq_name = base;
        for (int n = 2; model_.find_sequence(seq_name); ++n) {
            seq_name = std::format("{}{}", base, n);
        }
        model_.add_sequence(Sequence{seq_name, table.name, column.name, std::nullopt});
        column.default_value = std::format("nextval({})",
            sql::quote_literal(sql::maybe_quote_identifier(seq_name)));
        column.nullable = false;
    } else if (mapped.null_default) {
        if (column.nullable) {
            column.default_value = "NULL";
        } else {
            warn(WarningKind::DROPPED_CONSTRUCT, construct,
                 "DEFAULT NULL on a NOT NULL column dropped");
        }
    } else {
        column.default_value = std::move(mapped.default_value);
    }

    if (has_comment) {
        model_.add_comment(CommentEntry{CommentTarget::COLUMN, table.name, column.name,
                                        column.comment});
    }

    const std::string column_name = column.name;
    table.columns.push_back(std::move(column));

    if (primary) {
        if (table.primary_key.empty()) {
            table.primary_key = {column_name};
        } else {
            warn(WarningKind::DROPPED_CONSTRUCT, construct, "Second PRIMARY KEY skipped");
        }
    }
    if (unique) {
        std::string index_name = column_name;
        for (int n = 2; table.find_index(index_name); ++n) {
            index_name = std::format("{}_{}", column_name, n);
        }
        table.indexes.push_back(Index{std::move(index_name), table.name, {column_name}, true});
    }
}

namespace {

// Key part list "(a, b(10), c DESC)" -> column names. Empty on a functional part.
std::vector<std::string> parse_key_parts(std::string_view group, std::vector<std::string>& dropped,
                                         bool& functional) {
    std::vector<std::string> columns;
    functional = false;
    for (const auto& part : sql::split_top_level(group)) {
        const auto tokens = sql::tokenize(part);
        if (tokens.empty() || !tokens[0].is_identifier()) {
            functional = true;
            return {};
        }
        columns.push_back(sql::unquote_identifier(tokens[0].text));
        if (at(tokens, 1).kind == sql::TokenKind::PAREN_GROUP) {
            dropped.push_back(std::format("{}({})", columns.back(), tokens[1].text));
        }
    }
    return columns;
}

} // anonymous namespace

void DdlParser::parse_primary_key(Table& table, const Tokens& clause, size_t pos) {
    if (word_at(clause, pos, "KEY")) ++pos;
    while (pos < clause.size() && clause[pos].kind != sql::TokenKind::PAREN_GROUP) ++pos;
    if (pos >= clause.size()) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name, "PRIMARY KEY without columns skipped");
        return;
    }

    std::vector<std::string> dropped;
    bool functional = false;
    auto columns = parse_key_parts(clause[pos].text, dropped, functional);
    if (functional || columns.empty()) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
             "PRIMARY KEY with an expression part skipped");
        return;
    }
    for (const auto& c : columns) {
        if (!table.find_column(c)) {
            warn(WarningKind::DROPPED_CONSTRUCT, table.name,
                 std::format("PRIMARY KEY references unknown column \"{}\", skipped", c));
            return;
        }
    }
    if (!table.primary_key.empty()) {
        warn(WarningKind::DROPPED_CONSTRUCT, table.name, "Second PRIMARY KEY skipped");
        return;
    }
    if (!dropped.empty()) {
        warn(WarningKind::DROPPED_CONSTRUCT, table.name,
             std::format("Key prefix lengths dropped: {}", utils::join(dropped, ", ")));
    }
    table.primary_key = std::move(columns);
}

void DdlParser::parse_index(Table& table, const Tokens& clause, size_t pos, bool unique,
                            std::string name) {
    if (at(clause, pos).is_identifier() && !word_at(clause, pos, "USING")) {
        name = sql::unquote_identifier(clause[pos++].text);
    }
    if (word_at(clause, pos, "USING")) pos += 2;
    if (at(clause, pos).kind != sql::TokenKind::PAREN_GROUP) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
             std::format("Index {} without a column list skipped", name));
        return;
    }

    std::vector<std::string> dropped;
    bool functional = false;
    auto columns = parse_key_parts(clause[pos].text, dropped, functional);
    const std::string construct = qualified(table.name, name.empty() ? "<index>" : name);
    if (functional || columns.empty()) {
        warn(WarningKind::DROPPED_CONSTRUCT, construct, "Functional index is not converted");
        return;
    }
    for (const auto& c : columns) {
        if (!table.find_column(c)) {
            warn(WarningKind::DROPPED_CONSTRUCT, construct,
                 std::format("Index references unknown column \"{}\", skipped", c));
            return;
        }
    }
    if (!dropped.empty()) {
        warn(WarningKind::DROPPED_CONSTRUCT, construct,
             std::format("Index prefix lengths dropped: {}", utils::join(dropped, ", ")));
    }

    if (name.empty()) {
        // MySQL names an anonymous key after its first column
        name = columns.front();
        for (int n = 2; table.find_index(name); ++n) {
            name = std::format("{}_{}", columns.front(), n);
        }
    } else if (table.find_index(name)) {
        warn(WarningKind::DROPPED_CONSTRUCT, construct, "Duplicate index name skipped");
        return;
    }

    table.indexes.push_back(Index{std::move(name), table.name, std::move(columns), unique});
}

void DdlParser::parse_foreign_key(Table& table, const Tokens& clause, size_t pos,
                                  std::string name) {
    // Index name after FOREIGN KEY; used only when no CONSTRAINT name was given
    if (at(clause, pos).is_identifier()) {
        auto index_name = sql::unquote_identifier(clause[pos++].text);
        if (name.empty()) name = std::move(index_name);
    }

    ForeignKey fk;
    fk.table = table.name;

    if (at(clause, pos).kind != sql::TokenKind::PAREN_GROUP) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name, "FOREIGN KEY without columns skipped");
        return;
    }
    for (const auto& c : sql::split_top_level(clause[pos++].text)) {
        fk.columns.push_back(sql::unquote_identifier(c));
    }

    if (!word_at(clause, pos, "REFERENCES")) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name, "FOREIGN KEY without REFERENCES skipped");
        return;
    }
    ++pos;
    fk.ref_table = take_qualified_name(clause, pos);
    if (fk.ref_table.empty() || at(clause, pos).kind != sql::TokenKind::PAREN_GROUP) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
             "FOREIGN KEY with incomplete REFERENCES skipped");
        return;
    }
    for (const auto& c : sql::split_top_level(clause[pos++].text)) {
        fk.ref_columns.push_back(sql::unquote_identifier(c));
    }
    if (fk.columns.size() != fk.ref_columns.size()) {
        warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
             "FOREIGN KEY column count does not match REFERENCES, skipped");
        return;
    }

    while (pos < clause.size()) {
        if (word_at(clause, pos, "ON") && word_at(clause, pos + 1, "DELETE")) {
            pos += 2;
            fk.on_delete = take_referential_action(clause, pos);
        } else if (word_at(clause, pos, "ON") && word_at(clause, pos + 1, "UPDATE")) {
            pos += 2;
            fk.on_update = take_referential_action(clause, pos);
        } else if (word_at(clause, pos, "MATCH")) {
            pos += 2;
        } else {
            warn(WarningKind::UNCLASSIFIED_CLAUSE, table.name,
                 std::format("Unrecognized FOREIGN KEY option '{}' skipped", clause[pos].text));
            ++pos;
        }
    }

    fk.name = name.empty()
        ? std::format("{}_{}_fkey", table.name, utils::join(fk.columns, "_"))
        : std::move(name);
    model_.add_foreign_key(std::move(fk));
}

void DdlParser::apply_table_options(Table& table, const Tokens& tokens, size_t pos) {
    while (pos < tokens.size()) {
        if (word_at(tokens, pos, "AUTO_INCREMENT")) {
            ++pos;
            if (at(tokens, pos).is_symbol('=')) ++pos;
            if (auto start = utils::try_parse_int<int64_t>(at(tokens, pos).text)) {
                seed_sequences(table, *start);
                ++pos;
            }
        } else if (word_at(tokens, pos, "COMMENT")) {
            ++pos;
            if (at(tokens, pos).is_symbol('=')) ++pos;
            if (auto text = sql::parse_string_literal(at(tokens, pos).text)) {
                set_table_comment(table, std::move(*text));
                ++pos;
            }
        } else {
            // ENGINE, CHARSET, COLLATE, ROW_FORMAT, ... have no target meaning
            ++pos;
        }
    }
}

void DdlParser::set_table_comment(Table& table, std::string text) {
    table.comment = text;
    model_.add_comment(CommentEntry{CommentTarget::TABLE, table.name, {}, std::move(text)});
}

void DdlParser::seed_sequences(const Table& table, int64_t start) {
    for (auto& seq : model_.sequences()) {
        if (seq.table == table.name) seq.start = start;
    }
}

// ============================================================================
// Cross-table resolution
// ============================================================================

void DdlParser::finish() {
    auto& fks = model_.foreign_keys();
    std::erase_if(fks, [this](const ForeignKey& fk) {
        const Table* owner = model_.find_table(fk.table);
        const Table* target = model_.find_table(fk.ref_table);
        if (!owner || !target) {
            warn(WarningKind::DROPPED_CONSTRUCT, fk.table,
                 std::format("Foreign key {} references missing table \"{}\", not emitted",
                             fk.name, fk.ref_table));
            return true;
        }
        for (const auto& c : fk.columns) {
            if (!owner->find_column(c)) {
                warn(WarningKind::DROPPED_CONSTRUCT, fk.table,
                     std::format("Foreign key {} uses unknown column \"{}\", not emitted",
                                 fk.name, c));
                return true;
            }
        }
        for (const auto& c : fk.ref_columns) {
            if (!target->find_column(c)) {
                warn(WarningKind::DROPPED_CONSTRUCT, fk.table,
                     std::format("Foreign key {} references unknown column \"{}\".\"{}\", "
                                 "not emitted", fk.name, fk.ref_table, c));
                return true;
            }
        }
        return false;
    });

    // Relation names share one namespace in PostgreSQL
    std::unordered_set<std::string> taken;
    for (const auto& t : model_.tables()) taken.insert(t.name);
    for (const auto& s : model_.sequences()) taken.insert(s.name);

    for (auto& table : model_.tables()) {
        for (auto& idx : table.indexes) {
            if (taken.contains(idx.name)) {
                const std::string base = std::format("{}_{}", table.name, idx.name);
                std::string candidate = base;
                for (int n = 2; taken.contains(candidate); ++n) {
                    candidate = std::format("{}_{}", base, n);
                }
                idx.name = std::move(candidate);
            }
            taken.insert(idx.name);
        }
    }
}

} // namespace mysql2pg
