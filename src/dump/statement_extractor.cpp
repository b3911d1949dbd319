#include "dump/statement_extractor.hpp"
#include "core/sql_lexer.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <optional>

namespace mysql2pg {

namespace {

bool starts_with_keyword(std::string_view text, std::string_view keyword) {
    if (!utils::istarts_with(text, keyword)) return false;
    return text.size() == keyword.size() ||
           std::isspace(static_cast<unsigned char>(text[keyword.size()])) != 0;
}

// Reads the next bare word at `pos`, skipping leading whitespace.
std::string_view next_word(std::string_view text, size_t& pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    const size_t start = pos;
    while (pos < text.size() && sql::is_ident_char(text[pos])) ++pos;
    return text.substr(start, pos - start);
}

} // anonymous namespace

std::optional<size_t> StatementExtractor::find_upsert_clause(std::string_view statement) {
    sql::ScanState state;
    for (size_t i = 0; i < statement.size(); ++i) {
        const char c = statement[i];
        if ((c == 'O' || c == 'o') && state.at_top_level() &&
            (i == 0 || !sql::is_ident_char(statement[i - 1]))) {
            size_t pos = i;
            if (utils::iequals(next_word(statement, pos), "ON") &&
                utils::iequals(next_word(statement, pos), "DUPLICATE") &&
                utils::iequals(next_word(statement, pos), "KEY") &&
                utils::iequals(next_word(statement, pos), "UPDATE")) {
                return i;
            }
        }
        state.feed(c);
    }
    return std::nullopt;
}

StatementExtractor::StatementExtractor(std::istream& input)
    : scanner_(input) {}

bool StatementExtractor::is_insert(std::string_view statement) {
    return starts_with_keyword(statement, "INSERT");
}

bool StatementExtractor::is_replace(std::string_view statement) {
    return starts_with_keyword(statement, "REPLACE");
}

std::string StatementExtractor::rewrite(const RawInsertUnit& unit, bool* upsert_dropped) {
    // Quote tracking is only valid on MySQL syntax, so the clause is cut
    // before the literal rewrite
    std::string_view source = unit.text;
    const auto upsert = find_upsert_clause(source);
    if (upsert) {
        source = source.substr(0, *upsert);
        while (!source.empty() && std::isspace(static_cast<unsigned char>(source.back()))) {
            source.remove_suffix(1);
        }
    }
    if (upsert_dropped) *upsert_dropped = upsert.has_value();

    const std::string body = sql::rewrite_literals(source);

    // INSERT [LOW_PRIORITY | DELAYED | HIGH_PRIORITY] [IGNORE] [INTO] tbl ...
    size_t pos = 0;
    (void)next_word(body, pos);   // INSERT
    bool ignore = false;
    bool has_modifiers = false;
    size_t rest = pos;
    for (;;) {
        size_t lookahead = rest;
        const auto word = next_word(body, lookahead);
        if (utils::iequals(word, "LOW_PRIORITY") || utils::iequals(word, "DELAYED") ||
            utils::iequals(word, "HIGH_PRIORITY")) {
            has_modifiers = true;
            rest = lookahead;
        } else if (utils::iequals(word, "IGNORE")) {
            has_modifiers = true;
            ignore = true;
            rest = lookahead;
        } else if (utils::iequals(word, "INTO")) {
            rest = lookahead;
            break;
        } else {
            has_modifiers = true;   // INTO omitted
            break;
        }
    }

    std::string out;
    out.reserve(body.size() + 32);
    if (has_modifiers) {
        out += "INSERT INTO";
        out += body.substr(rest);
    } else {
        out += body;
    }
    if (ignore || upsert) {
        out += " ON CONFLICT DO NOTHING";
    }
    out += ';';
    return out;
}

ExtractStep StatementExtractor::next() {
    while (!stopped_) {
        auto step = scanner_.next();

        if (step.status == ScanStatus::END_OF_INPUT) {
            stopped_ = true;
            break;
        }

        const auto& raw = step.statement;

        if (step.status == ScanStatus::UNTERMINATED) {
            stopped_ = true;
            if (is_insert(raw.text)) {
                return ExtractStep::error(std::format(
                    "Unterminated INSERT statement #{} starting at line {}: "
                    "quote or parenthesis still open at end of input",
                    next_index_, raw.line));
            }
            utils::log::warn(std::format(
                "Ignoring unterminated non-INSERT statement at line {}", raw.line));
            break;
        }

        if (is_insert(raw.text)) {
            RawInsertUnit unit{raw.text, next_index_++, raw.line};
            bool upsert_dropped = false;
            auto text = rewrite(unit, &upsert_dropped);
            if (upsert_dropped) ++dropped_upserts_;
            return ExtractStep::of(RewrittenStatement{std::move(text), unit.index, unit.line});
        }

        if (is_replace(raw.text)) {
            ++skipped_replace_;
        } else {
            ++skipped_statements_;
        }
    }
    return ExtractStep::end();
}

StatementExtractor::Stats StatementExtractor::stats() const {
    return Stats{
        .statements_scanned = scanner_.statements_scanned(),
        .inserts_extracted = next_index_,
        .skipped_statements = skipped_statements_,
        .skipped_replace = skipped_replace_,
        .dropped_upserts = dropped_upserts_,
        .bytes_consumed = scanner_.bytes_consumed()
    };
}

} // namespace mysql2pg
