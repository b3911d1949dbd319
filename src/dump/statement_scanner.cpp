#include "dump/statement_scanner.hpp"
#include "core/sql_lexer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <format>

namespace mysql2pg {

StatementScanner::StatementScanner(std::istream& input, size_t buffer_size)
    : input_(input),
      buffer_(std::max<size_t>(buffer_size, 64)) {}

int StatementScanner::peek(size_t ahead) {
    if (pos_ + ahead >= end_) {
        if (input_exhausted_) return kEof;

        // Compact, then refill the tail of the buffer
        if (pos_ > 0) {
            std::memmove(buffer_.data(), buffer_.data() + pos_, end_ - pos_);
            end_ -= pos_;
            pos_ = 0;
        }
        if (ahead >= buffer_.size()) {
            buffer_.resize(ahead + 1);
        }
        while (end_ <= ahead && !input_exhausted_) {
            input_.read(buffer_.data() + end_, static_cast<std::streamsize>(buffer_.size() - end_));
            const auto got = input_.gcount();
            if (got <= 0) {
                input_exhausted_ = true;
                break;
            }
            end_ += static_cast<size_t>(got);
        }
        if (pos_ + ahead >= end_) return kEof;
    }
    return static_cast<unsigned char>(buffer_[pos_ + ahead]);
}

void StatementScanner::advance(size_t count) {
    for (size_t i = 0; i < count && peek() != kEof; ++i) {
        if (buffer_[pos_] == '\n') ++line_;
        ++pos_;
        ++bytes_consumed_;
    }
}

bool StatementScanner::match_keyword(std::string_view keyword) {
    for (size_t i = 0; i < keyword.size(); ++i) {
        const int c = peek(i);
        if (c == kEof || std::tolower(c) != std::tolower(static_cast<unsigned char>(keyword[i]))) {
            return false;
        }
    }
    const int after = peek(keyword.size());
    return after == ' ' || after == '\t';
}

bool StatementScanner::match_delimiter() {
    for (size_t i = 0; i < delimiter_.size(); ++i) {
        if (peek(i) != static_cast<unsigned char>(delimiter_[i])) return false;
    }
    return true;
}

StatementScanner::CommentKind StatementScanner::comment_at() {
    const int c = peek();
    if (c == '#') return CommentKind::LINE;
    if (c == '-' && peek(1) == '-') {
        const int c2 = peek(2);
        if (c2 == ' ' || c2 == '\t' || c2 == '\n' || c2 == '\r' || c2 == kEof) {
            return CommentKind::LINE;
        }
    }
    if (c == '/' && peek(1) == '*') return CommentKind::BLOCK;
    return CommentKind::NONE;
}

void StatementScanner::skip_comment(CommentKind kind) {
    if (kind == CommentKind::LINE) {
        // The newline stays in the input
        while (peek() != kEof && peek() != '\n') advance();
        return;
    }
    advance(2);
    while (peek() != kEof && !(peek() == '*' && peek(1) == '/')) advance();
    advance(2);
}

bool StatementScanner::skip_to_statement() {
    for (;;) {
        const int c = peek();
        if (c == kEof) return false;

        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            advance();
            continue;
        }

        if (const auto comment = comment_at(); comment != CommentKind::NONE) {
            skip_comment(comment);
            continue;
        }

        if (match_keyword("DELIMITER")) {
            advance(9);
            std::string value;
            while (peek() != kEof && peek() != '\n') {
                value += static_cast<char>(peek());
                advance();
            }
            value = utils::trim(value);
            if (!value.empty()) {
                utils::log::debug(std::format("Statement delimiter changed to '{}' at line {}", value, line_));
                delimiter_ = std::move(value);
            }
            continue;
        }

        // Stray delimiter (e.g. left behind by a skipped "/*!...*/;")
        if (match_delimiter()) {
            advance(delimiter_.size());
            continue;
        }

        return true;
    }
}

ScanStep StatementScanner::next() {
    if (finished_) return {};

    if (!skip_to_statement()) {
        finished_ = true;
        return {};
    }

    ScanStep step;
    step.statement.line = line_;
    step.statement.ordinal = ordinal_;

    std::string& text = step.statement.text;
    sql::ScanState state;

    for (;;) {
        const int c = peek();
        if (c == kEof) break;

        if (state.at_top_level() && match_delimiter()) {
            advance(delimiter_.size());
            ++ordinal_;
            text = utils::trim(text);
            step.status = ScanStatus::STATEMENT;
            return step;
        }

        // Comments inside a statement are dropped so quotes in them never
        // reach the boundary state; a block comment leaves one space
        if (!state.in_quote()) {
            if (const auto comment = comment_at(); comment != CommentKind::NONE) {
                skip_comment(comment);
                if (comment == CommentKind::BLOCK) text += ' ';
                continue;
            }
        }

        const char ch = static_cast<char>(c);
        state.feed(ch);
        text += ch;
        advance();
    }

    // End of input inside a statement
    finished_ = true;
    ++ordinal_;
    text = utils::trim(text);
    if (text.empty()) return {};
    step.status = state.at_top_level() ? ScanStatus::STATEMENT : ScanStatus::UNTERMINATED;
    return step;
}

} // namespace mysql2pg
