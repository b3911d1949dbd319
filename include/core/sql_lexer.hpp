#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mysql2pg::sql {

/**
 * @brief Quote context of the MySQL lexical grammar
 *
 * SINGLE and DOUBLE are string literals (backslash escapes the next byte).
 * BACKTICK is a quoted identifier (no backslash escapes).
 */
enum class QuoteContext : uint8_t {
    NONE,
    SINGLE,
    DOUBLE,
    BACKTICK,
};

/**
 * @brief Byte-at-a-time tracker for quotes, escapes and parenthesis depth
 *
 * Shared by the statement scanner (boundary detection) and the DDL layer
 * (clause splitting). A doubled quote inside a literal closes and reopens
 * the literal, which leaves the boundary state unchanged, so no look-ahead
 * is needed.
 */
class ScanState {
public:
    void feed(char c) {
        if (escape_) {
            escape_ = false;
            return;
        }
        switch (quote_) {
            case QuoteContext::NONE:
                if (c == '\'') quote_ = QuoteContext::SINGLE;
                else if (c == '"') quote_ = QuoteContext::DOUBLE;
                else if (c == '`') quote_ = QuoteContext::BACKTICK;
                else if (c == '(') ++depth_;
                else if (c == ')') --depth_;
                break;
            case QuoteContext::SINGLE:
                if (c == '\\') escape_ = true;
                else if (c == '\'') quote_ = QuoteContext::NONE;
                break;
            case QuoteContext::DOUBLE:
                if (c == '\\') escape_ = true;
                else if (c == '"') quote_ = QuoteContext::NONE;
                break;
            case QuoteContext::BACKTICK:
                if (c == '`') quote_ = QuoteContext::NONE;
                break;
        }
    }

    [[nodiscard]] bool in_quote() const { return quote_ != QuoteContext::NONE || escape_; }
    [[nodiscard]] int depth() const { return depth_; }
    [[nodiscard]] QuoteContext quote() const { return quote_; }

    // Outside every literal and every parenthesis
    [[nodiscard]] bool at_top_level() const { return !in_quote() && depth_ == 0; }

private:
    QuoteContext quote_ = QuoteContext::NONE;
    bool escape_ = false;
    int depth_ = 0;
};

// ============================================================================
// Identifiers and literals
// ============================================================================

[[nodiscard]] bool is_ident_char(char c);

/**
 * @brief Strip `backticks` or "double quotes" from an identifier
 *
 * Doubled quote characters inside the identifier are collapsed.
 * Unquoted input is returned unchanged (trimmed).
 */
[[nodiscard]] std::string unquote_identifier(std::string_view ident);

/**
 * @brief PostgreSQL double-quoted identifier
 */
[[nodiscard]] std::string quote_identifier(std::string_view name);

/**
 * @brief Bare name when PostgreSQL would read it back unchanged
 * (lowercase letters, digits, underscore), otherwise quote_identifier()
 */
[[nodiscard]] std::string maybe_quote_identifier(std::string_view name);

/**
 * @brief PostgreSQL single-quoted literal (standard_conforming_strings)
 */
[[nodiscard]] std::string quote_literal(std::string_view value);

/**
 * @brief Decode the body of a MySQL string literal
 * @param body Text between the quotes
 * @param quote The delimiting quote character (' or ")
 *
 * \0 is dropped since PostgreSQL text values cannot contain NUL.
 * \% and \_ keep their backslash, as MySQL does.
 */
[[nodiscard]] std::string decode_mysql_string(std::string_view body, char quote);

/**
 * @brief Decode a complete quoted MySQL string token ('...' or "...")
 * @return Decoded value, or std::nullopt if the token is not a string literal
 */
[[nodiscard]] std::optional<std::string> parse_string_literal(std::string_view token);

/**
 * @brief Split text on a separator at parenthesis depth 0 outside quotes
 *
 * Parts are trimmed; empty parts are dropped.
 */
[[nodiscard]] std::vector<std::string> split_top_level(std::string_view text, char sep = ',');

/**
 * @brief Rewrite a MySQL DML statement into PostgreSQL literal syntax
 *
 * Single pass, left to right:
 * - `ident` becomes "ident"
 * - 'str' / "str" with MySQL escapes become standard 'str' (\' becomes '')
 * - bare \N becomes NULL
 * - b'0101' becomes '0101'
 * - 0xABCD and x'ABCD' become '\xABCD' (bytea hex input)
 * - charset introducers (_binary, _utf8mb4, ...) before a string are dropped
 * - CRLF outside literals becomes LF
 */
[[nodiscard]] std::string rewrite_literals(std::string_view statement);

// ============================================================================
// Tokenizer (DDL clauses)
// ============================================================================

enum class TokenKind : uint8_t {
    WORD,           // keyword, bare identifier or number
    QUOTED_IDENT,   // `name`
    STRING,         // 'text' or "text" (raw, quotes included)
    BIT_LITERAL,    // b'01' (raw)
    HEX_LITERAL,    // x'AF' (raw)
    PAREN_GROUP,    // (...) - text holds the inner content
    SYMBOL,         // any other single character
};

struct Token {
    TokenKind kind = TokenKind::WORD;
    std::string text;

    [[nodiscard]] bool is_word(std::string_view keyword) const;
    [[nodiscard]] bool is_symbol(char c) const {
        return kind == TokenKind::SYMBOL && text.size() == 1 && text[0] == c;
    }
    [[nodiscard]] bool is_identifier() const {
        return kind == TokenKind::WORD || kind == TokenKind::QUOTED_IDENT;
    }
};

/**
 * @brief Tokenize a DDL fragment
 *
 * Comments (-- ..., # ..., / * ... * /) are skipped. Parenthesized groups are
 * returned as a single PAREN_GROUP token. An unterminated quote or group
 * consumes the rest of the input into the last token.
 */
[[nodiscard]] std::vector<Token> tokenize(std::string_view text);

} // namespace mysql2pg::sql
