#include "core/sql_lexer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace mysql2pg::sql {

namespace {

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Index one past the closing quote of a literal starting at `start`,
// or npos if the literal is unterminated.
size_t find_string_end(std::string_view s, size_t start) {
    const char q = s[start];
    size_t j = start + 1;
    while (j < s.size()) {
        const char c = s[j];
        if (c == '\\' && q != '`') {
            j += 2;
        } else if (c == q) {
            if (j + 1 < s.size() && s[j + 1] == q) {
                j += 2;
            } else {
                return j + 1;
            }
        } else {
            ++j;
        }
    }
    return std::string_view::npos;
}

// Length of the b'...' / x'...' body starting after the opening quote,
// or npos if not closed or containing foreign characters.
size_t prefixed_literal_body(std::string_view s, size_t body_start, bool hex) {
    size_t k = body_start;
    while (k < s.size() && s[k] != '\'') {
        const bool ok = hex ? is_hex_digit(s[k]) : (s[k] == '0' || s[k] == '1');
        if (!ok) return std::string_view::npos;
        ++k;
    }
    if (k >= s.size()) return std::string_view::npos;
    return k - body_start;
}

} // anonymous namespace

bool is_ident_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || uc >= 0x80;
}

std::string unquote_identifier(std::string_view ident) {
    const std::string trimmed = utils::trim(ident);
    if (trimmed.size() >= 2) {
        const char q = trimmed.front();
        if ((q == '`' || q == '"') && trimmed.back() == q) {
            std::string result;
            result.reserve(trimmed.size() - 2);
            for (size_t i = 1; i + 1 < trimmed.size(); ++i) {
                result += trimmed[i];
                if (trimmed[i] == q && i + 2 < trimmed.size() && trimmed[i + 1] == q) {
                    ++i;
                }
            }
            return result;
        }
    }
    return trimmed;
}

std::string quote_identifier(std::string_view name) {
    std::string result;
    result.reserve(name.size() + 2);
    result += '"';
    for (const char c : name) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

std::string maybe_quote_identifier(std::string_view name) {
    bool plain = !name.empty() && !std::isdigit(static_cast<unsigned char>(name[0]));
    for (const char c : name) {
        if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_')) {
            plain = false;
            break;
        }
    }
    return plain ? std::string(name) : quote_identifier(name);
}

std::string quote_literal(std::string_view value) {
    std::string result;
    result.reserve(value.size() + 2);
    result += '\'';
    for (const char c : value) {
        if (c == '\'') result += '\'';
        result += c;
    }
    result += '\'';
    return result;
}

std::string decode_mysql_string(std::string_view body, char quote) {
    std::string result;
    result.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            const char next = body[++i];
            switch (next) {
                case '0':  break;
                case 'b':  result += '\b'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'Z':  result += '\x1a'; break;
                case '%':  result += "\\%"; break;
                case '_':  result += "\\_"; break;
                default:   result += next; break;
            }
        } else if (c == quote && i + 1 < body.size() && body[i + 1] == quote) {
            result += quote;
            ++i;
        } else {
            result += c;
        }
    }
    return result;
}

std::optional<std::string> parse_string_literal(std::string_view token) {
    if (token.size() < 2) return std::nullopt;
    const char q = token.front();
    if ((q != '\'' && q != '"') || token.back() != q) return std::nullopt;
    if (find_string_end(token, 0) != token.size()) return std::nullopt;
    return decode_mysql_string(token.substr(1, token.size() - 2), q);
}

std::vector<std::string> split_top_level(std::string_view text, char sep) {
    std::vector<std::string> parts;
    ScanState state;
    std::string current;
    for (const char c : text) {
        if (c == sep && state.at_top_level()) {
            auto part = utils::trim(current);
            if (!part.empty()) parts.emplace_back(std::move(part));
            current.clear();
            continue;
        }
        state.feed(c);
        current += c;
    }
    auto part = utils::trim(current);
    if (!part.empty()) parts.emplace_back(std::move(part));
    return parts;
}

std::string rewrite_literals(std::string_view s) {
    std::string out;
    out.reserve(s.size() + s.size() / 16);

    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        const char c = s[i];
        const bool after_ident = i > 0 && is_ident_char(s[i - 1]);

        if (c == '`') {
            const size_t end = find_string_end(s, i);
            if (end == std::string_view::npos) {
                out.append(s.substr(i));
                break;
            }
            out += quote_identifier(unquote_identifier(s.substr(i, end - i)));
            i = end;
            continue;
        }

        if (c == '\'' || c == '"') {
            const size_t end = find_string_end(s, i);
            if (end == std::string_view::npos) {
                // Unterminated; the scanner never hands us one, keep it verbatim
                out.append(s.substr(i));
                break;
            }
            out += quote_literal(decode_mysql_string(s.substr(i + 1, end - i - 2), c));
            i = end;
            continue;
        }

        if (c == '\\' && i + 1 < n && s[i + 1] == 'N' &&
            (i + 2 >= n || !is_ident_char(s[i + 2]))) {
            out += "NULL";
            i += 2;
            continue;
        }

        if (!after_ident && i + 1 < n && s[i + 1] == '\'' &&
            (c == 'b' || c == 'B' || c == 'x' || c == 'X')) {
            const bool hex = (c == 'x' || c == 'X');
            const size_t len = prefixed_literal_body(s, i + 2, hex);
            if (len != std::string_view::npos) {
                out += hex ? "'\\x" : "'";
                out.append(s.substr(i + 2, len));
                out += '\'';
                i += len + 3;
                continue;
            }
        }

        if (c == '0' && !after_ident && i + 1 < n && (s[i + 1] == 'x' || s[i + 1] == 'X')) {
            size_t j = i + 2;
            while (j < n && is_hex_digit(s[j])) ++j;
            if (j > i + 2 && (j >= n || !is_ident_char(s[j]))) {
                out += "'\\x";
                out.append(s.substr(i + 2, j - i - 2));
                out += '\'';
                i = j;
                continue;
            }
        }

        if (c == '_' && !after_ident) {
            size_t j = i + 1;
            while (j < n && is_ident_char(s[j])) ++j;
            size_t k = j;
            while (k < n && is_space(s[k])) ++k;
            if (j > i + 1 && k < n && (s[k] == '\'' || s[k] == '"')) {
                i = k;
                continue;
            }
            out.append(s.substr(i, j - i));
            i = j;
            continue;
        }

        if (c == '\r' && i + 1 < n && s[i + 1] == '\n') {
            ++i;
            continue;
        }

        if (is_ident_char(c)) {
            // Copy the whole word so prefixes inside it are never reinterpreted
            size_t j = i + 1;
            while (j < n && is_ident_char(s[j])) ++j;
            out.append(s.substr(i, j - i));
            i = j;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

bool Token::is_word(std::string_view keyword) const {
    return kind == TokenKind::WORD && utils::iequals(text, keyword);
}

std::vector<Token> tokenize(std::string_view s) {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = s.size();

    while (i < n) {
        const char c = s[i];

        if (is_space(c)) {
            ++i;
            continue;
        }

        // Comments
        if (c == '#' || (c == '-' && i + 1 < n && s[i + 1] == '-' &&
                         (i + 2 >= n || is_space(s[i + 2])))) {
            while (i < n && s[i] != '\n') ++i;
            continue;
        }
        if (c == '/' && i + 1 < n && s[i + 1] == '*') {
            const size_t close = s.find("*/", i + 2);
            i = (close == std::string_view::npos) ? n : close + 2;
            continue;
        }

        if (c == '`' || c == '\'' || c == '"') {
            const size_t end = std::min(find_string_end(s, i), n);
            tokens.push_back({c == '`' ? TokenKind::QUOTED_IDENT : TokenKind::STRING,
                              std::string(s.substr(i, end - i))});
            i = end;
            continue;
        }

        const bool after_ident = i > 0 && is_ident_char(s[i - 1]);
        if (!after_ident && i + 1 < n && s[i + 1] == '\'' &&
            (c == 'b' || c == 'B' || c == 'x' || c == 'X')) {
            const size_t end = std::min(find_string_end(s, i + 1), n);
            const bool hex = (c == 'x' || c == 'X');
            tokens.push_back({hex ? TokenKind::HEX_LITERAL : TokenKind::BIT_LITERAL,
                              std::string(s.substr(i, end - i))});
            i = end;
            continue;
        }

        if (c == '(') {
            ScanState state;
            size_t j = i;
            for (; j < n; ++j) {
                state.feed(s[j]);
                if (state.at_top_level()) break;
            }
            if (j >= n) {
                tokens.push_back({TokenKind::PAREN_GROUP, std::string(s.substr(i + 1))});
                i = n;
            } else {
                tokens.push_back({TokenKind::PAREN_GROUP, std::string(s.substr(i + 1, j - i - 1))});
                i = j + 1;
            }
            continue;
        }

        if (is_ident_char(c)) {
            const bool numeric = std::isdigit(static_cast<unsigned char>(c)) != 0;
            size_t j = i + 1;
            while (j < n && (is_ident_char(s[j]) || (numeric && s[j] == '.'))) ++j;
            tokens.push_back({TokenKind::WORD, std::string(s.substr(i, j - i))});
            i = j;
            continue;
        }

        tokens.push_back({TokenKind::SYMBOL, std::string(1, c)});
        ++i;
    }
    return tokens;
}

} // namespace mysql2pg::sql
