#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace mysql2pg {

/**
 * @brief One complete SQL statement as it appeared in the dump
 */
struct ScannedStatement {
    std::string text;        // statement text, delimiter excluded, trimmed
    uint64_t ordinal = 0;    // 0-based position among all statements
    uint64_t line = 0;       // 1-based line where the statement starts
};

enum class ScanStatus {
    STATEMENT,
    END_OF_INPUT,
    UNTERMINATED,            // quote or parenthesis still open at end of input
};

struct ScanStep {
    ScanStatus status = ScanStatus::END_OF_INPUT;
    ScannedStatement statement;   // partial text when UNTERMINATED
};

/**
 * @brief Pull-based splitter of a SQL byte stream into statements
 *
 * Memory is bounded by the read buffer plus the statement currently being
 * assembled; the input is never held in full.
 *
 * Boundary rule: the delimiter (default ";") ends a statement only at
 * parenthesis depth 0 outside any quote context. "-- ", "#" and C-style
 * comments outside quotes are dropped wherever they appear, including
 * inside a statement body. Between statements, mysql client "DELIMITER xx"
 * commands change the delimiter.
 *
 * Forward-only and non-restartable. After END_OF_INPUT or UNTERMINATED
 * every further call returns END_OF_INPUT.
 */
class StatementScanner {
public:
    explicit StatementScanner(std::istream& input, size_t buffer_size = 64 * 1024);

    StatementScanner(const StatementScanner&) = delete;
    StatementScanner& operator=(const StatementScanner&) = delete;

    [[nodiscard]] ScanStep next();

    [[nodiscard]] uint64_t bytes_consumed() const { return bytes_consumed_; }
    [[nodiscard]] uint64_t current_line() const { return line_; }
    [[nodiscard]] uint64_t statements_scanned() const { return ordinal_; }

private:
    static constexpr int kEof = -1;

    // Byte `ahead` positions past the cursor, or kEof
    int peek(size_t ahead = 0);
    void advance(size_t count = 1);

    enum class CommentKind { NONE, LINE, BLOCK };

    // Comment opening at the cursor, if any
    CommentKind comment_at();
    void skip_comment(CommentKind kind);

    // Skips whitespace, comments and DELIMITER commands; false at end of input
    bool skip_to_statement();
    bool match_delimiter();
    bool match_keyword(std::string_view keyword);

    std::istream& input_;
    std::vector<char> buffer_;
    size_t pos_ = 0;
    size_t end_ = 0;
    bool input_exhausted_ = false;
    bool finished_ = false;

    std::string delimiter_ = ";";
    uint64_t bytes_consumed_ = 0;
    uint64_t line_ = 1;
    uint64_t ordinal_ = 0;
};

} // namespace mysql2pg
