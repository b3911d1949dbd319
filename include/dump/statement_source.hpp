#pragma once

#include <cstdint>
#include <string>

namespace mysql2pg {

/**
 * @brief One INSERT statement after dialect rewriting
 *
 * text always ends with ";". index is the 0-based source-order position
 * among the INSERT statements of the dump.
 */
struct RewrittenStatement {
    std::string text;
    uint64_t index = 0;
    uint64_t line = 0;
};

enum class StepStatus {
    STATEMENT,
    END_OF_INPUT,
    PARSE_ERROR,
};

struct ExtractStep {
    StepStatus status = StepStatus::END_OF_INPUT;
    RewrittenStatement statement;
    std::string error_message;

    static ExtractStep of(RewrittenStatement stmt) {
        ExtractStep step;
        step.status = StepStatus::STATEMENT;
        step.statement = std::move(stmt);
        return step;
    }

    static ExtractStep end() { return {}; }

    static ExtractStep error(std::string message) {
        ExtractStep step;
        step.status = StepStatus::PARSE_ERROR;
        step.error_message = std::move(message);
        return step;
    }
};

/**
 * @brief Lazy, forward-only sequence of rewritten statements
 *
 * Pull-based: the consumer calls next() at its own pace and may stop early.
 */
class IStatementSource {
public:
    virtual ~IStatementSource() = default;

    [[nodiscard]] virtual ExtractStep next() = 0;
};

} // namespace mysql2pg
