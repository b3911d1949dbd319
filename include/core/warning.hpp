#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mysql2pg {

/**
 * @brief Non-fatal conditions reported by the DDL and data layers
 *
 * Producers only record warnings; callers decide how to surface them.
 */
enum class WarningKind {
    UNKNOWN_TYPE,
    UNCLASSIFIED_CLAUSE,
    DROPPED_CONSTRUCT,
    OVERSIZED_STATEMENT,
};

[[nodiscard]] inline std::string_view warning_kind_to_string(WarningKind kind) {
    switch (kind) {
        case WarningKind::UNKNOWN_TYPE:        return "unknown_type";
        case WarningKind::UNCLASSIFIED_CLAUSE: return "unclassified_clause";
        case WarningKind::DROPPED_CONSTRUCT:   return "dropped_construct";
        case WarningKind::OVERSIZED_STATEMENT: return "oversized_statement";
        default: return "unknown";
    }
}

struct Warning {
    WarningKind kind = WarningKind::UNCLASSIFIED_CLAUSE;
    std::string construct;      // table, table.column or statement index
    std::string message;
};

using WarningList = std::vector<Warning>;

} // namespace mysql2pg
