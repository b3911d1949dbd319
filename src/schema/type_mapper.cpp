#include "schema/type_mapper.hpp"
#include "core/sql_lexer.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace mysql2pg {

namespace {

// Types whose arguments are display widths or storage hints only
const std::unordered_map<std::string_view, std::string_view>& fixed_types() {
    static const std::unordered_map<std::string_view, std::string_view> TYPE_MAP = {
        {"tinyint", "smallint"},
        {"smallint", "smallint"},
        {"mediumint", "integer"},
        {"int", "integer"},
        {"integer", "integer"},
        {"bigint", "bigint"},
        {"float", "real"},
        {"real", "real"},
        {"double", "double precision"},
        {"double precision", "double precision"},
        {"tinytext", "text"},
        {"text", "text"},
        {"mediumtext", "text"},
        {"longtext", "text"},
        {"tinyblob", "bytea"},
        {"blob", "bytea"},
        {"mediumblob", "bytea"},
        {"longblob", "bytea"},
        {"binary", "bytea"},
        {"varbinary", "bytea"},
        {"date", "date"},
        {"year", "smallint"},
        {"json", "jsonb"},
        {"bool", "boolean"},
        {"boolean", "boolean"},
        {"enum", "varchar(255)"},
        {"set", "text"},
    };
    return TYPE_MAP;
}

std::string with_args(std::string_view name, const std::vector<std::string>& args) {
    if (args.empty()) return std::string(name);
    return std::format("{}({})", name, utils::join(args, ","));
}

} // anonymous namespace

std::optional<std::string> TypeMapper::map_type_name(
    std::string_view type_name, const std::vector<std::string>& args) {

    const std::string name = utils::to_lower(type_name);

    const auto& fixed = fixed_types();
    if (const auto it = fixed.find(name); it != fixed.end()) {
        return std::string(it->second);
    }

    if (name == "decimal" || name == "numeric" || name == "dec" || name == "fixed") {
        return with_args("numeric", args);
    }
    if (name == "varchar" || name == "char") {
        return with_args(name, args);
    }
    if (name == "datetime" || name == "timestamp") {
        return with_args("timestamp", args);
    }
    if (name == "time") {
        return with_args("time", args);
    }
    if (name == "bit") {
        if (args.empty() || (args.size() == 1 && args[0] == "1")) return "boolean";
        return with_args("bit", args);
    }
    return std::nullopt;
}

bool TypeMapper::is_current_timestamp(std::string_view expr) {
    std::string upper = utils::to_upper(utils::trim(expr));
    // Optional "()" or "(fsp)"
    if (!upper.empty() && upper.back() == ')') {
        const auto open = upper.find('(');
        if (open == std::string::npos) return false;
        const auto inner = std::string_view(upper).substr(open + 1, upper.size() - open - 2);
        if (!inner.empty() && !utils::try_parse_int<int>(inner)) return false;
        upper.erase(open);
    }
    return upper == "CURRENT_TIMESTAMP" || upper == "NOW" ||
           upper == "LOCALTIMESTAMP" || upper == "LOCALTIME";
}

std::optional<std::string> TypeMapper::rewrite_default(
    std::string_view raw, std::string_view target_type) {

    const std::string expr = utils::trim(raw);

    if (utils::iequals(expr, "NULL")) {
        return std::nullopt;
    }
    if (is_current_timestamp(expr)) {
        return "CURRENT_TIMESTAMP";
    }

    // b'0101' -> '0101'
    if (expr.size() >= 3 && (expr[0] == 'b' || expr[0] == 'B') && expr[1] == '\'' &&
        expr.back() == '\'') {
        return std::format("'{}'", expr.substr(2, expr.size() - 3));
    }

    if (const auto value = sql::parse_string_literal(expr)) {
        return sql::quote_literal(*value);
    }

    if (target_type == "boolean") {
        if (expr == "0") return "false";
        if (expr == "1") return "true";
    }

    // Numbers, hex literals, charset-introduced strings, (expr) defaults
    return sql::rewrite_literals(expr);
}

MappedType TypeMapper::map(const ColumnTypeSpec& spec) {
    MappedType result;

    if (auto mapped = map_type_name(spec.type_name, spec.args)) {
        result.type = std::move(*mapped);
    } else {
        result.type = with_args(spec.type_name, spec.args);
        result.warning = Warning{
            WarningKind::UNKNOWN_TYPE,
            spec.column,
            std::format("Unknown MySQL type '{}', passed through unchanged", result.type)
        };
    }

    // Dump rows carry SET values as 'a,b', which text accepts as-is
    if (utils::iequals(spec.type_name, "set")) {
        result.warning = Warning{
            WarningKind::DROPPED_CONSTRUCT,
            spec.column,
            "SET member list dropped, column stored as comma-separated text"
        };
    }

    if (utils::iequals(spec.type_name, "enum") && !spec.enum_values.empty()) {
        std::vector<std::string> quoted;
        quoted.reserve(spec.enum_values.size());
        for (const auto& v : spec.enum_values) {
            quoted.push_back(sql::quote_literal(v));
        }
        result.constraint = std::format("CHECK ({} IN ({}))",
            sql::quote_identifier(spec.column), utils::join(quoted, ", "));
    }

    if (spec.default_literal) {
        result.default_value = rewrite_default(*spec.default_literal, result.type);
        result.null_default = !result.default_value.has_value();
    }

    return result;
}

} // namespace mysql2pg
