#pragma once

#include "core/warning.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mysql2pg {

/**
 * @brief MySQL column type as declared in CREATE TABLE
 */
struct ColumnTypeSpec {
    std::string column;                         // column name (CHECK constraint target)
    std::string type_name;                      // lowercase, e.g. "varchar", "double precision"
    std::vector<std::string> args;              // raw length/precision args: "10", "2"
    std::vector<std::string> enum_values;       // decoded ENUM / SET members
    std::optional<std::string> default_literal; // raw DEFAULT expression
};

/**
 * @brief PostgreSQL rendition of a column type
 */
struct MappedType {
    std::string type;                           // "integer", "numeric(10,2)", ...
    std::string constraint;                     // column constraint, e.g. CHECK (...), or empty
    std::optional<std::string> default_value;   // rewritten DEFAULT expression
    bool null_default = false;                  // explicit DEFAULT NULL
    std::optional<Warning> warning;
};

/**
 * @brief MySQL to PostgreSQL column type mapping
 *
 * Stateless: the result depends only on the ColumnTypeSpec.
 * Unknown type names pass through unchanged with an UNKNOWN_TYPE warning.
 */
class TypeMapper {
public:
    [[nodiscard]] static MappedType map(const ColumnTypeSpec& spec);

    /**
     * @brief Target type name for a MySQL type and its args
     * @return Mapped type, or std::nullopt for an unknown type name
     */
    [[nodiscard]] static std::optional<std::string> map_type_name(
        std::string_view type_name, const std::vector<std::string>& args);

    /**
     * @brief Rewrite a MySQL DEFAULT expression for a column of `target_type`
     * @return Rewritten expression, or std::nullopt for DEFAULT NULL
     */
    [[nodiscard]] static std::optional<std::string> rewrite_default(
        std::string_view raw, std::string_view target_type);

    [[nodiscard]] static bool is_current_timestamp(std::string_view expr);
};

} // namespace mysql2pg
