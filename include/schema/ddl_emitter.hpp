#pragma once

#include "schema/schema_model.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace mysql2pg {

/**
 * @brief Renders a SchemaModel as PostgreSQL DDL
 *
 * Output is five phases, each introduced by "-- ===== <PHASE> =====":
 * SEQUENCES, TABLES, INDEXES, FOREIGN KEYS, COMMENTS. Foreign keys come
 * after every CREATE TABLE, so reference cycles need no ordering. A foreign
 * key whose owning or referenced table is not in the model is never emitted.
 *
 * Deterministic: the same model always produces the same bytes.
 */
class DdlEmitter {
public:
    static constexpr std::string_view kSequencesPhase = "SEQUENCES";
    static constexpr std::string_view kTablesPhase = "TABLES";
    static constexpr std::string_view kIndexesPhase = "INDEXES";
    static constexpr std::string_view kForeignKeysPhase = "FOREIGN KEYS";
    static constexpr std::string_view kCommentsPhase = "COMMENTS";

    static void emit(const SchemaModel& model, std::ostream& out);
    [[nodiscard]] static std::string emit(const SchemaModel& model);

    [[nodiscard]] static std::string phase_marker(std::string_view phase);

    [[nodiscard]] static std::string render_sequence(const Sequence& seq);
    [[nodiscard]] static std::string render_table(const Table& table);
    [[nodiscard]] static std::string render_index(const Index& index);
    [[nodiscard]] static std::string render_foreign_key(const ForeignKey& fk);
    [[nodiscard]] static std::string render_comment(const CommentEntry& entry);
};

} // namespace mysql2pg
