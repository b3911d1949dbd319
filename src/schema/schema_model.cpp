#include "schema/schema_model.hpp"

namespace mysql2pg {

Column* Table::find_column(std::string_view column_name) {
    for (auto& c : columns) {
        if (c.name == column_name) return &c;
    }
    return nullptr;
}

const Column* Table::find_column(std::string_view column_name) const {
    for (const auto& c : columns) {
        if (c.name == column_name) return &c;
    }
    return nullptr;
}

const Index* Table::find_index(std::string_view index_name) const {
    for (const auto& idx : indexes) {
        if (idx.name == index_name) return &idx;
    }
    return nullptr;
}

Table* SchemaModel::add_table(Table table) {
    const auto [it, inserted] = table_index_.try_emplace(table.name, tables_.size());
    if (!inserted) return nullptr;
    tables_.push_back(std::move(table));
    return &tables_.back();
}

Table* SchemaModel::find_table(std::string_view name) {
    const auto it = table_index_.find(std::string(name));
    return it == table_index_.end() ? nullptr : &tables_[it->second];
}

const Table* SchemaModel::find_table(std::string_view name) const {
    const auto it = table_index_.find(std::string(name));
    return it == table_index_.end() ? nullptr : &tables_[it->second];
}

Sequence* SchemaModel::add_sequence(Sequence sequence) {
    const auto [it, inserted] = sequence_index_.try_emplace(sequence.name, sequences_.size());
    if (!inserted) return nullptr;
    sequences_.push_back(std::move(sequence));
    return &sequences_.back();
}

Sequence* SchemaModel::find_sequence(std::string_view name) {
    const auto it = sequence_index_.find(std::string(name));
    return it == sequence_index_.end() ? nullptr : &sequences_[it->second];
}

size_t SchemaModel::index_count() const {
    size_t count = 0;
    for (const auto& t : tables_) count += t.indexes.size();
    return count;
}

} // namespace mysql2pg
