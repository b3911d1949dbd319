#include <catch2/catch_test_macros.hpp>
#include "schema/type_mapper.hpp"

using namespace mysql2pg;

namespace {

std::string mapped(std::string_view name, std::vector<std::string> args = {}) {
    auto result = TypeMapper::map_type_name(name, args);
    return result ? *result : "<unknown>";
}

} // anonymous namespace

TEST_CASE("TypeMapper: integer family", "[type_mapper]") {
    CHECK(mapped("tinyint", {"4"}) == "smallint");
    CHECK(mapped("smallint") == "smallint");
    CHECK(mapped("mediumint") == "integer");
    CHECK(mapped("int", {"11"}) == "integer");
    CHECK(mapped("INT") == "integer");
    CHECK(mapped("bigint", {"20"}) == "bigint");
}

TEST_CASE("TypeMapper: numeric keeps precision", "[type_mapper]") {
    CHECK(mapped("decimal", {"10", "2"}) == "numeric(10,2)");
    CHECK(mapped("numeric") == "numeric");
    CHECK(mapped("float") == "real");
    CHECK(mapped("double") == "double precision");
}

TEST_CASE("TypeMapper: strings and binaries", "[type_mapper]") {
    CHECK(mapped("varchar", {"255"}) == "varchar(255)");
    CHECK(mapped("char", {"2"}) == "char(2)");
    CHECK(mapped("longtext") == "text");
    CHECK(mapped("mediumblob") == "bytea");
    CHECK(mapped("varbinary", {"16"}) == "bytea");
}

TEST_CASE("TypeMapper: temporal types", "[type_mapper]") {
    CHECK(mapped("datetime") == "timestamp");
    CHECK(mapped("datetime", {"6"}) == "timestamp(6)");
    CHECK(mapped("timestamp") == "timestamp");
    CHECK(mapped("date") == "date");
    CHECK(mapped("time", {"3"}) == "time(3)");
    CHECK(mapped("year", {"4"}) == "smallint");
}

TEST_CASE("TypeMapper: bit, json, enum, set", "[type_mapper]") {
    CHECK(mapped("bit") == "boolean");
    CHECK(mapped("bit", {"1"}) == "boolean");
    CHECK(mapped("bit", {"8"}) == "bit(8)");
    CHECK(mapped("json") == "jsonb");
    CHECK(mapped("enum") == "varchar(255)");
    CHECK(mapped("set") == "text");
}

TEST_CASE("TypeMapper: unknown type passes through with warning", "[type_mapper]") {
    CHECK_FALSE(TypeMapper::map_type_name("geometry", {}).has_value());

    ColumnTypeSpec spec;
    spec.column = "shape";
    spec.type_name = "geometry";
    const auto result = TypeMapper::map(spec);
    CHECK(result.type == "geometry");
    REQUIRE(result.warning.has_value());
    CHECK(result.warning->kind == WarningKind::UNKNOWN_TYPE);
    CHECK(result.warning->construct == "shape");
}

TEST_CASE("TypeMapper: enum gets CHECK constraint", "[type_mapper]") {
    ColumnTypeSpec spec;
    spec.column = "status";
    spec.type_name = "enum";
    spec.enum_values = {"active", "it's"};
    const auto result = TypeMapper::map(spec);
    CHECK(result.type == "varchar(255)");
    CHECK(result.constraint == "CHECK (\"status\" IN ('active', 'it''s'))");
    CHECK_FALSE(result.warning.has_value());
}

TEST_CASE("TypeMapper: set becomes text with a dropped-construct warning", "[type_mapper]") {
    ColumnTypeSpec spec;
    spec.column = "tags";
    spec.type_name = "set";
    spec.enum_values = {"a", "b"};
    spec.default_literal = "'a,b'";
    const auto result = TypeMapper::map(spec);
    CHECK(result.type == "text");
    CHECK(result.default_value == "'a,b'");
    CHECK(result.constraint.empty());
    REQUIRE(result.warning.has_value());
    CHECK(result.warning->kind == WarningKind::DROPPED_CONSTRUCT);
    CHECK(result.warning->construct == "tags");
}

TEST_CASE("TypeMapper: default rewriting", "[type_mapper][default]") {
    CHECK_FALSE(TypeMapper::rewrite_default("NULL", "integer").has_value());
    CHECK(TypeMapper::rewrite_default("CURRENT_TIMESTAMP", "timestamp") == "CURRENT_TIMESTAMP");
    CHECK(TypeMapper::rewrite_default("current_timestamp(6)", "timestamp(6)") == "CURRENT_TIMESTAMP");
    CHECK(TypeMapper::rewrite_default("now()", "timestamp") == "CURRENT_TIMESTAMP");
    CHECK(TypeMapper::rewrite_default("'0'", "integer") == "'0'");
    CHECK(TypeMapper::rewrite_default("'it\\'s'", "text") == "'it''s'");
    CHECK(TypeMapper::rewrite_default("b'1'", "boolean") == "'1'");
    CHECK(TypeMapper::rewrite_default("1", "boolean") == "true");
    CHECK(TypeMapper::rewrite_default("0", "boolean") == "false");
    CHECK(TypeMapper::rewrite_default("42", "integer") == "42");
    CHECK(TypeMapper::rewrite_default("'a,b'", "text") == "'a,b'");
}

TEST_CASE("TypeMapper: is_current_timestamp", "[type_mapper][default]") {
    CHECK(TypeMapper::is_current_timestamp("LOCALTIMESTAMP"));
    CHECK(TypeMapper::is_current_timestamp("CURRENT_TIMESTAMP()"));
    CHECK_FALSE(TypeMapper::is_current_timestamp("'CURRENT_TIMESTAMP'"));
    CHECK_FALSE(TypeMapper::is_current_timestamp("CURRENT_TIMESTAMP(x)"));
}

TEST_CASE("TypeMapper: map carries default and null flag", "[type_mapper][default]") {
    ColumnTypeSpec spec;
    spec.column = "created";
    spec.type_name = "datetime";
    spec.default_literal = "CURRENT_TIMESTAMP";
    auto result = TypeMapper::map(spec);
    CHECK(result.default_value == "CURRENT_TIMESTAMP");
    CHECK_FALSE(result.null_default);

    spec.default_literal = "NULL";
    result = TypeMapper::map(spec);
    CHECK_FALSE(result.default_value.has_value());
    CHECK(result.null_default);
}

TEST_CASE("TypeMapper: map is a pure function of its input", "[type_mapper][pure]") {
    ColumnTypeSpec status;
    status.column = "status";
    status.type_name = "enum";
    status.enum_values = {"new", "done"};
    status.default_literal = "'new'";

    ColumnTypeSpec shape;
    shape.column = "shape";
    shape.type_name = "geometry";

    ColumnTypeSpec created;
    created.column = "created";
    created.type_name = "datetime";
    created.args = {"6"};
    created.default_literal = "CURRENT_TIMESTAMP(6)";

    auto same = [](const MappedType& a, const MappedType& b) {
        CHECK(a.type == b.type);
        CHECK(a.constraint == b.constraint);
        CHECK(a.default_value == b.default_value);
        CHECK(a.null_default == b.null_default);
        REQUIRE(a.warning.has_value() == b.warning.has_value());
        if (a.warning) {
            CHECK(a.warning->kind == b.warning->kind);
            CHECK(a.warning->construct == b.warning->construct);
            CHECK(a.warning->message == b.warning->message);
        }
    };

    const auto status_first = TypeMapper::map(status);
    const auto shape_first = TypeMapper::map(shape);
    const auto created_first = TypeMapper::map(created);

    // Unrelated calls in between must not leak into later results
    for (const char* name : {"set", "bit", "json", "mystery", "decimal"}) {
        ColumnTypeSpec other;
        other.column = "x";
        other.type_name = name;
        other.default_literal = "'1'";
        (void)TypeMapper::map(other);
    }

    same(status_first, TypeMapper::map(status));
    same(shape_first, TypeMapper::map(shape));
    same(created_first, TypeMapper::map(created));
    same(TypeMapper::map(created), TypeMapper::map(created));

    CHECK(status_first.constraint == "CHECK (\"status\" IN ('new', 'done'))");
    CHECK(shape_first.warning.has_value());
    CHECK(created_first.default_value == "CURRENT_TIMESTAMP");
}
