#include <catch2/catch_test_macros.hpp>
#include "schema/ddl_parser.hpp"

#include <sstream>

using namespace mysql2pg;

namespace {

bool has_warning(const SchemaModel& model, WarningKind kind, std::string_view needle) {
    for (const auto& w : model.warnings()) {
        if (w.kind == kind && w.message.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

TEST_CASE("DdlParser: basic CREATE TABLE", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);

    const auto kind = parser.parse_statement(
        "CREATE TABLE `users` (\n"
        "  `id` int(11) NOT NULL AUTO_INCREMENT,\n"
        "  `email` varchar(255) NOT NULL,\n"
        "  `score` decimal(10,2) DEFAULT '0.00',\n"
        "  `created_at` datetime DEFAULT CURRENT_TIMESTAMP,\n"
        "  PRIMARY KEY (`id`),\n"
        "  UNIQUE KEY `email_uq` (`email`),\n"
        "  KEY `idx_created` (`created_at`)\n"
        ") ENGINE=InnoDB AUTO_INCREMENT=42 DEFAULT CHARSET=utf8mb4", 1);
    parser.finish();

    CHECK(kind == DdlStatementKind::CREATE_TABLE);
    const Table* users = model.find_table("users");
    REQUIRE(users != nullptr);
    REQUIRE(users->columns.size() == 4);

    const auto& id = users->columns[0];
    CHECK(id.target_type == "integer");
    CHECK(id.auto_increment);
    CHECK_FALSE(id.nullable);
    CHECK(id.default_value == "nextval('users_id_seq')");

    CHECK(users->columns[1].target_type == "varchar(255)");
    CHECK(users->columns[2].target_type == "numeric(10,2)");
    CHECK(users->columns[2].default_value == "'0.00'");
    CHECK(users->columns[3].target_type == "timestamp");
    CHECK(users->columns[3].default_value == "CURRENT_TIMESTAMP");

    CHECK(users->primary_key == std::vector<std::string>{"id"});
    REQUIRE(users->indexes.size() == 2);
    CHECK(users->indexes[0].name == "email_uq");
    CHECK(users->indexes[0].unique);
    CHECK(users->indexes[1].name == "idx_created");
    CHECK_FALSE(users->indexes[1].unique);

    REQUIRE(model.sequences().size() == 1);
    CHECK(model.sequences()[0].name == "users_id_seq");
    CHECK(model.sequences()[0].start == 42);
}

TEST_CASE("DdlParser: statement classification", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);

    CHECK(parser.parse_statement("INSERT INTO t VALUES (1)") == DdlStatementKind::DATA);
    CHECK(parser.parse_statement("REPLACE INTO t VALUES (1)") == DdlStatementKind::DATA);
    CHECK(parser.parse_statement("DROP TABLE IF EXISTS `t`") == DdlStatementKind::IGNORED);
    CHECK(parser.parse_statement("LOCK TABLES `t` WRITE") == DdlStatementKind::IGNORED);
    CHECK(parser.parse_statement("SET NAMES utf8mb4") == DdlStatementKind::IGNORED);
    CHECK(parser.parse_statement("CREATE DATABASE shop") == DdlStatementKind::IGNORED);
    CHECK(parser.parse_statement("CREATE VIEW v AS SELECT 1") == DdlStatementKind::UNSUPPORTED);
    CHECK(model.warnings().size() == 1);
}

TEST_CASE("DdlParser: enum, set, bit and unsigned columns", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement(
        "CREATE TABLE `t` (\n"
        "  `status` enum('new','done') NOT NULL DEFAULT 'new',\n"
        "  `tags` set('a','b') DEFAULT 'a',\n"
        "  `flag` bit(1) DEFAULT b'0',\n"
        "  `qty` int(10) unsigned zerofill DEFAULT NULL\n"
        ")");

    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    REQUIRE(t->columns.size() == 4);
    CHECK(t->columns[0].target_type == "varchar(255)");
    CHECK(t->columns[0].check_constraint == "CHECK (\"status\" IN ('new', 'done'))");
    CHECK(t->columns[0].default_value == "'new'");
    CHECK(t->columns[1].target_type == "text");
    CHECK(t->columns[1].default_value == "'a'");
    CHECK(t->columns[2].target_type == "boolean");
    CHECK(t->columns[2].default_value == "'0'");
    CHECK(t->columns[3].target_type == "integer");
    CHECK(t->columns[3].default_value == "NULL");
    REQUIRE(model.warnings().size() == 1);
    CHECK(model.warnings()[0].kind == WarningKind::DROPPED_CONSTRUCT);
}

TEST_CASE("DdlParser: DEFAULT NULL on NOT NULL column dropped", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE t (a int NOT NULL DEFAULT NULL)");

    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    CHECK_FALSE(t->columns[0].default_value.has_value());
    CHECK(has_warning(model, WarningKind::DROPPED_CONSTRUCT, "DEFAULT NULL"));
}

TEST_CASE("DdlParser: ON UPDATE and unknown types warn", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement(
        "CREATE TABLE t (\n"
        "  updated timestamp NOT NULL DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP,\n"
        "  shape geometry\n"
        ")");

    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    CHECK(t->columns[0].default_value == "CURRENT_TIMESTAMP");
    CHECK(t->columns[1].target_type == "geometry");
    CHECK(has_warning(model, WarningKind::DROPPED_CONSTRUCT, "ON UPDATE"));
    CHECK(has_warning(model, WarningKind::UNKNOWN_TYPE, "geometry"));
}

TEST_CASE("DdlParser: foreign keys keep actions", "[ddl_parser][fk]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE users (id int NOT NULL, PRIMARY KEY (id))");
    parser.parse_statement(
        "CREATE TABLE orders (\n"
        "  id int NOT NULL,\n"
        "  user_id int,\n"
        "  CONSTRAINT `fk_orders_user` FOREIGN KEY (`user_id`) REFERENCES `users` (`id`)\n"
        "    ON DELETE CASCADE ON UPDATE SET NULL\n"
        ")");
    parser.finish();

    REQUIRE(model.foreign_keys().size() == 1);
    const auto& fk = model.foreign_keys()[0];
    CHECK(fk.name == "fk_orders_user");
    CHECK(fk.table == "orders");
    CHECK(fk.columns == std::vector<std::string>{"user_id"});
    CHECK(fk.ref_table == "users");
    CHECK(fk.ref_columns == std::vector<std::string>{"id"});
    CHECK(fk.on_delete == "CASCADE");
    CHECK(fk.on_update == "SET NULL");
}

TEST_CASE("DdlParser: unnamed foreign key gets default name", "[ddl_parser][fk]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE a (id int)");
    parser.parse_statement("CREATE TABLE b (a_id int, FOREIGN KEY (a_id) REFERENCES a (id))");
    parser.finish();

    REQUIRE(model.foreign_keys().size() == 1);
    CHECK(model.foreign_keys()[0].name == "b_a_id_fkey");
}

TEST_CASE("DdlParser: foreign key to missing table dropped at finish", "[ddl_parser][fk]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE b (a_id int, FOREIGN KEY (a_id) REFERENCES ghost (id))");
    CHECK(model.foreign_keys().size() == 1);

    parser.finish();
    CHECK(model.foreign_keys().empty());
    CHECK(has_warning(model, WarningKind::DROPPED_CONSTRUCT, "ghost"));
}

TEST_CASE("DdlParser: forward references resolve at finish", "[ddl_parser][fk]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE child (p_id int, FOREIGN KEY (p_id) REFERENCES parent (id))");
    parser.parse_statement("CREATE TABLE parent (id int)");
    parser.finish();
    CHECK(model.foreign_keys().size() == 1);
}

TEST_CASE("DdlParser: duplicate table and column skipped", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    CHECK(parser.parse_statement("CREATE TABLE t (a int, a text)") == DdlStatementKind::CREATE_TABLE);
    CHECK(parser.parse_statement("CREATE TABLE t (b int)") == DdlStatementKind::UNSUPPORTED);

    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    REQUIRE(t->columns.size() == 1);
    CHECK(t->columns[0].target_type == "integer");
    CHECK(has_warning(model, WarningKind::DROPPED_CONSTRUCT, "Duplicate column"));
    CHECK(has_warning(model, WarningKind::DROPPED_CONSTRUCT, "Duplicate CREATE TABLE"));
}

TEST_CASE("DdlParser: comments recorded", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement(
        "CREATE TABLE t (a int COMMENT 'the a') COMMENT='table note'");

    REQUIRE(model.comments().size() == 2);
    CHECK(model.comments()[0].target == CommentTarget::COLUMN);
    CHECK(model.comments()[0].column == "a");
    CHECK(model.comments()[0].text == "the a");
    CHECK(model.comments()[1].target == CommentTarget::TABLE);
    CHECK(model.comments()[1].text == "table note");
}

TEST_CASE("DdlParser: ALTER TABLE and CREATE INDEX", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE t (id int NOT NULL, name varchar(20))");

    CHECK(parser.parse_statement("ALTER TABLE `t` ADD PRIMARY KEY (`id`), ADD KEY `k_name` (`name`)") ==
          DdlStatementKind::ALTER_TABLE);
    CHECK(parser.parse_statement("ALTER TABLE t ADD COLUMN extra text") ==
          DdlStatementKind::ALTER_TABLE);
    CHECK(parser.parse_statement("ALTER TABLE t DISABLE KEYS") == DdlStatementKind::ALTER_TABLE);
    CHECK(parser.parse_statement("CREATE UNIQUE INDEX name_uq ON t (name)") ==
          DdlStatementKind::CREATE_INDEX);
    CHECK(parser.parse_statement("CREATE FULLTEXT INDEX ft ON t (name)") ==
          DdlStatementKind::UNSUPPORTED);

    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    CHECK(t->primary_key == std::vector<std::string>{"id"});
    CHECK(t->columns.size() == 3);
    REQUIRE(t->indexes.size() == 2);
    CHECK(t->indexes[1].name == "name_uq");
    CHECK(t->indexes[1].unique);
}

TEST_CASE("DdlParser: index name collisions get table prefix", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE a (name int, KEY `idx_name` (name))");
    parser.parse_statement("CREATE TABLE b (name int, KEY `idx_name` (name))");
    parser.finish();

    CHECK(model.find_table("a")->indexes[0].name == "idx_name");
    CHECK(model.find_table("b")->indexes[0].name == "b_idx_name");
}

TEST_CASE("DdlParser: anonymous and prefix-length keys", "[ddl_parser]") {
    SchemaModel model;
    DdlParser parser(model);
    parser.parse_statement("CREATE TABLE t (title varchar(200), KEY (title(50)))");

    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    REQUIRE(t->indexes.size() == 1);
    CHECK(t->indexes[0].name == "title");
    CHECK(has_warning(model, WarningKind::DROPPED_CONSTRUCT, "prefix lengths"));
}

TEST_CASE("DdlParser: parse_dump over a full stream", "[ddl_parser]") {
    std::istringstream in(
        "-- MySQL dump\n"
        "DROP TABLE IF EXISTS `t`;\n"
        "CREATE TABLE `t` (`id` int NOT NULL AUTO_INCREMENT, PRIMARY KEY (`id`));\n"
        "INSERT INTO `t` VALUES (1),(2);\n");
    auto result = DdlParser::parse_dump(in);
    REQUIRE(result.is_ok());
    CHECK(result.value().tables().size() == 1);
    CHECK(result.value().sequences().size() == 1);
}

TEST_CASE("DdlParser: apostrophe in a body comment is not a literal", "[ddl_parser]") {
    std::istringstream in(
        "CREATE TABLE t (\n"
        " id int NOT NULL, -- user's id\n"
        " name varchar(10)\n"
        ");\n"
        "CREATE TABLE u (id int);\n");
    auto result = DdlParser::parse_dump(in);
    REQUIRE(result.is_ok());
    const auto& model = result.value();
    REQUIRE(model.tables().size() == 2);
    const Table* t = model.find_table("t");
    REQUIRE(t != nullptr);
    REQUIRE(t->columns.size() == 2);
    CHECK(t->columns[1].name == "name");
    CHECK(t->columns[1].target_type == "varchar(10)");
    CHECK(model.find_table("u") != nullptr);
}

TEST_CASE("DdlParser: unterminated CREATE TABLE is fatal", "[ddl_parser]") {
    std::istringstream in(
        "CREATE TABLE `ok` (`id` int);\n"
        "CREATE TABLE `broken` (\n  `id` int,\n");
    auto result = DdlParser::parse_dump(in);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    CHECK(result.error_message().find("\"broken\"") != std::string::npos);
    CHECK(result.error_message().find("line 2") != std::string::npos);
}
