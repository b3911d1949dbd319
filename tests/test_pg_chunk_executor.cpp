#include <catch2/catch_test_macros.hpp>
#include "load/pg_chunk_executor.hpp"
#include "mocks/mock_db_connection.hpp"
#include "helpers/temp_dir.hpp"

using namespace mysql2pg;
using namespace mysql2pg::testing;

TEST_CASE("PgChunkExecutor: sends file as one script", "[pg_executor]") {
    TempDir dir;
    const auto path = dir.write("c_part_001.sql", "INSERT INTO t VALUES (1);\n");
    MockConnectionFactory factory;
    PgChunkExecutor executor(factory, {"host=db dbname=target", 0});

    const auto outcome = executor.execute(ChunkRef{1, path});
    CHECK(outcome.success);

    const auto& log = factory.log();
    REQUIRE(log.connection_strings.size() == 1);
    CHECK(log.connection_strings[0] == "host=db dbname=target");
    REQUIRE(log.scripts.size() == 1);
    CHECK(log.scripts[0] == "INSERT INTO t VALUES (1);\n");
    CHECK(log.timeouts.empty());
    CHECK(log.closed == 1);
}

TEST_CASE("PgChunkExecutor: fresh connection per attempt", "[pg_executor]") {
    TempDir dir;
    const auto path = dir.write("c.sql", "SELECT 1;");
    MockConnectionFactory factory;
    PgChunkExecutor executor(factory, {"dbname=x", 0});

    CHECK(executor.execute(ChunkRef{1, path}).success);
    CHECK(executor.execute(ChunkRef{1, path}).success);
    CHECK(factory.log().connection_strings.size() == 2);
    CHECK(factory.log().closed == 2);
}

TEST_CASE("PgChunkExecutor: statement timeout applied", "[pg_executor]") {
    TempDir dir;
    const auto path = dir.write("c.sql", "SELECT 1;");
    MockConnectionFactory factory;
    PgChunkExecutor executor(factory, {"dbname=x", 30000});

    CHECK(executor.execute(ChunkRef{1, path}).success);
    REQUIRE(factory.log().timeouts.size() == 1);
    CHECK(factory.log().timeouts[0] == 30000);
}

TEST_CASE("PgChunkExecutor: failures reported, not thrown", "[pg_executor]") {
    TempDir dir;
    const auto path = dir.write("c.sql", "SELECT 1;");
    MockConnectionFactory factory;
    PgChunkExecutor executor(factory, {"dbname=x", 0});

    SECTION("missing file") {
        const auto outcome = executor.execute(ChunkRef{1, dir.file("nope.sql")});
        CHECK_FALSE(outcome.success);
        CHECK(outcome.error_message.find("Cannot open chunk file") != std::string::npos);
        CHECK(factory.log().connection_strings.empty());
    }
    SECTION("connect fails") {
        factory.set_fail_connect(true);
        const auto outcome = executor.execute(ChunkRef{1, path});
        CHECK_FALSE(outcome.success);
        CHECK(outcome.error_message.find("Failed to connect") != std::string::npos);
    }
    SECTION("script fails") {
        factory.set_fail_execute(true);
        const auto outcome = executor.execute(ChunkRef{1, path});
        CHECK_FALSE(outcome.success);
        CHECK(outcome.error_message.find("duplicate key") != std::string::npos);
    }
}
