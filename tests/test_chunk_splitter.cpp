#include <catch2/catch_test_macros.hpp>
#include "chunk/chunk_splitter.hpp"
#include "dump/statement_extractor.hpp"
#include "mocks/memory_chunk_sink.hpp"
#include "mocks/vector_statement_source.hpp"
#include "helpers/temp_dir.hpp"

#include <filesystem>
#include <sstream>

using namespace mysql2pg;
using namespace mysql2pg::testing;

namespace {

// 9 characters, 10 bytes with the newline
std::vector<std::string> statements(size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i) out.push_back(std::format("INSERT {};", i));
    return out;
}

} // anonymous namespace

TEST_CASE("ChunkSplitter: unit closes once budget is reached", "[splitter]") {
    MemoryChunkSink sink;
    VectorStatementSource source(statements(5));
    ChunkSplitter splitter(sink, 25);

    auto result = splitter.split(source);
    REQUIRE(result.is_ok());
    const auto& summary = result.value();

    REQUIRE(summary.chunks.size() == 2);
    CHECK(summary.chunks[0].statement_count == 3);
    CHECK(summary.chunks[0].bytes == 30);
    CHECK(summary.chunks[0].first_index == 0);
    CHECK(summary.chunks[0].last_index == 2);
    CHECK(summary.chunks[1].statement_count == 2);
    CHECK(summary.chunks[1].first_index == 3);
    CHECK(summary.chunks[1].last_index == 4);
    CHECK(summary.statements == 5);
    CHECK(summary.bytes == 50);
    CHECK(summary.warnings.empty());

    REQUIRE(sink.units().size() == 2);
    CHECK(sink.units()[0].sequence == 1);
    CHECK(sink.units()[1].sequence == 2);
    CHECK(sink.units()[0].closed);
    CHECK(sink.units()[1].closed);
}

TEST_CASE("ChunkSplitter: concatenated units reproduce the input", "[splitter]") {
    MemoryChunkSink sink;
    const auto input = statements(17);
    VectorStatementSource source(input);
    ChunkSplitter splitter(sink, 32);

    auto result = splitter.split(source);
    REQUIRE(result.is_ok());

    std::string joined;
    for (const auto& unit : sink.units()) {
        CHECK_FALSE(unit.content.empty());
        joined += unit.content;
    }
    std::string expected;
    for (const auto& s : input) expected += s + "\n";
    CHECK(joined == expected);

    uint64_t total = 0;
    for (const auto& c : result.value().chunks) total += c.statement_count;
    CHECK(total == input.size());
}

TEST_CASE("ChunkSplitter: oversized statement gets its own unit", "[splitter]") {
    MemoryChunkSink sink;
    const std::string big(100, 'x');
    VectorStatementSource source({"INSERT 0;", big, "INSERT 2;"});
    ChunkSplitter splitter(sink, 25);

    auto result = splitter.split(source);
    REQUIRE(result.is_ok());
    const auto& summary = result.value();

    REQUIRE(summary.chunks.size() == 3);
    CHECK(summary.chunks[0].statement_count == 1);
    CHECK_FALSE(summary.chunks[0].oversized);
    CHECK(summary.chunks[1].statement_count == 1);
    CHECK(summary.chunks[1].oversized);
    CHECK(summary.chunks[1].first_index == 1);
    CHECK(summary.chunks[2].statement_count == 1);

    REQUIRE(summary.warnings.size() == 1);
    CHECK(summary.warnings[0].kind == WarningKind::OVERSIZED_STATEMENT);
}

TEST_CASE("ChunkSplitter: empty source produces no units", "[splitter]") {
    MemoryChunkSink sink;
    VectorStatementSource source({});
    ChunkSplitter splitter(sink, 25);

    auto result = splitter.split(source);
    REQUIRE(result.is_ok());
    CHECK(result.value().chunks.empty());
    CHECK(sink.units().empty());
}

TEST_CASE("ChunkSplitter: source error closes open unit", "[splitter]") {
    MemoryChunkSink sink;
    VectorStatementSource source(statements(2), "Unterminated INSERT statement #2");
    ChunkSplitter splitter(sink, 1000);

    auto result = splitter.split(source);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    CHECK(result.error_message().find("#2") != std::string::npos);
    REQUIRE(sink.units().size() == 1);
    CHECK(sink.units()[0].closed);
}

TEST_CASE("ChunkSplitter: sink failures are IO errors", "[splitter]") {
    SECTION("open fails") {
        MemoryChunkSink sink;
        sink.set_fail_open(true);
        VectorStatementSource source(statements(1));
        ChunkSplitter splitter(sink, 100);
        auto result = splitter.split(source);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    }
    SECTION("append fails") {
        MemoryChunkSink sink;
        sink.set_fail_after_appends(2);
        VectorStatementSource source(statements(3));
        ChunkSplitter splitter(sink, 100);
        auto result = splitter.split(source);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
        CHECK(result.error_message().find("#1") != std::string::npos);
    }
}

TEST_CASE("ChunkSplitter: budget of zero is clamped", "[splitter]") {
    MemoryChunkSink sink;
    ChunkSplitter splitter(sink, 0);
    CHECK(splitter.budget_bytes() == 1);

    VectorStatementSource source(statements(3));
    auto result = splitter.split(source);
    REQUIRE(result.is_ok());
    CHECK(result.value().chunks.size() == 3);
}

// ============================================================================
// FileChunkSink
// ============================================================================

TEST_CASE("FileChunkSink: file naming", "[splitter][file_sink]") {
    CHECK(FileChunkSink::chunk_file_name("pg_inserts", 1) == "pg_inserts_part_001.sql");
    CHECK(FileChunkSink::chunk_file_name("data", 42) == "data_part_042.sql");
    CHECK(FileChunkSink::chunk_file_name("data", 1234) == "data_part_1234.sql");
}

TEST_CASE("FileChunkSink: session settings frame each file", "[splitter][file_sink]") {
    TempDir dir;
    const auto out_dir = dir.file("chunks");
    FileChunkSink sink({out_dir, "p", true});

    const auto path = sink.open_chunk(1);
    CHECK(path == (std::filesystem::path(out_dir) / "p_part_001.sql").string());
    REQUIRE(sink.append("INSERT INTO t VALUES (1);"));
    REQUIRE(sink.append("\n"));
    sink.close_chunk();

    const auto content = TempDir::read(path);
    CHECK(content == FileChunkSink::session_header(1) +
                     "INSERT INTO t VALUES (1);\n" +
                     std::string(FileChunkSink::kSessionFooter));
}

TEST_CASE("FileChunkSink: header names the part and tunes the session", "[splitter][file_sink]") {
    const auto header = FileChunkSink::session_header(7);
    CHECK(header.rfind("-- mysql2pg INSERT statements - Part 7\n", 0) == 0);
    CHECK(header.find("SET session_replication_role = 'replica';\n") != std::string::npos);
    CHECK(header.find("SET synchronous_commit = OFF;\n") != std::string::npos);
    CHECK(header.find("SET maintenance_work_mem = '256MB';\n") != std::string::npos);
    CHECK(header.ends_with(std::string(FileChunkSink::kSessionSettings)));
}

TEST_CASE("FileChunkSink: without session settings", "[splitter][file_sink]") {
    TempDir dir;
    FileChunkSink sink({dir.path().string(), "p", false});
    const auto path = sink.open_chunk(3);
    REQUIRE(sink.append("X;\n"));
    sink.close_chunk();
    CHECK(TempDir::read(path) == "X;\n");
}

TEST_CASE("FileChunkSink: dump to files end to end", "[splitter][file_sink]") {
    TempDir dir;
    std::istringstream dump(
        "CREATE TABLE t (id int);\n"
        "INSERT INTO `t` VALUES (1);\n"
        "INSERT INTO `t` VALUES (2);\n"
        "INSERT INTO `t` VALUES (3);\n");

    StatementExtractor extractor(dump);
    FileChunkSink sink({dir.path().string(), "pg_inserts", false});
    ChunkSplitter splitter(sink, 40);

    auto result = splitter.split(extractor);
    REQUIRE(result.is_ok());
    const auto& chunks = result.value().chunks;
    REQUIRE(chunks.size() == 2);
    CHECK(TempDir::read(chunks[0].path) ==
          "INSERT INTO \"t\" VALUES (1);\nINSERT INTO \"t\" VALUES (2);\n");
    CHECK(TempDir::read(chunks[1].path) == "INSERT INTO \"t\" VALUES (3);\n");
}
