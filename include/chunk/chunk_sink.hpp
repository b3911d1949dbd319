#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>

namespace mysql2pg {

/**
 * @brief Destination for chunk units
 *
 * The splitter calls open_chunk / append... / close_chunk per unit, units in
 * increasing sequence order, never two units open at once.
 */
class IChunkSink {
public:
    virtual ~IChunkSink() = default;

    /**
     * @brief Start unit `sequence` (1-based)
     * @return Reference to the unit (a file path for the file sink)
     * @throws std::runtime_error if the unit cannot be created
     */
    virtual std::string open_chunk(uint32_t sequence) = 0;

    /**
     * @return false on write failure
     */
    [[nodiscard]] virtual bool append(std::string_view text) = 0;

    /**
     * @throws std::runtime_error if the unit cannot be finalized
     */
    virtual void close_chunk() = 0;
};

/**
 * @brief Writes each unit to <output_dir>/<prefix>_part_<NNN>.sql
 *
 * With session settings enabled every file starts with a "Part N" banner and
 *   SET session_replication_role = 'replica';
 *   SET synchronous_commit = OFF;
 *   SET maintenance_work_mem = '256MB';
 * and ends with
 *   SET session_replication_role = 'origin';
 * which disables triggers and FK checks for the bulk load of that file.
 */
class FileChunkSink : public IChunkSink {
public:
    struct Config {
        std::string output_dir = "pg_inserts";
        std::string prefix = "pg_inserts";
        bool session_settings = true;
    };

    static constexpr std::string_view kSessionSettings =
        "SET session_replication_role = 'replica';\n"
        "SET synchronous_commit = OFF;\n"
        "SET maintenance_work_mem = '256MB';\n\n";
    static constexpr std::string_view kSessionFooter =
        "\nSET session_replication_role = 'origin';\n";

    /**
     * @throws std::runtime_error if output_dir cannot be created
     */
    explicit FileChunkSink(Config config);
    ~FileChunkSink() override;

    FileChunkSink(const FileChunkSink&) = delete;
    FileChunkSink& operator=(const FileChunkSink&) = delete;

    std::string open_chunk(uint32_t sequence) override;
    [[nodiscard]] bool append(std::string_view text) override;
    void close_chunk() override;

    [[nodiscard]] static std::string chunk_file_name(std::string_view prefix, uint32_t sequence);

    // Banner plus kSessionSettings
    [[nodiscard]] static std::string session_header(uint32_t sequence);

private:
    Config config_;
    std::ofstream file_;
    std::string current_path_;
};

} // namespace mysql2pg
