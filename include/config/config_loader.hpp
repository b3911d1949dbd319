#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace mysql2pg {

// ============================================================================
// Section configs (mirror the TOML hierarchy)
// ============================================================================

struct InputConfig {
    std::string dump_file;
};

struct DdlConfig {
    bool enabled = true;
    std::string output_file = "schema_pg.sql";
};

struct SplitConfig {
    bool enabled = true;
    std::string output_dir = "pg_inserts";
    std::string prefix = "pg_inserts";
    int64_t chunk_size_mb = 200;
    bool session_settings = true;

    [[nodiscard]] uint64_t chunk_size_bytes() const {
        return static_cast<uint64_t>(chunk_size_mb) * 1024 * 1024;
    }
};

struct LoadConfig {
    bool enabled = false;
    std::string connection_string;
    int64_t workers = 4;
    int64_t max_attempts = 3;
    int64_t statement_timeout_ms = 0;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// ConverterConfig - Complete parsed configuration
// ============================================================================

struct ConverterConfig {
    InputConfig input;
    DdlConfig ddl;
    SplitConfig split;
    LoadConfig load;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * @brief Loads mysql2pg.toml
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to "". Every validation problem is reported in one
 * error message.
 */
class ConfigLoader {
public:
    // Upper bounds; the load settings are narrowed to uint32_t downstream
    static constexpr int64_t kMaxChunkSizeMb = 1024 * 1024;
    static constexpr int64_t kMaxWorkers = 1024;
    static constexpr int64_t kMaxAttempts = 1000;
    static constexpr int64_t kMaxStatementTimeoutMs = std::numeric_limits<uint32_t>::max();

    struct LoadResult {
        bool success = false;
        std::string error_message;
        ConverterConfig config;

        static LoadResult ok(ConverterConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Expand ${VAR} references from the environment
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    [[nodiscard]] static std::vector<std::string> validate_config(const ConverterConfig& config);

private:
    static LoadResult validate_and_return(ConverterConfig config);
};

} // namespace mysql2pg
