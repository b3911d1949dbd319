#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace mysql2pg {

// Constexpr section keys
static constexpr std::string_view kInput   = "input";
static constexpr std::string_view kDdl     = "ddl";
static constexpr std::string_view kSplit   = "split";
static constexpr std::string_view kLoad    = "load";
static constexpr std::string_view kLogging = "logging";

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

// Section as a table; an absent section reads as empty
const toml::table& section(const toml::table& root, std::string_view key) {
    static const toml::table kEmpty;
    const auto* tbl = root[key].as_table();
    return tbl ? *tbl : kEmpty;
}

ConverterConfig extract_all_sections(const toml::table& root) {
    ConverterConfig config;

    const auto& input = section(root, kInput);
    config.input.dump_file = input["dump_file"].value_or(""s);

    const auto& ddl = section(root, kDdl);
    config.ddl.enabled     = ddl["enabled"].value_or(config.ddl.enabled);
    config.ddl.output_file = ddl["output_file"].value_or(config.ddl.output_file);

    const auto& split = section(root, kSplit);
    config.split.enabled          = split["enabled"].value_or(config.split.enabled);
    config.split.output_dir       = split["output_dir"].value_or(config.split.output_dir);
    config.split.prefix           = split["prefix"].value_or(config.split.prefix);
    config.split.chunk_size_mb    = split["chunk_size_mb"].value_or(config.split.chunk_size_mb);
    config.split.session_settings = split["session_settings"].value_or(config.split.session_settings);

    const auto& load = section(root, kLoad);
    config.load.enabled              = load["enabled"].value_or(config.load.enabled);
    config.load.connection_string    = load["connection_string"].value_or(""s);
    config.load.workers              = load["workers"].value_or(config.load.workers);
    config.load.max_attempts         = load["max_attempts"].value_or(config.load.max_attempts);
    config.load.statement_timeout_ms = load["statement_timeout_ms"].value_or(config.load.statement_timeout_ms);

    const auto& logging = section(root, kLogging);
    config.logging.level = logging["level"].value_or(config.logging.level);

    return config;
}

} // anonymous namespace

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ConverterConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ConverterConfig& config) {
    std::vector<std::string> errors;

    if (config.input.dump_file.empty()) {
        errors.push_back("input.dump_file must not be empty");
    }

    if (config.ddl.enabled && config.ddl.output_file.empty()) {
        errors.push_back("ddl.output_file required when ddl is enabled");
    }

    if (config.split.enabled) {
        if (config.split.chunk_size_mb < 1 || config.split.chunk_size_mb > kMaxChunkSizeMb) {
            errors.push_back(std::format("split.chunk_size_mb must be in [1, {}], got {}",
                                         kMaxChunkSizeMb, config.split.chunk_size_mb));
        }
        if (config.split.output_dir.empty()) {
            errors.push_back("split.output_dir must not be empty");
        }
        if (config.split.prefix.empty()) {
            errors.push_back("split.prefix must not be empty");
        }
    }

    if (config.load.enabled) {
        if (!config.split.enabled) {
            errors.push_back("load requires split to be enabled");
        }
        if (config.load.connection_string.empty()) {
            errors.push_back("load.connection_string required when load is enabled");
        }
    }
    if (config.load.workers < 1 || config.load.workers > kMaxWorkers) {
        errors.push_back(std::format("load.workers must be in [1, {}], got {}",
                                     kMaxWorkers, config.load.workers));
    }
    if (config.load.max_attempts < 1 || config.load.max_attempts > kMaxAttempts) {
        errors.push_back(std::format("load.max_attempts must be in [1, {}], got {}",
                                     kMaxAttempts, config.load.max_attempts));
    }
    if (config.load.statement_timeout_ms < 0 ||
        config.load.statement_timeout_ms > kMaxStatementTimeoutMs) {
        errors.push_back(std::format("load.statement_timeout_ms must be in [0, {}], got {}",
                                     kMaxStatementTimeoutMs, config.load.statement_timeout_ms));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace mysql2pg
