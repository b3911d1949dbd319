#pragma once

#include <cstdint>
#include <string>

namespace mysql2pg {

// What came back from one chunk script
struct ScriptResult {
    bool success = false;
    std::string error_message;

    // Totals across all statements in the script
    uint64_t affected_rows = 0;
    uint64_t statements = 0;
};

/**
 * @brief Target database session used to apply chunk scripts
 *
 * One instance per load attempt; never shared between workers.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Send a whole chunk script in one round trip
     *
     * The script has no BEGIN/COMMIT of its own, so the server applies it
     * atomically: a failing statement discards the chunk's earlier rows.
     */
    [[nodiscard]] virtual ScriptResult execute_script(const std::string& script) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    // 0 disables the limit
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace mysql2pg
