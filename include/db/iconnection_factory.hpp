#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace mysql2pg {

/**
 * @brief Opens target sessions for the chunk loader
 *
 * PgChunkExecutor asks for a fresh session per attempt. Tests plug in
 * MockConnectionFactory here.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    // LOAD_ERROR carries the driver's message when the session can't be opened
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const std::string& connection_string) = 0;
};

} // namespace mysql2pg
