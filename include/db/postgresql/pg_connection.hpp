#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace mysql2pg {

/**
 * @brief libpq session that runs chunk scripts
 *
 * Owns the PGconn*; it is finished in close() or the destructor.
 * Scripts go out with PQsendQuery so every statement's result is read back.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    ScriptResult execute_script(const std::string& script) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

    // libpq's message for the last failure on this session
    [[nodiscard]] std::string last_error() const;

private:
    // Reads PGresults until libpq returns null, keeping the first error
    ScriptResult drain_results();

    PGconn* conn_;
};

// PQconnectdb-backed factory
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;
};

} // namespace mysql2pg
