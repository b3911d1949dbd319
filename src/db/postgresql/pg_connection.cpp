#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace mysql2pg {

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

ScriptResult PgConnection::execute_script(const std::string& script) {
    if (!conn_) {
        return {false, "Connection is null", 0, 0};
    }

    // Simple query protocol: a multi-statement string is one implicit transaction
    if (PQsendQuery(conn_, script.c_str()) == 0) {
        return {false, utils::trim(PQerrorMessage(conn_)), 0, 0};
    }

    return drain_results();
}

ScriptResult PgConnection::drain_results() {
    ScriptResult result;
    result.success = true;

    // PQgetResult must be called until it returns null, even after an error
    while (PGresult* res = PQgetResult(conn_)) {
        const ExecStatusType status = PQresultStatus(res);
        if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
            ++result.statements;
            if (auto affected = utils::try_parse_int<uint64_t>(PQcmdTuples(res))) {
                result.affected_rows += *affected;
            }
        } else if (result.success) {
            result.success = false;
            const char* message = PQresultErrorMessage(res);
            result.error_message = utils::trim(message ? message : "");
            if (result.error_message.empty()) {
                result.error_message = PQresStatus(status);
            }
        }
        PQclear(res);
    }
    return result;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    auto result = execute_script(std::format("SET statement_timeout = {}", timeout_ms));
    if (!result.success) {
        utils::log::warn(std::format("statement_timeout not applied: {}", result.error_message));
    }
    return result.success;
}

std::string PgConnection::last_error() const {
    if (!conn_) return "out of memory allocating PGconn";
    return utils::trim(PQerrorMessage(conn_));
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const std::string& connection_string) {

    using R = Result<std::unique_ptr<IDbConnection>>;

    // Owned from here on, so every early return finishes the handle
    auto session = std::make_unique<PgConnection>(PQconnectdb(connection_string.c_str()));
    if (!session->is_connected()) {
        return R::error(ErrorCategory::LOAD_ERROR,
            std::format("Failed to connect: {}", session->last_error()));
    }
    return R::ok(std::move(session));
}

} // namespace mysql2pg
