#include "db/database_creator.hpp"
#include "db/pq_ping_probe.hpp"
#include "core/utils.hpp"

#include <format>
#include <libpq-fe.h>

namespace pgsession {

PgDatabaseCreator::PgDatabaseCreator(std::string maintenance_db)
    : maintenance_db_(std::move(maintenance_db)) {}

CreateResult PgDatabaseCreator::create_database(
    const std::string& host, uint16_t port, const std::string& db_name) {
    CreateResult result;

    const auto info = PqPingProbe::conninfo(host, port, maintenance_db_, 5);
    PGconn* conn = PQconnectdb(info.c_str());
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        result.message = conn ? PQerrorMessage(conn) : "out of memory";
        if (conn) PQfinish(conn);
        return result;
    }

    char* quoted = PQescapeIdentifier(conn, db_name.c_str(), db_name.size());
    if (!quoted) {
        result.message = PQerrorMessage(conn);
        PQfinish(conn);
        return result;
    }
    const std::string sql = std::format("CREATE DATABASE {}", quoted);
    PQfreemem(quoted);

    PGresult* res = PQexec(conn, sql.c_str());
    if (res && PQresultStatus(res) == PGRES_COMMAND_OK) {
        result.outcome = CreateOutcome::CREATED;
    } else {
        const char* sqlstate = res ? PQresultErrorField(res, PG_DIAG_SQLSTATE) : nullptr;
        if (sqlstate && std::string_view(sqlstate) == SQLSTATE_DUPLICATE_DATABASE) {
            result.outcome = CreateOutcome::ALREADY_EXISTS;
        }
        result.message = PQerrorMessage(conn);
    }

    if (res) PQclear(res);
    PQfinish(conn);
    return result;
}

} // namespace pgsession
