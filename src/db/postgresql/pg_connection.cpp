#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace tracestore {

namespace {

DbResultSet failure(std::string message) {
    DbResultSet rs;
    rs.success = false;
    rs.error_message = std::move(message);
    return rs;
}

// libpq messages end with a newline
std::string pq_error(PGconn* conn) {
    return utils::trim(PQerrorMessage(conn));
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<std::string>& params) {
    if (!conn_) {
        return failure("Connection is null");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    // Types left to the server (inferred from the ::casts in the SQL text)
    PGresult* res = PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,
                                 values.empty() ? nullptr : values.data(),
                                 nullptr,
                                 nullptr,
                                 0);
    return consume_result(res);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        return failure(pq_error(conn_));
    }

    DbResultSet result;
    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
        case PGRES_COMMAND_OK:  // no tuples: PQnfields/PQntuples are 0
            result = process_tuples_result(res);
            break;
        default: {
            const char* msg = PQresultErrorMessage(res);
            result = failure(utils::trim(msg && *msg ? msg : PQerrorMessage(conn_)));
            break;
        }
    }

    PQclear(res);
    return result;
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back();
            } else {
                row.emplace_back(PQgetvalue(res, i, j), static_cast<size_t>(PQgetlength(res, i, j)));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", pq_error(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace tracestore
