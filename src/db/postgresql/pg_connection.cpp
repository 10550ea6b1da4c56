#include "db/postgresql/pg_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>

namespace secplane {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

std::unique_ptr<PgConnection> PgConnection::connect(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                            "PostgreSQL: out of memory allocating connection");
    }
    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        PQfinish(conn);
        throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                            std::format("PostgreSQL connect failed: {}", utils::trim(error)));
    }
    return std::make_unique<PgConnection>(conn);
}

PgResultPtr PgConnection::execute(const std::string& sql,
                                  const std::vector<std::optional<std::string>>& params) {
    if (!conn_) {
        throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE, "PostgreSQL: connection is closed");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PgResultPtr res(PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,           // Let the server infer types
                                 values.data(),
                                 nullptr, nullptr,  // Text format
                                 0));
    if (!res) {
        throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                            std::format("PostgreSQL: {}", utils::trim(PQerrorMessage(conn_))));
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                            std::format("PostgreSQL: {}", utils::trim(PQerrorMessage(conn_))));
    }
    return res;
}

uint64_t PgConnection::affected_rows(PGresult* res) {
    const char* affected = PQcmdTuples(res);
    if (!affected || std::strlen(affected) == 0) return 0;
    return utils::parse_int<uint64_t>(affected, 0);
}

std::optional<std::string> PgConnection::get(PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) return std::nullopt;
    const char* val = PQgetvalue(res, row, col);
    return std::string(val ? val : "");
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PgResultPtr res(PQexec(conn_, timeout_sql.c_str()));
    if (!res) {
        return false;
    }
    return PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

} // namespace secplane
