/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <sstream>

namespace Sessionizer {

PostgresConnection::PostgresConnection() {
    // Build connection string from environment
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "sessionizer") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    connect(conninfo.str());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("PostgreSQL connection failed: " + last_error_);
    }

    // Timestamps are exchanged as UTC ISO text
    try {
        execute("SET TIME ZONE 'UTC'");
        execute("SET datestyle = 'ISO, YMD'");
    } catch (...) {
        disconnect();
        throw;
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::require_connection() const {
    if (!is_connected()) {
        throw DatabaseError("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_COPY_OUT) {
        last_error_ = PQerrorMessage(conn_);
        const char* state = result ? PQresultErrorField(result, PG_DIAG_SQLSTATE) : nullptr;
        std::string sqlstate = state ? state : "";
        PQclear(result);
        throw DatabaseError("PostgreSQL query failed: " + last_error_, sqlstate);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    return PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );
}

void PostgresConnection::collect_rows(PGresult* result,
                                      const std::function<void(const std::vector<std::string>&)>& callback) {
    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    std::vector<std::string> row;
    row.reserve(nfields);
    for (int i = 0; i < nrows; ++i) {
        row.clear();
        for (int j = 0; j < nfields; ++j) {
            row.emplace_back(PQgetvalue(result, i, j));
        }
        callback(row);
    }
}

void PostgresConnection::execute(const std::string& sql) {
    require_connection();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    PGresult* result = exec_params(sql, params);
    check_result(result);
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    require_connection();

    PGresult* result = exec_params(sql, params);
    check_result(result);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, std::function<void(const std::vector<std::string>&)> callback) {
    require_connection();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);

    try {
        collect_rows(result, callback);
    } catch (...) {
        PQclear(result);
        throw;
    }
    PQclear(result);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               std::function<void(const std::vector<std::string>&)> callback) {
    require_connection();

    PGresult* result = exec_params(sql, params);
    check_result(result);

    try {
        collect_rows(result, callback);
    } catch (...) {
        PQclear(result);
        throw;
    }
    PQclear(result);
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    require_connection();

    int result = PQputCopyData(conn_, buffer, nbytes);
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("COPY data failed: " + last_error_);
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    require_connection();

    int result = PQputCopyEnd(conn_, error_msg);
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("COPY end failed: " + last_error_);
    }

    // After sending end, we must get the final result
    PGresult* res = PQgetResult(conn_);
    check_result(res);
    PQclear(res);

    // Drain until NULL so the connection is ready for the next command
    while ((res = PQgetResult(conn_)) != nullptr) {
        PQclear(res);
    }
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn, const std::string& begin_sql) : conn_(conn) {
    conn_.execute(begin_sql);
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace Sessionizer
