/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include <libpq-fe.h>

namespace Sessionizer {

/**
 * @brief Failed statement or connection, with the server's SQLSTATE when there is one.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& what, std::string sqlstate = {})
        : std::runtime_error(what), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const { return sqlstate_; }

    // 40001 serialization_failure, 40P01 deadlock_detected, 55P03 lock_not_available
    bool is_conflict() const {
        return sqlstate_ == "40001" || sqlstate_ == "40P01" || sqlstate_ == "55P03";
    }

private:
    std::string sqlstate_;
};

/**
 * @brief PostgreSQL connection wrapper
 *
 * Sessions run in UTC with ISO date output, so timestamps round-trip as text.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, sessionizer, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // Owns the PGconn; not copyable or movable
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;


    bool is_connected() const;

    /**
     * @brief Execute statement (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute statement with parameters (no results)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return single value with params
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and iterate rows
     * @param callback Called for each row: callback(row_data). NULL fields arrive as empty strings.
     */
    void query(const std::string& sql, std::function<void(const std::vector<std::string>&)> callback);

    /**
     * @brief Execute query with params and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params,
               std::function<void(const std::vector<std::string>&)> callback);

    /**
     * @brief Send a chunk of COPY FROM STDIN data
     */
    void copy_data(const char* buffer, int nbytes);

    /**
     * @brief Finish COPY FROM STDIN; error_msg non-null aborts the COPY
     */
    void copy_end(const char* error_msg = nullptr);

    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn, const std::string& begin_sql = "BEGIN");
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);
    static void collect_rows(PGresult* result, const std::function<void(const std::vector<std::string>&)>& callback);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Sessionizer
