#pragma once

#include <database/postgres_connection.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace Sessionizer {

/**
 * @brief Streams many rows into Postgres using COPY FROM STDIN (text format).
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("schema.table" or "table", {"col1","col2",...});
 *   for (...) bc.add_row({...});
 *   bc.flush();
 *
 * Notes:
 * - begin_table must be called before add_row.
 * - flush() finishes the COPY. Until then the connection accepts no other command.
 * - Destroying an unflushed BulkCopy aborts its COPY; no rows of it are kept.
 * - This class is not thread-safe; use one instance per connection/thread.
 */
class BulkCopy {
public:
    using Field = std::optional<std::string>;  // std::nullopt is sent as NULL

    explicit BulkCopy(PostgresConnection& db) noexcept;
    ~BulkCopy();

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    // Prepare for a target table and column list. Call once before add_row.
    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Add a row. values.size() may be <= columns.size(); missing values become NULL.
    void add_row(const std::vector<Field>& values);

    // Send remaining rows and finish the COPY.
    void flush();

    static std::string quote_identifier(const std::string& id);

    // Quote "schema.table" or "table"
    static std::string quote_qualified(const std::string& name);

private:
    void start_copy_if_needed();
    void send_buffer();
    void escape_value_into_buffer(const std::string& value);

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string table_name_;
    std::vector<std::string> columns_;
    size_t buffered_rows_ = 0;
    bool in_copy_ = false;

    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

} // namespace Sessionizer
