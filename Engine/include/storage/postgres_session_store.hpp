/**
 * @file postgres_session_store.hpp
 * @brief Cleaned layer in PostgreSQL: daily range partitions, keyed upsert through COPY staging
 */

#pragma once

#include <storage/session_store.hpp>
#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <set>
#include <string>

namespace Sessionizer {

/**
 * @brief SessionStore on a table partitioned BY RANGE (pdate), one partition per day.
 *
 * Primary key (user_id, event_id, product_code, event_ts, pdate); pdate is derived
 * from event_ts, so it adds nothing to the natural key but lets partitions carry it.
 * Writes run in one transaction under an advisory lock derived from the table name.
 */
class SESSIONIZER_API PostgresSessionStore : public SessionStore {
public:
    PostgresSessionStore(PostgresConnection& db, std::string table);

    void ensure_schema() override;
    HistorySlice load_scope(const RecomputationScope& scope) override;
    MergeStats merge(const RecomputationScope& scope, const std::vector<SessionedEvent>& rows) override;
    MergeStats bootstrap(const std::vector<SessionedEvent>& rows) override;

    const std::string& table() const { return table_; }

    /**
     * @brief Name of the daily partition holding pdate (same schema as the table).
     */
    std::string partition_name(Date pdate) const;

private:
    void ensure_partitions(const std::set<Date>& dates);
    void acquire_write_lock();
    void stage_scope_keys(const RecomputationScope& scope);
    void copy_rows(const std::string& target, const std::vector<SessionedEvent>& rows);
    SessionedEvent parse_row(const std::vector<std::string>& fields) const;

    PostgresConnection& db_;
    std::string table_;
    std::string schema_;      // empty when the table name is unqualified
    std::string base_name_;
    int64_t lock_key_;
};

} // namespace Sessionizer
