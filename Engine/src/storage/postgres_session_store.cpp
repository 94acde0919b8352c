#include <storage/postgres_session_store.hpp>
#include <storage/format_utils.hpp>
#include <database/bulk_copy.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <sstream>

namespace Sessionizer {

namespace {

const std::vector<std::string> k_columns = {
    "user_id", "event_id", "product_code", "event_ts",
    "is_user_action", "time_diff_us", "is_new_session", "session_group_seq",
    "session_start", "session_id", "payload", "pdate"
};

// Column order must match PostgresSessionStore::parse_row
constexpr const char* k_select_list =
    "t.user_id, t.event_id, t.product_code, t.event_ts::text, "
    "t.is_user_action, COALESCE(t.time_diff_us::text, ''), t.is_new_session, "
    "t.session_group_seq, t.session_start::text, t.session_id, t.pdate::text";

constexpr const char* k_scope_keys_table = "sessionizer_scope_keys";
constexpr const char* k_staging_table = "sessionizer_staging";

std::string compact_date(Date d) {
    std::string s = TimeUtil::format_date(d);
    std::string out;
    for (char c : s) {
        if (c != '-') out.push_back(c);
    }
    return out;
}

std::string column_list(const std::string& prefix = "") {
    std::string out;
    for (size_t i = 0; i < k_columns.size(); ++i) {
        if (i) out += ", ";
        out += prefix + k_columns[i];
    }
    return out;
}

} // namespace

PostgresSessionStore::PostgresSessionStore(PostgresConnection& db, std::string table)
    : db_(db), table_(std::move(table)),
      lock_key_(BLAKE3Pipeline::to_int64(BLAKE3Pipeline::hash_fields({"sessionizer-merge", table_}))) {
    auto dot = table_.find('.');
    if (dot == std::string::npos) {
        base_name_ = table_;
    } else {
        schema_ = table_.substr(0, dot);
        base_name_ = table_.substr(dot + 1);
    }
}

std::string PostgresSessionStore::partition_name(Date pdate) const {
    std::string name = base_name_ + "_p" + compact_date(pdate);
    return schema_.empty() ? name : schema_ + "." + name;
}

void PostgresSessionStore::ensure_schema() {
    const std::string table = BulkCopy::quote_qualified(table_);

    if (!schema_.empty()) {
        db_.execute("CREATE SCHEMA IF NOT EXISTS " + BulkCopy::quote_identifier(schema_));
    }

    std::ostringstream ddl;
    ddl << "CREATE TABLE IF NOT EXISTS " << table << " ("
        << "user_id text NOT NULL, "
        << "event_id text NOT NULL, "
        << "product_code text NOT NULL, "
        << "event_ts timestamp NOT NULL, "
        << "is_user_action boolean NOT NULL, "
        << "time_diff_us bigint, "
        << "is_new_session boolean NOT NULL, "
        << "session_group_seq bigint NOT NULL, "
        << "session_start timestamp NOT NULL, "
        << "session_id text NOT NULL, "
        << "payload jsonb, "
        << "pdate date NOT NULL, "
        << "PRIMARY KEY (user_id, event_id, product_code, event_ts, pdate)"
        << ") PARTITION BY RANGE (pdate)";
    db_.execute(ddl.str());

    db_.execute("CREATE INDEX IF NOT EXISTS " + BulkCopy::quote_identifier(base_name_ + "_timeline_idx") +
                " ON " + table + " (user_id, product_code, event_ts)");

    Logger::debug("Schema ready for " + table_);
}

void PostgresSessionStore::ensure_partitions(const std::set<Date>& dates) {
    const std::string parent = BulkCopy::quote_qualified(table_);
    for (const Date& d : dates) {
        std::ostringstream sql;
        sql << "CREATE TABLE IF NOT EXISTS " << BulkCopy::quote_qualified(partition_name(d))
            << " PARTITION OF " << parent
            << " FOR VALUES FROM ('" << TimeUtil::format_date(d) << "') TO ('"
            << TimeUtil::format_date(d + Days(1)) << "')";
        db_.execute(sql.str());
    }
}

void PostgresSessionStore::acquire_write_lock() {
    auto locked = db_.query_single("SELECT pg_try_advisory_xact_lock($1::bigint)", {std::to_string(lock_key_)});
    if (!locked || pg_to_bool(*locked) != true) {
        throw MergeConflictError("Another run is writing to " + table_);
    }
}

void PostgresSessionStore::stage_scope_keys(const RecomputationScope& scope) {
    db_.execute(std::string("CREATE TEMP TABLE IF NOT EXISTS ") + k_scope_keys_table +
                " (user_id text NOT NULL, product_code text NOT NULL)");
    db_.execute(std::string("TRUNCATE ") + k_scope_keys_table);

    BulkCopy copy(db_);
    copy.begin_table(k_scope_keys_table, {"user_id", "product_code"});
    for (const auto& key : scope.keys) {
        copy.add_row({key.user_id, key.product_code});
    }
    copy.flush();
}

void PostgresSessionStore::copy_rows(const std::string& target, const std::vector<SessionedEvent>& rows) {
    BulkCopy copy(db_);
    copy.begin_table(target, k_columns);
    for (const auto& r : rows) {
        copy.add_row({
            r.user_id,
            r.event_id,
            r.product_code,
            TimeUtil::format_timestamp(r.timestamp),
            bool_to_pg(r.is_user_action),
            r.time_diff ? BulkCopy::Field(std::to_string(r.time_diff->count())) : std::nullopt,
            bool_to_pg(r.is_new_session),
            std::to_string(r.session_group_seq),
            TimeUtil::format_timestamp(r.session_start_time),
            r.session_id,
            r.payload ? BulkCopy::Field(payload_to_json(*r.payload)) : std::nullopt,
            TimeUtil::format_date(r.pdate)
        });
    }
    copy.flush();
}

SessionedEvent PostgresSessionStore::parse_row(const std::vector<std::string>& f) const {
    if (f.size() != 11) {
        throw DatabaseError("Unexpected column count " + std::to_string(f.size()) + " reading " + table_);
    }

    auto ts = [&](const std::string& text) {
        auto v = TimeUtil::parse_timestamp(text);
        if (!v) throw DatabaseError("Unparsable timestamp '" + text + "' in " + table_);
        return *v;
    };
    auto flag = [&](const std::string& text) {
        auto v = pg_to_bool(text);
        if (!v) throw DatabaseError("Unparsable boolean '" + text + "' in " + table_);
        return *v;
    };

    SessionedEvent e;
    e.user_id = f[0];
    e.event_id = f[1];
    e.product_code = f[2];
    e.timestamp = ts(f[3]);
    e.is_user_action = flag(f[4]);
    if (!f[5].empty()) e.time_diff = Duration(std::stoll(f[5]));
    e.is_new_session = flag(f[6]);
    e.session_group_seq = std::stoll(f[7]);
    e.session_start_time = ts(f[8]);
    e.session_id = f[9];

    auto pdate = TimeUtil::parse_date(f[10]);
    if (!pdate) throw DatabaseError("Unparsable pdate '" + f[10] + "' in " + table_);
    e.pdate = *pdate;
    return e;
}

HistorySlice PostgresSessionStore::load_scope(const RecomputationScope& scope) {
    HistorySlice slice;
    if (scope.empty() || scope.bootstrap) return slice;

    const std::string table = BulkCopy::quote_qualified(table_);
    const std::string context_start = TimeUtil::format_date(scope.context_start);

    PostgresConnection::Transaction tx(db_, "BEGIN ISOLATION LEVEL REPEATABLE READ");
    stage_scope_keys(scope);

    std::ostringstream rows_sql;
    rows_sql << "SELECT " << k_select_list << " FROM " << table << " t"
             << " JOIN " << k_scope_keys_table << " k"
             << " ON k.user_id = t.user_id AND k.product_code = t.product_code"
             << " WHERE t.pdate >= $1::date";
    db_.query(rows_sql.str(), {context_start}, [&](const std::vector<std::string>& row) {
        slice.rows.push_back(parse_row(row));
    });

    // Last row before the context window: the predecessor of the first context row
    std::ostringstream anchor_sql;
    anchor_sql << "SELECT DISTINCT ON (t.user_id, t.product_code) " << k_select_list
               << " FROM " << table << " t"
               << " JOIN " << k_scope_keys_table << " k"
               << " ON k.user_id = t.user_id AND k.product_code = t.product_code"
               << " WHERE t.pdate < $1::date"
               << " ORDER BY t.user_id, t.product_code, t.event_ts DESC, t.event_id DESC";
    db_.query(anchor_sql.str(), {context_start}, [&](const std::vector<std::string>& row) {
        slice.anchors.push_back(parse_row(row));
    });

    tx.commit();
    Logger::debug("Loaded " + std::to_string(slice.rows.size()) + " history row(s), " +
                  std::to_string(slice.anchors.size()) + " anchor(s) from " + table_);
    return slice;
}

MergeStats PostgresSessionStore::merge(const RecomputationScope& scope, const std::vector<SessionedEvent>& rows) {
    MergeStats stats;
    stats.staged = rows.size();
    if (rows.empty()) return stats;

    std::set<Date> dates;
    for (const auto& r : rows) dates.insert(r.pdate);
    stats.partitions = dates.size();

    const std::string table = BulkCopy::quote_qualified(table_);
    const std::string cols = column_list();

    std::ostringstream upsert;
    upsert << "INSERT INTO " << table << " AS target (" << cols << ")"
           << " SELECT " << cols << " FROM " << k_staging_table
           << " ON CONFLICT (user_id, event_id, product_code, event_ts, pdate) DO UPDATE SET "
           << "is_user_action = EXCLUDED.is_user_action, "
           << "time_diff_us = EXCLUDED.time_diff_us, "
           << "is_new_session = EXCLUDED.is_new_session, "
           << "session_group_seq = EXCLUDED.session_group_seq, "
           << "session_start = EXCLUDED.session_start, "
           << "session_id = EXCLUDED.session_id, "
           << "payload = COALESCE(EXCLUDED.payload, target.payload)"
           // Rows already holding the recomputed values are left untouched
           << " WHERE (target.is_user_action, target.time_diff_us, target.is_new_session,"
           << " target.session_group_seq, target.session_start, target.session_id, target.payload)"
           << " IS DISTINCT FROM (EXCLUDED.is_user_action, EXCLUDED.time_diff_us, EXCLUDED.is_new_session,"
           << " EXCLUDED.session_group_seq, EXCLUDED.session_start, EXCLUDED.session_id,"
           << " COALESCE(EXCLUDED.payload, target.payload))"
           << " RETURNING (xmax = 0)";

    try {
        PostgresConnection::Transaction tx(db_);
        acquire_write_lock();
        ensure_partitions(dates);

        db_.execute(std::string("CREATE TEMP TABLE IF NOT EXISTS ") + k_staging_table +
                    " (LIKE " + table + " INCLUDING DEFAULTS)");
        db_.execute(std::string("TRUNCATE ") + k_staging_table);
        copy_rows(k_staging_table, rows);

        db_.query(upsert.str(), [&](const std::vector<std::string>& row) {
            if (pg_to_bool(row.at(0)) == true) ++stats.inserted;
            else ++stats.updated;
        });

        tx.commit();
    } catch (const DatabaseError& e) {
        if (e.is_conflict()) {
            throw MergeConflictError("Merge into " + table_ + " conflicted with a concurrent writer (" +
                                     scope.describe() + "): " + e.what());
        }
        throw;
    }

    stats.unchanged = stats.staged - stats.inserted - stats.updated;
    return stats;
}

MergeStats PostgresSessionStore::bootstrap(const std::vector<SessionedEvent>& rows) {
    MergeStats stats;
    stats.staged = rows.size();

    std::set<Date> dates;
    for (const auto& r : rows) dates.insert(r.pdate);
    stats.partitions = dates.size();

    try {
        PostgresConnection::Transaction tx(db_);
        acquire_write_lock();
        db_.execute("TRUNCATE " + BulkCopy::quote_qualified(table_));
        ensure_partitions(dates);
        copy_rows(table_, rows);
        tx.commit();
    } catch (const DatabaseError& e) {
        if (e.is_conflict()) {
            throw MergeConflictError("Bootstrap of " + table_ + " conflicted with a concurrent writer: " +
                                     std::string(e.what()));
        }
        throw;
    }

    stats.inserted = rows.size();
    return stats;
}

} // namespace Sessionizer
