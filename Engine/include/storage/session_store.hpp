/**
 * @file session_store.hpp
 * @brief Persisted cleaned layer: keyed upsert of sessioned events, partitioned by pdate
 */

#pragma once

#include <core/event.hpp>
#include <pipeline/scope.hpp>
#include <string>
#include <vector>

namespace Sessionizer {

struct MergeStats {
    size_t staged = 0;        // rows handed to the store
    size_t inserted = 0;
    size_t updated = 0;
    size_t unchanged = 0;     // matched rows already holding identical values
    size_t partitions = 0;    // distinct pdates touched by staged rows

    std::string describe() const {
        return std::to_string(staged) + " staged, " + std::to_string(inserted) + " inserted, " +
               std::to_string(updated) + " updated, " + std::to_string(unchanged) + " unchanged across " +
               std::to_string(partitions) + " partition(s)";
    }
};

/**
 * @brief Storage interface used by the engine.
 *
 * merge() and bootstrap() are atomic: on exception the persisted layer is unchanged.
 * No row is ever deleted by merge(); a matched row is replaced by its recomputed version.
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual void ensure_schema() = 0;

    /**
     * @brief Rows of scope keys from context_start on, plus the anchor of each key.
     */
    virtual HistorySlice load_scope(const RecomputationScope& scope) = 0;

    /**
     * @brief Upsert rows keyed by (user_id, event_id, product_code, timestamp).
     * @throws MergeConflictError when another writer holds the same scope
     */
    virtual MergeStats merge(const RecomputationScope& scope, const std::vector<SessionedEvent>& rows) = 0;

    /**
     * @brief Replace the whole layer with the given rows (first run).
     */
    virtual MergeStats bootstrap(const std::vector<SessionedEvent>& rows) = 0;
};

} // namespace Sessionizer
