/**
 * @file deduplicator.hpp
 * @brief Collapses exact duplicate events before any session logic runs
 */

#pragma once

#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/event.hpp>
#include <vector>

namespace Sessionizer {

struct DedupResult {
    std::vector<Event> events;            // first occurrence of each identity, input order
    size_t duplicates_collapsed = 0;
    size_t conflicting_rows = 0;          // rows dropped because their payloads disagree
    std::vector<RejectedRow> conflicts;   // one entry per conflicting identity
};

/**
 * @brief Identity-tuple deduplication.
 *
 * Rows sharing (user_id, event_id, product_code, timestamp) with equal payloads are
 * duplicates: one survives. Rows sharing the identity with different payloads are a
 * schema violation, handled by the configured policy. A row without payload (reloaded
 * from the persisted layer) never conflicts.
 */
class Deduplicator {
public:
    explicit Deduplicator(SchemaPolicy policy = SchemaPolicy::RejectRows) : policy_(policy) {}

    /**
     * @throws SchemaViolationError under SchemaPolicy::RejectBatch when payloads conflict
     */
    DedupResult deduplicate(std::vector<Event> events) const;

private:
    SchemaPolicy policy_;
};

} // namespace Sessionizer
