/**
 * @file scope.hpp
 * @brief Recomputation scope of one run and the history slice loaded for it
 */

#pragma once

#include <core/event.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace Sessionizer {

/**
 * @brief Keys and date range recomputed in one run. Derived per run, never persisted.
 *
 * Rows of scope keys dated >= rewrite_start are recomputed and rewritten.
 * Rows dated in [context_start, rewrite_start) only supply predecessors.
 */
struct RecomputationScope {
    Date process_date;
    bool bootstrap = false;
    std::vector<PartitionKey> keys;   // sorted, distinct
    Date rewrite_start;
    Date context_start;

    bool empty() const { return keys.empty(); }

    bool contains(const PartitionKey& key) const {
        return std::binary_search(keys.begin(), keys.end(), key);
    }

    bool in_rewrite_range(Timestamp ts) const {
        return TimeUtil::to_date(ts) >= rewrite_start;
    }

    std::string describe() const {
        std::string out = std::to_string(keys.size()) + " key(s), rewrite from " +
                          TimeUtil::format_date(rewrite_start);
        if (!bootstrap) out += ", context from " + TimeUtil::format_date(context_start);
        return out;
    }
};

/**
 * @brief Persisted rows needed to recompute a scope.
 */
struct HistorySlice {
    // Rows of scope keys with timestamp >= context_start
    std::vector<SessionedEvent> rows;

    // Per scope key, the last persisted row before context_start (at most one per key)
    std::vector<SessionedEvent> anchors;

    size_t size() const { return rows.size() + anchors.size(); }
};

} // namespace Sessionizer
