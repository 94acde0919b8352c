#pragma once

#include <storage/session_store.hpp>
#include <export.hpp>
#include <map>
#include <mutex>

namespace Sessionizer {

/**
 * @brief Ordered in-memory cleaned layer, partitioned by pdate.
 *
 * Writes build a new copy of the layer and swap it in, so a failed write leaves
 * the previous state intact.
 */
class SESSIONIZER_API MemorySessionStore : public SessionStore {
public:
    using Partition = std::map<EventKey, SessionedEvent>;

    void ensure_schema() override {}

    HistorySlice load_scope(const RecomputationScope& scope) override;
    MergeStats merge(const RecomputationScope& scope, const std::vector<SessionedEvent>& rows) override;
    MergeStats bootstrap(const std::vector<SessionedEvent>& rows) override;

    /**
     * @brief Make the next merge fail as if a concurrent writer held the scope.
     */
    void simulate_conflict_on_next_merge() {
        std::lock_guard<std::mutex> lock(mutex_);
        conflict_next_ = true;
    }

    /**
     * @brief All rows ordered by (pdate, user, product, timestamp, event_id).
     */
    std::vector<SessionedEvent> snapshot() const;

    /**
     * @brief Rows of one (user, product) in timeline order.
     */
    std::vector<SessionedEvent> timeline(const PartitionKey& key) const;

    size_t size() const;
    size_t partition_count() const;

    /**
     * @brief Number of write generations that replaced each partition (touch counter).
     */
    size_t writes_to(Date pdate) const;

private:
    mutable std::mutex mutex_;
    std::map<Date, Partition> partitions_;
    std::map<Date, size_t> partition_writes_;
    bool conflict_next_ = false;
};

} // namespace Sessionizer
