#include <storage/memory_session_store.hpp>
#include <core/errors.hpp>
#include <set>

namespace Sessionizer {

HistorySlice MemorySessionStore::load_scope(const RecomputationScope& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    HistorySlice slice;

    std::map<PartitionKey, const SessionedEvent*> anchors;
    for (const auto& [pdate, partition] : partitions_) {
        for (const auto& [key, row] : partition) {
            if (!scope.contains(partition_of(row))) continue;

            if (pdate >= scope.context_start) {
                slice.rows.push_back(row);
                continue;
            }
            const SessionedEvent*& anchor = anchors[partition_of(row)];
            if (!anchor || timeline_less(*anchor, row)) anchor = &row;
        }
    }

    slice.anchors.reserve(anchors.size());
    for (const auto& [key, row] : anchors) slice.anchors.push_back(*row);
    return slice;
}

MergeStats MemorySessionStore::merge(const RecomputationScope& scope, const std::vector<SessionedEvent>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (conflict_next_) {
        conflict_next_ = false;
        throw MergeConflictError("Concurrent writer holds scope (" + scope.describe() + ")");
    }

    MergeStats stats;
    stats.staged = rows.size();

    // Staged partitions are rebuilt on copies and swapped in only once all rows applied
    std::map<Date, Partition> next;
    std::set<Date> written_dates;

    for (const auto& incoming : rows) {
        auto slot = next.find(incoming.pdate);
        if (slot == next.end()) {
            auto current = partitions_.find(incoming.pdate);
            slot = next.emplace(incoming.pdate,
                                current == partitions_.end() ? Partition{} : current->second).first;
        }
        Partition& partition = slot->second;
        EventKey key = EventKey::of(incoming);

        auto it = partition.find(key);
        if (it == partition.end()) {
            partition.emplace(std::move(key), incoming);
            written_dates.insert(incoming.pdate);
            ++stats.inserted;
            continue;
        }

        SessionedEvent replacement = incoming;
        if (!replacement.payload) replacement.payload = it->second.payload;

        if (replacement == it->second) {
            ++stats.unchanged;
        } else {
            it->second = std::move(replacement);
            written_dates.insert(incoming.pdate);
            ++stats.updated;
        }
    }
    stats.partitions = next.size();

    for (auto& [pdate, partition] : next) partitions_[pdate].swap(partition);
    for (const Date& d : written_dates) ++partition_writes_[d];
    return stats;
}

MergeStats MemorySessionStore::bootstrap(const std::vector<SessionedEvent>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);

    MergeStats stats;
    stats.staged = rows.size();

    std::map<Date, Partition> next;
    for (const auto& row : rows) {
        bool inserted = next[row.pdate].insert_or_assign(EventKey::of(row), row).second;
        if (inserted) ++stats.inserted;
        else ++stats.updated;
    }
    stats.partitions = next.size();

    partitions_.swap(next);
    partition_writes_.clear();
    for (const auto& [d, partition] : partitions_) ++partition_writes_[d];
    return stats;
}

std::vector<SessionedEvent> MemorySessionStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionedEvent> out;
    for (const auto& [pdate, partition] : partitions_) {
        for (const auto& [key, row] : partition) out.push_back(row);
    }
    return out;
}

std::vector<SessionedEvent> MemorySessionStore::timeline(const PartitionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionedEvent> out;
    for (const auto& [pdate, partition] : partitions_) {
        for (const auto& [k, row] : partition) {
            if (k.user_id == key.user_id && k.product_code == key.product_code) out.push_back(row);
        }
    }
    return out;
}

size_t MemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [pdate, partition] : partitions_) n += partition.size();
    return n;
}

size_t MemorySessionStore::partition_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return partitions_.size();
}

size_t MemorySessionStore::writes_to(Date pdate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = partition_writes_.find(pdate);
    return it == partition_writes_.end() ? 0 : it->second;
}

} // namespace Sessionizer
