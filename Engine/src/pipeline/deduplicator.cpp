#include <pipeline/deduplicator.hpp>
#include <unordered_map>

namespace Sessionizer {

namespace {

std::string describe_key(const EventKey& k) {
    return "(" + k.user_id + ", " + k.event_id + ", " + k.product_code + ", " +
           TimeUtil::format_timestamp(k.timestamp) + ")";
}

bool payloads_conflict(const Event& a, const Event& b) {
    if (!a.payload || !b.payload) return false;
    return *a.payload != *b.payload;
}

struct Seen {
    size_t index;          // position in DedupResult::events
    size_t occurrences;
    bool conflicting;
};

} // namespace

DedupResult Deduplicator::deduplicate(std::vector<Event> events) const {
    DedupResult result;
    result.events.reserve(events.size());

    std::unordered_map<EventKey, Seen, EventKeyHasher> seen;
    seen.reserve(events.size());
    bool any_conflict = false;

    for (auto& e : events) {
        EventKey key = EventKey::of(e);
        auto it = seen.find(key);
        if (it == seen.end()) {
            seen.emplace(std::move(key), Seen{result.events.size(), 1, false});
            result.events.push_back(std::move(e));
            continue;
        }

        Seen& s = it->second;
        Event& kept = result.events[s.index];
        ++s.occurrences;

        if (payloads_conflict(kept, e)) {
            if (policy_ == SchemaPolicy::RejectBatch) {
                throw SchemaViolationError("Conflicting payloads for event " + describe_key(key),
                                           {{0, "conflicting payloads for " + describe_key(key)}});
            }
            s.conflicting = true;
            any_conflict = true;
        } else if (!kept.payload && e.payload) {
            kept.payload = std::move(e.payload);
        }
    }

    if (!any_conflict) {
        result.duplicates_collapsed = events.size() - result.events.size();
        return result;
    }

    // Every variant of a conflicting identity is rejected; none is silently preferred
    std::vector<Event> kept;
    kept.reserve(result.events.size());
    for (auto& e : result.events) {
        EventKey key = EventKey::of(e);
        const Seen& s = seen.at(key);
        if (s.conflicting) {
            result.conflicts.push_back({0, "conflicting payloads for " + describe_key(key)});
            result.conflicting_rows += s.occurrences;
            continue;
        }
        result.duplicates_collapsed += s.occurrences - 1;
        kept.push_back(std::move(e));
    }
    result.events = std::move(kept);
    return result;
}

} // namespace Sessionizer
