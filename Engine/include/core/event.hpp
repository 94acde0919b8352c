/**
 * @file event.hpp
 * @brief Event data model: raw events through sessioned rows
 */

#pragma once

#include <utils/time.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace Sessionizer {

/**
 * @brief Ordered extra columns of a raw row (name, value).
 */
using Payload = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One raw occurrence. Identity is (user_id, event_id, product_code, timestamp).
 */
struct Event {
    std::string user_id;
    std::string event_id;
    std::string product_code;
    Timestamp timestamp;

    // Absent for rows reloaded from the persisted layer
    std::optional<Payload> payload;
};

struct ClassifiedEvent : Event {
    bool is_user_action = false;
};

struct TimedEvent : ClassifiedEvent {
    // Elapsed time since the previous event of the same (user, product); null for the first in scope
    std::optional<Duration> time_diff;
};

struct SessionedEvent : TimedEvent {
    bool is_new_session = false;
    int64_t session_group_seq = 0;
    Timestamp session_start_time;
    std::string session_id;
    Date pdate;
};

bool operator==(const SessionedEvent& a, const SessionedEvent& b);
inline bool operator!=(const SessionedEvent& a, const SessionedEvent& b) { return !(a == b); }

/**
 * @brief (user_id, product_code): the unit of session computation.
 */
struct PartitionKey {
    std::string user_id;
    std::string product_code;

    bool operator==(const PartitionKey& o) const {
        return user_id == o.user_id && product_code == o.product_code;
    }
    bool operator!=(const PartitionKey& o) const { return !(*this == o); }
    bool operator<(const PartitionKey& o) const {
        return std::tie(user_id, product_code) < std::tie(o.user_id, o.product_code);
    }

    std::string to_string() const { return "(" + user_id + ", " + product_code + ")"; }
};

/**
 * @brief Natural key of an event: the deduplication identity and the upsert key.
 */
struct EventKey {
    std::string user_id;
    std::string event_id;
    std::string product_code;
    Timestamp timestamp;

    static EventKey of(const Event& e) {
        return {e.user_id, e.event_id, e.product_code, e.timestamp};
    }

    bool operator==(const EventKey& o) const {
        return timestamp == o.timestamp && user_id == o.user_id &&
               event_id == o.event_id && product_code == o.product_code;
    }
    bool operator!=(const EventKey& o) const { return !(*this == o); }
    bool operator<(const EventKey& o) const {
        return std::tie(user_id, product_code, timestamp, event_id) <
               std::tie(o.user_id, o.product_code, o.timestamp, o.event_id);
    }
};

inline size_t hash_combine(size_t seed, size_t h) {
    return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

struct PartitionKeyHasher {
    size_t operator()(const PartitionKey& k) const {
        return hash_combine(std::hash<std::string>{}(k.user_id), std::hash<std::string>{}(k.product_code));
    }
};

struct EventKeyHasher {
    size_t operator()(const EventKey& k) const {
        size_t h = std::hash<std::string>{}(k.user_id);
        h = hash_combine(h, std::hash<std::string>{}(k.event_id));
        h = hash_combine(h, std::hash<std::string>{}(k.product_code));
        return hash_combine(h, std::hash<int64_t>{}(k.timestamp.time_since_epoch().count()));
    }
};

inline PartitionKey partition_of(const Event& e) {
    return {e.user_id, e.product_code};
}

/**
 * @brief Fixed order within a partition: timestamp, then event_id.
 *
 * Total once duplicates are collapsed, since (user, product, timestamp, event_id) is unique.
 */
inline bool timeline_less(const Event& a, const Event& b) {
    if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
    return a.event_id < b.event_id;
}

} // namespace Sessionizer
