/**
 * @file session_assigner.hpp
 * @brief Gap calculation, boundary detection and session grouping per (user, product) timeline
 *
 * Each partition is an explicit fold: sort by timestamp then event_id, carry the
 * previous timestamp and the open session, emit one SessionedEvent per row. Partitions
 * share no state and are folded in parallel.
 */

#pragma once

#include <core/config.hpp>
#include <core/event.hpp>
#include <pipeline/event_classifier.hpp>
#include <export.hpp>
#include <optional>
#include <vector>

namespace Sessionizer {

class GapCalculator {
public:
    /**
     * @brief Attach time_diff to a timeline of one partition (already in timeline order).
     * @param predecessor Timestamp of the last trusted row before the timeline, if any
     */
    static std::vector<TimedEvent> compute(std::vector<ClassifiedEvent> timeline,
                                           std::optional<Timestamp> predecessor = std::nullopt);
};

class SessionBoundaryDetector {
public:
    explicit SessionBoundaryDetector(Duration timeout) : timeout_(timeout) {}

    // A gap exactly equal to the timeout stays in the same session
    bool is_new_session(const std::optional<Duration>& time_diff) const {
        return !time_diff || *time_diff > timeout_;
    }

    Duration timeout() const { return timeout_; }

private:
    Duration timeout_;
};

/**
 * @brief Session state carried into a fold from trusted (already persisted) rows.
 */
struct SessionCarry {
    bool open = false;
    int64_t group_seq = 0;
    Timestamp session_start;
    std::string session_id;

    static SessionCarry from(const SessionedEvent& last) {
        return {true, last.session_group_seq, last.session_start_time, last.session_id};
    }
};

class SessionGrouper {
public:
    SessionGrouper(SessionBoundaryDetector detector, SessionIdFormat id_format)
        : detector_(detector), id_format_(id_format) {}

    /**
     * @brief Running count of new-session flags, start time and id of the enclosing session.
     */
    std::vector<SessionedEvent> group(std::vector<TimedEvent> timeline, SessionCarry carry = {}) const;

private:
    SessionBoundaryDetector detector_;
    SessionIdFormat id_format_;
};

/**
 * @brief One (user, product) partition ready for folding.
 */
struct PartitionWork {
    PartitionKey key;
    std::vector<SessionedEvent> trusted;  // persisted rows before the rewrite range, timeline order
    std::vector<Event> pending;           // rows to (re)compute, timeline order
};

class SESSIONIZER_API SessionAssigner {
public:
    explicit SessionAssigner(const EngineConfig& config);

    /**
     * @brief Fold one partition; returns one row per pending event.
     */
    std::vector<SessionedEvent> assign(const PartitionWork& work) const;

    /**
     * @brief Fold all partitions in parallel. Output follows the order of the input partitions.
     */
    std::vector<SessionedEvent> assign_all(const std::vector<PartitionWork>& partitions) const;

    /**
     * @brief Group events without history into sorted partitions.
     */
    static std::vector<PartitionWork> partition(std::vector<Event> events);

private:
    EventClassifier classifier_;
    SessionGrouper grouper_;
    int threads_;
};

} // namespace Sessionizer
