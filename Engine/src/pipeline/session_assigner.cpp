#include <pipeline/session_assigner.hpp>
#include <pipeline/session_id.hpp>
#include <algorithm>
#include <iterator>
#include <map>
#include <omp.h>

namespace Sessionizer {

// ============================================================================
// GapCalculator
// ============================================================================

std::vector<TimedEvent> GapCalculator::compute(std::vector<ClassifiedEvent> timeline,
                                               std::optional<Timestamp> predecessor) {
    std::vector<TimedEvent> out;
    out.reserve(timeline.size());

    std::optional<Timestamp> prev = predecessor;
    for (auto& e : timeline) {
        TimedEvent t;
        static_cast<ClassifiedEvent&>(t) = std::move(e);
        if (prev) t.time_diff = t.timestamp - *prev;
        prev = t.timestamp;
        out.push_back(std::move(t));
    }
    return out;
}

// ============================================================================
// SessionGrouper
// ============================================================================

std::vector<SessionedEvent> SessionGrouper::group(std::vector<TimedEvent> timeline, SessionCarry carry) const {
    std::vector<SessionedEvent> out;
    out.reserve(timeline.size());

    for (auto& e : timeline) {
        SessionedEvent s;
        static_cast<TimedEvent&>(s) = std::move(e);

        // Without an open session there is nothing to continue, whatever the gap says
        s.is_new_session = detector_.is_new_session(s.time_diff) || !carry.open;
        if (s.is_new_session) {
            carry.open = true;
            carry.group_seq += 1;
            carry.session_start = s.timestamp;
            carry.session_id = derive_session_id(id_format_, s.user_id, s.product_code, s.timestamp);
        }

        s.session_group_seq = carry.group_seq;
        s.session_start_time = carry.session_start;
        s.session_id = carry.session_id;
        s.pdate = TimeUtil::to_date(s.timestamp);
        out.push_back(std::move(s));
    }
    return out;
}

// ============================================================================
// SessionAssigner
// ============================================================================

SessionAssigner::SessionAssigner(const EngineConfig& config)
    : classifier_(config.action_codes),
      grouper_(SessionBoundaryDetector(config.session_timeout), config.session_id_format),
      threads_(config.threads) {}

std::vector<SessionedEvent> SessionAssigner::assign(const PartitionWork& work) const {
    std::vector<ClassifiedEvent> classified;
    classified.reserve(work.pending.size());
    for (const auto& e : work.pending) {
        classified.push_back(classifier_.classify(e));
    }

    std::optional<Timestamp> predecessor;
    SessionCarry carry;
    if (!work.trusted.empty()) {
        const SessionedEvent& last = work.trusted.back();
        predecessor = last.timestamp;
        carry = SessionCarry::from(last);
    }

    return grouper_.group(GapCalculator::compute(std::move(classified), predecessor), std::move(carry));
}

std::vector<SessionedEvent> SessionAssigner::assign_all(const std::vector<PartitionWork>& partitions) const {
    std::vector<std::vector<SessionedEvent>> results(partitions.size());

    const int num_threads = threads_ > 0 ? threads_ : omp_get_max_threads();

    // Each iteration writes only its own slot
    #pragma omp parallel for schedule(dynamic, 64) num_threads(num_threads)
    for (long i = 0; i < static_cast<long>(partitions.size()); ++i) {
        results[i] = assign(partitions[i]);
    }

    size_t total = 0;
    for (const auto& r : results) total += r.size();

    std::vector<SessionedEvent> out;
    out.reserve(total);
    for (auto& r : results) {
        std::move(r.begin(), r.end(), std::back_inserter(out));
    }
    return out;
}

std::vector<PartitionWork> SessionAssigner::partition(std::vector<Event> events) {
    std::map<PartitionKey, std::vector<Event>> grouped;
    for (auto& e : events) {
        PartitionKey key = partition_of(e);
        grouped[std::move(key)].push_back(std::move(e));
    }

    std::vector<PartitionWork> out;
    out.reserve(grouped.size());
    for (auto& [key, timeline] : grouped) {
        std::sort(timeline.begin(), timeline.end(), timeline_less);
        out.push_back({key, {}, std::move(timeline)});
    }
    return out;
}

} // namespace Sessionizer
