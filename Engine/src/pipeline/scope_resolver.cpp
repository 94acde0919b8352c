#include <pipeline/scope_resolver.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <map>
#include <utility>

namespace Sessionizer {

ScopeResolver::ScopeResolver(const EngineConfig& config)
    : lookback_days_(config.lookback_days),
      context_days_(config.extended_lookback_days - config.lookback_days),
      retention_days_(config.retention_days) {}

RecomputationScope ScopeResolver::resolve(const std::vector<Event>& batch, const RunParams& params) const {
    RecomputationScope scope;
    scope.process_date = params.process_date;
    scope.bootstrap = params.is_first_run;

    std::map<PartitionKey, Date> earliest;
    for (const auto& e : batch) {
        const Date d = TimeUtil::to_date(e.timestamp);
        auto [it, inserted] = earliest.emplace(partition_of(e), d);
        if (!inserted && d < it->second) it->second = d;
    }

    scope.keys.reserve(earliest.size());
    Date batch_start = params.process_date;
    for (const auto& [key, d] : earliest) {
        scope.keys.push_back(key);
        batch_start = std::min(batch_start, d);
    }

    if (scope.bootstrap) {
        // Full load: everything in the batch is computed from scratch, nothing is reloaded
        scope.rewrite_start = batch_start;
        scope.context_start = batch_start;
        return scope;
    }

    scope.rewrite_start = std::min(params.process_date - Days(lookback_days_), batch_start);
    scope.context_start = scope.rewrite_start - Days(context_days_);

    const Date retention_floor = params.process_date - Days(retention_days_);
    if (scope.context_start < retention_floor) {
        std::vector<PartitionKey> offending;
        for (const auto& [key, d] : earliest) {
            if (d - Days(context_days_) < retention_floor) offending.push_back(key);
        }
        throw ScopeResolutionError(
            "Lookback for " + std::to_string(offending.size()) + " key(s) requires data from " +
                TimeUtil::format_date(scope.context_start) + " to " + TimeUtil::format_date(params.process_date) +
                ", beyond the retention floor " + TimeUtil::format_date(retention_floor),
            std::move(offending), scope.context_start, params.process_date);
    }

    return scope;
}

std::vector<PartitionWork> ScopeResolver::working_set(const RecomputationScope& scope,
                                                      std::vector<Event> batch,
                                                      HistorySlice history) {
    using TimelineSlot = std::pair<Timestamp, std::string>;

    struct Builder {
        std::vector<SessionedEvent> trusted;
        std::map<TimelineSlot, Event> pending;
    };

    std::map<PartitionKey, Builder> builders;
    for (const auto& key : scope.keys) builders.emplace(key, Builder{});

    auto builder_for = [&](const Event& e) -> Builder* {
        auto it = builders.find(partition_of(e));
        return it == builders.end() ? nullptr : &it->second;
    };

    for (auto& row : history.anchors) {
        if (Builder* b = builder_for(row)) b->trusted.push_back(std::move(row));
    }

    for (auto& row : history.rows) {
        Builder* b = builder_for(row);
        if (!b) continue;
        if (scope.in_rewrite_range(row.timestamp)) {
            Event e = static_cast<Event&&>(std::move(row));
            TimelineSlot slot{e.timestamp, e.event_id};
            b->pending.emplace(std::move(slot), std::move(e));
        } else {
            b->trusted.push_back(std::move(row));
        }
    }

    // Batch rows win over persisted rows with the same natural key
    for (auto& e : batch) {
        Builder* b = builder_for(e);
        if (!b) continue;
        TimelineSlot slot{e.timestamp, e.event_id};
        b->pending.insert_or_assign(std::move(slot), std::move(e));
    }

    std::vector<PartitionWork> out;
    out.reserve(builders.size());
    for (auto& [key, b] : builders) {
        PartitionWork work;
        work.key = key;
        std::sort(b.trusted.begin(), b.trusted.end(), timeline_less);
        work.trusted = std::move(b.trusted);
        work.pending.reserve(b.pending.size());
        for (auto& [slot, e] : b.pending) work.pending.push_back(std::move(e));
        if (!work.pending.empty()) out.push_back(std::move(work));
    }
    return out;
}

} // namespace Sessionizer
