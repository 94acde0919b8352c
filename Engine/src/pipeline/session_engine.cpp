#include <pipeline/session_engine.hpp>
#include <pipeline/deduplicator.hpp>
#include <pipeline/scope_resolver.hpp>
#include <pipeline/session_assigner.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Sessionizer {

namespace {

constexpr size_t k_rejected_log_limit = 10;

} // namespace

std::string RunReport::mode() const {
    std::string m = bootstrap ? "bootstrap" : "incremental";
    if (dry_run) m += ", dry-run";
    return m;
}

std::string RunReport::describe() const {
    std::ostringstream out;
    out << "Process date:        " << TimeUtil::format_date(process_date) << " (" << mode() << ")\n"
        << "Raw rows:            " << raw_rows << "\n"
        << "Rejected rows:       " << rejected_rows << "\n"
        << "Duplicates:          " << duplicates_collapsed << "\n"
        << "Conflicts rejected:  " << conflicts_rejected << "\n"
        << "Scope keys:          " << scope_keys << "\n";
    if (scope_keys > 0) {
        out << "Rewrite from:        " << TimeUtil::format_date(rewrite_start) << "\n";
        if (!bootstrap) out << "Context from:        " << TimeUtil::format_date(context_start) << "\n";
    }
    out << "History rows:        " << history_rows << "\n"
        << "Rows recomputed:     " << rows_recomputed << "\n"
        << "Sessions started:    " << sessions_started << "\n"
        << "Merge:               " << (dry_run ? "skipped" : merge.describe()) << "\n"
        << "Elapsed:             " << std::fixed << std::setprecision(1) << elapsed_ms << " ms";
    return out.str();
}

SessionEngine::SessionEngine(EngineConfig config, BatchSource& source, SessionStore& store)
    : config_(std::move(config)), source_(source), store_(store) {}

void SessionEngine::log_rejected(const std::string& what, const std::vector<RejectedRow>& rows) const {
    if (rows.empty()) return;
    const size_t shown = std::min(rows.size(), k_rejected_log_limit);
    for (size_t i = 0; i < shown; ++i) {
        const auto& r = rows[i];
        Logger::warn(what + (r.line ? " (line " + std::to_string(r.line) + ")" : std::string()) + ": " + r.reason);
    }
    if (rows.size() > shown) {
        Logger::warn("... and " + std::to_string(rows.size() - shown) + " more " + what + " row(s)");
    }
}

RunReport SessionEngine::run(const RunParams& params) {
    Timer timer;
    config_.validate();

    RunReport report;
    report.process_date = params.process_date;
    report.bootstrap = params.is_first_run;
    report.dry_run = params.dry_run;

    Logger::step("Sessionizing " + TimeUtil::format_date(params.process_date) + " (" + report.mode() + ")");
    Logger::debug(config_.describe());

    // [1/5] Raw batch
    RawBatch raw = source_.read(params.process_date);
    report.raw_rows = raw.raw_rows;
    report.rejected_rows = raw.rejected.size();
    log_rejected("Rejected", raw.rejected);
    Logger::info("Read " + std::to_string(raw.raw_rows) + " raw row(s), " +
                 std::to_string(raw.events.size()) + " valid");

    // [2/5] Deduplicate
    DedupResult dedup = Deduplicator(config_.schema_policy).deduplicate(std::move(raw.events));
    report.duplicates_collapsed = dedup.duplicates_collapsed;
    report.conflicts_rejected = dedup.conflicting_rows;
    log_rejected("Conflicting payload", dedup.conflicts);
    if (dedup.duplicates_collapsed > 0) {
        Logger::info("Collapsed " + std::to_string(dedup.duplicates_collapsed) + " duplicate row(s)");
    }

    // [3/5] Scope
    RecomputationScope scope = ScopeResolver(config_).resolve(dedup.events, params);
    report.scope_keys = scope.keys.size();
    report.rewrite_start = scope.rewrite_start;
    report.context_start = scope.context_start;

    if (scope.empty() && !scope.bootstrap) {
        Logger::info("Nothing to sessionize");
        report.elapsed_ms = timer.elapsed_ms();
        return report;
    }
    Logger::info("Scope: " + scope.describe());

    store_.ensure_schema();

    // [4/5] History and fold
    HistorySlice history;
    if (!scope.bootstrap) {
        history = store_.load_scope(scope);
        report.history_rows = history.size();
        Logger::info("Loaded " + std::to_string(history.rows.size()) + " history row(s), " +
                     std::to_string(history.anchors.size()) + " anchor(s)");
    }

    std::vector<PartitionWork> work = ScopeResolver::working_set(scope, std::move(dedup.events), std::move(history));
    std::vector<SessionedEvent> rows = SessionAssigner(config_).assign_all(work);
    report.rows_recomputed = rows.size();
    report.sessions_started = static_cast<size_t>(
        std::count_if(rows.begin(), rows.end(), [](const SessionedEvent& r) { return r.is_new_session; }));
    Logger::info("Recomputed " + std::to_string(rows.size()) + " row(s) in " + std::to_string(work.size()) +
                 " partition(s), " + std::to_string(report.sessions_started) + " session start(s)");

    // [5/5] Write
    if (params.dry_run) {
        Logger::info("Dry run: nothing written");
    } else if (scope.bootstrap) {
        report.merge = store_.bootstrap(rows);
        Logger::info("Bootstrap: " + report.merge.describe());
    } else {
        report.merge = store_.merge(scope, rows);
        Logger::info("Merge: " + report.merge.describe());
    }

    report.elapsed_ms = timer.elapsed_ms();
    Logger::success("Run for " + TimeUtil::format_date(params.process_date) + " finished in " +
                    std::to_string(static_cast<long long>(report.elapsed_ms)) + " ms");
    return report;
}

} // namespace Sessionizer
