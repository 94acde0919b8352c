/**
 * @file session_engine.hpp
 * @brief One daily run: raw batch in, sessioned rows merged into the cleaned layer
 */

#pragma once

#include <core/config.hpp>
#include <ingestion/batch_source.hpp>
#include <pipeline/scope.hpp>
#include <storage/session_store.hpp>
#include <export.hpp>
#include <string>

namespace Sessionizer {

struct RunReport {
    Date process_date;
    bool bootstrap = false;
    bool dry_run = false;

    size_t raw_rows = 0;
    size_t rejected_rows = 0;          // schema violations dropped by the reader
    size_t duplicates_collapsed = 0;
    size_t conflicts_rejected = 0;     // rows dropped for conflicting payloads

    size_t scope_keys = 0;
    Date rewrite_start;
    Date context_start;
    size_t history_rows = 0;           // persisted rows loaded, anchors included

    size_t rows_recomputed = 0;
    size_t sessions_started = 0;
    MergeStats merge;

    double elapsed_ms = 0.0;

    std::string mode() const;
    std::string describe() const;
};

/**
 * @brief Orchestrates a run: read, deduplicate, resolve scope, load history, fold, merge.
 *
 * Re-running the same process date against the same state yields the same persisted rows.
 * Any failure before the write leaves the store untouched; the store makes the write atomic.
 */
class SESSIONIZER_API SessionEngine {
public:
    SessionEngine(EngineConfig config, BatchSource& source, SessionStore& store);

    /**
     * @throws ConfigError, SchemaViolationError, ScopeResolutionError, MergeConflictError
     */
    RunReport run(const RunParams& params);

    const EngineConfig& config() const { return config_; }

private:
    void log_rejected(const std::string& what, const std::vector<RejectedRow>& rows) const;

    EngineConfig config_;
    BatchSource& source_;
    SessionStore& store_;
};

} // namespace Sessionizer
