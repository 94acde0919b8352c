/**
 * @file errors.hpp
 * @brief Run-level failures of the session engine
 *
 * Per-row computations never throw; everything here aborts or rejects a run.
 */

#pragma once

#include <core/event.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace Sessionizer {

class SessionizerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public SessionizerError {
public:
    using SessionizerError::SessionizerError;
};

/**
 * @brief A batch row (or the whole batch) does not match the event schema.
 */
struct RejectedRow {
    size_t line = 0;      // 1-based line in the source, 0 when not applicable
    std::string reason;
};

class SchemaViolationError : public SessionizerError {
public:
    SchemaViolationError(const std::string& what, std::vector<RejectedRow> rows = {})
        : SessionizerError(what), rows_(std::move(rows)) {}

    const std::vector<RejectedRow>& rows() const { return rows_; }

private:
    std::vector<RejectedRow> rows_;
};

/**
 * @brief Lookback data needed to recompute a scope is unavailable.
 */
class ScopeResolutionError : public SessionizerError {
public:
    ScopeResolutionError(const std::string& what, std::vector<PartitionKey> keys, Date from, Date to)
        : SessionizerError(what), keys_(std::move(keys)), from_(from), to_(to) {}

    const std::vector<PartitionKey>& keys() const { return keys_; }
    Date from() const { return from_; }
    Date to() const { return to_; }

private:
    std::vector<PartitionKey> keys_;
    Date from_;
    Date to_;
};

/**
 * @brief Another writer holds or modified the same scope. Retried by the orchestrator.
 */
class MergeConflictError : public SessionizerError {
public:
    using SessionizerError::SessionizerError;
};

} // namespace Sessionizer
