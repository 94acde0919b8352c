/**
 * @file scope_resolver.hpp
 * @brief Bounds the historical data a run must reload and recompute
 *
 * Sessions depend only on the immediately preceding event of the same (user, product),
 * so a batch can be sessionized from its keys' recent history alone. The scope is
 * derived from the keys in the batch, not from arrival dates: a late event pulls the
 * rewrite range back to its own date.
 */

#pragma once

#include <core/config.hpp>
#include <pipeline/scope.hpp>
#include <pipeline/session_assigner.hpp>
#include <export.hpp>
#include <vector>

namespace Sessionizer {

class SESSIONIZER_API ScopeResolver {
public:
    explicit ScopeResolver(const EngineConfig& config);

    /**
     * @brief Resolve keys and windows for a deduplicated batch.
     * @throws ScopeResolutionError when the context window reaches past retention
     */
    RecomputationScope resolve(const std::vector<Event>& batch, const RunParams& params) const;

    /**
     * @brief Build per-key fold inputs from the batch and the loaded history.
     *
     * Trusted rows are the anchor and context rows; pending rows are persisted rows in the
     * rewrite range plus batch rows, a batch row replacing a persisted row with the same
     * natural key. Keys outside the scope are ignored. Output is sorted by key.
     */
    static std::vector<PartitionWork> working_set(const RecomputationScope& scope,
                                                  std::vector<Event> batch,
                                                  HistorySlice history);

private:
    int lookback_days_;
    int context_days_;
    int retention_days_;
};

} // namespace Sessionizer
