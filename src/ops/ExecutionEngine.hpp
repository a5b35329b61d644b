#pragma once

#include "ops/Operation.hpp"
#include "ops/ExecutionEvent.hpp"
#include "dataframe/DataFrame.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ops {

/**
 * Snapshot of one history entry taken on the control thread. The engine
 * reads the state from here, never from the shared Operation.
 */
struct PlanEntry {
    OperationPtr operation;
    OperationState state = OperationState::Queued;
};

/// A frame equal to base with the first `length` entries applied
struct CachedPrefix {
    dataframe::DataFramePtr frame;
    size_t length = 0;
};

struct MaterializeRequest {
    dataframe::DataFramePtr baseFrame;
    std::vector<PlanEntry> entries;
    std::optional<CachedPrefix> prefix;
    bool fullRebuild = false;                // replay Executed entries too
    std::optional<size_t> limit;             // stop before this position
    std::shared_ptr<std::atomic<bool>> cancel;
    ApplyContext context;
    size_t checkpointInterval = 0;           // 0 disables checkpoints
    ExecutionCallback onEvent;
};

enum class OutcomeStatus {
    Applied,
    Cached,
    Failed,
    NotRun
};

std::string outcomeStatusToString(OutcomeStatus status);

struct OperationOutcome {
    std::string operationId;
    OutcomeStatus status = OutcomeStatus::NotRun;
    std::optional<OperationError> error;
    double durationMs = 0.0;

    nlohmann::json toJson() const;
};

struct MaterializeResult {
    dataframe::DataFramePtr frame;
    std::vector<OperationOutcome> outcomes;     // one per plan entry, same order
    std::optional<size_t> failedIndex;
    bool cancelled = false;
    /// Prefix length -> frame, for every interval boundary crossed
    std::map<size_t, dataframe::DataFramePtr> checkpoints;

    const OperationOutcome* firstFailure() const {
        return failedIndex ? &outcomes[*failedIndex] : nullptr;
    }
};

/**
 * Folds a plan of operations over a base frame.
 *
 * Stateless and free of side effects on the history: it only reads the
 * plan and returns per-entry outcomes, so it can run on any thread.
 * Applying stops at the first failure; an entry that is already Failed
 * blocks the pass until it is edited or removed.
 */
class ExecutionEngine {
public:
    MaterializeResult materialize(const MaterializeRequest& request) const;
};

} // namespace ops
