#pragma once

#include "ops/ExecutionEngine.hpp"
#include "ops/ExecutionEvent.hpp"
#include "ops/ExecutionModeController.hpp"
#include "ops/OperationHistory.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/Schema.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ops {

struct SessionOptions {
    ExecutionMode mode = ExecutionMode::Lazy;
    size_t checkpointInterval = 10;   // 0 disables checkpoints
};

enum class ExecuteScope {
    Next,   // first queued entry only
    All
};

/// "next" / "all"; throws ValidationError otherwise
ExecuteScope executeScopeFromString(const std::string& name);

/**
 * Summary of one materialization pass, as seen after its results were
 * committed to the history.
 */
struct ExecutionReport {
    std::vector<OperationOutcome> outcomes;
    std::optional<OperationOutcome> firstFailure;
    bool cancelled = false;
    std::optional<std::string> internalError;
    size_t executedCount = 0;
    size_t queuedCount = 0;

    nlohmann::json toJson() const;
};

struct SubmitResult {
    OperationPtr operation;
    ExecutionDecision decision = ExecutionDecision::Defer;
    std::optional<ExecutionReport> report;    // set when the operation ran now
};

/// Materialized frame and its schema, always published together
struct FrameSnapshot {
    dataframe::DataFramePtr frame;
    dataframe::Schema schema;
};

/// Looks up the base frame of another dataset (join right sides)
using FrameResolver = std::function<dataframe::DataFramePtr(const std::string& datasetId)>;

/**
 * One loaded dataset: base frame, operation history, execution mode and
 * the currently materialized frame.
 *
 * Threading model:
 * - every command runs on the control thread (the server's io_context)
 * - executeQueuedAsync() folds the plan on a worker pool and posts the
 *   commit back to the control executor
 * - while such a pass is in flight, mutating commands throw
 *   SessionBusyError; readers keep seeing the previous snapshot
 *
 * Checkpoints of the materialized frame are kept every
 * checkpointInterval executed entries so that undo, edit and remove only
 * replay from the nearest one.
 */
class DatasetSession : public std::enable_shared_from_this<DatasetSession> {
public:
    using CompletionHandler = std::function<void(const ExecutionReport&)>;

    DatasetSession(std::string id, std::string name, dataframe::DataFramePtr base,
                   SessionOptions options = {});

    const std::string& id() const { return m_id; }
    const std::string& name() const { return m_name; }
    void setName(std::string name) { m_name = std::move(name); }
    const std::string& sourcePath() const { return m_sourcePath; }
    void setSourcePath(std::string path) { m_sourcePath = std::move(path); }

    void setFrameResolver(FrameResolver resolver) { m_resolver = std::move(resolver); }
    void setListener(SessionCallback listener) { m_listener = std::move(listener); }
    void setAsyncContext(boost::asio::thread_pool& workers, boost::asio::any_io_executor control);

    // === Commands (control thread) ===

    /// Throws ValidationError, SessionBusyError
    SubmitResult submit(OperationParams params);
    HistoryResult undo();
    HistoryResult redo();
    /// Returns true if the mode changed
    bool setMode(ExecutionMode mode);
    ExecutionMode mode() const { return m_controller.mode(); }

    ExecutionReport executeQueued(ExecuteScope scope = ExecuteScope::All);
    /// Runs the pass on the worker pool; onDone is invoked on the control executor
    void executeQueuedAsync(ExecuteScope scope, CompletionHandler onDone);
    /// Stops an in-flight pass at the next operation boundary
    void cancel();
    size_t clearQueued();

    /// Throws std::out_of_range for an unknown id, ValidationError for bad params
    ExecutionReport editOperation(const std::string& operationId, OperationParams params);
    /// Throws std::out_of_range for an unknown id
    ExecutionReport removeOperation(const std::string& operationId);

    /**
     * Append operations restored from a saved analysis or workflow.
     * With executeCount, that many of them are executed right away;
     * without it the current mode decides.
     */
    ExecutionReport applyOperations(const std::vector<OperationParams>& operations,
                                    std::optional<size_t> executeCount = std::nullopt);

    // === Queries (any thread) ===

    dataframe::DataFramePtr baseFrame() const { return m_base; }
    dataframe::DataFramePtr materializedFrame() const;
    dataframe::Schema schema() const;
    FrameSnapshot snapshot() const;
    dataframe::DataFramePtr page(size_t offset, size_t limit) const;
    bool isBusy() const { return m_busy.load(); }

    // === History views (control thread) ===

    const OperationHistory& history() const { return m_history; }
    /// Non-undone entries in order, as persisted by saved analyses
    std::vector<OperationPtr> savedEntries() const { return m_history.activeEntries(); }
    size_t checkpointCount() const { return m_checkpoints.size(); }

    nlohmann::json toJson() const;

private:
    void ensureIdle() const;

    std::vector<PlanEntry> snapshotPlan() const;
    ApplyContext resolveContext(const std::vector<PlanEntry>& plan, size_t from, size_t to) const;
    MaterializeRequest queuedRequest(const std::vector<PlanEntry>& plan, std::optional<size_t> limit) const;
    MaterializeRequest rebuildRequest(const std::vector<PlanEntry>& plan, size_t executedLimit) const;

    ExecutionReport runQueued(std::optional<size_t> limit);
    ExecutionReport rebuildExecuted(size_t changedPosition, size_t executedLimit);
    ExecutionReport runSync(const std::vector<PlanEntry>& plan, const MaterializeRequest& request);

    ExecutionReport commit(const std::vector<PlanEntry>& plan,
                           const MaterializeResult& result,
                           std::optional<dataframe::Schema> schema);
    void publish(dataframe::DataFramePtr frame, std::optional<dataframe::Schema> schema);

    void notifyOperation(const Operation& operation);
    void notifyRemoved(const std::string& operationId);
    void notify(SessionEvent event);

    std::string m_id;
    std::string m_name;
    std::string m_sourcePath;
    dataframe::DataFramePtr m_base;
    SessionOptions m_options;

    OperationHistory m_history;
    ExecutionModeController m_controller;
    ExecutionEngine m_engine;
    std::map<size_t, dataframe::DataFramePtr> m_checkpoints;

    mutable std::mutex m_frameMutex;
    FrameSnapshot m_snapshot;

    std::atomic<bool> m_busy{false};
    std::shared_ptr<std::atomic<bool>> m_cancel;

    FrameResolver m_resolver;
    SessionCallback m_listener;
    boost::asio::thread_pool* m_workers = nullptr;
    std::optional<boost::asio::any_io_executor> m_control;
};

using DatasetSessionPtr = std::shared_ptr<DatasetSession>;

} // namespace ops
