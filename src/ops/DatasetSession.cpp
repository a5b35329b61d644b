#include "ops/DatasetSession.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace ops {

ExecuteScope executeScopeFromString(const std::string& name) {
    if (name == "next") return ExecuteScope::Next;
    if (name == "all") return ExecuteScope::All;
    throw ValidationError("Unknown execution scope: " + name);
}

nlohmann::json ExecutionReport::toJson() const {
    nlohmann::json outcomesJson = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        outcomesJson.push_back(outcome.toJson());
    }
    nlohmann::json j = {
        {"outcomes", outcomesJson},
        {"cancelled", cancelled},
        {"executed_count", executedCount},
        {"queued_count", queuedCount}
    };
    j["first_failure"] = firstFailure ? firstFailure->toJson() : nlohmann::json(nullptr);
    if (internalError) {
        j["internal_error"] = *internalError;
    }
    return j;
}

DatasetSession::DatasetSession(std::string id, std::string name, dataframe::DataFramePtr base,
                               SessionOptions options)
    : m_id(std::move(id))
    , m_name(std::move(name))
    , m_base(std::move(base))
    , m_options(options)
    , m_controller(options.mode)
    , m_cancel(std::make_shared<std::atomic<bool>>(false))
{
    if (!m_base) {
        throw std::invalid_argument("Dataset session requires a base frame");
    }
    m_snapshot.frame = m_base;
    m_snapshot.schema = dataframe::Schema::infer(*m_base);
}

void DatasetSession::setAsyncContext(boost::asio::thread_pool& workers,
                                     boost::asio::any_io_executor control) {
    m_workers = &workers;
    m_control = std::move(control);
}

void DatasetSession::ensureIdle() const {
    if (m_busy.load()) {
        throw SessionBusyError(m_id);
    }
}

// ============================================================================
// Commands
// ============================================================================

SubmitResult DatasetSession::submit(OperationParams params) {
    ensureIdle();

    auto currentSchema = schema();
    auto operation = Operation::create(std::move(params), &currentSchema);
    m_history.append(operation);
    LOG_DEBUG("[" + m_id + "] queued " + operation->id() + ": " + operation->displayLabel());
    notifyOperation(*operation);

    SubmitResult result;
    result.operation = operation;
    result.decision = m_controller.decide(*operation);
    if (result.decision == ExecutionDecision::RunNow) {
        result.report = runQueued(std::nullopt);
    }
    return result;
}

HistoryResult DatasetSession::undo() {
    ensureIdle();

    const size_t executedBefore = m_history.executedCount();
    auto result = m_history.undo();
    if (!result.ok()) {
        return result;
    }

    LOG_DEBUG("[" + m_id + "] undo " + result.operation->id());
    notifyOperation(*result.operation);

    // The undone entry was the last executed one: rebuild without it
    if (result.previousState == OperationState::Executed) {
        rebuildExecuted(executedBefore - 1, executedBefore - 1);
    }
    return result;
}

HistoryResult DatasetSession::redo() {
    ensureIdle();

    auto result = m_history.redo();
    if (!result.ok()) {
        return result;
    }

    LOG_DEBUG("[" + m_id + "] redo " + result.operation->id());
    notifyOperation(*result.operation);

    if (m_controller.decide(*result.operation) == ExecutionDecision::RunNow) {
        runQueued(std::nullopt);
    }
    return result;
}

bool DatasetSession::setMode(ExecutionMode mode) {
    if (!m_controller.setMode(mode)) {
        return false;
    }
    LOG_INFO("[" + m_id + "] execution mode set to " + executionModeToString(mode));
    notify(SessionEvent{SessionEventType::ModeChanged, m_id, "", executionModeToString(mode)});
    return true;
}

ExecutionReport DatasetSession::executeQueued(ExecuteScope scope) {
    ensureIdle();

    std::optional<size_t> limit;
    if (scope == ExecuteScope::Next) {
        limit = m_history.executedCount() + 1;
    }
    return runQueued(limit);
}

void DatasetSession::executeQueuedAsync(ExecuteScope scope, CompletionHandler onDone) {
    ensureIdle();
    if (!m_workers || !m_control) {
        throw std::logic_error("Dataset session '" + m_id + "' has no worker pool");
    }

    std::optional<size_t> limit;
    if (scope == ExecuteScope::Next) {
        limit = m_history.executedCount() + 1;
    }

    auto plan = snapshotPlan();
    auto request = queuedRequest(plan, limit);

    m_cancel->store(false);
    m_busy.store(true);

    auto self = shared_from_this();
    auto control = *m_control;

    boost::asio::post(*m_workers, [self, control, plan, request, onDone]() {
        tablescope::server::Logger::setThreadTag("worker");
        MaterializeResult result;
        std::optional<dataframe::Schema> schema;
        std::optional<std::string> failure;
        try {
            result = self->m_engine.materialize(request);
            schema = dataframe::Schema::infer(*result.frame);
        } catch (const std::exception& e) {
            LOG_ERROR("[" + self->m_id + "] materialization aborted: " + std::string(e.what()));
            result = MaterializeResult{};
            failure = e.what();
        }

        boost::asio::post(control, [self, plan, result, schema, failure, onDone]() {
            ExecutionReport report;
            if (failure) {
                report.internalError = failure;
                report.executedCount = self->m_history.executedCount();
                report.queuedCount = self->m_history.queuedCount();
            } else {
                report = self->commit(plan, result, schema);
            }
            self->m_busy.store(false);
            if (onDone) {
                onDone(report);
            }
        });
    });
}

void DatasetSession::cancel() {
    m_cancel->store(true);
}

size_t DatasetSession::clearQueued() {
    ensureIdle();

    auto removed = m_history.clearQueued();
    for (const auto& op : removed) {
        notifyRemoved(op->id());
    }
    if (!removed.empty()) {
        LOG_DEBUG("[" + m_id + "] cleared " + std::to_string(removed.size()) + " queued operations");
    }
    return removed.size();
}

ExecutionReport DatasetSession::editOperation(const std::string& operationId, OperationParams params) {
    ensureIdle();

    auto position = m_history.position(operationId);
    if (!position) {
        throw std::out_of_range("Operation '" + operationId + "' not found");
    }

    const auto& current = m_history.entries()[*position];
    const bool wasExecuted = current->state() == OperationState::Executed;
    const size_t executedBefore = m_history.executedCount();

    auto currentSchema = schema();
    auto replacement = Operation::createWithId(operationId, std::move(params), &currentSchema);
    m_history.replace(operationId, replacement);
    LOG_DEBUG("[" + m_id + "] edited " + operationId + ": " + replacement->displayLabel());
    notifyOperation(*replacement);

    ExecutionReport report;
    if (wasExecuted) {
        report = rebuildExecuted(*position, executedBefore);
    }
    if (m_controller.mode() == ExecutionMode::Eager) {
        report = runQueued(std::nullopt);
    }
    if (!wasExecuted && m_controller.mode() == ExecutionMode::Lazy) {
        report.executedCount = m_history.executedCount();
        report.queuedCount = m_history.queuedCount();
    }
    return report;
}

ExecutionReport DatasetSession::removeOperation(const std::string& operationId) {
    ensureIdle();

    auto position = m_history.position(operationId);
    if (!position) {
        throw std::out_of_range("Operation '" + operationId + "' not found");
    }

    const bool wasExecuted = m_history.entries()[*position]->state() == OperationState::Executed;
    const size_t executedBefore = m_history.executedCount();

    m_history.remove(operationId);
    LOG_DEBUG("[" + m_id + "] removed " + operationId);
    notifyRemoved(operationId);

    ExecutionReport report;
    if (wasExecuted) {
        report = rebuildExecuted(*position, executedBefore - 1);
    }
    if (m_controller.mode() == ExecutionMode::Eager) {
        report = runQueued(std::nullopt);
    }
    if (!wasExecuted && m_controller.mode() == ExecutionMode::Lazy) {
        report.executedCount = m_history.executedCount();
        report.queuedCount = m_history.queuedCount();
    }
    return report;
}

ExecutionReport DatasetSession::applyOperations(const std::vector<OperationParams>& operations,
                                                std::optional<size_t> executeCount) {
    ensureIdle();

    // All or nothing: validate everything before touching the history
    std::vector<OperationPtr> created;
    created.reserve(operations.size());
    for (const auto& params : operations) {
        created.push_back(Operation::create(params));
    }

    const size_t executedBefore = m_history.executedCount();
    for (const auto& op : created) {
        m_history.append(op);
        notifyOperation(*op);
    }
    LOG_INFO("[" + m_id + "] restored " + std::to_string(created.size()) + " operations");

    if (executeCount) {
        if (*executeCount == 0) {
            ExecutionReport report;
            report.executedCount = m_history.executedCount();
            report.queuedCount = m_history.queuedCount();
            return report;
        }
        return runQueued(executedBefore + *executeCount);
    }
    if (m_controller.mode() == ExecutionMode::Eager) {
        return runQueued(std::nullopt);
    }

    ExecutionReport report;
    report.executedCount = m_history.executedCount();
    report.queuedCount = m_history.queuedCount();
    return report;
}

// ============================================================================
// Queries
// ============================================================================

dataframe::DataFramePtr DatasetSession::materializedFrame() const {
    std::lock_guard<std::mutex> lock(m_frameMutex);
    return m_snapshot.frame;
}

dataframe::Schema DatasetSession::schema() const {
    std::lock_guard<std::mutex> lock(m_frameMutex);
    return m_snapshot.schema;
}

FrameSnapshot DatasetSession::snapshot() const {
    std::lock_guard<std::mutex> lock(m_frameMutex);
    return m_snapshot;
}

dataframe::DataFramePtr DatasetSession::page(size_t offset, size_t limit) const {
    return materializedFrame()->slice(offset, limit);
}

nlohmann::json DatasetSession::toJson() const {
    auto current = snapshot();

    nlohmann::json operations = nlohmann::json::array();
    for (const auto& op : m_history.entries()) {
        operations.push_back(op->toJson());
    }
    nlohmann::json redo = nlohmann::json::array();
    for (const auto& op : m_history.redoBuffer()) {
        redo.push_back({{"id", op->id()}, {"label", op->displayLabel()}});
    }

    return nlohmann::json{
        {"id", m_id},
        {"name", m_name},
        {"source_path", m_sourcePath},
        {"mode", executionModeToString(m_controller.mode())},
        {"busy", isBusy()},
        {"rows", current.frame->rowCount()},
        {"base_rows", m_base->rowCount()},
        {"schema", current.schema.toJson()},
        {"operations", operations},
        {"redo", redo},
        {"executed_count", m_history.executedCount()},
        {"queued_count", m_history.queuedCount()},
        {"can_undo", m_history.canUndo()},
        {"can_redo", m_history.canRedo()}
    };
}

// ============================================================================
// Materialization
// ============================================================================

std::vector<PlanEntry> DatasetSession::snapshotPlan() const {
    std::vector<PlanEntry> plan;
    for (const auto& op : m_history.activeEntries()) {
        plan.push_back(PlanEntry{op, op->state()});
    }
    return plan;
}

ApplyContext DatasetSession::resolveContext(const std::vector<PlanEntry>& plan,
                                            size_t from, size_t to) const {
    ApplyContext context;
    if (!m_resolver) return context;

    for (size_t i = from; i < std::min(to, plan.size()); ++i) {
        const auto* join = std::get_if<JoinParams>(&plan[i].operation->params());
        if (!join || context.datasets.count(join->rightDatasetId) > 0) continue;

        auto frame = m_resolver(join->rightDatasetId);
        if (frame) {
            context.datasets[join->rightDatasetId] = frame;
        }
    }
    return context;
}

MaterializeRequest DatasetSession::queuedRequest(const std::vector<PlanEntry>& plan,
                                                 std::optional<size_t> limit) const {
    MaterializeRequest request;
    request.baseFrame = m_base;
    request.entries = plan;
    request.prefix = CachedPrefix{materializedFrame(), m_history.executedCount()};
    request.limit = limit;
    request.cancel = m_cancel;
    request.checkpointInterval = m_options.checkpointInterval;
    request.context = resolveContext(plan, request.prefix->length, limit.value_or(plan.size()));
    return request;
}

MaterializeRequest DatasetSession::rebuildRequest(const std::vector<PlanEntry>& plan,
                                                  size_t executedLimit) const {
    MaterializeRequest request;
    request.baseFrame = m_base;
    request.entries = plan;
    request.fullRebuild = true;
    request.limit = executedLimit;
    request.cancel = m_cancel;
    request.checkpointInterval = m_options.checkpointInterval;

    // Nearest checkpoint at or before the replay limit
    auto it = m_checkpoints.upper_bound(executedLimit);
    if (it != m_checkpoints.begin()) {
        --it;
        request.prefix = CachedPrefix{it->second, it->first};
    } else {
        request.prefix = CachedPrefix{m_base, 0};
    }
    request.context = resolveContext(plan, request.prefix->length, executedLimit);
    return request;
}

ExecutionReport DatasetSession::runQueued(std::optional<size_t> limit) {
    auto plan = snapshotPlan();
    return runSync(plan, queuedRequest(plan, limit));
}

ExecutionReport DatasetSession::rebuildExecuted(size_t changedPosition, size_t executedLimit) {
    // Checkpoints past the change no longer describe the history
    m_checkpoints.erase(m_checkpoints.upper_bound(changedPosition), m_checkpoints.end());

    auto plan = snapshotPlan();
    LOG_DEBUG("[" + m_id + "] rebuilding executed prefix up to " + std::to_string(executedLimit));
    return runSync(plan, rebuildRequest(plan, executedLimit));
}

ExecutionReport DatasetSession::runSync(const std::vector<PlanEntry>& plan,
                                        const MaterializeRequest& request) {
    m_cancel->store(false);
    auto result = m_engine.materialize(request);
    return commit(plan, result, std::nullopt);
}

ExecutionReport DatasetSession::commit(const std::vector<PlanEntry>& plan,
                                       const MaterializeResult& result,
                                       std::optional<dataframe::Schema> schema) {
    const size_t count = std::min(plan.size(), result.outcomes.size());
    for (size_t i = 0; i < count; ++i) {
        const auto& entry = plan[i];
        const auto& outcome = result.outcomes[i];
        auto& op = *entry.operation;

        switch (outcome.status) {
            case OutcomeStatus::Applied:
                op.setState(OperationState::Executed);
                notifyOperation(op);
                break;
            case OutcomeStatus::Failed:
                if (outcome.error) {
                    op.markFailed(*outcome.error);
                }
                notifyOperation(op);
                break;
            case OutcomeStatus::NotRun:
                // Was part of the frame before a rebuild that stopped early
                if (entry.state == OperationState::Executed) {
                    op.setState(OperationState::Queued);
                    notifyOperation(op);
                }
                break;
            case OutcomeStatus::Cached:
                break;
        }
    }

    for (const auto& [length, frame] : result.checkpoints) {
        m_checkpoints[length] = frame;
    }
    m_checkpoints.erase(m_checkpoints.upper_bound(m_history.executedCount()), m_checkpoints.end());

    if (result.frame && result.frame != materializedFrame()) {
        publish(result.frame, std::move(schema));
    }

    ExecutionReport report;
    report.outcomes = result.outcomes;
    if (const auto* failure = result.firstFailure()) {
        report.firstFailure = *failure;
    }
    report.cancelled = result.cancelled;
    report.executedCount = m_history.executedCount();
    report.queuedCount = m_history.queuedCount();
    return report;
}

void DatasetSession::publish(dataframe::DataFramePtr frame, std::optional<dataframe::Schema> schema) {
    FrameSnapshot next;
    next.schema = schema ? std::move(*schema) : dataframe::Schema::infer(*frame);
    next.frame = std::move(frame);

    SessionEvent event{SessionEventType::FrameChanged, m_id, "", ""};
    event.frame = next.frame;
    event.schema = next.schema;
    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        m_snapshot = std::move(next);
    }
    notify(std::move(event));
}

// ============================================================================
// Notifications
// ============================================================================

void DatasetSession::notifyOperation(const Operation& operation) {
    SessionEvent event{SessionEventType::OperationChanged, m_id, operation.id(),
                       operationStateToString(operation.state())};
    event.label = operation.displayLabel();
    event.error = operation.error();
    notify(std::move(event));
}

void DatasetSession::notifyRemoved(const std::string& operationId) {
    notify(SessionEvent{SessionEventType::OperationRemoved, m_id, operationId, ""});
}

void DatasetSession::notify(SessionEvent event) {
    if (m_listener) {
        m_listener(event);
    }
}

} // namespace ops
