#include "ops/ExecutionEngine.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <algorithm>
#include <chrono>

namespace ops {

std::string outcomeStatusToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Applied: return "applied";
        case OutcomeStatus::Cached:  return "cached";
        case OutcomeStatus::Failed:  return "failed";
        case OutcomeStatus::NotRun:  return "not_run";
    }
    return "not_run";
}

nlohmann::json OperationOutcome::toJson() const {
    nlohmann::json j = {
        {"operation_id", operationId},
        {"status", outcomeStatusToString(status)},
        {"duration_ms", durationMs}
    };
    j["error"] = error ? error->toJson() : nlohmann::json(nullptr);
    return j;
}

MaterializeResult ExecutionEngine::materialize(const MaterializeRequest& request) const {
    PROFILE_SCOPE("materialize");

    const auto& entries = request.entries;
    const size_t count = entries.size();

    MaterializeResult result;
    result.outcomes.resize(count);
    for (size_t i = 0; i < count; ++i) {
        result.outcomes[i].operationId = entries[i].operation->id();
    }

    auto emit = [&](size_t index, ExecutionStatus status, double durationMs,
                    const std::optional<OperationError>& error) {
        if (!request.onEvent) return;
        ExecutionEvent evt;
        evt.operationId = entries[index].operation->id();
        evt.status = status;
        evt.durationMs = durationMs;
        evt.error = error;
        request.onEvent(evt);
    };

    size_t start = 0;
    dataframe::DataFramePtr frame = request.baseFrame;
    if (request.prefix && request.prefix->frame) {
        start = std::min(request.prefix->length, count);
        frame = request.prefix->frame;
    }
    const size_t end = request.limit ? std::min(*request.limit, count) : count;

    for (size_t i = 0; i < start; ++i) {
        result.outcomes[i].status = OutcomeStatus::Cached;
    }

    size_t i = start;
    for (; i < end; ++i) {
        if (request.cancel && request.cancel->load()) {
            LOG_INFO("Materialization cancelled before operation " + entries[i].operation->id());
            result.cancelled = true;
            break;
        }

        const auto& entry = entries[i];

        if (!request.fullRebuild) {
            if (entry.state == OperationState::Executed) {
                result.outcomes[i].status = OutcomeStatus::Cached;
                emit(i, ExecutionStatus::Skipped, 0.0, std::nullopt);
                continue;
            }
            if (entry.state == OperationState::Failed) {
                // Resolved only by editing or removing the entry
                result.outcomes[i].status = OutcomeStatus::Failed;
                result.outcomes[i].error = entry.operation->error();
                result.failedIndex = i;
                emit(i, ExecutionStatus::Failed, 0.0, result.outcomes[i].error);
                ++i;
                break;
            }
        }

        emit(i, ExecutionStatus::Started, 0.0, std::nullopt);

        auto startTime = std::chrono::high_resolution_clock::now();
        auto applied = entry.operation->apply(frame, request.context);
        auto endTime = std::chrono::high_resolution_clock::now();
        double durationMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

        auto& outcome = result.outcomes[i];
        outcome.durationMs = durationMs;

        if (!applied.ok()) {
            outcome.status = OutcomeStatus::Failed;
            outcome.error = applied.error;
            result.failedIndex = i;
            std::string message = "Operation " + entry.operation->id() + " ("
                + entry.operation->displayLabel() + ") failed: " + applied.error->message;
            if (applied.error->kind == dataframe::ErrorKind::EngineInternal) {
                LOG_ERROR(message);
            } else {
                LOG_WARN(message);
            }
            emit(i, ExecutionStatus::Failed, durationMs, outcome.error);
            ++i;
            break;
        }

        outcome.status = OutcomeStatus::Applied;
        frame = applied.frame;
        LOG_DEBUG("Applied " + entry.operation->displayLabel() + " -> "
                  + std::to_string(frame->rowCount()) + " rows");
        emit(i, ExecutionStatus::Completed, durationMs, std::nullopt);

        if (request.checkpointInterval > 0 && (i + 1) % request.checkpointInterval == 0) {
            result.checkpoints[i + 1] = frame;
        }
    }

    // Entries after a failure, a cancellation or the limit stay NotRun
    for (; i < count; ++i) {
        if (result.outcomes[i].status == OutcomeStatus::NotRun) {
            emit(i, ExecutionStatus::Skipped, 0.0, std::nullopt);
        }
    }

    result.frame = frame;
    return result;
}

} // namespace ops
