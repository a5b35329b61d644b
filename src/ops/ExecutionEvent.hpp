#pragma once

#include "ops/OperationErrors.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/Schema.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ops {

/**
 * Status of an operation while a materialization pass runs
 */
enum class ExecutionStatus {
    Started,
    Completed,
    Failed,
    Skipped     // cached prefix, or not reached
};

/**
 * Emitted by the engine for each operation it visits. Delivered on the
 * thread running the pass.
 */
struct ExecutionEvent {
    std::string operationId;
    ExecutionStatus status = ExecutionStatus::Started;
    double durationMs = 0.0;                 // Completed / Failed only
    std::optional<OperationError> error;     // Failed only

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["operation_id"] = operationId;

        switch (status) {
            case ExecutionStatus::Started:
                j["status"] = "started";
                break;
            case ExecutionStatus::Completed:
                j["status"] = "completed";
                j["duration_ms"] = durationMs;
                break;
            case ExecutionStatus::Failed:
                j["status"] = "failed";
                j["duration_ms"] = durationMs;
                if (error) {
                    j["error"] = error->toJson();
                }
                break;
            case ExecutionStatus::Skipped:
                j["status"] = "skipped";
                break;
        }

        return j;
    }
};

using ExecutionCallback = std::function<void(const ExecutionEvent&)>;

/**
 * Change notifications a dataset session publishes to its listener,
 * always from the control thread.
 */
enum class SessionEventType {
    FrameChanged,
    OperationChanged,
    OperationRemoved,
    ModeChanged
};

struct SessionEvent {
    SessionEventType type = SessionEventType::FrameChanged;
    std::string datasetId;
    std::string operationId;     // operation events only
    std::string detail;          // new state or new mode

    // OperationChanged
    std::string label;
    std::optional<OperationError> error;

    // FrameChanged: the published snapshot
    dataframe::DataFramePtr frame;
    dataframe::Schema schema;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["dataset_id"] = datasetId;
        switch (type) {
            case SessionEventType::FrameChanged:
                j["event"] = "frame_changed";
                j["rows"] = frame ? frame->rowCount() : 0;
                j["schema"] = schema.toJson();
                break;
            case SessionEventType::OperationChanged:
                j["event"] = "operation_changed";
                j["operation_id"] = operationId;
                j["label"] = label;
                j["state"] = detail;
                if (error) {
                    j["error"] = error->toJson();
                }
                break;
            case SessionEventType::OperationRemoved:
                j["event"] = "operation_removed";
                j["operation_id"] = operationId;
                break;
            case SessionEventType::ModeChanged:
                j["event"] = "mode_changed";
                j["mode"] = detail;
                break;
        }
        return j;
    }
};

using SessionCallback = std::function<void(const SessionEvent&)>;

} // namespace ops
