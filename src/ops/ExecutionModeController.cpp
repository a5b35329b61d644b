#include "ops/ExecutionModeController.hpp"
#include "ops/OperationErrors.hpp"

namespace ops {

std::string executionModeToString(ExecutionMode mode) {
    return mode == ExecutionMode::Eager ? "eager" : "lazy";
}

ExecutionMode executionModeFromString(const std::string& name) {
    if (name == "lazy") return ExecutionMode::Lazy;
    if (name == "eager") return ExecutionMode::Eager;
    throw ValidationError("Unknown execution mode: " + name);
}

ExecutionDecision ExecutionModeController::decide(ExecutionMode mode, const Operation& /*operation*/) {
    return mode == ExecutionMode::Eager ? ExecutionDecision::RunNow : ExecutionDecision::Defer;
}

bool ExecutionModeController::setMode(ExecutionMode mode) {
    if (mode == m_mode) return false;
    m_mode = mode;
    return true;
}

} // namespace ops
