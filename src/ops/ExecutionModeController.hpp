#pragma once

#include "ops/Operation.hpp"
#include <string>

namespace ops {

enum class ExecutionMode {
    Lazy,   // operations queue until an explicit execute
    Eager   // every new operation is materialized immediately
};

enum class ExecutionDecision {
    RunNow,
    Defer
};

std::string executionModeToString(ExecutionMode mode);
/// "lazy" / "eager"; throws ValidationError otherwise
ExecutionMode executionModeFromString(const std::string& name);

/**
 * Decides whether a newly submitted operation runs now or waits.
 * Changing the mode never touches existing entries.
 */
class ExecutionModeController {
public:
    explicit ExecutionModeController(ExecutionMode mode = ExecutionMode::Lazy) : m_mode(mode) {}

    static ExecutionDecision decide(ExecutionMode mode, const Operation& operation);
    ExecutionDecision decide(const Operation& operation) const { return decide(m_mode, operation); }

    /// Explicit execute requests always run
    static ExecutionDecision decideExplicit() { return ExecutionDecision::RunNow; }

    ExecutionMode mode() const { return m_mode; }
    /// Returns true if the mode changed
    bool setMode(ExecutionMode mode);

private:
    ExecutionMode m_mode;
};

} // namespace ops
