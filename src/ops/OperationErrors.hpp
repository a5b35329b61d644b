#pragma once

#include "dataframe/DataFrameError.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace ops {

/**
 * Malformed operation parameters. Raised before an operation enters any
 * history, so a history never holds an entry that cannot be validated.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * A mutating command was issued while a materialization pass is in flight.
 */
class SessionBusyError : public std::runtime_error {
public:
    explicit SessionBusyError(const std::string& sessionId)
        : std::runtime_error("Dataset session '" + sessionId + "' is busy materializing") {}
};

/**
 * Failure attached to an operation whose transform could not be applied.
 */
struct OperationError {
    dataframe::ErrorKind kind = dataframe::ErrorKind::EngineInternal;
    std::string message;

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"kind", dataframe::errorKindToString(kind)},
            {"message", message}
        };
    }
};

enum class HistoryError {
    NothingToUndo,
    NothingToRedo
};

inline std::string historyErrorToString(HistoryError error) {
    switch (error) {
        case HistoryError::NothingToUndo: return "NothingToUndo";
        case HistoryError::NothingToRedo: return "NothingToRedo";
    }
    return "NothingToUndo";
}

} // namespace ops
