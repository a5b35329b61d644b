#pragma once

#include "ops/OperationParams.hpp"
#include "ops/OperationErrors.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/Schema.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace ops {

enum class OperationState {
    Queued,     // recorded, not yet applied to the materialized frame
    Executed,   // effect is part of the materialized frame
    Failed,     // last attempt raised an OperationError
    Undone      // parked in the redo buffer
};

std::string operationStateToString(OperationState state);

/**
 * Frames an operation may read besides its input (join right sides),
 * keyed by dataset id. Resolved on the control thread before a pass starts.
 */
struct ApplyContext {
    std::unordered_map<std::string, dataframe::DataFramePtr> datasets;
};

struct ApplyResult {
    dataframe::DataFramePtr frame;
    std::optional<OperationError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * One user-issued transformation.
 *
 * Parameters and identity never change after creation; editing an
 * operation produces a new Operation carrying the same id. The mutable
 * part (state, error, sequence number) is owned by the history and only
 * touched from the control thread.
 */
class Operation {
    // Restricts construction to create() / createWithId()
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    Operation(PrivateTag, std::string id, OperationParams params);

    /**
     * Validate params and build a Queued operation with a fresh id.
     * When a schema is given, operators are checked against the category
     * of their target column; columns absent from it are not rejected.
     * Throws ValidationError.
     */
    static std::shared_ptr<Operation> create(OperationParams params,
                                             const dataframe::Schema* schema = nullptr);

    /// Same as create() but reuses an existing id (edit, restore)
    static std::shared_ptr<Operation> createWithId(std::string id,
                                                   OperationParams params,
                                                   const dataframe::Schema* schema = nullptr);

    /// Throws ValidationError
    static void validate(const OperationParams& params, const dataframe::Schema* schema);

    /// {"id", "kind", "params"}; throws ValidationError
    static std::shared_ptr<Operation> fromJson(const nlohmann::json& j,
                                               const dataframe::Schema* schema = nullptr);

    const std::string& id() const { return m_id; }
    OperationKind kind() const { return kindOf(m_params); }
    const OperationParams& params() const { return m_params; }
    const std::string& displayLabel() const { return m_label; }

    OperationState state() const { return m_state; }
    void setState(OperationState state);
    const std::optional<OperationError>& error() const { return m_error; }
    void markFailed(OperationError error);

    uint64_t createdAtSeq() const { return m_createdAtSeq; }
    void setCreatedAtSeq(uint64_t seq) { m_createdAtSeq = seq; }

    /**
     * Apply the transform to frame. Never throws: engine failures are
     * returned as an OperationError and frame is left untouched.
     * Safe to call from a worker thread.
     */
    ApplyResult apply(const dataframe::DataFramePtr& frame, const ApplyContext& context) const;

    /// Full description for API responses (state, label, error)
    nlohmann::json toJson() const;
    /// Minimal {"id", "kind", "params"} used by saved analyses and workflows
    nlohmann::json toPersistJson() const;

    static std::string generateId();

private:
    dataframe::DataFramePtr transform(const dataframe::DataFramePtr& frame,
                                      const ApplyContext& context) const;

    std::string m_id;
    OperationParams m_params;
    std::string m_label;
    OperationState m_state = OperationState::Queued;
    std::optional<OperationError> m_error;
    uint64_t m_createdAtSeq = 0;
};

using OperationPtr = std::shared_ptr<Operation>;

} // namespace ops
