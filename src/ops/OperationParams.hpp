#pragma once

#include "dataframe/DataFrame.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace ops {

using json = nlohmann::json;

enum class OperationKind {
    Filter,
    Search,
    Aggregate,
    Pivot,
    Join,
    Sort,
    ColumnEdit
};

std::string operationKindToString(OperationKind kind);
/// Throws ValidationError for an unknown kind
OperationKind operationKindFromString(const std::string& name);

// === Kind-specific parameters ===

/// Conditions are combined with AND
struct FilterParams {
    std::vector<dataframe::FilterCondition> conditions;
};

/// Case-insensitive text search across every text column
struct SearchParams {
    std::string query;
};

struct AggregateParams {
    dataframe::AggregateSpec spec;
};

struct PivotParams {
    dataframe::PivotSpec spec;
};

/// The right side is the loaded frame of another dataset of the workspace
struct JoinParams {
    std::string rightDatasetId;
    dataframe::JoinSpec spec;
};

struct SortParams {
    std::vector<dataframe::SortKey> keys;
};

enum class ColumnEditAction {
    Select,
    Drop,
    Rename
};

std::string columnEditActionToString(ColumnEditAction action);

struct ColumnEditParams {
    ColumnEditAction action = ColumnEditAction::Select;
    std::vector<std::string> columns;             // select / drop
    std::map<std::string, std::string> renames;   // rename: old -> new
};

/**
 * Tagged variant over every kind of transformation. This is the only
 * source of truth for an operation: transform, display label and exported
 * code are all derived from it.
 */
using OperationParams = std::variant<
    FilterParams,
    SearchParams,
    AggregateParams,
    PivotParams,
    JoinParams,
    SortParams,
    ColumnEditParams
>;

OperationKind kindOf(const OperationParams& params);

/**
 * JSON payloads (kind given separately):
 *   filter:      {"conditions": [{"column", "operator", "value"}]} or a single condition
 *   search:      {"query"}
 *   aggregate:   {"group_by": [...], "agg_col", "agg_func": [...]}
 *   pivot:       {"index": [...], "columns": [...], "values": [{"column", "agg_functions": [...]}]}
 *   join:        {"right_dataset_id", "left_key", "right_key", "how", "right_suffix"}
 *   sort:        {"keys": [{"column", "descending"}]}
 *   column_edit: {"action": "select"|"drop"|"rename", "columns": [...], "renames": {old: new}}
 */
json paramsToJson(const OperationParams& params);

/// Throws ValidationError when the payload is malformed
OperationParams paramsFromJson(OperationKind kind, const json& payload);

std::string displayLabel(const OperationParams& params);

} // namespace ops
