#include "ops/OperationParams.hpp"
#include "ops/OperationErrors.hpp"
#include <sstream>

namespace ops {

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string joinStrings(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << separator;
        oss << items[i];
    }
    return oss.str();
}

const json& requireField(const json& payload, const std::string& field) {
    if (!payload.is_object() || !payload.contains(field)) {
        throw ValidationError("Missing field '" + field + "'");
    }
    return payload.at(field);
}

std::string requireString(const json& payload, const std::string& field) {
    const auto& value = requireField(payload, field);
    if (!value.is_string()) {
        throw ValidationError("Field '" + field + "' must be a string");
    }
    return value.get<std::string>();
}

std::vector<std::string> stringList(const json& payload, const std::string& field, bool required) {
    if (!payload.is_object() || !payload.contains(field) || payload.at(field).is_null()) {
        if (required) throw ValidationError("Missing field '" + field + "'");
        return {};
    }
    const auto& value = payload.at(field);
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    if (!value.is_array()) {
        throw ValidationError("Field '" + field + "' must be a list of strings");
    }
    std::vector<std::string> result;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ValidationError("Field '" + field + "' must be a list of strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

// Numbers and booleans are kept in their textual form
std::string conditionValue(const json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_number()) return value.dump();
    throw ValidationError("Filter value must be a scalar");
}

std::vector<dataframe::AggFunction> aggFunctions(const std::vector<std::string>& names) {
    std::vector<dataframe::AggFunction> result;
    for (const auto& name : names) {
        try {
            result.push_back(dataframe::aggFunctionFromString(name));
        } catch (const dataframe::EngineError&) {
            throw ValidationError("Unknown aggregation function: " + name);
        }
    }
    return result;
}

std::vector<std::string> aggFunctionNames(const std::vector<dataframe::AggFunction>& functions) {
    std::vector<std::string> names;
    for (auto fn : functions) {
        names.push_back(dataframe::aggFunctionToString(fn));
    }
    return names;
}

dataframe::FilterCondition parseCondition(const json& item) {
    dataframe::FilterCondition condition;
    condition.column = requireString(item, "column");
    std::string op = requireString(item, "operator");
    try {
        condition.op = dataframe::filterOperatorFromString(op);
    } catch (const dataframe::EngineError&) {
        throw ValidationError("Unknown filter operator: " + op);
    }
    if (item.contains("value")) {
        condition.value = conditionValue(item.at("value"));
    }
    return condition;
}

FilterParams parseFilter(const json& payload) {
    FilterParams params;
    if (payload.is_object() && payload.contains("conditions")) {
        const auto& conditions = payload.at("conditions");
        if (!conditions.is_array()) {
            throw ValidationError("Field 'conditions' must be a list");
        }
        for (const auto& item : conditions) {
            params.conditions.push_back(parseCondition(item));
        }
    } else {
        params.conditions.push_back(parseCondition(payload));
    }
    return params;
}

AggregateParams parseAggregate(const json& payload) {
    AggregateParams params;
    params.spec.groupBy = stringList(payload, "group_by", false);
    params.spec.column = requireString(payload, "agg_col");
    params.spec.functions = aggFunctions(stringList(payload, "agg_func", true));
    return params;
}

PivotParams parsePivot(const json& payload) {
    PivotParams params;
    params.spec.index = stringList(payload, "index", true);
    params.spec.columns = stringList(payload, "columns", true);

    const auto& values = requireField(payload, "values");
    if (!values.is_array()) {
        throw ValidationError("Field 'values' must be a list");
    }
    for (const auto& item : values) {
        dataframe::PivotValue value;
        value.column = requireString(item, "column");
        value.functions = aggFunctions(stringList(item, "agg_functions", true));
        params.spec.values.push_back(std::move(value));
    }
    return params;
}

JoinParams parseJoin(const json& payload) {
    JoinParams params;
    params.rightDatasetId = requireString(payload, "right_dataset_id");

    std::string how = payload.is_object() && payload.contains("how")
        ? requireString(payload, "how") : "inner";
    try {
        params.spec.how = dataframe::joinHowFromString(how);
    } catch (const dataframe::EngineError&) {
        throw ValidationError("Unknown join type: " + how);
    }

    if (params.spec.how != dataframe::JoinHow::Cross) {
        params.spec.leftKey = requireString(payload, "left_key");
        params.spec.rightKey = requireString(payload, "right_key");
    }
    if (payload.contains("right_suffix")) {
        params.spec.rightSuffix = requireString(payload, "right_suffix");
    }
    return params;
}

SortParams parseSort(const json& payload) {
    SortParams params;
    const auto& keys = requireField(payload, "keys");
    if (!keys.is_array()) {
        throw ValidationError("Field 'keys' must be a list");
    }
    for (const auto& item : keys) {
        dataframe::SortKey key;
        key.column = requireString(item, "column");
        key.descending = item.value("descending", false);
        params.keys.push_back(std::move(key));
    }
    return params;
}

ColumnEditParams parseColumnEdit(const json& payload) {
    ColumnEditParams params;
    std::string action = requireString(payload, "action");
    if (action == "select") {
        params.action = ColumnEditAction::Select;
    } else if (action == "drop") {
        params.action = ColumnEditAction::Drop;
    } else if (action == "rename") {
        params.action = ColumnEditAction::Rename;
    } else {
        throw ValidationError("Unknown column edit action: " + action);
    }

    if (params.action == ColumnEditAction::Rename) {
        const auto& renames = requireField(payload, "renames");
        if (!renames.is_object()) {
            throw ValidationError("Field 'renames' must be an object");
        }
        for (auto it = renames.begin(); it != renames.end(); ++it) {
            if (!it.value().is_string()) {
                throw ValidationError("Rename target for '" + it.key() + "' must be a string");
            }
            params.renames[it.key()] = it.value().get<std::string>();
        }
    } else {
        params.columns = stringList(payload, "columns", true);
    }
    return params;
}

std::string conditionLabel(const dataframe::FilterCondition& condition) {
    std::string label = condition.column + " " + dataframe::filterOperatorToString(condition.op);
    if (!dataframe::isUnaryOperator(condition.op)) {
        label += " " + condition.value;
    }
    return label;
}

} // anonymous namespace

// ============================================================================
// Kinds
// ============================================================================

std::string operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Filter:     return "filter";
        case OperationKind::Search:     return "search";
        case OperationKind::Aggregate:  return "aggregate";
        case OperationKind::Pivot:      return "pivot";
        case OperationKind::Join:       return "join";
        case OperationKind::Sort:       return "sort";
        case OperationKind::ColumnEdit: return "column_edit";
    }
    return "filter";
}

OperationKind operationKindFromString(const std::string& name) {
    if (name == "filter") return OperationKind::Filter;
    if (name == "search") return OperationKind::Search;
    if (name == "aggregate") return OperationKind::Aggregate;
    if (name == "pivot") return OperationKind::Pivot;
    if (name == "join") return OperationKind::Join;
    if (name == "sort") return OperationKind::Sort;
    if (name == "column_edit") return OperationKind::ColumnEdit;
    throw ValidationError("Unknown operation kind: " + name);
}

std::string columnEditActionToString(ColumnEditAction action) {
    switch (action) {
        case ColumnEditAction::Select: return "select";
        case ColumnEditAction::Drop:   return "drop";
        case ColumnEditAction::Rename: return "rename";
    }
    return "select";
}

OperationKind kindOf(const OperationParams& params) {
    return std::visit(Overloaded{
        [](const FilterParams&)     { return OperationKind::Filter; },
        [](const SearchParams&)     { return OperationKind::Search; },
        [](const AggregateParams&)  { return OperationKind::Aggregate; },
        [](const PivotParams&)      { return OperationKind::Pivot; },
        [](const JoinParams&)       { return OperationKind::Join; },
        [](const SortParams&)       { return OperationKind::Sort; },
        [](const ColumnEditParams&) { return OperationKind::ColumnEdit; }
    }, params);
}

// ============================================================================
// JSON
// ============================================================================

json paramsToJson(const OperationParams& params) {
    return std::visit(Overloaded{
        [](const FilterParams& p) {
            json conditions = json::array();
            for (const auto& c : p.conditions) {
                conditions.push_back({
                    {"column", c.column},
                    {"operator", dataframe::filterOperatorToString(c.op)},
                    {"value", c.value}
                });
            }
            return json{{"conditions", conditions}};
        },
        [](const SearchParams& p) {
            return json{{"query", p.query}};
        },
        [](const AggregateParams& p) {
            return json{
                {"group_by", p.spec.groupBy},
                {"agg_col", p.spec.column},
                {"agg_func", aggFunctionNames(p.spec.functions)}
            };
        },
        [](const PivotParams& p) {
            json values = json::array();
            for (const auto& v : p.spec.values) {
                values.push_back({
                    {"column", v.column},
                    {"agg_functions", aggFunctionNames(v.functions)}
                });
            }
            return json{
                {"index", p.spec.index},
                {"columns", p.spec.columns},
                {"values", values}
            };
        },
        [](const JoinParams& p) {
            json j = {
                {"right_dataset_id", p.rightDatasetId},
                {"how", dataframe::joinHowToString(p.spec.how)},
                {"right_suffix", p.spec.rightSuffix}
            };
            if (p.spec.how != dataframe::JoinHow::Cross) {
                j["left_key"] = p.spec.leftKey;
                j["right_key"] = p.spec.rightKey;
            }
            return j;
        },
        [](const SortParams& p) {
            json keys = json::array();
            for (const auto& k : p.keys) {
                keys.push_back({{"column", k.column}, {"descending", k.descending}});
            }
            return json{{"keys", keys}};
        },
        [](const ColumnEditParams& p) {
            json j = {{"action", columnEditActionToString(p.action)}};
            if (p.action == ColumnEditAction::Rename) {
                j["renames"] = p.renames;
            } else {
                j["columns"] = p.columns;
            }
            return j;
        }
    }, params);
}

OperationParams paramsFromJson(OperationKind kind, const json& payload) {
    if (!payload.is_object()) {
        throw ValidationError("Operation parameters must be a JSON object");
    }
    switch (kind) {
        case OperationKind::Filter:     return parseFilter(payload);
        case OperationKind::Search:     return SearchParams{requireString(payload, "query")};
        case OperationKind::Aggregate:  return parseAggregate(payload);
        case OperationKind::Pivot:      return parsePivot(payload);
        case OperationKind::Join:       return parseJoin(payload);
        case OperationKind::Sort:       return parseSort(payload);
        case OperationKind::ColumnEdit: return parseColumnEdit(payload);
    }
    throw ValidationError("Unknown operation kind");
}

// ============================================================================
// Labels
// ============================================================================

std::string displayLabel(const OperationParams& params) {
    return std::visit(Overloaded{
        [](const FilterParams& p) {
            std::vector<std::string> parts;
            for (const auto& c : p.conditions) {
                parts.push_back(conditionLabel(c));
            }
            return "Filter: " + joinStrings(parts, " AND ");
        },
        [](const SearchParams& p) {
            return "Search: '" + p.query + "'";
        },
        [](const AggregateParams& p) {
            std::vector<std::string> parts;
            for (auto fn : p.spec.functions) {
                parts.push_back(dataframe::aggFunctionToString(fn) + "(" + p.spec.column + ")");
            }
            std::string label = "Aggregate: " + joinStrings(parts, ", ");
            if (!p.spec.groupBy.empty()) {
                label += " by " + joinStrings(p.spec.groupBy, ", ");
            }
            return label;
        },
        [](const PivotParams& p) {
            std::vector<std::string> parts;
            for (const auto& v : p.spec.values) {
                parts.push_back(v.column + "(" + joinStrings(aggFunctionNames(v.functions), ", ") + ")");
            }
            return "Pivot: " + joinStrings(parts, ", ")
                + " by " + joinStrings(p.spec.index, ", ")
                + " x " + joinStrings(p.spec.columns, ", ");
        },
        [](const JoinParams& p) {
            std::string label = "Join: " + dataframe::joinHowToString(p.spec.how) + " join";
            if (p.spec.how != dataframe::JoinHow::Cross) {
                label += " on " + p.spec.leftKey + " = " + p.spec.rightKey;
            }
            return label;
        },
        [](const SortParams& p) {
            std::vector<std::string> parts;
            for (const auto& k : p.keys) {
                parts.push_back(k.descending ? k.column + " desc" : k.column);
            }
            return "Sort: " + joinStrings(parts, ", ");
        },
        [](const ColumnEditParams& p) {
            switch (p.action) {
                case ColumnEditAction::Select:
                    return "Select: " + joinStrings(p.columns, ", ");
                case ColumnEditAction::Drop:
                    return "Drop: " + joinStrings(p.columns, ", ");
                case ColumnEditAction::Rename: {
                    std::vector<std::string> parts;
                    for (const auto& [from, to] : p.renames) {
                        parts.push_back(from + " → " + to);
                    }
                    return "Rename: " + joinStrings(parts, ", ");
                }
            }
            return std::string("Column edit");
        }
    }, params);
}

} // namespace ops
