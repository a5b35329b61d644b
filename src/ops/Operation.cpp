#include "ops/Operation.hpp"
#include "server/Profiler.hpp"
#include <iomanip>
#include <mutex>
#include <random>
#include <set>
#include <sstream>

namespace ops {

using dataframe::AggFunction;
using dataframe::TypeCategory;

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<TypeCategory> categoryOf(const dataframe::Schema* schema, const std::string& column) {
    if (!schema) return std::nullopt;
    return schema->categoryOf(column);
}

void requireColumnName(const std::string& column, const std::string& what) {
    if (column.empty()) {
        throw ValidationError(what + " column name cannot be empty");
    }
}

void requireFunctions(const std::vector<AggFunction>& functions, const std::string& column) {
    if (functions.empty()) {
        throw ValidationError("No aggregation function given for column '" + column + "'");
    }
    std::set<AggFunction> seen;
    for (auto fn : functions) {
        if (!seen.insert(fn).second) {
            throw ValidationError("Aggregation function '" + dataframe::aggFunctionToString(fn)
                                  + "' listed twice for column '" + column + "'");
        }
    }
}

bool countsOnly(AggFunction fn) {
    return fn == AggFunction::Count || fn == AggFunction::Len;
}

void validateFilter(const FilterParams& p, const dataframe::Schema* schema) {
    if (p.conditions.empty()) {
        throw ValidationError("Filter requires at least one condition");
    }
    for (const auto& condition : p.conditions) {
        requireColumnName(condition.column, "Filter");
        auto category = categoryOf(schema, condition.column);
        if (!category) continue;

        const std::string opName = dataframe::filterOperatorToString(condition.op);
        if (dataframe::isTextOperator(condition.op) && *category == TypeCategory::Numeric) {
            throw ValidationError("Operator '" + opName + "' is not valid for numeric column '"
                                  + condition.column + "'");
        }
        if (dataframe::isBooleanOperator(condition.op)
            && (*category == TypeCategory::Text || *category == TypeCategory::Date)) {
            throw ValidationError("Operator '" + opName + "' is not valid for "
                                  + dataframe::typeCategoryToString(*category)
                                  + " column '" + condition.column + "'");
        }
    }
}

void validateAggregate(const AggregateParams& p, const dataframe::Schema* schema) {
    requireColumnName(p.spec.column, "Aggregation");
    for (const auto& group : p.spec.groupBy) {
        requireColumnName(group, "Group by");
    }
    requireFunctions(p.spec.functions, p.spec.column);

    for (auto fn : p.spec.functions) {
        if (fn == AggFunction::First || fn == AggFunction::Last || fn == AggFunction::Len) {
            throw ValidationError("Aggregation function '" + dataframe::aggFunctionToString(fn)
                                  + "' is only available in pivots");
        }
    }

    auto category = categoryOf(schema, p.spec.column);
    if (category && *category != TypeCategory::Numeric && *category != TypeCategory::Unknown) {
        for (auto fn : p.spec.functions) {
            if (!countsOnly(fn)) {
                throw ValidationError("Cannot compute " + dataframe::aggFunctionToString(fn)
                                      + " of " + dataframe::typeCategoryToString(*category)
                                      + " column '" + p.spec.column + "'");
            }
        }
    }
}

void validatePivot(const PivotParams& p, const dataframe::Schema* schema) {
    if (p.spec.index.empty()) {
        throw ValidationError("Pivot requires at least one index column");
    }
    if (p.spec.columns.empty()) {
        throw ValidationError("Pivot requires at least one pivot column");
    }
    if (p.spec.values.empty()) {
        throw ValidationError("Pivot requires at least one value column");
    }
    for (const auto& name : p.spec.index) requireColumnName(name, "Pivot index");
    for (const auto& name : p.spec.columns) requireColumnName(name, "Pivot");

    for (const auto& value : p.spec.values) {
        requireColumnName(value.column, "Pivot value");
        requireFunctions(value.functions, value.column);

        auto category = categoryOf(schema, value.column);
        if (category && *category != TypeCategory::Numeric && *category != TypeCategory::Unknown) {
            for (auto fn : value.functions) {
                if (!countsOnly(fn)) {
                    throw ValidationError("Cannot compute " + dataframe::aggFunctionToString(fn)
                                          + " of " + dataframe::typeCategoryToString(*category)
                                          + " column '" + value.column + "'");
                }
            }
        }
    }
}

void validateJoin(const JoinParams& p) {
    if (p.rightDatasetId.empty()) {
        throw ValidationError("Join requires a right dataset");
    }
    if (p.spec.rightSuffix.empty()) {
        throw ValidationError("Join suffix cannot be empty");
    }
    if (p.spec.how != dataframe::JoinHow::Cross) {
        requireColumnName(p.spec.leftKey, "Left key");
        requireColumnName(p.spec.rightKey, "Right key");
    }
}

void validateSort(const SortParams& p) {
    if (p.keys.empty()) {
        throw ValidationError("Sort requires at least one key");
    }
    for (const auto& key : p.keys) {
        requireColumnName(key.column, "Sort");
    }
}

void validateColumnEdit(const ColumnEditParams& p) {
    if (p.action == ColumnEditAction::Rename) {
        if (p.renames.empty()) {
            throw ValidationError("Rename requires at least one column");
        }
        std::set<std::string> targets;
        for (const auto& [from, to] : p.renames) {
            requireColumnName(from, "Renamed");
            requireColumnName(to, "Target");
            if (!targets.insert(to).second) {
                throw ValidationError("Two columns renamed to '" + to + "'");
            }
        }
        return;
    }

    if (p.columns.empty()) {
        throw ValidationError(columnEditActionToString(p.action) + " requires at least one column");
    }
    for (const auto& name : p.columns) {
        requireColumnName(name, columnEditActionToString(p.action));
    }
}

} // anonymous namespace

std::string operationStateToString(OperationState state) {
    switch (state) {
        case OperationState::Queued:   return "queued";
        case OperationState::Executed: return "executed";
        case OperationState::Failed:   return "failed";
        case OperationState::Undone:   return "undone";
    }
    return "queued";
}

// ============================================================================
// Construction
// ============================================================================

Operation::Operation(PrivateTag, std::string id, OperationParams params)
    : m_id(std::move(id))
    , m_params(std::move(params))
    , m_label(ops::displayLabel(m_params))
{}

std::string Operation::generateId() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    std::lock_guard<std::mutex> lock(mutex);
    std::stringstream ss;
    ss << "op_" << std::hex << std::setfill('0') << std::setw(16) << dis(gen);
    return ss.str();
}

std::shared_ptr<Operation> Operation::create(OperationParams params, const dataframe::Schema* schema) {
    return createWithId(generateId(), std::move(params), schema);
}

std::shared_ptr<Operation> Operation::createWithId(std::string id,
                                                   OperationParams params,
                                                   const dataframe::Schema* schema) {
    if (id.empty()) {
        throw ValidationError("Operation id cannot be empty");
    }
    validate(params, schema);
    return std::make_shared<Operation>(PrivateTag{}, std::move(id), std::move(params));
}

void Operation::validate(const OperationParams& params, const dataframe::Schema* schema) {
    std::visit(Overloaded{
        [&](const FilterParams& p)     { validateFilter(p, schema); },
        [](const SearchParams&)        {},
        [&](const AggregateParams& p)  { validateAggregate(p, schema); },
        [&](const PivotParams& p)      { validatePivot(p, schema); },
        [](const JoinParams& p)        { validateJoin(p); },
        [](const SortParams& p)        { validateSort(p); },
        [](const ColumnEditParams& p)  { validateColumnEdit(p); }
    }, params);
}

std::shared_ptr<Operation> Operation::fromJson(const nlohmann::json& j, const dataframe::Schema* schema) {
    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
        throw ValidationError("Operation must have a 'kind'");
    }
    auto kind = operationKindFromString(j["kind"].get<std::string>());
    auto params = paramsFromJson(kind, j.value("params", nlohmann::json::object()));

    if (j.contains("id") && j["id"].is_string()) {
        return createWithId(j["id"].get<std::string>(), std::move(params), schema);
    }
    return create(std::move(params), schema);
}

// ============================================================================
// State
// ============================================================================

void Operation::setState(OperationState state) {
    m_state = state;
    if (state != OperationState::Failed) {
        m_error.reset();
    }
}

void Operation::markFailed(OperationError error) {
    m_state = OperationState::Failed;
    m_error = std::move(error);
}

// ============================================================================
// Apply
// ============================================================================

ApplyResult Operation::apply(const dataframe::DataFramePtr& frame, const ApplyContext& context) const {
    PROFILE_SCOPE("op:" + operationKindToString(kind()));

    if (!frame) {
        return {frame, OperationError{dataframe::ErrorKind::EngineInternal, "No input frame"}};
    }

    try {
        return {transform(frame, context), std::nullopt};
    } catch (const dataframe::EngineError& e) {
        return {frame, OperationError{e.kind(), e.what()}};
    } catch (const std::exception& e) {
        return {frame, OperationError{dataframe::ErrorKind::EngineInternal, e.what()}};
    }
}

dataframe::DataFramePtr Operation::transform(const dataframe::DataFramePtr& frame,
                                             const ApplyContext& context) const {
    return std::visit(Overloaded{
        [&](const FilterParams& p) { return frame->filter(p.conditions); },
        [&](const SearchParams& p) { return frame->search(p.query); },
        [&](const AggregateParams& p) { return frame->aggregate(p.spec); },
        [&](const PivotParams& p) { return frame->pivot(p.spec); },
        [&](const JoinParams& p) {
            auto it = context.datasets.find(p.rightDatasetId);
            if (it == context.datasets.end() || !it->second) {
                throw dataframe::EngineError(dataframe::ErrorKind::EngineInternal,
                                             "Right dataset '" + p.rightDatasetId + "' is not available");
            }
            return frame->join(*it->second, p.spec);
        },
        [&](const SortParams& p) { return frame->orderBy(p.keys); },
        [&](const ColumnEditParams& p) {
            switch (p.action) {
                case ColumnEditAction::Select: return frame->select(p.columns);
                case ColumnEditAction::Drop:   return frame->drop(p.columns);
                case ColumnEditAction::Rename: return frame->rename(p.renames);
            }
            throw dataframe::EngineError(dataframe::ErrorKind::EngineInternal, "Unknown column edit");
        }
    }, m_params);
}

// ============================================================================
// Serialization
// ============================================================================

nlohmann::json Operation::toJson() const {
    nlohmann::json j = toPersistJson();
    j["label"] = m_label;
    j["state"] = operationStateToString(m_state);
    j["seq"] = m_createdAtSeq;
    j["error"] = m_error ? m_error->toJson() : nlohmann::json(nullptr);
    return j;
}

nlohmann::json Operation::toPersistJson() const {
    return nlohmann::json{
        {"id", m_id},
        {"kind", operationKindToString(kind())},
        {"params", paramsToJson(m_params)}
    };
}

} // namespace ops
