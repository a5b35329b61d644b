#include "DataFrameFilter.hpp"
#include <algorithm>
#include <cstdlib>
#include <numeric>
#include <optional>

namespace dataframe {

namespace {

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

CompareOp toCompareOp(FilterOperator op) {
    switch (op) {
        case FilterOperator::Equal:          return CompareOp::Equal;
        case FilterOperator::NotEqual:       return CompareOp::NotEqual;
        case FilterOperator::Less:           return CompareOp::Less;
        case FilterOperator::LessOrEqual:    return CompareOp::LessOrEqual;
        case FilterOperator::Greater:        return CompareOp::Greater;
        case FilterOperator::GreaterOrEqual: return CompareOp::GreaterOrEqual;
        default: break;
    }
    throw EngineError(ErrorKind::InvalidOperator,
                      "Operator '" + filterOperatorToString(op) + "' is not a comparison");
}

TextMatch toTextMatch(FilterOperator op) {
    switch (op) {
        case FilterOperator::Contains:    return TextMatch::Contains;
        case FilterOperator::NotContains: return TextMatch::NotContains;
        case FilterOperator::StartsWith:  return TextMatch::StartsWith;
        case FilterOperator::EndsWith:    return TextMatch::EndsWith;
        default: break;
    }
    throw EngineError(ErrorKind::InvalidOperator,
                      "Operator '" + filterOperatorToString(op) + "' is not a text match");
}

std::vector<size_t> numericCompare(const IColumnPtr& col, const FilterCondition& condition) {
    auto target = parseNumber(condition.value);
    if (!target) {
        throw EngineError(ErrorKind::TypeMismatch,
                          "Cannot compare numeric column '" + condition.column +
                          "' with non-numeric value '" + condition.value + "'");
    }
    CompareOp op = toCompareOp(condition.op);
    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
        return intCol->filterCompare(op, *target);
    }
    return std::static_pointer_cast<DoubleColumn>(col)->filterCompare(op, *target);
}

std::vector<size_t> booleanMatch(const IColumnPtr& col, bool wanted) {
    std::vector<size_t> result;
    if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
        const std::string literal = wanted ? "true" : "false";
        for (size_t i = 0; i < stringCol->size(); ++i) {
            if (stringCol->foldedAt(i) == literal) {
                result.push_back(i);
            }
        }
        return result;
    }
    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
        return intCol->filterCompare(CompareOp::Equal, wanted ? 1.0 : 0.0);
    }
    return std::static_pointer_cast<DoubleColumn>(col)->filterCompare(CompareOp::Equal, wanted ? 1.0 : 0.0);
}

} // anonymous namespace

FilterOperator filterOperatorFromString(const std::string& op) {
    if (op == "==") return FilterOperator::Equal;
    if (op == "!=") return FilterOperator::NotEqual;
    if (op == "<") return FilterOperator::Less;
    if (op == "<=") return FilterOperator::LessOrEqual;
    if (op == ">") return FilterOperator::Greater;
    if (op == ">=") return FilterOperator::GreaterOrEqual;
    if (op == "contains") return FilterOperator::Contains;
    if (op == "not contains") return FilterOperator::NotContains;
    if (op == "starts with") return FilterOperator::StartsWith;
    if (op == "ends with") return FilterOperator::EndsWith;
    if (op == "is true") return FilterOperator::IsTrue;
    if (op == "is false") return FilterOperator::IsFalse;
    if (op == "is null") return FilterOperator::IsNull;
    if (op == "is not null") return FilterOperator::IsNotNull;
    throw EngineError(ErrorKind::InvalidOperator, "Unknown filter operator: " + op);
}

std::string filterOperatorToString(FilterOperator op) {
    switch (op) {
        case FilterOperator::Equal:          return "==";
        case FilterOperator::NotEqual:       return "!=";
        case FilterOperator::Less:           return "<";
        case FilterOperator::LessOrEqual:    return "<=";
        case FilterOperator::Greater:        return ">";
        case FilterOperator::GreaterOrEqual: return ">=";
        case FilterOperator::Contains:       return "contains";
        case FilterOperator::NotContains:    return "not contains";
        case FilterOperator::StartsWith:     return "starts with";
        case FilterOperator::EndsWith:       return "ends with";
        case FilterOperator::IsTrue:         return "is true";
        case FilterOperator::IsFalse:        return "is false";
        case FilterOperator::IsNull:         return "is null";
        case FilterOperator::IsNotNull:      return "is not null";
    }
    return "==";
}

bool isUnaryOperator(FilterOperator op) {
    return isBooleanOperator(op) || op == FilterOperator::IsNull || op == FilterOperator::IsNotNull;
}

bool isTextOperator(FilterOperator op) {
    return op == FilterOperator::Contains || op == FilterOperator::NotContains ||
           op == FilterOperator::StartsWith || op == FilterOperator::EndsWith;
}

bool isComparisonOperator(FilterOperator op) {
    return !isUnaryOperator(op) && !isTextOperator(op);
}

bool isBooleanOperator(FilterOperator op) {
    return op == FilterOperator::IsTrue || op == FilterOperator::IsFalse;
}

std::vector<size_t> DataFrameFilter::apply(
    const std::vector<FilterCondition>& conditions,
    size_t rowCount,
    const ColumnGetter& getColumn
) {
    // Initialiser avec tous les indices
    std::vector<size_t> result(rowCount);
    std::iota(result.begin(), result.end(), 0);

    // Appliquer chaque filtre successivement
    for (const auto& condition : conditions) {
        auto col = getColumn(condition.column);
        std::vector<size_t> matchingIndices = applyCondition(col, condition);

        std::vector<size_t> newResult;
        newResult.reserve(std::min(result.size(), matchingIndices.size()));

        std::set_intersection(
            result.begin(), result.end(),
            matchingIndices.begin(), matchingIndices.end(),
            std::back_inserter(newResult)
        );

        result = std::move(newResult);
    }

    return result;
}

std::vector<size_t> DataFrameFilter::applyCondition(
    const IColumnPtr& col,
    const FilterCondition& condition
) {
    const FilterOperator op = condition.op;

    if (op == FilterOperator::IsNull) return col->filterNull(true);
    if (op == FilterOperator::IsNotNull) return col->filterNull(false);
    if (op == FilterOperator::IsTrue) return booleanMatch(col, true);
    if (op == FilterOperator::IsFalse) return booleanMatch(col, false);

    if (col->getType() == ColumnTypeOpt::STRING) {
        auto stringCol = std::static_pointer_cast<StringColumn>(col);
        if (isTextOperator(op)) {
            return stringCol->filterText(toTextMatch(op), condition.value);
        }
        return stringCol->filterCompare(toCompareOp(op), condition.value);
    }

    if (isTextOperator(op)) {
        throw EngineError(ErrorKind::InvalidOperator,
                          "Operator '" + filterOperatorToString(op) +
                          "' cannot be applied to numeric column '" + condition.column + "'");
    }
    return numericCompare(col, condition);
}

std::vector<size_t> DataFrameFilter::search(
    const std::string& query,
    size_t rowCount,
    const std::vector<std::string>& columnOrder,
    const ColumnGetter& getColumn
) {
    std::vector<size_t> all(rowCount);
    std::iota(all.begin(), all.end(), 0);
    if (query.empty()) {
        return all;
    }

    auto numericQuery = parseNumber(query);
    std::vector<bool> matched(rowCount, false);

    for (const auto& name : columnOrder) {
        auto col = getColumn(name);
        std::vector<size_t> hits;
        if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
            hits = stringCol->filterText(TextMatch::Contains, query);
        } else if (numericQuery) {
            if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
                hits = intCol->filterCompare(CompareOp::Equal, *numericQuery);
            } else {
                hits = std::static_pointer_cast<DoubleColumn>(col)->filterCompare(CompareOp::Equal, *numericQuery);
            }
        }
        for (size_t idx : hits) {
            matched[idx] = true;
        }
    }

    std::vector<size_t> result;
    for (size_t i = 0; i < rowCount; ++i) {
        if (matched[i]) result.push_back(i);
    }
    return result;
}

} // namespace dataframe
