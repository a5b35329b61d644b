#include "DataFrameAggregator.hpp"
#include "DataFrame.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>

namespace dataframe {

namespace {

// Valeurs numériques non nulles d'un sous-ensemble de lignes
std::vector<double> numericValues(const IColumnPtr& column, const std::vector<size_t>& rows) {
    std::vector<double> values;
    values.reserve(rows.size());
    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(column)) {
        for (size_t idx : rows) values.push_back(static_cast<double>(intCol->at(idx)));
    } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(column)) {
        for (size_t idx : rows) {
            if (!doubleCol->isNull(idx)) values.push_back(doubleCol->at(idx));
        }
    }
    return values;
}

void copyFirstValue(const IColumnPtr& source, const IColumnPtr& target, size_t row) {
    if (auto intSrc = std::dynamic_pointer_cast<IntColumn>(source)) {
        std::static_pointer_cast<IntColumn>(target)->push_back(intSrc->at(row));
    } else if (auto doubleSrc = std::dynamic_pointer_cast<DoubleColumn>(source)) {
        std::static_pointer_cast<DoubleColumn>(target)->push_back(doubleSrc->at(row));
    } else if (auto stringSrc = std::dynamic_pointer_cast<StringColumn>(source)) {
        std::static_pointer_cast<StringColumn>(target)->push_back(stringSrc->getId(row));
    }
}

} // anonymous namespace

AggFunction aggFunctionFromString(const std::string& name) {
    if (name == "sum") return AggFunction::Sum;
    if (name == "mean") return AggFunction::Mean;
    if (name == "count") return AggFunction::Count;
    if (name == "min") return AggFunction::Min;
    if (name == "max") return AggFunction::Max;
    if (name == "median") return AggFunction::Median;
    if (name == "std") return AggFunction::Std;
    if (name == "first") return AggFunction::First;
    if (name == "last") return AggFunction::Last;
    if (name == "len") return AggFunction::Len;
    throw EngineError(ErrorKind::InvalidOperator, "Unknown aggregation function: " + name);
}

std::string aggFunctionToString(AggFunction fn) {
    switch (fn) {
        case AggFunction::Sum:    return "sum";
        case AggFunction::Mean:   return "mean";
        case AggFunction::Count:  return "count";
        case AggFunction::Min:    return "min";
        case AggFunction::Max:    return "max";
        case AggFunction::Median: return "median";
        case AggFunction::Std:    return "std";
        case AggFunction::First:  return "first";
        case AggFunction::Last:   return "last";
        case AggFunction::Len:    return "len";
    }
    return "sum";
}

void DataFrameAggregator::checkNumeric(AggFunction fn, const IColumnPtr& column) {
    if (fn == AggFunction::Count || fn == AggFunction::Len) return;
    if (column->getType() == ColumnTypeOpt::STRING) {
        throw EngineError(ErrorKind::TypeMismatch,
                          "Cannot compute " + aggFunctionToString(fn) +
                          " on text column '" + column->getName() + "'");
    }
}

double DataFrameAggregator::reduce(AggFunction fn, const IColumnPtr& column, const std::vector<size_t>& rows) {
    const double nan = DoubleColumn::null();

    if (fn == AggFunction::Len) {
        return static_cast<double>(rows.size());
    }
    if (fn == AggFunction::Count) {
        size_t count = 0;
        for (size_t idx : rows) {
            if (!column->isNull(idx)) ++count;
        }
        return static_cast<double>(count);
    }

    if (fn == AggFunction::First || fn == AggFunction::Last) {
        if (rows.empty()) return nan;
        size_t idx = fn == AggFunction::First ? rows.front() : rows.back();
        if (auto intCol = std::dynamic_pointer_cast<IntColumn>(column)) {
            return static_cast<double>(intCol->at(idx));
        }
        return std::static_pointer_cast<DoubleColumn>(column)->at(idx);
    }

    auto values = numericValues(column, rows);
    switch (fn) {
        case AggFunction::Sum:
            return std::accumulate(values.begin(), values.end(), 0.0);
        case AggFunction::Mean:
            if (values.empty()) return nan;
            return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
        case AggFunction::Min:
            if (values.empty()) return nan;
            return *std::min_element(values.begin(), values.end());
        case AggFunction::Max:
            if (values.empty()) return nan;
            return *std::max_element(values.begin(), values.end());
        case AggFunction::Median: {
            if (values.empty()) return nan;
            std::sort(values.begin(), values.end());
            size_t mid = values.size() / 2;
            if (values.size() % 2 == 1) return values[mid];
            return (values[mid - 1] + values[mid]) / 2.0;
        }
        case AggFunction::Std: {
            // Écart-type échantillon (ddof = 1)
            if (values.size() < 2) return nan;
            double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
            double sq = 0.0;
            for (double v : values) sq += (v - mean) * (v - mean);
            return std::sqrt(sq / (values.size() - 1));
        }
        default:
            break;
    }
    return nan;
}

DataFrameAggregator::Groups DataFrameAggregator::buildGroups(
    const std::vector<std::string>& groupByColumns,
    const std::vector<size_t>& rowIndices,
    const ColumnGetter& getColumn
) {
    using ExtractorFn = std::function<uint64_t(size_t)>;
    std::vector<ExtractorFn> extractors;
    extractors.reserve(groupByColumns.size());

    for (const auto& colName : groupByColumns) {
        auto col = getColumn(colName);

        if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
            extractors.push_back([intCol](size_t i) -> uint64_t {
                return static_cast<uint64_t>(intCol->at(i));
            });
        } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
            extractors.push_back([doubleCol](size_t i) -> uint64_t {
                double val = doubleCol->at(i);
                if (std::isnan(val)) val = DoubleColumn::null();
                uint64_t bits;
                std::memcpy(&bits, &val, sizeof(double));
                return bits;
            });
        } else if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
            extractors.push_back([stringCol](size_t i) -> uint64_t {
                return static_cast<uint64_t>(stringCol->getId(i));
            });
        }
    }

    Groups groups;
    std::unordered_map<GroupKey, size_t, GroupKeyHash> positions;

    for (size_t i : rowIndices) {
        GroupKey groupKey;
        groupKey.values.reserve(extractors.size());
        for (const auto& extract : extractors) {
            groupKey.values.push_back(extract(i));
        }

        auto [it, inserted] = positions.emplace(std::move(groupKey), groups.rows.size());
        if (inserted) {
            groups.rows.emplace_back();
        }
        groups.rows[it->second].push_back(i);
    }

    return groups;
}

DataFrameAggregator::DataFramePtr DataFrameAggregator::aggregate(
    const AggregateSpec& spec,
    size_t rowCount,
    const ColumnGetter& getColumn,
    std::shared_ptr<StringPool> stringPool
) {
    auto sourceCol = getColumn(spec.column);
    for (auto fn : spec.functions) {
        checkNumeric(fn, sourceCol);
    }

    std::vector<size_t> allRows(rowCount);
    std::iota(allRows.begin(), allRows.end(), 0);

    // Agrégation globale : un seul groupe, même si la frame est vide
    Groups groups;
    if (spec.groupBy.empty()) {
        groups.rows.push_back(allRows);
    } else {
        groups = buildGroups(spec.groupBy, allRows, getColumn);
    }

    auto result = std::make_shared<DataFrame>();
    result->setStringPool(stringPool);

    // Colonnes de groupement (même type que l'original)
    for (const auto& colName : spec.groupBy) {
        auto source = getColumn(colName);
        auto target = source->emptyLike();
        for (const auto& rows : groups.rows) {
            copyFirstValue(source, target, rows.front());
        }
        result->addColumn(target);
    }

    // Colonnes d'agrégation
    for (auto fn : spec.functions) {
        const std::string alias = spec.column + "_" + aggFunctionToString(fn);
        if (fn == AggFunction::Count || fn == AggFunction::Len) {
            auto col = std::make_shared<IntColumn>(alias);
            for (const auto& rows : groups.rows) {
                col->push_back(static_cast<int64_t>(reduce(fn, sourceCol, rows)));
            }
            result->addColumn(col);
        } else {
            auto col = std::make_shared<DoubleColumn>(alias);
            for (const auto& rows : groups.rows) {
                col->push_back(reduce(fn, sourceCol, rows));
            }
            result->addColumn(col);
        }
    }

    return result;
}

DataFrameAggregator::DataFramePtr DataFrameAggregator::pivot(
    const PivotSpec& spec,
    size_t rowCount,
    const ColumnGetter& getColumn,
    std::shared_ptr<StringPool> stringPool
) {
    std::vector<IColumnPtr> pivotCols;
    for (const auto& name : spec.columns) {
        pivotCols.push_back(getColumn(name));
    }
    std::vector<IColumnPtr> valueCols;
    for (const auto& value : spec.values) {
        auto col = getColumn(value.column);
        for (auto fn : value.functions) {
            checkNumeric(fn, col);
        }
        valueCols.push_back(col);
    }

    // 1. Ignorer les lignes dont une clé pivot est nulle
    std::vector<size_t> kept;
    kept.reserve(rowCount);
    for (size_t i = 0; i < rowCount; ++i) {
        bool hasNull = std::any_of(pivotCols.begin(), pivotCols.end(),
                                   [i](const IColumnPtr& c) { return c->isNull(i); });
        if (!hasNull) kept.push_back(i);
    }

    // 2. Valeurs pivot distinctes (ordre d'apparition) et libellés associés
    auto pivotGroups = buildGroups(spec.columns, kept, getColumn);
    std::vector<std::string> pivotLabels;
    std::vector<size_t> pivotOfRow(rowCount, NULL_INDEX);
    for (size_t p = 0; p < pivotGroups.rows.size(); ++p) {
        size_t first = pivotGroups.rows[p].front();
        std::string label;
        for (size_t c = 0; c < pivotCols.size(); ++c) {
            if (c > 0) label += "_";
            label += pivotCols[c]->toDisplayString(first);
        }
        pivotLabels.push_back(label);
        for (size_t row : pivotGroups.rows[p]) {
            pivotOfRow[row] = p;
        }
    }

    // 3. Grouper par index
    auto indexGroups = spec.index.empty()
        ? Groups{{kept}}
        : buildGroups(spec.index, kept, getColumn);

    auto result = std::make_shared<DataFrame>();
    result->setStringPool(stringPool);

    for (const auto& colName : spec.index) {
        auto source = getColumn(colName);
        auto target = source->emptyLike();
        for (const auto& rows : indexGroups.rows) {
            copyFirstValue(source, target, rows.front());
        }
        result->addColumn(target);
    }

    // 4. Une colonne DOUBLE par (valeur, fonction, valeur pivot)
    for (size_t v = 0; v < spec.values.size(); ++v) {
        const auto& value = spec.values[v];
        const bool multiFn = value.functions.size() > 1;

        for (auto fn : value.functions) {
            for (size_t p = 0; p < pivotLabels.size(); ++p) {
                std::string name = value.column;
                if (multiFn) name += "_" + aggFunctionToString(fn);
                name += "_" + pivotLabels[p];

                auto col = std::make_shared<DoubleColumn>(name);
                col->reserve(indexGroups.rows.size());
                for (const auto& rows : indexGroups.rows) {
                    std::vector<size_t> cell;
                    for (size_t row : rows) {
                        if (pivotOfRow[row] == p) cell.push_back(row);
                    }
                    col->push_back(cell.empty() ? DoubleColumn::null() : reduce(fn, valueCols[v], cell));
                }
                result->setColumn(col);
            }
        }
    }

    return result;
}

} // namespace dataframe
