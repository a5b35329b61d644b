#pragma once

#include "Column.hpp"
#include "StringPool.hpp"
#include <vector>
#include <string>
#include <memory>
#include <functional>
#include <unordered_map>

namespace dataframe {

class DataFrame;

enum class AggFunction {
    Sum,
    Mean,
    Count,
    Min,
    Max,
    Median,
    Std,
    First,
    Last,
    Len
};

/// "sum", "mean", ... ; lève EngineError(InvalidOperator) si inconnu
AggFunction aggFunctionFromString(const std::string& name);
std::string aggFunctionToString(AggFunction fn);

/**
 * Agrégation d'une colonne, groupée ou globale (groupBy vide)
 * Colonnes résultat : groupBy..., puis "<column>_<fonction>" pour chaque fonction
 */
struct AggregateSpec {
    std::vector<std::string> groupBy;
    std::string column;
    std::vector<AggFunction> functions;
};

struct PivotValue {
    std::string column;
    std::vector<AggFunction> functions;
};

/**
 * Pivot : une ligne par combinaison d'index, une colonne par valeur distincte
 * des colonnes pivot (et par fonction si plusieurs).
 */
struct PivotSpec {
    std::vector<std::string> index;
    std::vector<std::string> columns;
    std::vector<PivotValue> values;
};

/**
 * Responsabilité unique : agrégation et pivot des DataFrames
 *
 * L'ordre des groupes est celui de leur première apparition, ce qui rend
 * le résultat reproductible d'un rejeu à l'autre.
 */
class DataFrameAggregator {
public:
    using ColumnGetter = std::function<IColumnPtr(const std::string&)>;
    using DataFramePtr = std::shared_ptr<DataFrame>;

    static DataFramePtr aggregate(
        const AggregateSpec& spec,
        size_t rowCount,
        const ColumnGetter& getColumn,
        std::shared_ptr<StringPool> stringPool
    );

    static DataFramePtr pivot(
        const PivotSpec& spec,
        size_t rowCount,
        const ColumnGetter& getColumn,
        std::shared_ptr<StringPool> stringPool
    );

    /**
     * Applique une fonction d'agrégation sur un sous-ensemble de lignes
     * (NaN si le résultat est indéfini, ex: moyenne d'un groupe vide)
     */
    static double reduce(AggFunction fn, const IColumnPtr& column, const std::vector<size_t>& rows);

private:
    struct GroupKey {
        std::vector<uint64_t> values;

        bool operator==(const GroupKey& other) const {
            return values == other.values;
        }
    };

    struct GroupKeyHash {
        size_t operator()(const GroupKey& key) const {
            size_t hash = 0;
            for (auto v : key.values) {
                hash ^= std::hash<uint64_t>{}(v) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
            }
            return hash;
        }
    };

    // Groupes dans l'ordre de première apparition
    struct Groups {
        std::vector<std::vector<size_t>> rows;
    };

    static Groups buildGroups(
        const std::vector<std::string>& groupByColumns,
        const std::vector<size_t>& rowIndices,
        const ColumnGetter& getColumn
    );

    static void checkNumeric(AggFunction fn, const IColumnPtr& column);
};

} // namespace dataframe
