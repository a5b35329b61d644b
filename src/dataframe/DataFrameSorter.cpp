#include "DataFrameSorter.hpp"
#include <algorithm>
#include <numeric>

namespace dataframe {

std::vector<size_t> DataFrameSorter::getSortedIndices(
    const std::vector<SortKey>& keys,
    size_t rowCount,
    const ColumnGetter& getColumn
) {
    std::vector<size_t> indices(rowCount);
    std::iota(indices.begin(), indices.end(), 0);

    if (keys.empty()) {
        return indices;
    }

    // Comparateurs inline sans branches
    auto cmp = [](const auto& a, const auto& b) -> int {
        return (a > b) - (a < b);
    };

    using CompareFn = std::function<int(size_t, size_t)>;
    std::vector<CompareFn> comparators;
    comparators.reserve(keys.size());

    for (const auto& key : keys) {
        auto col = getColumn(key.column);
        const int direction = key.descending ? -1 : 1;

        // Les nulls sont placés après toutes les valeurs, indépendamment du sens
        auto nullOrder = [col](size_t a, size_t b) -> int {
            bool nullA = col->isNull(a);
            bool nullB = col->isNull(b);
            return static_cast<int>(nullA) - static_cast<int>(nullB);
        };

        if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
            comparators.push_back([intCol, direction, cmp](size_t a, size_t b) -> int {
                return direction * cmp(intCol->at(a), intCol->at(b));
            });
        } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
            comparators.push_back([doubleCol, direction, cmp, nullOrder](size_t a, size_t b) -> int {
                if (int n = nullOrder(a, b); n != 0 || doubleCol->isNull(a)) return n;
                return direction * cmp(doubleCol->at(a), doubleCol->at(b));
            });
        } else if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
            // Comparaison alphabétique via le StringPool
            comparators.push_back([stringCol, direction, cmp, nullOrder](size_t a, size_t b) -> int {
                if (int n = nullOrder(a, b); n != 0 || stringCol->isNull(a)) return n;
                return direction * cmp(stringCol->at(a), stringCol->at(b));
            });
        }
    }

    std::stable_sort(indices.begin(), indices.end(), [&comparators](size_t a, size_t b) -> bool {
        for (const auto& compare : comparators) {
            int result = compare(a, b);
            if (result != 0) {
                return result < 0;
            }
        }
        return false;
    });

    return indices;
}

} // namespace dataframe
