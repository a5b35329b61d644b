#pragma once

#include "Column.hpp"
#include <vector>
#include <string>
#include <memory>
#include <functional>

namespace dataframe {

struct SortKey {
    std::string column;
    bool descending = false;
};

/**
 * Responsabilité unique : tri des DataFrames
 */
class DataFrameSorter {
public:
    using ColumnGetter = std::function<IColumnPtr(const std::string&)>;

    /**
     * Tri stable multi-clés, nulls toujours en fin quel que soit le sens
     */
    static std::vector<size_t> getSortedIndices(
        const std::vector<SortKey>& keys,
        size_t rowCount,
        const ColumnGetter& getColumn
    );
};

} // namespace dataframe
