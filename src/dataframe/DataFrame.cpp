#include "DataFrame.hpp"
#include "DataFrameSerializer.hpp"
#include <algorithm>
#include <set>

namespace dataframe {

// ============================================================================
// Construction
// ============================================================================

void DataFrame::addColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }

    const auto& name = column->getName();
    if (m_columns.find(name) != m_columns.end()) {
        throw std::invalid_argument("Column '" + name + "' already exists");
    }

    m_columns[name] = column;
    m_columnOrder.push_back(name);
}

void DataFrame::setColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot set null column");
    }

    const auto& name = column->getName();
    auto it = m_columns.find(name);
    if (it != m_columns.end()) {
        it->second = column;
    } else {
        m_columns[name] = column;
        m_columnOrder.push_back(name);
    }
}

void DataFrame::addIntColumn(const std::string& name) {
    addColumn(std::make_shared<IntColumn>(name));
}

void DataFrame::addDoubleColumn(const std::string& name) {
    addColumn(std::make_shared<DoubleColumn>(name));
}

void DataFrame::addStringColumn(const std::string& name) {
    addColumn(std::make_shared<StringColumn>(name, m_string_pool));
}

void DataFrame::addRow(const std::vector<std::string>& values) {
    if (values.size() != m_columnOrder.size()) {
        throw std::invalid_argument("Row size mismatch");
    }

    for (size_t i = 0; i < values.size(); ++i) {
        auto col = m_columns[m_columnOrder[i]];

        if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
            intCol->push_back(std::stoll(values[i]));
        } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
            doubleCol->push_back(values[i].empty() ? DoubleColumn::null() : std::stod(values[i]));
        } else if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
            stringCol->push_back(values[i]);
        }
    }
}

// ============================================================================
// Accesseurs
// ============================================================================

IColumnPtr DataFrame::getColumn(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) {
        throw EngineError(ErrorKind::ColumnNotFound, "Column '" + name + "' not found");
    }
    return it->second;
}

bool DataFrame::hasColumn(const std::string& name) const {
    return m_columns.find(name) != m_columns.end();
}

std::vector<std::string> DataFrame::getColumnNames() const {
    return m_columnOrder;
}

size_t DataFrame::rowCount() const {
    if (m_columnOrder.empty()) return 0;
    return m_columns.at(m_columnOrder.front())->size();
}

bool DataFrame::empty() const {
    return m_columns.empty() || rowCount() == 0;
}

std::function<IColumnPtr(const std::string&)> DataFrame::columnGetter() const {
    return [this](const std::string& name) { return getColumn(name); };
}

std::shared_ptr<DataFrame> DataFrame::fromIndices(const std::vector<size_t>& indices) const {
    auto result = std::make_shared<DataFrame>(m_string_pool);
    for (const auto& colName : m_columnOrder) {
        result->addColumn(m_columns.at(colName)->filterByIndices(indices));
    }
    return result;
}

// ============================================================================
// Opérations (délégation aux classes spécialisées)
// ============================================================================

std::shared_ptr<DataFrame> DataFrame::filter(const std::vector<FilterCondition>& conditions) const {
    return fromIndices(DataFrameFilter::apply(conditions, rowCount(), columnGetter()));
}

std::shared_ptr<DataFrame> DataFrame::search(const std::string& query) const {
    return fromIndices(DataFrameFilter::search(query, rowCount(), m_columnOrder, columnGetter()));
}

std::shared_ptr<DataFrame> DataFrame::orderBy(const std::vector<SortKey>& keys) const {
    return fromIndices(DataFrameSorter::getSortedIndices(keys, rowCount(), columnGetter()));
}

std::shared_ptr<DataFrame> DataFrame::aggregate(const AggregateSpec& spec) const {
    return DataFrameAggregator::aggregate(spec, rowCount(), columnGetter(), m_string_pool);
}

std::shared_ptr<DataFrame> DataFrame::pivot(const PivotSpec& spec) const {
    return DataFrameAggregator::pivot(spec, rowCount(), columnGetter(), m_string_pool);
}

std::shared_ptr<DataFrame> DataFrame::join(const DataFrame& right, const JoinSpec& spec) const {
    return DataFrameJoiner::join(
        spec,
        rowCount(),
        columnGetter(),
        m_columnOrder,
        m_string_pool,
        right.rowCount(),
        right.columnGetter(),
        right.m_columnOrder
    );
}

std::shared_ptr<DataFrame> DataFrame::select(const std::vector<std::string>& columnNames) const {
    auto result = std::make_shared<DataFrame>(m_string_pool);
    for (const auto& name : columnNames) {
        result->addColumn(getColumn(name)->clone());
    }
    return result;
}

std::shared_ptr<DataFrame> DataFrame::drop(const std::vector<std::string>& columnNames) const {
    std::set<std::string> dropped;
    for (const auto& name : columnNames) {
        getColumn(name);  // ColumnNotFound si absente
        dropped.insert(name);
    }

    auto result = std::make_shared<DataFrame>(m_string_pool);
    for (const auto& name : m_columnOrder) {
        if (dropped.count(name) == 0) {
            result->addColumn(m_columns.at(name)->clone());
        }
    }
    return result;
}

std::shared_ptr<DataFrame> DataFrame::rename(const std::map<std::string, std::string>& renames) const {
    for (const auto& [from, to] : renames) {
        getColumn(from);
    }

    auto result = std::make_shared<DataFrame>(m_string_pool);
    for (const auto& name : m_columnOrder) {
        auto col = m_columns.at(name)->clone();
        auto it = renames.find(name);
        if (it != renames.end()) {
            col->setName(it->second);
        }
        if (result->hasColumn(col->getName())) {
            throw EngineError(ErrorKind::InvalidOperator,
                              "Rename produces duplicate column '" + col->getName() + "'");
        }
        result->addColumn(col);
    }
    return result;
}

std::shared_ptr<DataFrame> DataFrame::slice(size_t offset, size_t limit) const {
    size_t rows = rowCount();
    size_t begin = std::min(offset, rows);
    size_t end = std::min(rows, begin + std::min(limit, rows - begin));

    std::vector<size_t> indices;
    indices.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        indices.push_back(i);
    }
    return fromIndices(indices);
}

// ============================================================================
// Utilitaires
// ============================================================================

std::string DataFrame::toString(size_t maxRows) const {
    return DataFrameSerializer::toString(*this, maxRows);
}

json DataFrame::toJson() const {
    return DataFrameSerializer::toJson(*this);
}

json DataFrame::toJsonWithSchema() const {
    return DataFrameSerializer::toJsonWithSchema(*this);
}

bool DataFrame::sameContent(const DataFrame& other) const {
    if (m_columnOrder != other.m_columnOrder || rowCount() != other.rowCount()) {
        return false;
    }
    return toJsonWithSchema() == other.toJsonWithSchema();
}

} // namespace dataframe
