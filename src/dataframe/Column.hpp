#pragma once

#include "StringPool.hpp"
#include "DataFrameError.hpp"
#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <cmath>
#include <limits>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace dataframe {

enum class ColumnTypeOpt {
    INT,
    DOUBLE,
    STRING
};

/**
 * Opérateurs de comparaison (numérique ou lexicale)
 */
enum class CompareOp {
    Equal,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual
};

/**
 * Correspondances textuelles, toujours insensibles à la casse
 */
enum class TextMatch {
    Contains,
    NotContains,
    StartsWith,
    EndsWith
};

/// Index de gather représentant une ligne nulle (côté non apparié d'une jointure)
constexpr size_t NULL_INDEX = std::numeric_limits<size_t>::max();

template <typename T, typename U>
inline bool compareValues(const T& lhs, CompareOp op, const U& rhs) {
    switch (op) {
        case CompareOp::Equal:          return lhs == rhs;
        case CompareOp::NotEqual:       return lhs != rhs;
        case CompareOp::Less:           return lhs < rhs;
        case CompareOp::LessOrEqual:    return lhs <= rhs;
        case CompareOp::Greater:        return lhs > rhs;
        case CompareOp::GreaterOrEqual: return lhs >= rhs;
    }
    return false;
}

/**
 * Interface de base pour les colonnes typées
 *
 * Une valeur nulle est une chaîne vide (STRING) ou NaN (DOUBLE).
 * Les colonnes INT ne sont jamais nulles.
 */
class IColumn {
public:
    virtual ~IColumn() = default;

    virtual const std::string& getName() const = 0;
    virtual void setName(const std::string& name) = 0;
    virtual ColumnTypeOpt getType() const = 0;
    virtual size_t size() const = 0;
    virtual void reserve(size_t capacity) = 0;
    virtual void clear() = 0;

    virtual bool isNull(size_t index) const = 0;
    virtual std::string toDisplayString(size_t index) const = 0;

    // Indices des lignes nulles (ou non nulles si wantNull == false)
    std::vector<size_t> filterNull(bool wantNull) const {
        std::vector<size_t> result;
        for (size_t i = 0; i < size(); ++i) {
            if (isNull(i) == wantNull) {
                result.push_back(i);
            }
        }
        return result;
    }

    // Pour créer une colonne filtrée / réordonnée (NULL_INDEX produit une valeur nulle)
    virtual std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const = 0;

    // Colonne vide de même type et même nom
    virtual std::shared_ptr<IColumn> emptyLike() const = 0;

    virtual std::shared_ptr<IColumn> clone() const = 0;
};

using IColumnPtr = std::shared_ptr<IColumn>;

class DoubleColumn;

/**
 * Colonne d'entiers 64 bits
 */
class IntColumn : public IColumn {
public:
    explicit IntColumn(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    void setName(const std::string& name) override { m_name = name; }
    ColumnTypeOpt getType() const override { return ColumnTypeOpt::INT; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override { m_data.reserve(capacity); }
    void clear() override { m_data.clear(); }

    void push_back(int64_t value) { m_data.push_back(value); }
    void set(size_t index, int64_t value) { m_data[index] = value; }
    int64_t at(size_t index) const { return m_data[index]; }
    const std::vector<int64_t>& data() const { return m_data; }

    bool isNull(size_t) const override { return false; }
    std::string toDisplayString(size_t index) const override {
        return std::to_string(m_data[index]);
    }

    std::vector<size_t> filterCompare(CompareOp op, double target) const {
        std::vector<size_t> result;
        result.reserve(m_data.size() / 2);
        for (size_t i = 0; i < m_data.size(); ++i) {
            if (compareValues(static_cast<double>(m_data[i]), op, target)) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<IntColumn>(m_name);
        newCol->reserve(indices.size());
        for (size_t idx : indices) {
            if (idx == NULL_INDEX) {
                throw EngineError(ErrorKind::EngineInternal,
                                  "Integer column '" + m_name + "' cannot hold null values");
            }
            newCol->push_back(m_data[idx]);
        }
        return newCol;
    }

    // Conversion vers DOUBLE pour accueillir des nulls
    std::shared_ptr<DoubleColumn> toDouble() const;

    std::shared_ptr<IColumn> emptyLike() const override {
        return std::make_shared<IntColumn>(m_name);
    }

    std::shared_ptr<IColumn> clone() const override {
        auto newCol = std::make_shared<IntColumn>(m_name);
        newCol->m_data = m_data;
        return newCol;
    }

private:
    std::string m_name;
    std::vector<int64_t> m_data;
};

/**
 * Colonne de doubles (NaN = null)
 */
class DoubleColumn : public IColumn {
public:
    explicit DoubleColumn(const std::string& name) : m_name(name) {}

    static double null() { return std::numeric_limits<double>::quiet_NaN(); }

    const std::string& getName() const override { return m_name; }
    void setName(const std::string& name) override { m_name = name; }
    ColumnTypeOpt getType() const override { return ColumnTypeOpt::DOUBLE; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override { m_data.reserve(capacity); }
    void clear() override { m_data.clear(); }

    void push_back(double value) { m_data.push_back(value); }
    void set(size_t index, double value) { m_data[index] = value; }
    double at(size_t index) const { return m_data[index]; }
    const std::vector<double>& data() const { return m_data; }

    bool isNull(size_t index) const override { return std::isnan(m_data[index]); }
    std::string toDisplayString(size_t index) const override {
        if (isNull(index)) return "";
        std::ostringstream oss;
        oss << m_data[index];
        return oss.str();
    }

    // Les nulls ne matchent jamais une comparaison
    std::vector<size_t> filterCompare(CompareOp op, double target) const {
        std::vector<size_t> result;
        result.reserve(m_data.size() / 2);
        for (size_t i = 0; i < m_data.size(); ++i) {
            if (!std::isnan(m_data[i]) && compareValues(m_data[i], op, target)) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<DoubleColumn>(m_name);
        newCol->reserve(indices.size());
        for (size_t idx : indices) {
            newCol->push_back(idx == NULL_INDEX ? null() : m_data[idx]);
        }
        return newCol;
    }

    std::shared_ptr<IColumn> emptyLike() const override {
        return std::make_shared<DoubleColumn>(m_name);
    }

    std::shared_ptr<IColumn> clone() const override {
        auto newCol = std::make_shared<DoubleColumn>(m_name);
        newCol->m_data = m_data;
        return newCol;
    }

private:
    std::string m_name;
    std::vector<double> m_data;
};

inline std::shared_ptr<DoubleColumn> IntColumn::toDouble() const {
    auto col = std::make_shared<DoubleColumn>(m_name);
    col->reserve(m_data.size());
    for (int64_t v : m_data) {
        col->push_back(static_cast<double>(v));
    }
    return col;
}

/**
 * Colonne de strings avec dictionary encoding
 * - Stocke des indices (uint32_t) au lieu de strings
 * - Égalité = comparaison d'entiers
 */
class StringColumn : public IColumn {
public:
    using StringId = StringPool::StringId;

    explicit StringColumn(const std::string& name, std::shared_ptr<StringPool> pool)
        : m_name(name), m_string_pool(std::move(pool)) {}

    const std::string& getName() const override { return m_name; }
    void setName(const std::string& name) override { m_name = name; }
    ColumnTypeOpt getType() const override { return ColumnTypeOpt::STRING; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override { m_data.reserve(capacity); }
    void clear() override { m_data.clear(); }

    void push_back(const std::string& value) {
        m_data.push_back(m_string_pool->intern(value));
    }

    void push_back(StringId id) {
        m_data.push_back(id);
    }

    void set(size_t index, const std::string& value) {
        m_data[index] = m_string_pool->intern(value);
    }

    const std::string& at(size_t index) const {
        return m_string_pool->getString(m_data[index]);
    }

    /// Valeur en minuscules, pour les comparaisons insensibles à la casse
    const std::string& foldedAt(size_t index) const {
        return m_string_pool->folded(m_data[index]);
    }

    StringId getId(size_t index) const {
        return m_data[index];
    }

    const std::vector<StringId>& data() const { return m_data; }
    std::shared_ptr<StringPool> getStringPool() const { return m_string_pool; }

    bool isNull(size_t index) const override { return at(index).empty(); }
    std::string toDisplayString(size_t index) const override { return at(index); }

    std::vector<size_t> filterCompare(CompareOp op, const std::string& value) const {
        std::vector<size_t> result;

        // Égalité : on compare les IDs sans ajouter la valeur au pool
        if (op == CompareOp::Equal || op == CompareOp::NotEqual) {
            auto targetId = m_string_pool->find(value);
            for (size_t i = 0; i < m_data.size(); ++i) {
                bool equal = targetId.has_value() && m_data[i] == *targetId;
                if (equal == (op == CompareOp::Equal)) {
                    result.push_back(i);
                }
            }
            return result;
        }

        for (size_t i = 0; i < m_data.size(); ++i) {
            const std::string& str = at(i);
            if (!str.empty() && compareValues(str, op, value)) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::vector<size_t> filterText(TextMatch match, const std::string& needle) const {
        const std::string lowered = toLowerAscii(needle);
        std::vector<size_t> result;
        result.reserve(m_data.size() / 10);

        for (size_t i = 0; i < m_data.size(); ++i) {
            const std::string& str = m_string_pool->folded(m_data[i]);
            bool hit = false;
            switch (match) {
                case TextMatch::Contains:
                    hit = str.find(lowered) != std::string::npos;
                    break;
                case TextMatch::NotContains:
                    hit = str.find(lowered) == std::string::npos;
                    break;
                case TextMatch::StartsWith:
                    hit = str.rfind(lowered, 0) == 0;
                    break;
                case TextMatch::EndsWith:
                    hit = str.size() >= lowered.size() &&
                          str.compare(str.size() - lowered.size(), lowered.size(), lowered) == 0;
                    break;
            }
            if (hit) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<StringColumn>(m_name, m_string_pool);
        newCol->reserve(indices.size());
        for (size_t idx : indices) {
            if (idx == NULL_INDEX) {
                newCol->push_back(std::string());
            } else {
                newCol->push_back(m_data[idx]);
            }
        }
        return newCol;
    }

    std::shared_ptr<IColumn> emptyLike() const override {
        return std::make_shared<StringColumn>(m_name, m_string_pool);
    }

    std::shared_ptr<IColumn> clone() const override {
        auto newCol = std::make_shared<StringColumn>(m_name, m_string_pool);
        newCol->m_data = m_data;
        return newCol;
    }

private:
    std::string m_name;
    std::shared_ptr<StringPool> m_string_pool;
    std::vector<StringId> m_data;  // Indices dans le string pool
};

} // namespace dataframe
