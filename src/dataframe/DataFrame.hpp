#pragma once

#include "Column.hpp"
#include "StringPool.hpp"
#include "DataFrameError.hpp"
#include "DataFrameFilter.hpp"
#include "DataFrameSorter.hpp"
#include "DataFrameAggregator.hpp"
#include "DataFrameJoiner.hpp"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>
#include <map>

namespace dataframe {

using json = nlohmann::json;

/**
 * DataFrame colonnaire immuable une fois construit
 *
 * Toutes les opérations retournent une nouvelle frame ; la frame source
 * n'est jamais modifiée, ce qui permet de partager une même instance
 * entre le thread de contrôle et les workers de matérialisation.
 *
 * Architecture SRP:
 * - DataFrame: gestion des données et structure
 * - DataFrameFilter: filtrage et recherche
 * - DataFrameSorter: tri
 * - DataFrameAggregator: agrégations et pivot
 * - DataFrameJoiner: jointures
 * - DataFrameSerializer: toString et toJson
 *
 * Les erreurs sont levées sous forme d'EngineError (voir ErrorKind).
 */
class DataFrame {
public:
    DataFrame() : m_string_pool(std::make_shared<StringPool>()) {}
    explicit DataFrame(std::shared_ptr<StringPool> pool) : m_string_pool(std::move(pool)) {}

    // Construction
    void addColumn(IColumnPtr column);
    void setColumn(IColumnPtr column);  // replaces if exists, adds if not
    void addIntColumn(const std::string& name);
    void addDoubleColumn(const std::string& name);
    void addStringColumn(const std::string& name);

    // Helper pour ajouter des données (valeur vide = null)
    void addRow(const std::vector<std::string>& values);

    // Accesseurs
    IColumnPtr getColumn(const std::string& name) const;
    bool hasColumn(const std::string& name) const;
    std::vector<std::string> getColumnNames() const;
    size_t rowCount() const;
    size_t columnCount() const { return m_columns.size(); }
    bool empty() const;

    // Opérations (délèguent aux classes spécialisées)
    std::shared_ptr<DataFrame> filter(const std::vector<FilterCondition>& conditions) const;
    std::shared_ptr<DataFrame> search(const std::string& query) const;
    std::shared_ptr<DataFrame> orderBy(const std::vector<SortKey>& keys) const;
    std::shared_ptr<DataFrame> aggregate(const AggregateSpec& spec) const;
    std::shared_ptr<DataFrame> pivot(const PivotSpec& spec) const;
    std::shared_ptr<DataFrame> join(const DataFrame& right, const JoinSpec& spec) const;

    // Édition de colonnes
    std::shared_ptr<DataFrame> select(const std::vector<std::string>& columnNames) const;
    std::shared_ptr<DataFrame> drop(const std::vector<std::string>& columnNames) const;
    std::shared_ptr<DataFrame> rename(const std::map<std::string, std::string>& renames) const;

    // Pagination : lignes [offset, offset + limit)
    std::shared_ptr<DataFrame> slice(size_t offset, size_t limit) const;

    // Utilitaires (délèguent au Serializer)
    std::string toString(size_t maxRows = 10) const;
    json toJson() const;
    json toJsonWithSchema() const;

    // Même colonnes, mêmes types, mêmes valeurs (NaN == NaN)
    bool sameContent(const DataFrame& other) const;

    // String pool accessor/mutator
    std::shared_ptr<StringPool> getStringPool() const { return m_string_pool; }
    void setStringPool(std::shared_ptr<StringPool> pool) { m_string_pool = std::move(pool); }

private:
    std::shared_ptr<DataFrame> fromIndices(const std::vector<size_t>& indices) const;
    std::function<IColumnPtr(const std::string&)> columnGetter() const;

    std::unordered_map<std::string, IColumnPtr> m_columns;
    std::vector<std::string> m_columnOrder;
    std::shared_ptr<StringPool> m_string_pool;
};

using DataFramePtr = std::shared_ptr<DataFrame>;

} // namespace dataframe
