#pragma once

#include "Column.hpp"
#include <vector>
#include <string>
#include <memory>
#include <functional>

namespace dataframe {

enum class FilterOperator {
    Equal,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual,
    Contains,
    NotContains,
    StartsWith,
    EndsWith,
    IsTrue,
    IsFalse,
    IsNull,
    IsNotNull
};

/**
 * Une condition de filtre : colonne, opérateur, valeur (texte brut)
 * La valeur est ignorée pour les opérateurs unaires (is null, is true, ...)
 */
struct FilterCondition {
    std::string column;
    FilterOperator op = FilterOperator::Equal;
    std::string value;
};

/// "==", "contains", "is not null", ... ; lève EngineError(InvalidOperator) si inconnu
FilterOperator filterOperatorFromString(const std::string& op);
std::string filterOperatorToString(FilterOperator op);

bool isUnaryOperator(FilterOperator op);
bool isTextOperator(FilterOperator op);
bool isComparisonOperator(FilterOperator op);
bool isBooleanOperator(FilterOperator op);

/**
 * Responsabilité unique : filtrage des DataFrames
 */
class DataFrameFilter {
public:
    using ColumnGetter = std::function<IColumnPtr(const std::string&)>;

    /**
     * Conditions combinées en ET. Retourne les indices triés des lignes retenues.
     */
    static std::vector<size_t> apply(
        const std::vector<FilterCondition>& conditions,
        size_t rowCount,
        const ColumnGetter& getColumn
    );

    /**
     * Recherche plein texte : sous-chaîne insensible à la casse sur toutes les
     * colonnes texte (OU), plus égalité sur les colonnes numériques si la
     * requête est un nombre. Une requête vide retient toutes les lignes.
     */
    static std::vector<size_t> search(
        const std::string& query,
        size_t rowCount,
        const std::vector<std::string>& columnOrder,
        const ColumnGetter& getColumn
    );

private:
    static std::vector<size_t> applyCondition(
        const IColumnPtr& col,
        const FilterCondition& condition
    );
};

} // namespace dataframe
