#pragma once

#include "DataFrame.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dataframe {

/**
 * Catégorie de type exposée à l'utilisateur, dérivée du type physique
 * et, pour les colonnes texte, du contenu.
 */
enum class TypeCategory {
    Numeric,
    Text,
    Date,
    Boolean,
    Unknown
};

std::string typeCategoryToString(TypeCategory category);
/// Lève std::invalid_argument si la catégorie est inconnue
TypeCategory typeCategoryFromString(const std::string& name);

struct ColumnSchema {
    std::string name;
    TypeCategory category = TypeCategory::Unknown;
};

/**
 * Schéma ordonné d'une frame : nom de colonne -> catégorie
 */
class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<ColumnSchema> columns) : m_columns(std::move(columns)) {}

    /**
     * INT/DOUBLE -> numeric ; STRING -> date si toutes les valeurs non nulles
     * sont des dates ISO, boolean si toutes valent true/false, text sinon ;
     * colonne sans valeur non nulle -> unknown.
     */
    static Schema infer(const DataFrame& df);

    const std::vector<ColumnSchema>& columns() const { return m_columns; }
    bool contains(const std::string& name) const { return categoryOf(name).has_value(); }
    std::optional<TypeCategory> categoryOf(const std::string& name) const;
    size_t size() const { return m_columns.size(); }

    // [{"name": "Age", "type": "numeric"}, ...]
    nlohmann::json toJson() const;

    bool operator==(const Schema& other) const;

private:
    std::vector<ColumnSchema> m_columns;
};

bool isIsoDate(const std::string& value);

} // namespace dataframe
