#pragma once

#include "Column.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace dataframe {

class DataFrame;
using DataFramePtr = std::shared_ptr<DataFrame>;

using json = nlohmann::json;

/**
 * Conversion DataFrame <-> JSON et rendu texte
 *
 * Format colonnaire échangé avec le client :
 * {
 *   "columns": ["PassengerId", "Name"],
 *   "schema": [{"name": "PassengerId", "type": "INT"}, {"name": "Name", "type": "STRING"}],
 *   "data": [[1, "Braund, Mr. Owen"], [2, null]]
 * }
 * "schema" est optionnel en entrée. Les nulls s'écrivent en JSON null.
 */
class DataFrameSerializer {
public:
    static std::string toString(const DataFrame& df, size_t maxRows = 10);

    static json toJson(const DataFrame& df);
    static json toJsonWithSchema(const DataFrame& df);

    /**
     * Sans "schema", le type de chaque colonne vient de ses valeurs :
     * entiers seuls -> INT, nombres (ou entiers avec null) -> DOUBLE,
     * sinon STRING.
     *
     * Lève std::invalid_argument pour un document mal formé et
     * EngineError(TypeMismatch) pour une valeur incompatible avec le
     * type déclaré de sa colonne.
     */
    static DataFramePtr fromJson(const json& j);

    static json cellToJson(const IColumn& column, size_t row);

    static std::string columnTypeToString(ColumnTypeOpt type);
    /// "INT", "DOUBLE", "STRING" ; lève std::invalid_argument sinon
    static ColumnTypeOpt columnTypeFromString(const std::string& name);

private:
    static ColumnTypeOpt inferColumnType(const json& rows, size_t index);
    static void appendCell(IColumn& column, const json& value);
};

} // namespace dataframe
