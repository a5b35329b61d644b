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

enum class JoinHow {
    Inner,
    Left,
    Outer,   ///< aussi accepté sous le nom "full"
    Cross,
    Semi,
    Anti
};

/// "inner", "left", "outer"/"full", ... ; lève EngineError(InvalidOperator) si inconnu
JoinHow joinHowFromString(const std::string& how);
std::string joinHowToString(JoinHow how);

struct JoinSpec {
    std::string leftKey;
    std::string rightKey;
    JoinHow how = JoinHow::Inner;
    std::string rightSuffix = "_right";
};

/**
 * Responsabilité unique : opérations de jointure entre DataFrames
 *
 * Colonnes résultat :
 * - inner / left : colonnes left, puis colonnes right sans la clef right
 * - outer : colonnes left, puis toutes les colonnes right
 * - cross : toutes les colonnes des deux côtés
 * - semi / anti : colonnes left uniquement
 * Une colonne right dont le nom existe déjà à gauche reçoit le suffixe.
 *
 * Les clefs INT et DOUBLE sont compatibles (comparées en DOUBLE).
 * Une clef nulle ne correspond jamais.
 */
class DataFrameJoiner {
public:
    using ColumnGetter = std::function<IColumnPtr(const std::string&)>;
    using DataFramePtr = std::shared_ptr<DataFrame>;

    static DataFramePtr join(
        const JoinSpec& spec,
        // Left DataFrame info
        size_t leftRowCount,
        const ColumnGetter& getLeftColumn,
        const std::vector<std::string>& leftColumnOrder,
        std::shared_ptr<StringPool> leftStringPool,
        // Right DataFrame info
        size_t rightRowCount,
        const ColumnGetter& getRightColumn,
        const std::vector<std::string>& rightColumnOrder
    );

private:
    // Paires (ligne left, ligne right) ; NULL_INDEX pour le côté absent
    struct RowPairs {
        std::vector<size_t> left;
        std::vector<size_t> right;
    };

    static void checkKeyTypes(const JoinSpec& spec, const IColumnPtr& leftKey, const IColumnPtr& rightKey);

    static RowPairs matchRows(
        const JoinSpec& spec,
        size_t leftRowCount,
        const IColumnPtr& leftKey,
        size_t rightRowCount,
        const IColumnPtr& rightKey
    );

    // Réordonne une colonne ; promeut INT en DOUBLE et ré-interne les strings si besoin
    static IColumnPtr gather(
        const IColumnPtr& column,
        const std::vector<size_t>& indices,
        const std::shared_ptr<StringPool>& targetPool
    );
};

} // namespace dataframe
