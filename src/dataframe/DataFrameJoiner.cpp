#include "DataFrameJoiner.hpp"
#include "DataFrame.hpp"
#include <algorithm>
#include <cstring>
#include <unordered_set>

namespace dataframe {

namespace {

uint64_t numericKey(const IColumnPtr& column, size_t row) {
    double val = 0.0;
    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(column)) {
        val = static_cast<double>(intCol->at(row));
    } else {
        val = std::static_pointer_cast<DoubleColumn>(column)->at(row);
    }
    if (val == 0.0) val = 0.0;  // -0.0 et 0.0 partagent la même clef
    uint64_t bits;
    std::memcpy(&bits, &val, sizeof(double));
    return bits;
}

} // anonymous namespace

JoinHow joinHowFromString(const std::string& how) {
    if (how == "inner") return JoinHow::Inner;
    if (how == "left") return JoinHow::Left;
    if (how == "outer" || how == "full") return JoinHow::Outer;
    if (how == "cross") return JoinHow::Cross;
    if (how == "semi") return JoinHow::Semi;
    if (how == "anti") return JoinHow::Anti;
    throw EngineError(ErrorKind::InvalidOperator, "Unknown join type: " + how);
}

std::string joinHowToString(JoinHow how) {
    switch (how) {
        case JoinHow::Inner: return "inner";
        case JoinHow::Left:  return "left";
        case JoinHow::Outer: return "outer";
        case JoinHow::Cross: return "cross";
        case JoinHow::Semi:  return "semi";
        case JoinHow::Anti:  return "anti";
    }
    return "inner";
}

void DataFrameJoiner::checkKeyTypes(
    const JoinSpec& spec,
    const IColumnPtr& leftKey,
    const IColumnPtr& rightKey
) {
    bool leftText = leftKey->getType() == ColumnTypeOpt::STRING;
    bool rightText = rightKey->getType() == ColumnTypeOpt::STRING;
    if (leftText != rightText) {
        throw EngineError(ErrorKind::TypeMismatch,
                          "Key type mismatch: '" + spec.leftKey + "' vs '" + spec.rightKey + "'");
    }
}

DataFrameJoiner::RowPairs DataFrameJoiner::matchRows(
    const JoinSpec& spec,
    size_t leftRowCount,
    const IColumnPtr& leftKey,
    size_t rightRowCount,
    const IColumnPtr& rightKey
) {
    RowPairs pairs;

    if (spec.how == JoinHow::Cross) {
        pairs.left.reserve(leftRowCount * rightRowCount);
        pairs.right.reserve(leftRowCount * rightRowCount);
        for (size_t l = 0; l < leftRowCount; ++l) {
            for (size_t r = 0; r < rightRowCount; ++r) {
                pairs.left.push_back(l);
                pairs.right.push_back(r);
            }
        }
        return pairs;
    }

    // Hash table construite sur le côté right, lignes dans l'ordre d'origine
    const bool textKeys = leftKey->getType() == ColumnTypeOpt::STRING;
    std::unordered_map<std::string, std::vector<size_t>> textTable;
    std::unordered_map<uint64_t, std::vector<size_t>> numericTable;

    for (size_t r = 0; r < rightRowCount; ++r) {
        if (rightKey->isNull(r)) continue;
        if (textKeys) {
            textTable[std::static_pointer_cast<StringColumn>(rightKey)->at(r)].push_back(r);
        } else {
            numericTable[numericKey(rightKey, r)].push_back(r);
        }
    }

    auto lookup = [&](size_t l) -> const std::vector<size_t>* {
        if (leftKey->isNull(l)) return nullptr;
        if (textKeys) {
            auto it = textTable.find(std::static_pointer_cast<StringColumn>(leftKey)->at(l));
            return it == textTable.end() ? nullptr : &it->second;
        }
        auto it = numericTable.find(numericKey(leftKey, l));
        return it == numericTable.end() ? nullptr : &it->second;
    };

    std::vector<bool> rightMatched(rightRowCount, false);

    for (size_t l = 0; l < leftRowCount; ++l) {
        const auto* matches = lookup(l);
        const bool found = matches != nullptr && !matches->empty();

        switch (spec.how) {
            case JoinHow::Semi:
                if (found) pairs.left.push_back(l);
                break;
            case JoinHow::Anti:
                if (!found) pairs.left.push_back(l);
                break;
            default:
                if (found) {
                    for (size_t r : *matches) {
                        pairs.left.push_back(l);
                        pairs.right.push_back(r);
                        rightMatched[r] = true;
                    }
                } else if (spec.how == JoinHow::Left || spec.how == JoinHow::Outer) {
                    pairs.left.push_back(l);
                    pairs.right.push_back(NULL_INDEX);
                }
                break;
        }
    }

    if (spec.how == JoinHow::Outer) {
        for (size_t r = 0; r < rightRowCount; ++r) {
            if (!rightMatched[r]) {
                pairs.left.push_back(NULL_INDEX);
                pairs.right.push_back(r);
            }
        }
    }

    return pairs;
}

IColumnPtr DataFrameJoiner::gather(
    const IColumnPtr& column,
    const std::vector<size_t>& indices,
    const std::shared_ptr<StringPool>& targetPool
) {
    const bool hasNull = std::find(indices.begin(), indices.end(), NULL_INDEX) != indices.end();

    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(column)) {
        if (hasNull) {
            return intCol->toDouble()->filterByIndices(indices);
        }
        return intCol->filterByIndices(indices);
    }

    if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(column)) {
        if (stringCol->getStringPool() != targetPool) {
            // Intern dans le pool cible pour garantir une comparaison cohérente
            auto result = std::make_shared<StringColumn>(stringCol->getName(), targetPool);
            result->reserve(indices.size());
            for (size_t idx : indices) {
                result->push_back(idx == NULL_INDEX ? std::string() : stringCol->at(idx));
            }
            return result;
        }
    }

    return column->filterByIndices(indices);
}

DataFrameJoiner::DataFramePtr DataFrameJoiner::join(
    const JoinSpec& spec,
    size_t leftRowCount,
    const ColumnGetter& getLeftColumn,
    const std::vector<std::string>& leftColumnOrder,
    std::shared_ptr<StringPool> leftStringPool,
    size_t rightRowCount,
    const ColumnGetter& getRightColumn,
    const std::vector<std::string>& rightColumnOrder
) {
    if (spec.rightSuffix.empty()) {
        throw EngineError(ErrorKind::InvalidOperator, "Join suffix cannot be empty");
    }

    IColumnPtr leftKey;
    IColumnPtr rightKey;
    if (spec.how != JoinHow::Cross) {
        leftKey = getLeftColumn(spec.leftKey);
        rightKey = getRightColumn(spec.rightKey);
        checkKeyTypes(spec, leftKey, rightKey);
    }

    auto pairs = matchRows(spec, leftRowCount, leftKey, rightRowCount, rightKey);

    auto result = std::make_shared<DataFrame>();
    result->setStringPool(leftStringPool);

    std::unordered_set<std::string> usedNames;
    for (const auto& name : leftColumnOrder) {
        result->addColumn(gather(getLeftColumn(name), pairs.left, leftStringPool));
        usedNames.insert(name);
    }

    if (spec.how == JoinHow::Semi || spec.how == JoinHow::Anti) {
        return result;
    }

    const bool dropRightKey = spec.how == JoinHow::Inner || spec.how == JoinHow::Left;
    for (const auto& name : rightColumnOrder) {
        if (dropRightKey && name == spec.rightKey) continue;

        auto column = gather(getRightColumn(name), pairs.right, leftStringPool);
        std::string resultName = name;
        while (usedNames.count(resultName) > 0) {
            resultName += spec.rightSuffix;
        }
        column->setName(resultName);
        usedNames.insert(resultName);
        result->addColumn(column);
    }

    return result;
}

} // namespace dataframe
