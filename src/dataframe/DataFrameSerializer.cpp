#include "DataFrameSerializer.hpp"
#include "DataFrame.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace dataframe {

// ============================================================================
// Écriture
// ============================================================================

json DataFrameSerializer::cellToJson(const IColumn& column, size_t row) {
    if (column.isNull(row)) {
        return nullptr;
    }
    switch (column.getType()) {
        case ColumnTypeOpt::INT:
            return static_cast<const IntColumn&>(column).at(row);
        case ColumnTypeOpt::DOUBLE:
            return static_cast<const DoubleColumn&>(column).at(row);
        case ColumnTypeOpt::STRING:
            return static_cast<const StringColumn&>(column).at(row);
    }
    return nullptr;
}

std::string DataFrameSerializer::toString(const DataFrame& df, size_t maxRows) {
    auto names = df.getColumnNames();
    if (names.empty()) {
        return "Empty DataFrame\n";
    }

    std::ostringstream oss;
    for (const auto& name : names) {
        oss << name << "\t";
    }
    oss << "\n";

    size_t rows = df.rowCount();
    for (size_t i = 0; i < std::min(rows, maxRows); ++i) {
        for (const auto& name : names) {
            auto col = df.getColumn(name);
            oss << (col->isNull(i) ? "null" : col->toDisplayString(i)) << "\t";
        }
        oss << "\n";
    }
    if (rows > maxRows) {
        oss << "... (" << (rows - maxRows) << " more rows)\n";
    }
    return oss.str();
}

json DataFrameSerializer::toJson(const DataFrame& df) {
    auto names = df.getColumnNames();
    std::vector<IColumnPtr> columns;
    columns.reserve(names.size());
    for (const auto& name : names) {
        columns.push_back(df.getColumn(name));
    }

    json data = json::array();
    for (size_t i = 0; i < df.rowCount(); ++i) {
        json row = json::array();
        for (const auto& col : columns) {
            row.push_back(cellToJson(*col, i));
        }
        data.push_back(std::move(row));
    }

    return json{{"columns", names}, {"data", std::move(data)}};
}

json DataFrameSerializer::toJsonWithSchema(const DataFrame& df) {
    json result = toJson(df);

    json schema = json::array();
    for (const auto& name : df.getColumnNames()) {
        schema.push_back({{"name", name}, {"type", columnTypeToString(df.getColumn(name)->getType())}});
    }
    result["schema"] = std::move(schema);
    return result;
}

std::string DataFrameSerializer::columnTypeToString(ColumnTypeOpt type) {
    switch (type) {
        case ColumnTypeOpt::INT:    return "INT";
        case ColumnTypeOpt::DOUBLE: return "DOUBLE";
        case ColumnTypeOpt::STRING: return "STRING";
    }
    return "STRING";
}

ColumnTypeOpt DataFrameSerializer::columnTypeFromString(const std::string& name) {
    if (name == "INT") return ColumnTypeOpt::INT;
    if (name == "DOUBLE") return ColumnTypeOpt::DOUBLE;
    if (name == "STRING") return ColumnTypeOpt::STRING;
    throw std::invalid_argument("Unknown column type: " + name);
}

// ============================================================================
// Lecture
// ============================================================================

ColumnTypeOpt DataFrameSerializer::inferColumnType(const json& rows, size_t index) {
    bool sawNull = false;
    bool sawInt = false;
    bool sawFloat = false;
    for (const auto& row : rows) {
        const auto& value = row.at(index);
        if (value.is_null()) {
            sawNull = true;
        } else if (value.is_number_integer()) {
            sawInt = true;
        } else if (value.is_number()) {
            sawFloat = true;
        } else {
            return ColumnTypeOpt::STRING;
        }
    }
    if (!sawInt && !sawFloat) return ColumnTypeOpt::STRING;
    // IntColumn n'a pas de null
    if (sawFloat || sawNull) return ColumnTypeOpt::DOUBLE;
    return ColumnTypeOpt::INT;
}

void DataFrameSerializer::appendCell(IColumn& column, const json& value) {
    switch (column.getType()) {
        case ColumnTypeOpt::INT:
            if (!value.is_number_integer()) {
                throw EngineError(ErrorKind::TypeMismatch,
                                  "Column '" + column.getName() + "' expects integers, got " + value.dump());
            }
            static_cast<IntColumn&>(column).push_back(value.get<int64_t>());
            break;
        case ColumnTypeOpt::DOUBLE:
            if (value.is_null()) {
                static_cast<DoubleColumn&>(column).push_back(DoubleColumn::null());
            } else if (value.is_number()) {
                static_cast<DoubleColumn&>(column).push_back(value.get<double>());
            } else {
                throw EngineError(ErrorKind::TypeMismatch,
                                  "Column '" + column.getName() + "' expects numbers, got " + value.dump());
            }
            break;
        case ColumnTypeOpt::STRING: {
            auto& strings = static_cast<StringColumn&>(column);
            if (value.is_string()) {
                strings.push_back(value.get<std::string>());
            } else if (value.is_null()) {
                strings.push_back(std::string());
            } else {
                strings.push_back(value.dump());
            }
            break;
        }
    }
}

DataFramePtr DataFrameSerializer::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("columns") || !j.contains("data")) {
        throw std::invalid_argument("Invalid DataFrame JSON: missing 'columns' or 'data'");
    }
    const auto& columns = j.at("columns");
    const auto& rows = j.at("data");
    if (!columns.is_array() || !rows.is_array()) {
        throw std::invalid_argument("Invalid DataFrame JSON: 'columns' and 'data' must be arrays");
    }

    for (const auto& row : rows) {
        if (!row.is_array() || row.size() != columns.size()) {
            throw std::invalid_argument("Invalid DataFrame JSON: row size mismatch");
        }
    }

    const json* schema = j.contains("schema") && j.at("schema").is_array() ? &j.at("schema") : nullptr;

    auto df = std::make_shared<DataFrame>();
    std::vector<IColumnPtr> typed;
    typed.reserve(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        std::string name = columns[i].get<std::string>();
        ColumnTypeOpt type = schema && i < schema->size()
            ? columnTypeFromString((*schema)[i].value("type", std::string("STRING")))
            : inferColumnType(rows, i);

        switch (type) {
            case ColumnTypeOpt::INT:    df->addIntColumn(name); break;
            case ColumnTypeOpt::DOUBLE: df->addDoubleColumn(name); break;
            case ColumnTypeOpt::STRING: df->addStringColumn(name); break;
        }
        auto column = df->getColumn(name);
        column->reserve(rows.size());
        typed.push_back(column);
    }

    for (const auto& row : rows) {
        for (size_t i = 0; i < typed.size(); ++i) {
            appendCell(*typed[i], row[i]);
        }
    }
    return df;
}

} // namespace dataframe
