#include "Schema.hpp"
#include <cctype>
#include <stdexcept>

namespace dataframe {

namespace {

bool digitsAt(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size()) return false;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

TypeCategory inferTextCategory(const StringColumn& column) {
    bool anyValue = false;
    bool allDates = true;
    bool allBooleans = true;

    for (size_t i = 0; i < column.size() && (allDates || allBooleans); ++i) {
        const std::string& value = column.at(i);
        if (value.empty()) continue;
        anyValue = true;

        if (allDates && !isIsoDate(value)) {
            allDates = false;
        }
        if (allBooleans) {
            std::string lowered = toLowerAscii(value);
            if (lowered != "true" && lowered != "false") {
                allBooleans = false;
            }
        }
    }

    if (!anyValue) return TypeCategory::Unknown;
    if (allDates) return TypeCategory::Date;
    if (allBooleans) return TypeCategory::Boolean;
    return TypeCategory::Text;
}

} // anonymous namespace

// YYYY-MM-DD, suivi optionnellement de [T ]HH:MM[:SS[.fff]]
bool isIsoDate(const std::string& value) {
    if (!digitsAt(value, 0, 4) || value.size() < 10 || value[4] != '-' ||
        !digitsAt(value, 5, 2) || value[7] != '-' || !digitsAt(value, 8, 2)) {
        return false;
    }
    int month = std::stoi(value.substr(5, 2));
    int day = std::stoi(value.substr(8, 2));
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }
    if (value.size() == 10) {
        return true;
    }

    if ((value[10] != 'T' && value[10] != ' ') || !digitsAt(value, 11, 2) ||
        value.size() < 16 || value[13] != ':' || !digitsAt(value, 14, 2)) {
        return false;
    }
    size_t pos = 16;
    if (pos < value.size() && value[pos] == ':') {
        if (!digitsAt(value, pos + 1, 2)) return false;
        pos += 3;
        if (pos < value.size() && value[pos] == '.') {
            ++pos;
            size_t start = pos;
            while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) ++pos;
            if (pos == start) return false;
        }
    }
    if (pos < value.size() && value[pos] == 'Z') ++pos;
    return pos == value.size();
}

std::string typeCategoryToString(TypeCategory category) {
    switch (category) {
        case TypeCategory::Numeric: return "numeric";
        case TypeCategory::Text:    return "text";
        case TypeCategory::Date:    return "date";
        case TypeCategory::Boolean: return "boolean";
        case TypeCategory::Unknown: return "unknown";
    }
    return "unknown";
}

TypeCategory typeCategoryFromString(const std::string& name) {
    if (name == "numeric") return TypeCategory::Numeric;
    if (name == "text") return TypeCategory::Text;
    if (name == "date") return TypeCategory::Date;
    if (name == "boolean") return TypeCategory::Boolean;
    if (name == "unknown") return TypeCategory::Unknown;
    throw std::invalid_argument("Unknown type category: " + name);
}

Schema Schema::infer(const DataFrame& df) {
    std::vector<ColumnSchema> columns;
    for (const auto& name : df.getColumnNames()) {
        auto col = df.getColumn(name);
        TypeCategory category = TypeCategory::Unknown;
        switch (col->getType()) {
            case ColumnTypeOpt::INT:
            case ColumnTypeOpt::DOUBLE:
                category = TypeCategory::Numeric;
                break;
            case ColumnTypeOpt::STRING:
                category = inferTextCategory(static_cast<const StringColumn&>(*col));
                break;
        }
        columns.push_back({name, category});
    }
    return Schema(std::move(columns));
}

std::optional<TypeCategory> Schema::categoryOf(const std::string& name) const {
    for (const auto& column : m_columns) {
        if (column.name == name) return column.category;
    }
    return std::nullopt;
}

nlohmann::json Schema::toJson() const {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& column : m_columns) {
        result.push_back({{"name", column.name}, {"type", typeCategoryToString(column.category)}});
    }
    return result;
}

bool Schema::operator==(const Schema& other) const {
    if (m_columns.size() != other.m_columns.size()) return false;
    for (size_t i = 0; i < m_columns.size(); ++i) {
        if (m_columns[i].name != other.m_columns[i].name ||
            m_columns[i].category != other.m_columns[i].category) {
            return false;
        }
    }
    return true;
}

} // namespace dataframe
