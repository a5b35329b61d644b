#include "DataFrameIO.hpp"
#include <cctype>
#include <fstream>

namespace dataframe {

namespace {

constexpr const char* kBlank = " \t\r\n";

std::string trim(const std::string& raw) {
    size_t start = raw.find_first_not_of(kBlank);
    if (start == std::string::npos) {
        return "";
    }
    return raw.substr(start, raw.find_last_not_of(kBlank) - start + 1);
}

} // namespace

// ============================================================================
// Lecture
// ============================================================================

bool DataFrameIO::readRecord(std::istream& input, char delimiter, std::vector<std::string>& fields) {
    std::string line;
    do {
        if (!std::getline(input, line)) {
            return false;
        }
    } while (line.find_first_not_of(kBlank) == std::string::npos);

    fields.clear();
    std::string field;
    bool quoted = false;    // le champ courant a commencé par un guillemet
    bool inQuotes = false;

    auto push = [&]() {
        fields.push_back(quoted ? field : trim(field));
        field.clear();
        quoted = false;
    };

    size_t i = 0;
    while (true) {
        if (i == line.size()) {
            if (!inQuotes) break;
            // Retour à la ligne à l'intérieur d'un champ quoté
            std::string next;
            if (!std::getline(input, next)) break;
            field += '\n';
            line = std::move(next);
            i = 0;
            continue;
        }

        char c = line[i++];
        if (inQuotes) {
            if (c != '"') {
                field += c;
            } else if (i < line.size() && line[i] == '"') {
                field += '"';
                ++i;
            } else {
                inQuotes = false;
            }
        } else if (c == delimiter) {
            push();
        } else if (c == '"' && !quoted && field.find_first_not_of(kBlank) == std::string::npos) {
            field.clear();
            quoted = true;
            inQuotes = true;
        } else if (!quoted) {
            field += c;
        }
    }
    push();
    return true;
}

ColumnTypeOpt DataFrameIO::detectType(const std::string& value, char delimiter) {
    size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    bool hasDecimal = false;
    size_t digits = 0;

    for (size_t i = start; i < value.size(); ++i) {
        char c = value[i];
        if (c == '.' || (c == ',' && delimiter != ',')) {
            if (hasDecimal) return ColumnTypeOpt::STRING;
            hasDecimal = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            ++digits;
        } else {
            return ColumnTypeOpt::STRING;
        }
    }

    if (digits == 0) return ColumnTypeOpt::STRING;
    // Au-delà de 18 chiffres, un entier ne tient plus dans int64
    if (hasDecimal || digits > 18) return ColumnTypeOpt::DOUBLE;
    return ColumnTypeOpt::INT;
}

double DataFrameIO::parseDouble(const std::string& value, char delimiter) {
    if (delimiter == ',') {
        return std::stod(value);
    }
    std::string normalized = value;
    for (auto& c : normalized) {
        if (c == ',') c = '.';
    }
    return std::stod(normalized);
}

void DataFrameIO::ColumnProfile::observe(const std::string& value, char delimiter) {
    if (value.empty()) {
        sawEmpty = true;
        return;
    }
    sawValue = true;
    if (type == ColumnTypeOpt::STRING) return;

    ColumnTypeOpt detected = detectType(value, delimiter);
    if (detected == ColumnTypeOpt::STRING || detected == ColumnTypeOpt::DOUBLE) {
        type = detected;
    }
}

ColumnTypeOpt DataFrameIO::ColumnProfile::resolve() const {
    if (!sawValue) return ColumnTypeOpt::STRING;
    if (type == ColumnTypeOpt::INT && sawEmpty) return ColumnTypeOpt::DOUBLE;
    return type;
}

std::shared_ptr<DataFrame> DataFrameIO::readCSV(
    const std::string& filepath,
    char delimiter,
    bool hasHeader
) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return readCSV(file, delimiter, hasHeader);
}

std::shared_ptr<DataFrame> DataFrameIO::readCSV(
    std::istream& input,
    char delimiter,
    bool hasHeader
) {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> fields;

    if (!readRecord(input, delimiter, fields)) {
        throw std::runtime_error("CSV input has no header");
    }
    if (hasHeader) {
        headers = fields;
    } else {
        for (size_t i = 0; i < fields.size(); ++i) {
            headers.push_back("col" + std::to_string(i));
        }
        rows.push_back(fields);
    }
    while (readRecord(input, delimiter, fields)) {
        rows.push_back(fields);
    }

    std::vector<ColumnProfile> profiles(headers.size());
    for (auto& row : rows) {
        row.resize(headers.size());
        for (size_t i = 0; i < headers.size(); ++i) {
            profiles[i].observe(row[i], delimiter);
        }
    }

    auto df = std::make_shared<DataFrame>();
    df->getStringPool()->reserve(rows.size());

    std::vector<IColumnPtr> columns;
    for (size_t i = 0; i < headers.size(); ++i) {
        switch (profiles[i].resolve()) {
            case ColumnTypeOpt::INT:    df->addIntColumn(headers[i]); break;
            case ColumnTypeOpt::DOUBLE: df->addDoubleColumn(headers[i]); break;
            case ColumnTypeOpt::STRING: df->addStringColumn(headers[i]); break;
        }
        columns.push_back(df->getColumn(headers[i]));
        columns.back()->reserve(rows.size());
    }

    for (const auto& row : rows) {
        for (size_t i = 0; i < columns.size(); ++i) {
            const std::string& value = row[i];
            switch (columns[i]->getType()) {
                case ColumnTypeOpt::INT:
                    static_cast<IntColumn&>(*columns[i]).push_back(std::stoll(value));
                    break;
                case ColumnTypeOpt::DOUBLE:
                    static_cast<DoubleColumn&>(*columns[i]).push_back(
                        value.empty() ? DoubleColumn::null() : parseDouble(value, delimiter));
                    break;
                case ColumnTypeOpt::STRING:
                    static_cast<StringColumn&>(*columns[i]).push_back(value);
                    break;
            }
        }
    }

    return df;
}

// ============================================================================
// Écriture
// ============================================================================

std::string DataFrameIO::quoteField(const std::string& field, char delimiter) {
    if (field.find_first_of(std::string("\"\n\r") + delimiter) == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void DataFrameIO::writeCSV(
    const DataFrame& df,
    const std::string& filepath,
    char delimiter,
    bool includeHeader
) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filepath);
    }
    writeCSV(df, file, delimiter, includeHeader);
}

void DataFrameIO::writeCSV(
    const DataFrame& df,
    std::ostream& output,
    char delimiter,
    bool includeHeader
) {
    auto names = df.getColumnNames();
    std::vector<IColumnPtr> columns;
    for (const auto& name : names) {
        columns.push_back(df.getColumn(name));
    }

    auto writeLine = [&](auto&& cell) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) output << delimiter;
            output << quoteField(cell(c), delimiter);
        }
        output << "\n";
    };

    if (includeHeader) {
        writeLine([&](size_t c) { return names[c]; });
    }
    for (size_t row = 0; row < df.rowCount(); ++row) {
        writeLine([&](size_t c) { return columns[c]->toDisplayString(row); });
    }
}

} // namespace dataframe
