#include "exporter/ScriptExporter.hpp"
#include "dataframe/Column.hpp"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace exporter {

using json = nlohmann::json;

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string pyString(const std::string& value) {
    return json(value).dump();
}

std::string pyStringList(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += pyString(values[i]);
    }
    return out + "]";
}

std::string col(const std::string& name) {
    return "pl.col(" + pyString(name) + ")";
}

bool isNumberLiteral(const std::string& value) {
    if (value.empty()) return false;
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    return end == value.c_str() + value.size() && std::isfinite(parsed);
}

// Numbers stay numbers; anything else becomes a string literal
std::string pyValue(const std::string& value) {
    return isNumberLiteral(value) ? value : pyString(value);
}

std::string lowered(const std::string& name) {
    return col(name) + ".cast(pl.Utf8).str.to_lowercase()";
}

std::string conditionExpr(const dataframe::FilterCondition& c) {
    using Op = dataframe::FilterOperator;
    const std::string needle = pyString(dataframe::toLowerAscii(c.value));

    switch (c.op) {
        case Op::Equal:          return "(" + col(c.column) + " == " + pyValue(c.value) + ")";
        case Op::NotEqual:       return "(" + col(c.column) + " != " + pyValue(c.value) + ")";
        case Op::Less:           return "(" + col(c.column) + " < " + pyValue(c.value) + ")";
        case Op::LessOrEqual:    return "(" + col(c.column) + " <= " + pyValue(c.value) + ")";
        case Op::Greater:        return "(" + col(c.column) + " > " + pyValue(c.value) + ")";
        case Op::GreaterOrEqual: return "(" + col(c.column) + " >= " + pyValue(c.value) + ")";
        case Op::Contains:       return lowered(c.column) + ".str.contains(" + needle + ", literal=True)";
        case Op::NotContains:    return "~" + lowered(c.column) + ".str.contains(" + needle + ", literal=True)";
        case Op::StartsWith:     return lowered(c.column) + ".str.starts_with(" + needle + ")";
        case Op::EndsWith:       return lowered(c.column) + ".str.ends_with(" + needle + ")";
        case Op::IsTrue:         return lowered(c.column) + ".is_in([\"true\", \"1\", \"1.0\"])";
        case Op::IsFalse:        return lowered(c.column) + ".is_in([\"false\", \"0\", \"0.0\"])";
        case Op::IsNull:         return col(c.column) + ".is_null()";
        case Op::IsNotNull:      return col(c.column) + ".is_not_null()";
    }
    return "pl.lit(True)";
}

std::string aggExpr(const std::string& base, dataframe::AggFunction fn) {
    using Fn = dataframe::AggFunction;
    switch (fn) {
        case Fn::Sum:    return base + ".sum()";
        case Fn::Mean:   return base + ".mean()";
        case Fn::Count:  return base + ".count()";
        case Fn::Min:    return base + ".min()";
        case Fn::Max:    return base + ".max()";
        case Fn::Median: return base + ".median()";
        case Fn::Std:    return base + ".std()";
        case Fn::First:  return base + ".first()";
        case Fn::Last:   return base + ".last()";
        case Fn::Len:    return base + ".len()";
    }
    return base;
}

std::string filterCode(const ops::FilterParams& p) {
    std::string expr;
    for (size_t i = 0; i < p.conditions.size(); ++i) {
        if (i > 0) expr += " & ";
        expr += conditionExpr(p.conditions[i]);
    }
    return "df = df.filter(" + expr + ")";
}

std::string searchCode(const ops::SearchParams& p) {
    if (p.query.empty()) {
        return "# empty search keeps every row";
    }
    std::string expr = "pl.any_horizontal(cs.string().str.to_lowercase().str.contains("
        + pyString(dataframe::toLowerAscii(p.query)) + ", literal=True))";
    if (isNumberLiteral(p.query)) {
        expr += " | pl.any_horizontal(cs.numeric() == " + p.query + ")";
    }
    return "df = df.filter(" + expr + ")";
}

std::string aggregateCode(const ops::AggregateParams& p) {
    std::string aggs;
    for (size_t i = 0; i < p.spec.functions.size(); ++i) {
        if (i > 0) aggs += ", ";
        auto fn = p.spec.functions[i];
        aggs += aggExpr(col(p.spec.column), fn)
            + ".alias(" + pyString(p.spec.column + "_" + dataframe::aggFunctionToString(fn)) + ")";
    }
    if (p.spec.groupBy.empty()) {
        return "df = df.select(" + aggs + ")";
    }
    return "df = df.group_by(" + pyStringList(p.spec.groupBy) + ", maintain_order=True).agg(" + aggs + ")";
}

std::string pivotCode(const ops::PivotParams& p) {
    const std::string index = pyStringList(p.spec.index);
    const std::string on = pyStringList(p.spec.columns);

    std::ostringstream oss;
    oss << "_parts = [\n";
    for (const auto& value : p.spec.values) {
        for (auto fn : value.functions) {
            std::string prefix = value.column + "_";
            if (value.functions.size() > 1) {
                prefix += dataframe::aggFunctionToString(fn) + "_";
            }
            oss << "    df.pivot(on=" << on << ", index=" << index
                << ", values=" << pyString(value.column)
                << ", aggregate_function=" << aggExpr("pl.element()", fn) << ")\n"
                << "      .rename(lambda c: c if c in " << index
                << " else " << pyString(prefix) << " + c),\n";
        }
    }
    oss << "]\n"
        << "df = _parts[0]\n"
        << "for _part in _parts[1:]:\n"
        << "    df = df.join(_part, on=" << index << ", how=\"left\")";
    return oss.str();
}

std::string joinCode(const ops::JoinParams& p) {
    using How = dataframe::JoinHow;
    std::string how = p.spec.how == How::Outer ? "full" : dataframe::joinHowToString(p.spec.how);
    std::string code = "df = df.join(" + p.rightDatasetId;
    if (p.spec.how != How::Cross) {
        code += ", left_on=" + pyString(p.spec.leftKey) + ", right_on=" + pyString(p.spec.rightKey);
    }
    code += ", how=" + pyString(how) + ", suffix=" + pyString(p.spec.rightSuffix) + ")";
    return code;
}

std::string sortCode(const ops::SortParams& p) {
    std::vector<std::string> columns;
    std::string descending = "[";
    for (size_t i = 0; i < p.keys.size(); ++i) {
        columns.push_back(p.keys[i].column);
        if (i > 0) descending += ", ";
        descending += p.keys[i].descending ? "True" : "False";
    }
    descending += "]";
    return "df = df.sort(" + pyStringList(columns) + ", descending=" + descending + ", nulls_last=True)";
}

std::string columnEditCode(const ops::ColumnEditParams& p) {
    switch (p.action) {
        case ops::ColumnEditAction::Select:
            return "df = df.select(" + pyStringList(p.columns) + ")";
        case ops::ColumnEditAction::Drop:
            return "df = df.drop(" + pyStringList(p.columns) + ")";
        case ops::ColumnEditAction::Rename:
            return "df = df.rename(" + json(p.renames).dump() + ")";
    }
    return "";
}

std::string generatedAt() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// Notebook sources are lists of lines, each but the last ending with "\n"
json sourceLines(const std::string& text) {
    json lines = json::array();
    std::istringstream stream(text);
    std::string line;
    std::vector<std::string> collected;
    while (std::getline(stream, line)) {
        collected.push_back(line);
    }
    for (size_t i = 0; i < collected.size(); ++i) {
        lines.push_back(i + 1 < collected.size() ? collected[i] + "\n" : collected[i]);
    }
    return lines;
}

json markdownCell(const std::string& text) {
    return json{{"cell_type", "markdown"}, {"metadata", json::object()}, {"source", sourceLines(text)}};
}

json codeCell(const std::string& text) {
    return json{
        {"cell_type", "code"},
        {"execution_count", nullptr},
        {"metadata", json::object()},
        {"outputs", json::array()},
        {"source", sourceLines(text)}
    };
}

} // anonymous namespace

ExportFormat exportFormatFromString(const std::string& name) {
    if (name == "python" || name == "py") return ExportFormat::Python;
    if (name == "jupyter" || name == "ipynb") return ExportFormat::Jupyter;
    if (name == "csv") return ExportFormat::Csv;
    throw std::invalid_argument("Unknown export format: " + name);
}

std::string exportFormatToString(ExportFormat format) {
    switch (format) {
        case ExportFormat::Python:  return "python";
        case ExportFormat::Jupyter: return "jupyter";
        case ExportFormat::Csv:     return "csv";
    }
    return "python";
}

std::string ScriptExporter::operationCode(const ops::OperationParams& params) {
    return std::visit(Overloaded{
        [](const ops::FilterParams& p)     { return filterCode(p); },
        [](const ops::SearchParams& p)     { return searchCode(p); },
        [](const ops::AggregateParams& p)  { return aggregateCode(p); },
        [](const ops::PivotParams& p)      { return pivotCode(p); },
        [](const ops::JoinParams& p)       { return joinCode(p); },
        [](const ops::SortParams& p)       { return sortCode(p); },
        [](const ops::ColumnEditParams& p) { return columnEditCode(p); }
    }, params);
}

std::vector<std::string> ScriptExporter::loadStatements(const ExportInput& input) {
    std::vector<std::string> statements;
    statements.push_back("df = pl.read_csv(" + pyString(input.datasetPath) + ")");

    std::set<std::string> loaded;
    for (const auto& op : input.operations) {
        const auto* join = std::get_if<ops::JoinParams>(&op->params());
        if (!join || !loaded.insert(join->rightDatasetId).second) continue;

        auto it = input.joinSources.find(join->rightDatasetId);
        if (it != input.joinSources.end() && !it->second.empty()) {
            statements.push_back(join->rightDatasetId + " = pl.read_csv(" + pyString(it->second) + ")");
        } else {
            statements.push_back("# source file of " + join->rightDatasetId + " is unknown");
            statements.push_back(join->rightDatasetId + " = pl.DataFrame()");
        }
    }
    return statements;
}

std::string ScriptExporter::toPythonScript(const ExportInput& input) {
    std::ostringstream oss;
    oss << "# " << (input.name.empty() ? "Untitled analysis" : input.name) << "\n";
    if (!input.description.empty()) {
        oss << "# " << input.description << "\n";
    }
    oss << "# Generated by tablescope on " << generatedAt() << "\n"
        << "# Operations: " << input.operations.size() << "\n\n"
        << "import polars as pl\n"
        << "import polars.selectors as cs\n\n";

    for (const auto& statement : loadStatements(input)) {
        oss << statement << "\n";
    }

    for (size_t i = 0; i < input.operations.size(); ++i) {
        const auto& op = input.operations[i];
        oss << "\n# " << (i + 1) << ". " << op->displayLabel() << "\n"
            << operationCode(op->params()) << "\n";
    }

    oss << "\nprint(df)\n";
    return oss.str();
}

json ScriptExporter::toNotebook(const ExportInput& input) {
    json cells = json::array();

    std::string title = "# " + (input.name.empty() ? std::string("Untitled analysis") : input.name);
    if (!input.description.empty()) {
        title += "\n\n" + input.description;
    }
    title += "\n\nGenerated by tablescope on " + generatedAt();
    cells.push_back(markdownCell(title));

    std::string setup = "import polars as pl\nimport polars.selectors as cs\n";
    for (const auto& statement : loadStatements(input)) {
        setup += "\n" + statement;
    }
    cells.push_back(codeCell(setup));

    for (size_t i = 0; i < input.operations.size(); ++i) {
        const auto& op = input.operations[i];
        cells.push_back(markdownCell("### " + std::to_string(i + 1) + ". " + op->displayLabel()));
        cells.push_back(codeCell(operationCode(op->params()) + "\ndf.head()"));
    }

    cells.push_back(codeCell("df"));

    return json{
        {"cells", cells},
        {"metadata", {
            {"kernelspec", {
                {"display_name", "Python 3"},
                {"language", "python"},
                {"name", "python3"}
            }},
            {"language_info", {{"name", "python"}}}
        }},
        {"nbformat", 4},
        {"nbformat_minor", 4}
    };
}

void ScriptExporter::writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

} // namespace exporter
