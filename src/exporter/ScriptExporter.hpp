#pragma once

#include "ops/Operation.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace exporter {

enum class ExportFormat {
    Python,     // standalone polars script
    Jupyter,    // nbformat 4 notebook
    Csv         // materialized frame
};

/// "python" / "jupyter" / "csv"; throws std::invalid_argument otherwise
ExportFormat exportFormatFromString(const std::string& name);
std::string exportFormatToString(ExportFormat format);

struct ExportInput {
    std::string name;
    std::string description;
    std::string datasetPath;
    std::vector<ops::OperationPtr> operations;          // application order
    std::map<std::string, std::string> joinSources;     // dataset id -> file path
};

/**
 * Renders a sequence of operations as polars code.
 *
 * The generated code is derived from the structured parameters only,
 * never from display labels. Each operation becomes one statement that
 * rebinds `df`; join right sides are loaded under their dataset id.
 */
class ScriptExporter {
public:
    /// Statement(s) applying one operation to `df`
    static std::string operationCode(const ops::OperationParams& params);

    static std::string toPythonScript(const ExportInput& input);
    static nlohmann::json toNotebook(const ExportInput& input);

    /// Throws std::runtime_error if the file cannot be written
    static void writeFile(const std::string& path, const std::string& content);

private:
    static std::vector<std::string> loadStatements(const ExportInput& input);
};

} // namespace exporter
