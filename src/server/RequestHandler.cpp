#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "exporter/ScriptExporter.hpp"
#include "dataframe/DataFrameError.hpp"
#include "dataframe/DataFrameIO.hpp"
#include "dataframe/DataFrameSerializer.hpp"
#include "dataframe/Schema.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace tablescope {
namespace server {

namespace {

/**
 * Stockage des analyses non configuré
 */
class StorageUnavailableError : public std::runtime_error {
public:
    StorageUnavailableError() : std::runtime_error("Analysis storage is not configured") {}
};

json errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

std::string decisionToString(ops::ExecutionDecision decision) {
    return decision == ops::ExecutionDecision::RunNow ? "run_now" : "defer";
}

/**
 * Découpe "/a/b/c" en {"a", "b", "c"}
 */
std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

int64_t parseRecordId(const std::string& text) {
    size_t pos = 0;
    int64_t id = 0;
    try {
        id = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid id: '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid id: '" + text + "'");
    }
    return id;
}

/**
 * [{"id", "kind", "params"}, ...] -> paramètres validés structurellement
 */
std::vector<ops::OperationParams> paramsFromStored(const json& operations) {
    if (!operations.is_array()) {
        throw ops::ValidationError("'operations' must be an array");
    }
    std::vector<ops::OperationParams> params;
    params.reserve(operations.size());
    for (const auto& entry : operations) {
        auto kind = ops::operationKindFromString(entry.at("kind").get<std::string>());
        params.push_back(ops::paramsFromJson(kind, entry.value("params", json::object())));
    }
    return params;
}

json persistOperations(const std::vector<ops::OperationPtr>& operations) {
    json list = json::array();
    for (const auto& op : operations) {
        list.push_back(op->toPersistJson());
    }
    return list;
}

json schemaToRequirement(const dataframe::Schema& schema) {
    json required = json::object();
    for (const auto& column : schema.columns()) {
        required[column.name] = dataframe::typeCategoryToString(column.category);
    }
    return required;
}

} // namespace

RequestHandler::RequestHandler(Workspace& workspace, storage::AnalysisStorage* storage, size_t pageSize)
    : m_workspace(workspace)
    , m_storage(storage)
    , m_pageSize(pageSize == 0 ? 100 : pageSize)
{
}

// ============================================================================
// Dispatch
// ============================================================================

RouteResult RequestHandler::route(const std::string& method, const std::string& target, const std::string& body) {
    ScopedTimer timer("http:" + method);

    std::string path = target.substr(0, target.find('?'));

    try {
        json request = json::object();
        if (!body.empty()) {
            try {
                request = json::parse(body);
            } catch (const json::parse_error& e) {
                return {400, errorBody("Invalid JSON: " + std::string(e.what()))};
            }
        }
        return dispatch(method, path, request);
    } catch (const SchemaMismatchError& e) {
        json response = errorBody(e.what());
        response["details"] = e.details();
        return {422, response};
    } catch (const ops::SessionBusyError& e) {
        return {409, errorBody(e.what())};
    } catch (const WorkspaceFullError& e) {
        return {409, errorBody(e.what())};
    } catch (const StorageUnavailableError& e) {
        return {503, errorBody(e.what())};
    } catch (const dataframe::EngineError& e) {
        json response = errorBody(e.what());
        response["kind"] = dataframe::errorKindToString(e.kind());
        return {400, response};
    } catch (const json::exception& e) {
        return {400, errorBody("Invalid request: " + std::string(e.what()))};
    } catch (const std::out_of_range& e) {
        return {404, errorBody(e.what())};
    } catch (const std::invalid_argument& e) {
        return {400, errorBody(e.what())};
    } catch (const std::exception& e) {
        LOG_ERROR(method + " " + path + " failed: " + e.what());
        return {500, errorBody(e.what())};
    }
}

RouteResult RequestHandler::dispatch(const std::string& method, const std::string& path, const json& body) {
    auto parts = splitPath(path);
    if (parts.size() < 2 || parts[0] != "api") {
        return {404, errorBody("Not found: " + path)};
    }
    const std::string& resource = parts[1];

    if (resource == "health" && parts.size() == 2 && method == "GET") {
        return {200, handleHealth()};
    }
    if (resource == "stats" && parts.size() == 2 && method == "GET") {
        return {200, handleStats()};
    }
    if (resource == "stats" && parts.size() == 3 && parts[2] == "reset" && method == "POST") {
        return {200, handleResetStats()};
    }

    // /api/datasets[/:id[/...]]
    if (resource == "datasets") {
        if (parts.size() == 2) {
            if (method == "GET") return {200, handleListDatasets()};
            if (method == "POST") return {201, handleLoadDataset(body)};
            return {405, errorBody("Method not allowed")};
        }
        std::string subPath;
        for (size_t i = 3; i < parts.size(); ++i) {
            subPath += "/" + parts[i];
        }
        return dispatchDataset(method, parts[2], subPath, body);
    }

    // /api/analyses[/:id[/apply]]
    if (resource == "analyses") {
        if (parts.size() == 2 && method == "GET") {
            return {200, handleListAnalyses()};
        }
        if (parts.size() == 3 && method == "DELETE") {
            return {200, handleDeleteAnalysis(parseRecordId(parts[2]))};
        }
        if (parts.size() == 4 && parts[3] == "apply" && method == "POST") {
            return {200, handleApplyAnalysis(parseRecordId(parts[2]), body)};
        }
    }

    // /api/workflows[/:id/apply]
    if (resource == "workflows") {
        if (parts.size() == 2 && method == "GET") {
            return {200, handleListWorkflows()};
        }
        if (parts.size() == 2 && method == "POST") {
            return {201, handleSaveWorkflow(body)};
        }
        if (parts.size() == 4 && parts[3] == "apply" && method == "POST") {
            return {200, handleApplyWorkflow(parseRecordId(parts[2]), body)};
        }
    }

    return {404, errorBody("Not found: " + method + " " + path)};
}

RouteResult RequestHandler::dispatchDataset(const std::string& method, const std::string& datasetId,
                                            const std::string& subPath, const json& body) {
    if (subPath.empty()) {
        if (method == "GET") return {200, handleGetDataset(datasetId)};
        if (method == "DELETE") return {200, handleRemoveDataset(datasetId)};
        return {405, errorBody("Method not allowed")};
    }

    // PUT/DELETE /api/datasets/:id/operations/:opId
    const std::string operationsPrefix = "/operations/";
    if (subPath.rfind(operationsPrefix, 0) == 0 && subPath.length() > operationsPrefix.length()) {
        std::string operationId = subPath.substr(operationsPrefix.length());
        if (method == "PUT") return {200, handleEditOperation(datasetId, operationId, body)};
        if (method == "DELETE") return {200, handleRemoveOperation(datasetId, operationId)};
        return {405, errorBody("Method not allowed")};
    }

    if (method != "POST") {
        return {405, errorBody("Method not allowed")};
    }

    if (subPath == "/page") return {200, handlePage(datasetId, body)};
    if (subPath == "/activate") return {200, handleActivateDataset(datasetId)};
    if (subPath == "/operations") return {201, handleSubmitOperation(datasetId, body)};
    if (subPath == "/undo") return {200, handleUndo(datasetId)};
    if (subPath == "/redo") return {200, handleRedo(datasetId)};
    if (subPath == "/mode") return {200, handleSetMode(datasetId, body)};
    if (subPath == "/execute") {
        json result = handleExecute(datasetId, body);
        return {result.value("started", false) ? 202u : 200u, result};
    }
    if (subPath == "/cancel") return {200, handleCancel(datasetId)};
    if (subPath == "/clear-queue") return {200, handleClearQueue(datasetId)};
    if (subPath == "/export") return {200, handleExport(datasetId, body)};
    if (subPath == "/analyses") return {201, handleSaveAnalysis(datasetId, body)};

    return {404, errorBody("Not found: " + method + " /api/datasets/" + datasetId + subPath)};
}

storage::AnalysisStorage& RequestHandler::requireStorage() {
    if (!m_storage) {
        throw StorageUnavailableError();
    }
    return *m_storage;
}

json RequestHandler::sessionSummary(const ops::DatasetSession& session) const {
    const auto& history = session.history();
    return json{
        {"id", session.id()},
        {"rows", session.materializedFrame()->rowCount()},
        {"executed_count", history.executedCount()},
        {"queued_count", history.queuedCount()},
        {"can_undo", history.canUndo()},
        {"can_redo", history.canRedo()},
        {"busy", session.isBusy()}
    };
}

// ============================================================================
// Serveur
// ============================================================================

json RequestHandler::handleHealth() {
    json storageHealth = nullptr;
    if (m_storage) {
        auto [ok, message] = m_storage->checkHealth();
        storageHealth = json{{"ok", ok}, {"message", message}, {"path", m_storage->path()}};
    }
    return json{
        {"status", "ok"},
        {"service", "TableScope"},
        {"version", "1.0.0"},
        {"datasets", m_workspace.size()},
        {"storage", storageHealth}
    };
}

json RequestHandler::handleStats() {
    return json{
        {"status", "ok"},
        {"profiler_enabled", Profiler::instance().isEnabled()},
        {"profiler", Profiler::instance().toJson()},
        {"log", Logger::instance().counts()}
    };
}

json RequestHandler::handleResetStats() {
    Profiler::instance().reset();
    Logger::instance().resetCounts();
    return json{{"status", "ok"}};
}

// ============================================================================
// Workspace
// ============================================================================

json RequestHandler::handleListDatasets() {
    json result = m_workspace.toJson();
    result["status"] = "ok";
    return result;
}

json RequestHandler::handleLoadDataset(const json& request) {
    std::optional<std::string> name;
    if (request.contains("name")) {
        name = request.at("name").get<std::string>();
    }

    DatasetAddResult added;
    if (request.contains("path")) {
        std::string path = request.at("path").get<std::string>();
        if (!std::filesystem::exists(path)) {
            throw std::out_of_range("File not found: " + path);
        }
        added = m_workspace.loadCsv(path, name);
    } else if (request.contains("data")) {
        auto frame = dataframe::DataFrameSerializer::fromJson(request.at("data"));
        added = m_workspace.addDataset(name.value_or("dataset"), frame);
    } else {
        throw std::invalid_argument("Expected 'path' or 'data'");
    }

    return json{
        {"status", "ok"},
        {"add_status", datasetAddStatusToString(added.status)},
        {"dataset", added.session->toJson()}
    };
}

json RequestHandler::handleGetDataset(const std::string& datasetId) {
    auto session = m_workspace.require(datasetId);
    return json{{"status", "ok"}, {"dataset", session->toJson()}};
}

json RequestHandler::handleRemoveDataset(const std::string& datasetId) {
    if (!m_workspace.removeDataset(datasetId)) {
        throw std::out_of_range("Dataset not found: " + datasetId);
    }
    auto active = m_workspace.active();
    return json{
        {"status", "ok"},
        {"removed", datasetId},
        {"active_id", active ? json(active->id()) : json(nullptr)}
    };
}

json RequestHandler::handleActivateDataset(const std::string& datasetId) {
    m_workspace.setActive(datasetId);
    return json{{"status", "ok"}, {"active_id", datasetId}};
}

json RequestHandler::handlePage(const std::string& datasetId, const json& request) {
    auto session = m_workspace.require(datasetId);

    // Pagination
    size_t offset = request.value("offset", static_cast<size_t>(0));
    size_t limit = request.value("limit", m_pageSize);

    // Frame et schéma issus du même instantané
    auto snapshot = session->snapshot();
    size_t totalRows = snapshot.frame->rowCount();
    auto page = snapshot.frame->slice(offset, limit);

    json result = page->toJsonWithSchema();
    result["status"] = "ok";
    result["total_rows"] = totalRows;
    result["offset"] = std::min(offset, totalRows);
    result["limit"] = limit;
    result["categories"] = snapshot.schema.toJson();
    return result;
}

// ============================================================================
// Opérations
// ============================================================================

json RequestHandler::handleSubmitOperation(const std::string& datasetId, const json& request) {
    auto session = m_workspace.require(datasetId);

    auto kind = ops::operationKindFromString(request.at("kind").get<std::string>());
    auto params = ops::paramsFromJson(kind, request.value("params", json::object()));
    auto submitted = session->submit(std::move(params));

    return json{
        {"status", "ok"},
        {"operation", submitted.operation->toJson()},
        {"decision", decisionToString(submitted.decision)},
        {"report", submitted.report ? submitted.report->toJson() : json(nullptr)},
        {"dataset", sessionSummary(*session)}
    };
}

json RequestHandler::handleEditOperation(const std::string& datasetId, const std::string& operationId,
                                         const json& request) {
    auto session = m_workspace.require(datasetId);
    auto current = session->history().find(operationId);
    if (!current) {
        throw std::out_of_range("Operation not found: " + operationId);
    }

    // Le type d'opération est conservé sauf si la requête en précise un autre
    auto kind = request.contains("kind")
        ? ops::operationKindFromString(request.at("kind").get<std::string>())
        : current->kind();
    auto params = ops::paramsFromJson(kind, request.at("params"));
    auto report = session->editOperation(operationId, std::move(params));

    auto edited = session->history().find(operationId);
    return json{
        {"status", "ok"},
        {"operation", edited ? edited->toJson() : json(nullptr)},
        {"report", report.toJson()},
        {"dataset", sessionSummary(*session)}
    };
}

json RequestHandler::handleRemoveOperation(const std::string& datasetId, const std::string& operationId) {
    auto session = m_workspace.require(datasetId);
    auto report = session->removeOperation(operationId);
    return json{
        {"status", "ok"},
        {"removed", operationId},
        {"report", report.toJson()},
        {"dataset", sessionSummary(*session)}
    };
}

json RequestHandler::handleUndo(const std::string& datasetId) {
    auto session = m_workspace.require(datasetId);
    auto result = session->undo();

    json response = {
        {"status", "ok"},
        {"changed", result.ok()},
        {"dataset", sessionSummary(*session)}
    };
    if (result.ok()) {
        response["operation"] = result.operation->toJson();
    } else {
        response["history_error"] = ops::historyErrorToString(*result.error);
    }
    return response;
}

json RequestHandler::handleRedo(const std::string& datasetId) {
    auto session = m_workspace.require(datasetId);
    auto result = session->redo();

    json response = {
        {"status", "ok"},
        {"changed", result.ok()},
        {"dataset", sessionSummary(*session)}
    };
    if (result.ok()) {
        response["operation"] = result.operation->toJson();
    } else {
        response["history_error"] = ops::historyErrorToString(*result.error);
    }
    return response;
}

json RequestHandler::handleSetMode(const std::string& datasetId, const json& request) {
    auto session = m_workspace.require(datasetId);
    auto mode = ops::executionModeFromString(request.at("mode").get<std::string>());
    bool changed = session->setMode(mode);
    return json{
        {"status", "ok"},
        {"mode", ops::executionModeToString(session->mode())},
        {"changed", changed}
    };
}

json RequestHandler::handleExecute(const std::string& datasetId, const json& request) {
    auto session = m_workspace.require(datasetId);
    auto scope = ops::executeScopeFromString(request.value("scope", std::string("all")));

    if (request.value("async", false)) {
        std::string id = session->id();
        session->executeQueuedAsync(scope, [id](const ops::ExecutionReport& report) {
            if (report.internalError) {
                LOG_ERROR("[" + id + "] background pass failed: " + *report.internalError);
            } else {
                LOG_INFO("[" + id + "] background pass done: " + std::to_string(report.executedCount)
                         + " executed, " + std::to_string(report.queuedCount) + " queued"
                         + (report.cancelled ? " (cancelled)" : ""));
            }
        });
        return json{{"status", "ok"}, {"started", true}};
    }

    auto report = session->executeQueued(scope);
    return json{
        {"status", "ok"},
        {"started", false},
        {"report", report.toJson()},
        {"dataset", sessionSummary(*session)}
    };
}

json RequestHandler::handleCancel(const std::string& datasetId) {
    auto session = m_workspace.require(datasetId);
    bool wasBusy = session->isBusy();
    session->cancel();
    return json{{"status", "ok"}, {"cancelled", wasBusy}};
}

json RequestHandler::handleClearQueue(const std::string& datasetId) {
    auto session = m_workspace.require(datasetId);
    size_t removed = session->clearQueued();
    return json{
        {"status", "ok"},
        {"removed", removed},
        {"dataset", sessionSummary(*session)}
    };
}

json RequestHandler::handleExport(const std::string& datasetId, const json& request) {
    auto session = m_workspace.require(datasetId);
    auto format = exporter::exportFormatFromString(request.at("format").get<std::string>());
    std::string path = request.value("path", std::string());

    json response = {{"status", "ok"}, {"format", exporter::exportFormatToString(format)}};

    if (format == exporter::ExportFormat::Csv) {
        auto frame = session->materializedFrame();
        if (path.empty()) {
            std::ostringstream out;
            dataframe::DataFrameIO::writeCSV(*frame, out);
            response["content"] = out.str();
        } else {
            dataframe::DataFrameIO::writeCSV(*frame, path);
            response["path"] = path;
        }
        response["rows"] = frame->rowCount();
        return response;
    }

    exporter::ExportInput input;
    input.name = request.value("name", session->name());
    input.description = request.value("description", std::string());
    input.datasetPath = session->sourcePath();
    input.operations = session->savedEntries();
    for (const auto& op : input.operations) {
        if (const auto* join = std::get_if<ops::JoinParams>(&op->params())) {
            if (auto right = m_workspace.get(join->rightDatasetId)) {
                input.joinSources[join->rightDatasetId] = right->sourcePath();
            }
        }
    }

    std::string content = format == exporter::ExportFormat::Jupyter
        ? exporter::ScriptExporter::toNotebook(input).dump(1)
        : exporter::ScriptExporter::toPythonScript(input);

    if (path.empty()) {
        response["content"] = content;
    } else {
        exporter::ScriptExporter::writeFile(path, content);
        response["path"] = path;
    }
    response["operation_count"] = input.operations.size();
    return response;
}

// ============================================================================
// Analyses sauvegardées
// ============================================================================

json RequestHandler::handleSaveAnalysis(const std::string& datasetId, const json& request) {
    auto& db = requireStorage();
    auto session = m_workspace.require(datasetId);

    auto entries = session->savedEntries();
    storage::SavedAnalysis analysis;
    analysis.name = request.value("name", session->name());
    analysis.description = request.value("description", std::string());
    analysis.operationCount = static_cast<int64_t>(entries.size());
    analysis.executedCount = static_cast<int64_t>(session->history().executedCount());
    analysis.datasetPath = session->sourcePath();
    analysis.mode = ops::executionModeToString(session->mode());
    analysis.operations = persistOperations(entries);

    auto saved = db.saveAnalysis(analysis);
    LOG_INFO("Saved analysis " + std::to_string(saved.id) + " from " + datasetId);

    json response = {
        {"status", "ok"},
        {"id", saved.id},
        {"name", saved.versionedName.value_or(analysis.name)},
        {"versioned", saved.versionedName.has_value()},
        {"operation_count", analysis.operationCount}
    };
    return response;
}

json RequestHandler::handleListAnalyses() {
    auto& db = requireStorage();
    json list = json::array();
    for (const auto& analysis : db.listAnalyses()) {
        list.push_back({
            {"id", analysis.id},
            {"name", analysis.name},
            {"description", analysis.description},
            {"created_at", analysis.createdAt},
            {"modified_at", analysis.modifiedAt},
            {"operation_count", analysis.operationCount},
            {"executed_count", analysis.executedCount},
            {"dataset_path", analysis.datasetPath},
            {"mode", analysis.mode}
        });
    }
    return json{{"status", "ok"}, {"analyses", list}};
}

json RequestHandler::handleApplyAnalysis(int64_t analysisId, const json& request) {
    auto& db = requireStorage();
    auto analysis = db.loadAnalysis(analysisId);
    if (!analysis) {
        throw std::out_of_range("Analysis not found: " + std::to_string(analysisId));
    }

    // Validation complète avant de charger quoi que ce soit
    auto params = paramsFromStored(analysis->operations);

    ops::DatasetSessionPtr session;
    if (request.contains("dataset_id")) {
        session = m_workspace.require(request.at("dataset_id").get<std::string>());
    } else if (!analysis->datasetPath.empty()) {
        if (!std::filesystem::exists(analysis->datasetPath)) {
            throw std::out_of_range("Dataset file not found: " + analysis->datasetPath);
        }
        session = m_workspace.loadCsv(analysis->datasetPath).session;
    } else {
        throw std::invalid_argument("Analysis has no dataset path; 'dataset_id' is required");
    }

    size_t executeCount = static_cast<size_t>(std::max<int64_t>(0, analysis->executedCount));
    auto report = session->applyOperations(params, std::min(executeCount, params.size()));
    if (!analysis->mode.empty()) {
        session->setMode(ops::executionModeFromString(analysis->mode));
    }

    return json{
        {"status", "ok"},
        {"analysis_id", analysisId},
        {"report", report.toJson()},
        {"dataset", session->toJson()}
    };
}

json RequestHandler::handleDeleteAnalysis(int64_t analysisId) {
    auto& db = requireStorage();
    if (!db.deleteAnalysis(analysisId)) {
        throw std::out_of_range("Analysis not found: " + std::to_string(analysisId));
    }
    return json{{"status", "ok"}, {"deleted", analysisId}};
}

// ============================================================================
// Workflows
// ============================================================================

json RequestHandler::handleListWorkflows() {
    auto& db = requireStorage();
    json list = json::array();
    for (const auto& workflow : db.listWorkflows()) {
        list.push_back({
            {"id", workflow.id},
            {"name", workflow.name},
            {"description", workflow.description},
            {"created_at", workflow.createdAt},
            {"modified_at", workflow.modifiedAt},
            {"operation_count", workflow.operationCount},
            {"required_schema", workflow.requiredSchema}
        });
    }
    return json{{"status", "ok"}, {"workflows", list}};
}

json RequestHandler::handleSaveWorkflow(const json& request) {
    auto& db = requireStorage();

    storage::Workflow workflow;
    workflow.name = request.at("name").get<std::string>();
    workflow.description = request.value("description", std::string());

    if (request.contains("dataset_id")) {
        // Depuis un dataset : ses opérations et le schéma de sa frame de base
        auto session = m_workspace.require(request.at("dataset_id").get<std::string>());
        workflow.operations = persistOperations(session->savedEntries());
        workflow.requiredSchema = schemaToRequirement(dataframe::Schema::infer(*session->baseFrame()));
    } else if (request.contains("operations")) {
        json operations = json::array();
        for (const auto& entry : request.at("operations")) {
            operations.push_back(ops::Operation::fromJson(entry)->toPersistJson());
        }
        workflow.operations = operations;
        workflow.requiredSchema = request.value("required_schema", json(nullptr));
        for (const auto& [column, category] : workflow.requiredSchema.items()) {
            dataframe::typeCategoryFromString(category.get<std::string>());
        }
    } else {
        throw std::invalid_argument("Expected 'dataset_id' or 'operations'");
    }
    workflow.operationCount = static_cast<int64_t>(workflow.operations.size());

    auto saved = db.saveWorkflow(workflow);
    LOG_INFO("Saved workflow " + std::to_string(saved.id) + " '" + saved.versionedName.value_or(workflow.name) + "'");

    return json{
        {"status", "ok"},
        {"id", saved.id},
        {"name", saved.versionedName.value_or(workflow.name)},
        {"versioned", saved.versionedName.has_value()},
        {"operation_count", workflow.operationCount}
    };
}

json RequestHandler::handleApplyWorkflow(int64_t workflowId, const json& request) {
    auto& db = requireStorage();
    auto workflow = db.loadWorkflow(workflowId);
    if (!workflow) {
        throw std::out_of_range("Workflow not found: " + std::to_string(workflowId));
    }

    auto session = m_workspace.require(request.at("dataset_id").get<std::string>());
    auto params = paramsFromStored(workflow->operations);

    // Vérification du schéma courant du dataset cible
    if (workflow->requiredSchema.is_object()) {
        auto current = session->schema();
        json missing = json::array();
        json mismatches = json::array();
        for (const auto& [column, expected] : workflow->requiredSchema.items()) {
            auto category = current.categoryOf(column);
            if (!category) {
                missing.push_back(column);
            } else if (dataframe::typeCategoryToString(*category) != expected.get<std::string>()) {
                mismatches.push_back({
                    {"column", column},
                    {"expected", expected},
                    {"actual", dataframe::typeCategoryToString(*category)}
                });
            }
        }
        if (!missing.empty() || !mismatches.empty()) {
            throw SchemaMismatchError(
                "Dataset does not match the schema required by workflow '" + workflow->name + "'",
                json{{"missing_columns", missing}, {"type_mismatches", mismatches}});
        }
    }

    auto report = session->applyOperations(params);
    return json{
        {"status", "ok"},
        {"workflow_id", workflowId},
        {"report", report.toJson()},
        {"dataset", session->toJson()}
    };
}

} // namespace server
} // namespace tablescope
