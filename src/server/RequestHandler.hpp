#pragma once

#include "server/Workspace.hpp"
#include "storage/AnalysisStorage.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tablescope {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * Le schéma d'un dataset ne satisfait pas celui requis par un workflow
 */
class SchemaMismatchError : public std::invalid_argument {
public:
    SchemaMismatchError(const std::string& message, json details)
        : std::invalid_argument(message), m_details(std::move(details)) {}

    const json& details() const { return m_details; }

private:
    json m_details;
};

/**
 * Gestionnaire de requêtes - traite la logique métier
 *
 * Tous les appels ont lieu sur le thread de contrôle (l'io_context du
 * serveur). Les handleX() lèvent des exceptions ; route() les convertit
 * en {"status": "error", "message": ...} avec le code HTTP adapté.
 */
class RequestHandler {
public:
    /**
     * storage peut être nul : les routes analyses/workflows répondent alors 503
     */
    RequestHandler(Workspace& workspace, storage::AnalysisStorage* storage, size_t pageSize = 100);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /**
     * Dispatch d'une requête. target peut contenir une query string (ignorée).
     */
    RouteResult route(const std::string& method, const std::string& target, const std::string& body);

    // Endpoints serveur
    json handleHealth();
    json handleStats();
    json handleResetStats();

    // Endpoints workspace
    json handleListDatasets();
    json handleLoadDataset(const json& request);
    json handleGetDataset(const std::string& datasetId);
    json handleRemoveDataset(const std::string& datasetId);
    json handleActivateDataset(const std::string& datasetId);
    json handlePage(const std::string& datasetId, const json& request);

    // Endpoints opérations
    json handleSubmitOperation(const std::string& datasetId, const json& request);
    json handleEditOperation(const std::string& datasetId, const std::string& operationId, const json& request);
    json handleRemoveOperation(const std::string& datasetId, const std::string& operationId);
    json handleUndo(const std::string& datasetId);
    json handleRedo(const std::string& datasetId);
    json handleSetMode(const std::string& datasetId, const json& request);
    json handleExecute(const std::string& datasetId, const json& request);
    json handleCancel(const std::string& datasetId);
    json handleClearQueue(const std::string& datasetId);
    json handleExport(const std::string& datasetId, const json& request);

    // Endpoints analyses sauvegardées
    json handleSaveAnalysis(const std::string& datasetId, const json& request);
    json handleListAnalyses();
    json handleApplyAnalysis(int64_t analysisId, const json& request);
    json handleDeleteAnalysis(int64_t analysisId);

    // Endpoints workflows
    json handleListWorkflows();
    json handleSaveWorkflow(const json& request);
    json handleApplyWorkflow(int64_t workflowId, const json& request);

private:
    RouteResult dispatch(const std::string& method, const std::string& path, const json& body);
    RouteResult dispatchDataset(const std::string& method, const std::string& datasetId,
                                const std::string& subPath, const json& body);

    storage::AnalysisStorage& requireStorage();
    json sessionSummary(const ops::DatasetSession& session) const;

    Workspace& m_workspace;
    storage::AnalysisStorage* m_storage;
    size_t m_pageSize;
};

} // namespace server
} // namespace tablescope
