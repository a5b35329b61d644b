#include "server/Config.hpp"
#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "server/Workspace.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "storage/AnalysisStorage.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <iostream>
#include <memory>

using namespace tablescope::server;

int main(int argc, char* argv[]) {
    try {
        AppConfig config = parseCommandLine(argc, argv);
        if (config.showHelp) {
            printUsage(std::cout, argv[0]);
            return 0;
        }

        // Configure Logger
        Logger::instance().setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::instance().enableFileLogging(config.logFile);
        }

        // Configure Profiler
        Profiler::instance().setEnabled(config.enableProfiler);

        std::cout << "=== TableScope ===" << std::endl;
        std::cout << std::endl;

        // Stockage des analyses et workflows
        auto analyses = std::make_unique<storage::AnalysisStorage>(config.analysesDb);
        LOG_INFO("Analysis storage: " + analyses->path());

        // Thread de contrôle (io_context à un thread) + workers de matérialisation
        net::io_context ioc{1};
        net::thread_pool workers(config.workerThreads);

        WorkspaceOptions workspaceOptions;
        workspaceOptions.maxDatasets = config.maxDatasets;
        workspaceOptions.session.mode = config.defaultMode;
        workspaceOptions.session.checkpointInterval = config.checkpointInterval;

        Workspace workspace(workspaceOptions);
        workspace.setAsyncContext(workers, ioc.get_executor());
        workspace.setListener([](const ops::SessionEvent& event) {
            LOG_DEBUG("event " + event.toJson().dump());
        });

        // Datasets chargés au démarrage
        for (const auto& path : config.datasets) {
            auto added = workspace.loadCsv(path);
            std::cout << "Loaded " << path << " as " << added.session->id()
                      << " (" << added.session->baseFrame()->rowCount() << " rows)" << std::endl;
        }

        RequestHandler handler(workspace, analyses.get(), config.pageSize);

        // Créer et démarrer le serveur
        HttpServer server(ioc, config.address, config.port, handler);
        server.run();

        // Gérer le signal d'arrêt
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int /*signal*/) {
            if (ec) return;
            LOG_INFO("Shutting down...");

            for (const auto& session : workspace.datasets()) {
                session->cancel();
            }

            // Afficher les stats du profiler
            if (Profiler::instance().isEnabled()) {
                std::cout << Profiler::instance().formatStats() << std::endl;
            }

            server.stop();
            ioc.stop();
        });

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /api/health                         - Health check" << std::endl;
        std::cout << "  GET  /api/stats                          - Profiler statistics" << std::endl;
        std::cout << "  POST /api/stats/reset                    - Reset profiler and log counters" << std::endl;
        std::cout << std::endl;
        std::cout << "  GET  /api/datasets                       - List loaded datasets" << std::endl;
        std::cout << "  POST /api/datasets                       - Load a CSV dataset" << std::endl;
        std::cout << "  GET  /api/datasets/:id                   - Dataset state and history" << std::endl;
        std::cout << "  DELETE /api/datasets/:id                 - Unload a dataset" << std::endl;
        std::cout << "  POST /api/datasets/:id/page              - Page of the materialized frame" << std::endl;
        std::cout << "  POST /api/datasets/:id/operations        - Submit an operation" << std::endl;
        std::cout << "  PUT  /api/datasets/:id/operations/:op    - Edit an operation" << std::endl;
        std::cout << "  DELETE /api/datasets/:id/operations/:op  - Remove an operation" << std::endl;
        std::cout << "  POST /api/datasets/:id/undo | redo       - History navigation" << std::endl;
        std::cout << "  POST /api/datasets/:id/mode              - Switch lazy / eager" << std::endl;
        std::cout << "  POST /api/datasets/:id/execute           - Execute queued operations" << std::endl;
        std::cout << "  POST /api/datasets/:id/cancel            - Cancel a background pass" << std::endl;
        std::cout << "  POST /api/datasets/:id/clear-queue       - Drop queued operations" << std::endl;
        std::cout << "  POST /api/datasets/:id/export            - Export script, notebook or CSV" << std::endl;
        std::cout << "  POST /api/datasets/:id/analyses          - Save the analysis" << std::endl;
        std::cout << std::endl;
        std::cout << "  GET  /api/analyses                       - List saved analyses" << std::endl;
        std::cout << "  POST /api/analyses/:id/apply             - Restore an analysis" << std::endl;
        std::cout << "  DELETE /api/analyses/:id                 - Delete an analysis" << std::endl;
        std::cout << "  GET  /api/workflows                      - List workflows" << std::endl;
        std::cout << "  POST /api/workflows                      - Save a workflow" << std::endl;
        std::cout << "  POST /api/workflows/:id/apply            - Apply a workflow to a dataset" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        // Lancer la boucle d'événements
        Logger::setThreadTag("control");
        ioc.run();

        workers.join();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
