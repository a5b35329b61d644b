#pragma once

#include "server/Logger.hpp"
#include "ops/ExecutionModeController.hpp"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace tablescope {
namespace server {

/**
 * Paramètres du serveur.
 *
 * Sources, par priorité croissante : valeurs par défaut, fichier
 * --config (lignes key=value, '#' pour les commentaires), options de la
 * ligne de commande.
 */
struct AppConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    bool enableProfiler = true;

    std::string analysesDb = "./analyses.db";
    ops::ExecutionMode defaultMode = ops::ExecutionMode::Lazy;
    size_t checkpointInterval = 10;
    size_t maxDatasets = 10;
    size_t workerThreads = 2;
    size_t pageSize = 100;

    std::vector<std::string> datasets;   // CSV files loaded at startup
    bool showHelp = false;
};

/**
 * Applique une clé du fichier de configuration
 * ("port", "log_level", "default_mode", ...).
 * Lève std::invalid_argument pour une clé ou une valeur invalide.
 */
void applyConfigValue(AppConfig& config, const std::string& key, const std::string& value);

/**
 * Lit un fichier key=value ; un '@' en tête du chemin est ignoré.
 * Lève std::runtime_error si le fichier ne peut pas être ouvert.
 */
void loadConfigFile(AppConfig& config, const std::string& path);

/**
 * Parse argv. Le fichier --config est appliqué avant les autres options,
 * qui le surchargent quelle que soit leur position.
 */
AppConfig parseCommandLine(int argc, char* argv[]);

void printUsage(std::ostream& os, const std::string& program);

} // namespace server
} // namespace tablescope
