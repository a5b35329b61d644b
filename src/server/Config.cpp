#include "server/Config.hpp"
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace tablescope {
namespace server {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

size_t parseCount(const std::string& key, const std::string& value, size_t minimum) {
    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (pos != value.size() || value[0] == '-' || parsed < minimum) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
}

} // namespace

void applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
    if (key == "address") {
        config.address = value;
    } else if (key == "port") {
        size_t port = parseCount(key, value, 1);
        if (port > 65535) {
            throw std::invalid_argument("Invalid value for port: '" + value + "'");
        }
        config.port = static_cast<unsigned short>(port);
    } else if (key == "log_level") {
        config.logLevel = Logger::levelFromString(value);
    } else if (key == "log_file") {
        config.logFile = value;
    } else if (key == "profiler") {
        config.enableProfiler = parseBool(key, value);
    } else if (key == "analyses_db") {
        config.analysesDb = value;
    } else if (key == "default_mode") {
        config.defaultMode = ops::executionModeFromString(value);
    } else if (key == "checkpoint_interval") {
        config.checkpointInterval = parseCount(key, value, 0);
    } else if (key == "max_datasets") {
        config.maxDatasets = parseCount(key, value, 1);
    } else if (key == "worker_threads") {
        config.workerThreads = parseCount(key, value, 1);
    } else if (key == "page_size") {
        config.pageSize = parseCount(key, value, 1);
    } else if (key == "dataset") {
        config.datasets.push_back(value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

void loadConfigFile(AppConfig& config, const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::string line;
    size_t lineNumber = 0;
    size_t applied = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(filePath + ":" + std::to_string(lineNumber) + ": expected key=value");
        }
        applyConfigValue(config, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
        ++applied;
    }
    LOG_INFO("Loaded " + std::to_string(applied) + " settings from " + filePath);
}

AppConfig parseCommandLine(int argc, char* argv[]) {
    AppConfig config;

    // Fichier d'abord : les options explicites gagnent
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            loadConfigFile(config, argv[i + 1]);
            break;
        }
    }

    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--port") {
            applyConfigValue(config, "port", requireValue(i, arg));
        } else if (arg == "-a" || arg == "--address") {
            applyConfigValue(config, "address", requireValue(i, arg));
        } else if (arg == "-d" || arg == "--dataset") {
            applyConfigValue(config, "dataset", requireValue(i, arg));
        } else if (arg == "-l" || arg == "--log-level") {
            applyConfigValue(config, "log_level", requireValue(i, arg));
        } else if (arg == "--log-file") {
            applyConfigValue(config, "log_file", requireValue(i, arg));
        } else if (arg == "--no-profiler") {
            config.enableProfiler = false;
        } else if (arg == "--analyses-db") {
            applyConfigValue(config, "analyses_db", requireValue(i, arg));
        } else if (arg == "-m" || arg == "--mode") {
            applyConfigValue(config, "default_mode", requireValue(i, arg));
        } else if (arg == "--checkpoint-interval") {
            applyConfigValue(config, "checkpoint_interval", requireValue(i, arg));
        } else if (arg == "--max-datasets") {
            applyConfigValue(config, "max_datasets", requireValue(i, arg));
        } else if (arg == "-w" || arg == "--workers") {
            applyConfigValue(config, "worker_threads", requireValue(i, arg));
        } else if (arg == "--page-size") {
            applyConfigValue(config, "page_size", requireValue(i, arg));
        } else if (arg == "--config") {
            ++i;   // déjà appliqué
        } else if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    return config;
}

void printUsage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  -p, --port PORT            Port to listen on (default: 8080)\n"
       << "  -a, --address ADDR         Address to bind to (default: 0.0.0.0)\n"
       << "  -d, --dataset PATH         CSV dataset to load at startup (repeatable)\n"
       << "  -m, --mode MODE            Default execution mode: lazy, eager (default: lazy)\n"
       << "  -w, --workers N            Background materialization threads (default: 2)\n"
       << "  --analyses-db PATH         SQLite database for saved analyses (default: ./analyses.db)\n"
       << "  --checkpoint-interval N    Checkpoint every N executed operations, 0 = off (default: 10)\n"
       << "  --max-datasets N           Maximum number of loaded datasets (default: 10)\n"
       << "  --page-size N              Default rows per page (default: 100)\n"
       << "  --config FILE              Settings file (key=value lines, @file syntax)\n"
       << "  -l, --log-level LVL        Log level: debug, info, warn, error (default: info)\n"
       << "  --log-file PATH            Also write logs to PATH\n"
       << "  --no-profiler              Disable profiler\n"
       << "  -h, --help                 Show this help\n";
}

} // namespace server
} // namespace tablescope
