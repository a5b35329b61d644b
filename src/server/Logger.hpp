#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace tablescope {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - journal partagé par le serveur et le cœur
 *
 * Appelé depuis le thread de contrôle et depuis les workers de
 * matérialisation. Chaque thread peut poser une étiquette (setThreadTag)
 * qui préfixe ses lignes : "[control]", "[worker]".
 */
class Logger {
public:
    /**
     * Trace d'une requête HTTP, de la réception à la réponse
     */
    struct RequestTrace {
        uint64_t id = 0;
        std::chrono::steady_clock::time_point start;

        double elapsedMs() const {
            return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        }
    };

    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level.load(); }
    bool isEnabled(LogLevel level) const { return level >= m_level.load(); }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }

    /// Étiquette du thread appelant ; vide pour ne rien afficher
    static void setThreadTag(const std::string& tag);
    static const std::string& threadTag();

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    RequestTrace beginRequest(const std::string& method, const std::string& target, const std::string& body = "");
    void endRequest(const RequestTrace& trace, int statusCode, size_t bodySize, const std::string& body = "");

    /// Nombre de messages émis par niveau depuis le démarrage (ou resetCounts)
    nlohmann::json counts() const;
    void resetCounts();

    static std::string levelToString(LogLevel level);
    /// "debug", "info", "warn", "error" ; lève std::invalid_argument sinon
    static LogLevel levelFromString(const std::string& name);
    static std::string formatSize(size_t bytes);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    static std::string timestamp();
    static std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    mutable std::mutex m_mutex;
    std::atomic<bool> m_logRequests{true};
    std::atomic<uint64_t> m_nextRequestId{0};
    std::array<std::atomic<uint64_t>, 4> m_counts{};
};

// Le message n'est construit que si le niveau est actif
#define TABLESCOPE_LOG(level, method, msg) \
    do { \
        auto& _logger = tablescope::server::Logger::instance(); \
        if (_logger.isEnabled(level)) _logger.method(msg); \
    } while (0)

#define LOG_DEBUG(msg) TABLESCOPE_LOG(tablescope::server::LogLevel::DEBUG, debug, msg)
#define LOG_INFO(msg) TABLESCOPE_LOG(tablescope::server::LogLevel::INFO, info, msg)
#define LOG_WARN(msg) TABLESCOPE_LOG(tablescope::server::LogLevel::WARN, warn, msg)
#define LOG_ERROR(msg) TABLESCOPE_LOG(tablescope::server::LogLevel::ERROR, error, msg)

} // namespace server
} // namespace tablescope
