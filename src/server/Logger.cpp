#include "server/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace tablescope {
namespace server {

namespace {

thread_local std::string t_threadTag;

} // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::setOutputStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_output = os ? os : &std::cout;
}

void Logger::enableFileLogging(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
    m_fileStream.open(filepath, std::ios::app);
    if (!m_fileStream.is_open()) {
        m_output = &std::cout;
        throw std::runtime_error("Cannot open log file: " + filepath);
    }
    m_output = &m_fileStream;
}

void Logger::setThreadTag(const std::string& tag) {
    t_threadTag = tag;
}

const std::string& Logger::threadTag() {
    return t_threadTag;
}

// ============================================================================
// Formatage
// ============================================================================

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

LogLevel Logger::levelFromString(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::truncate(const std::string& str, size_t maxLen) {
    if (str.length() <= maxLen) {
        return str;
    }
    return str.substr(0, maxLen) + "... (" + formatSize(str.length()) + ")";
}

std::string Logger::formatSize(size_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " o";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " ko";
    } else {
        oss << std::fixed << std::setprecision(2) << (bytes / (1024.0 * 1024.0)) << " Mo";
    }
    return oss.str();
}

// ============================================================================
// Émission
// ============================================================================

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) return;

    m_counts[static_cast<size_t>(level)]++;

    std::ostringstream line;
    line << "[" << timestamp() << "] [" << levelToString(level) << "] ";
    if (!t_threadTag.empty()) {
        line << "[" << t_threadTag << "] ";
    }
    line << message << '\n';

    std::lock_guard<std::mutex> lock(m_mutex);
    *m_output << line.str() << std::flush;
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

nlohmann::json Logger::counts() const {
    return nlohmann::json{
        {"debug", m_counts[0].load()},
        {"info", m_counts[1].load()},
        {"warn", m_counts[2].load()},
        {"error", m_counts[3].load()}
    };
}

void Logger::resetCounts() {
    for (auto& count : m_counts) {
        count = 0;
    }
}

// ============================================================================
// Requêtes HTTP
// ============================================================================

Logger::RequestTrace Logger::beginRequest(const std::string& method, const std::string& target,
                                          const std::string& body) {
    RequestTrace trace{++m_nextRequestId, std::chrono::steady_clock::now()};

    if (m_logRequests && isEnabled(LogLevel::INFO)) {
        std::string message = "[REQ-" + std::to_string(trace.id) + "] " + method + " " + target;
        if (!body.empty()) {
            message += " | Body: " + truncate(body);
        }
        log(LogLevel::INFO, message);
    }
    return trace;
}

void Logger::endRequest(const RequestTrace& trace, int statusCode, size_t bodySize, const std::string& body) {
    if (!m_logRequests) return;

    // Les erreurs serveur remontent même quand INFO est coupé
    LogLevel level = statusCode >= 500 ? LogLevel::ERROR : LogLevel::INFO;
    if (!isEnabled(level)) return;

    std::ostringstream oss;
    oss << "[REQ-" << trace.id << "] " << statusCode;
    if (bodySize > 0) {
        oss << " | " << formatSize(bodySize);
    }
    oss << " | " << std::fixed << std::setprecision(1) << trace.elapsedMs() << "ms";
    if (!body.empty() && isEnabled(LogLevel::DEBUG)) {
        oss << " | Body: " << truncate(body);
    }
    log(level, oss.str());
}

} // namespace server
} // namespace tablescope
