#pragma once

#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace tablescope {
namespace server {

/**
 * Profiler - agrège les durées mesurées par ScopedTimer
 *
 * Les noms suivent la forme "<catégorie>:<détail>" : "op:filter",
 * "http:POST". Un nom sans ':' tombe dans la catégorie "engine"
 * ("materialize" par exemple).
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;
        double lastMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
        void add(double durationMs);
    };

    static Profiler& instance();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    void record(const std::string& name, double durationMs);

    Stats getStats(const std::string& name) const;
    /// Somme des stats de tous les noms d'une catégorie
    Stats categoryStats(const std::string& category) const;
    std::map<std::string, Stats> getAllStats() const;

    void reset();

    std::string formatStats() const;

    /**
     * {"<catégorie>": {"<nom>": {"count", "total_ms", "avg_ms", "min_ms", "max_ms", "last_ms"}}}
     */
    nlohmann::json toJson() const;

    static std::string categoryOf(const std::string& name);

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::atomic<bool> m_enabled{true};
    mutable std::mutex m_mutex;
    std::map<std::string, Stats> m_stats;
};

/**
 * Chronomètre RAII : enregistre sa durée à la destruction (ou au premier stop())
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : m_name(std::move(name))
        , m_start(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = elapsedMs();
            Profiler::instance().record(m_name, m_duration);
        }
        return m_duration;
    }

    double elapsedMs() const {
        if (m_stopped) return m_duration;
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - m_start).count();
    }

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_stopped = false;
    double m_duration = 0.0;
};

#define TABLESCOPE_PROFILE_CONCAT_INNER(a, b) a##b
#define TABLESCOPE_PROFILE_CONCAT(a, b) TABLESCOPE_PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) \
    tablescope::server::ScopedTimer TABLESCOPE_PROFILE_CONCAT(_profiler_, __LINE__)(name)

} // namespace server
} // namespace tablescope
