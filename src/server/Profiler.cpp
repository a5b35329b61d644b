#include "server/Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace tablescope {
namespace server {

namespace {

nlohmann::json statsToJson(const Profiler::Stats& stats) {
    return nlohmann::json{
        {"count", stats.count},
        {"total_ms", stats.totalMs},
        {"avg_ms", stats.avgMs()},
        {"min_ms", stats.count > 0 ? stats.minMs : 0.0},
        {"max_ms", stats.maxMs},
        {"last_ms", stats.lastMs}
    };
}

} // namespace

void Profiler::Stats::add(double durationMs) {
    count++;
    totalMs += durationMs;
    lastMs = durationMs;
    minMs = std::min(minMs, durationMs);
    maxMs = std::max(maxMs, durationMs);
}

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

std::string Profiler::categoryOf(const std::string& name) {
    auto colon = name.find(':');
    return colon == std::string::npos ? "engine" : name.substr(0, colon);
}

void Profiler::record(const std::string& name, double durationMs) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats[name].add(durationMs);
}

Profiler::Stats Profiler::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(name);
    return it != m_stats.end() ? it->second : Stats{};
}

Profiler::Stats Profiler::categoryStats(const std::string& category) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats total;
    for (const auto& [name, stats] : m_stats) {
        if (categoryOf(name) != category) continue;
        total.count += stats.count;
        total.totalMs += stats.totalMs;
        total.minMs = std::min(total.minMs, stats.minMs);
        total.maxMs = std::max(total.maxMs, stats.maxMs);
    }
    return total;
}

std::map<std::string, Profiler::Stats> Profiler::getAllStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
}

std::string Profiler::formatStats() const {
    auto all = getAllStats();
    if (all.empty()) {
        return "No profiling data available.";
    }

    // Regroupés par catégorie, triés par temps total décroissant
    std::map<std::string, std::vector<std::pair<std::string, Stats>>> byCategory;
    for (const auto& entry : all) {
        byCategory[categoryOf(entry.first)].push_back(entry);
    }

    std::ostringstream oss;
    oss << "\n========== PROFILER STATS ==========\n";
    oss << std::left << std::setw(30) << "Timer"
        << std::right << std::setw(10) << "Count"
        << std::setw(12) << "Total(ms)"
        << std::setw(12) << "Avg(ms)"
        << std::setw(12) << "Max(ms)"
        << "\n";

    for (auto& [category, entries] : byCategory) {
        std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.second.totalMs > b.second.totalMs; });

        oss << "--- " << category << " " << std::string(category.size() < 71 ? 71 - category.size() : 3, '-') << "\n";
        for (const auto& [name, stats] : entries) {
            oss << std::left << std::setw(30) << name
                << std::right << std::setw(10) << stats.count
                << std::setw(12) << std::fixed << std::setprecision(2) << stats.totalMs
                << std::setw(12) << stats.avgMs()
                << std::setw(12) << stats.maxMs
                << "\n";
        }
    }
    oss << "=====================================\n";
    return oss.str();
}

nlohmann::json Profiler::toJson() const {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [name, stats] : getAllStats()) {
        result[categoryOf(name)][name] = statsToJson(stats);
    }
    return result;
}

} // namespace server
} // namespace tablescope
