#pragma once

#include "storage/AnalysisRecords.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace storage {

/**
 * SQLite-based storage for saved analyses and workflows
 *
 * Names are unique per table. Saving under a name that already exists
 * stores the record as "<name>_YYYYMMDD_HHMMSS" (then "_2", "_3", ... if
 * that is taken too) and reports the name actually used.
 *
 * Usage:
 *   AnalysisStorage db("./analyses.db");
 *   auto saved = db.saveAnalysis({.name = "Survivors", .operations = ops});
 *   auto loaded = db.loadAnalysis(saved.id);
 */
class AnalysisStorage {
public:
    /**
     * Open or create a SQLite database at the given path (":memory:" works)
     */
    explicit AnalysisStorage(const std::string& dbPath);
    ~AnalysisStorage();

    // Non-copyable
    AnalysisStorage(const AnalysisStorage&) = delete;
    AnalysisStorage& operator=(const AnalysisStorage&) = delete;

    // Movable
    AnalysisStorage(AnalysisStorage&&) noexcept;
    AnalysisStorage& operator=(AnalysisStorage&&) noexcept;

    // === Saved analyses ===

    SaveResult saveAnalysis(const SavedAnalysis& analysis);

    /**
     * All analyses, most recently modified first. Operations are not loaded.
     */
    std::vector<SavedAnalysis> listAnalyses();

    std::optional<SavedAnalysis> loadAnalysis(int64_t id);

    /**
     * Replace name, description and operations (updates modified_at)
     * Returns false if the analysis doesn't exist
     */
    bool updateAnalysis(int64_t id, const SavedAnalysis& analysis);

    bool deleteAnalysis(int64_t id);

    // === Workflows ===

    SaveResult saveWorkflow(const Workflow& workflow);
    std::vector<Workflow> listWorkflows();
    std::optional<Workflow> loadWorkflow(int64_t id);
    bool updateWorkflow(int64_t id, const Workflow& workflow);
    bool deleteWorkflow(int64_t id);

    // === Maintenance ===

    /**
     * Run SQLite's integrity check; returns (ok, message)
     */
    std::pair<bool, std::string> checkHealth();

    /**
     * Get the database file path
     */
    const std::string& path() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
