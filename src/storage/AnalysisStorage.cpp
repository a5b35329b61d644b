#include "storage/AnalysisStorage.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace storage {

using json = nlohmann::json;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Get current UTC timestamp in ISO 8601 format
 */
std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

/**
 * Local time suffix used to version a duplicate name: YYYYMMDD_HHMMSS
 */
std::string versionSuffix() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

json parseStored(const std::string& text, const std::string& what) {
    if (text.empty()) {
        return nullptr;
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Corrupted " + what + ": " + e.what());
    }
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindNull(int index) {
        sqlite3_bind_null(m_stmt, index);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

} // anonymous namespace

// =============================================================================
// AnalysisStorage::Impl
// =============================================================================

class AnalysisStorage::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) {
                sqlite3_close(m_db);
                m_db = nullptr;
            }
            throw std::runtime_error("Failed to open database: " + error);
        }

        createTables();
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS saved_analyses (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                description TEXT,
                created_at TEXT NOT NULL,
                modified_at TEXT NOT NULL,
                operation_count INTEGER NOT NULL CHECK (operation_count >= 0),
                executed_count INTEGER NOT NULL DEFAULT 0,
                dataset_path TEXT NOT NULL,
                mode TEXT NOT NULL DEFAULT 'lazy',
                operations TEXT NOT NULL
            )
        )");
        exec("CREATE INDEX IF NOT EXISTS idx_saved_analyses_modified ON saved_analyses(modified_at DESC)");

        exec(R"(
            CREATE TABLE IF NOT EXISTS workflows (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                description TEXT,
                created_at TEXT NOT NULL,
                modified_at TEXT NOT NULL,
                operation_count INTEGER NOT NULL CHECK (operation_count >= 0),
                operations TEXT NOT NULL,
                required_schema TEXT
            )
        )");
        exec("CREATE INDEX IF NOT EXISTS idx_workflows_modified ON workflows(modified_at DESC)");
    }

    bool nameExists(const std::string& table, const std::string& name) {
        Statement stmt(m_db, "SELECT 1 FROM " + table + " WHERE name = ?");
        stmt.bindText(1, name);
        return stmt.step();
    }

    bool nameTakenByOther(const std::string& table, const std::string& name, int64_t id) {
        Statement stmt(m_db, "SELECT 1 FROM " + table + " WHERE name = ? AND id != ?");
        stmt.bindText(1, name);
        stmt.bindInt64(2, id);
        return stmt.step();
    }

    /**
     * name if free, else name_YYYYMMDD_HHMMSS, else name_YYYYMMDD_HHMMSS_N
     */
    std::optional<std::string> resolveName(const std::string& table, const std::string& name) {
        if (!nameExists(table, name)) {
            return std::nullopt;
        }
        const std::string base = name + "_" + versionSuffix();
        std::string candidate = base;
        int counter = 1;
        while (nameExists(table, candidate)) {
            ++counter;
            candidate = base + "_" + std::to_string(counter);
        }
        return candidate;
    }

    // === Saved analyses ===

    SaveResult saveAnalysis(const SavedAnalysis& analysis) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (analysis.name.empty()) {
            throw std::invalid_argument("Analysis name cannot be empty");
        }

        SaveResult result;
        result.versionedName = resolveName("saved_analyses", analysis.name);

        Statement stmt(m_db,
            "INSERT INTO saved_analyses (name, description, created_at, modified_at, operation_count, "
            "executed_count, dataset_path, mode, operations) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");

        std::string now = currentTimestamp();
        stmt.bindText(1, result.versionedName.value_or(analysis.name));
        stmt.bindText(2, analysis.description);
        stmt.bindText(3, now);
        stmt.bindText(4, now);
        stmt.bindInt64(5, static_cast<int64_t>(analysis.operations.size()));
        stmt.bindInt64(6, analysis.executedCount);
        stmt.bindText(7, analysis.datasetPath);
        stmt.bindText(8, analysis.mode.empty() ? "lazy" : analysis.mode);
        stmt.bindText(9, analysis.operations.dump());
        stmt.step();

        result.id = sqlite3_last_insert_rowid(m_db);
        return result;
    }

    std::vector<SavedAnalysis> listAnalyses() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db,
            "SELECT id, name, description, created_at, modified_at, operation_count, executed_count, "
            "dataset_path, mode FROM saved_analyses ORDER BY modified_at DESC, id DESC");

        std::vector<SavedAnalysis> result;
        while (stmt.step()) {
            result.push_back({
                .id = stmt.getInt64(0),
                .name = stmt.getText(1),
                .description = stmt.getText(2),
                .createdAt = stmt.getText(3),
                .modifiedAt = stmt.getText(4),
                .operationCount = stmt.getInt64(5),
                .executedCount = stmt.getInt64(6),
                .datasetPath = stmt.getText(7),
                .mode = stmt.getText(8),
                .operations = json::array()
            });
        }
        return result;
    }

    std::optional<SavedAnalysis> loadAnalysis(int64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db,
            "SELECT id, name, description, created_at, modified_at, operation_count, executed_count, "
            "dataset_path, mode, operations FROM saved_analyses WHERE id = ?");
        stmt.bindInt64(1, id);

        if (!stmt.step()) {
            return std::nullopt;
        }

        return SavedAnalysis{
            .id = stmt.getInt64(0),
            .name = stmt.getText(1),
            .description = stmt.getText(2),
            .createdAt = stmt.getText(3),
            .modifiedAt = stmt.getText(4),
            .operationCount = stmt.getInt64(5),
            .executedCount = stmt.getInt64(6),
            .datasetPath = stmt.getText(7),
            .mode = stmt.getText(8),
            .operations = parseStored(stmt.getText(9), "operations of analysis " + std::to_string(id))
        };
    }

    bool updateAnalysis(int64_t id, const SavedAnalysis& analysis) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (nameTakenByOther("saved_analyses", analysis.name, id)) {
            throw std::invalid_argument("Analysis name already in use: " + analysis.name);
        }

        Statement stmt(m_db,
            "UPDATE saved_analyses SET name = ?, description = ?, modified_at = ?, operation_count = ?, "
            "executed_count = ?, operations = ? WHERE id = ?");
        stmt.bindText(1, analysis.name);
        stmt.bindText(2, analysis.description);
        stmt.bindText(3, currentTimestamp());
        stmt.bindInt64(4, static_cast<int64_t>(analysis.operations.size()));
        stmt.bindInt64(5, analysis.executedCount);
        stmt.bindText(6, analysis.operations.dump());
        stmt.bindInt64(7, id);
        stmt.step();

        return sqlite3_changes(m_db) > 0;
    }

    bool deleteAnalysis(int64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "DELETE FROM saved_analyses WHERE id = ?");
        stmt.bindInt64(1, id);
        stmt.step();
        return sqlite3_changes(m_db) > 0;
    }

    // === Workflows ===

    SaveResult saveWorkflow(const Workflow& workflow) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (workflow.name.empty()) {
            throw std::invalid_argument("Workflow name cannot be empty");
        }

        SaveResult result;
        result.versionedName = resolveName("workflows", workflow.name);

        Statement stmt(m_db,
            "INSERT INTO workflows (name, description, created_at, modified_at, operation_count, "
            "operations, required_schema) VALUES (?, ?, ?, ?, ?, ?, ?)");

        std::string now = currentTimestamp();
        stmt.bindText(1, result.versionedName.value_or(workflow.name));
        stmt.bindText(2, workflow.description);
        stmt.bindText(3, now);
        stmt.bindText(4, now);
        stmt.bindInt64(5, static_cast<int64_t>(workflow.operations.size()));
        stmt.bindText(6, workflow.operations.dump());
        if (workflow.requiredSchema.is_null()) {
            stmt.bindNull(7);
        } else {
            stmt.bindText(7, workflow.requiredSchema.dump());
        }
        stmt.step();

        result.id = sqlite3_last_insert_rowid(m_db);
        return result;
    }

    std::vector<Workflow> listWorkflows() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db,
            "SELECT id, name, description, created_at, modified_at, operation_count "
            "FROM workflows ORDER BY modified_at DESC, id DESC");

        std::vector<Workflow> result;
        while (stmt.step()) {
            result.push_back({
                .id = stmt.getInt64(0),
                .name = stmt.getText(1),
                .description = stmt.getText(2),
                .createdAt = stmt.getText(3),
                .modifiedAt = stmt.getText(4),
                .operationCount = stmt.getInt64(5),
                .operations = json::array(),
                .requiredSchema = nullptr
            });
        }
        return result;
    }

    std::optional<Workflow> loadWorkflow(int64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db,
            "SELECT id, name, description, created_at, modified_at, operation_count, operations, "
            "required_schema FROM workflows WHERE id = ?");
        stmt.bindInt64(1, id);

        if (!stmt.step()) {
            return std::nullopt;
        }

        const std::string what = "workflow " + std::to_string(id);
        return Workflow{
            .id = stmt.getInt64(0),
            .name = stmt.getText(1),
            .description = stmt.getText(2),
            .createdAt = stmt.getText(3),
            .modifiedAt = stmt.getText(4),
            .operationCount = stmt.getInt64(5),
            .operations = parseStored(stmt.getText(6), "operations of " + what),
            .requiredSchema = stmt.isNull(7) ? json(nullptr) : parseStored(stmt.getText(7), "schema of " + what)
        };
    }

    bool updateWorkflow(int64_t id, const Workflow& workflow) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (nameTakenByOther("workflows", workflow.name, id)) {
            throw std::invalid_argument("Workflow name already in use: " + workflow.name);
        }

        Statement stmt(m_db,
            "UPDATE workflows SET name = ?, description = ?, modified_at = ?, operation_count = ?, "
            "operations = ?, required_schema = ? WHERE id = ?");
        stmt.bindText(1, workflow.name);
        stmt.bindText(2, workflow.description);
        stmt.bindText(3, currentTimestamp());
        stmt.bindInt64(4, static_cast<int64_t>(workflow.operations.size()));
        stmt.bindText(5, workflow.operations.dump());
        if (workflow.requiredSchema.is_null()) {
            stmt.bindNull(6);
        } else {
            stmt.bindText(6, workflow.requiredSchema.dump());
        }
        stmt.bindInt64(7, id);
        stmt.step();

        return sqlite3_changes(m_db) > 0;
    }

    bool deleteWorkflow(int64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "DELETE FROM workflows WHERE id = ?");
        stmt.bindInt64(1, id);
        stmt.step();
        return sqlite3_changes(m_db) > 0;
    }

    std::pair<bool, std::string> checkHealth() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement stmt(m_db, "PRAGMA integrity_check");
        if (!stmt.step()) {
            return {false, "integrity check returned no result"};
        }
        std::string message = stmt.getText(0);
        return {message == "ok", message};
    }

    const std::string& path() const { return m_dbPath; }

private:
    std::string m_dbPath;
    sqlite3* m_db;
    std::mutex m_mutex;
};

// =============================================================================
// AnalysisStorage public interface
// =============================================================================

AnalysisStorage::AnalysisStorage(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

AnalysisStorage::~AnalysisStorage() = default;

AnalysisStorage::AnalysisStorage(AnalysisStorage&&) noexcept = default;
AnalysisStorage& AnalysisStorage::operator=(AnalysisStorage&&) noexcept = default;

SaveResult AnalysisStorage::saveAnalysis(const SavedAnalysis& analysis) {
    return m_impl->saveAnalysis(analysis);
}

std::vector<SavedAnalysis> AnalysisStorage::listAnalyses() {
    return m_impl->listAnalyses();
}

std::optional<SavedAnalysis> AnalysisStorage::loadAnalysis(int64_t id) {
    return m_impl->loadAnalysis(id);
}

bool AnalysisStorage::updateAnalysis(int64_t id, const SavedAnalysis& analysis) {
    return m_impl->updateAnalysis(id, analysis);
}

bool AnalysisStorage::deleteAnalysis(int64_t id) {
    return m_impl->deleteAnalysis(id);
}

SaveResult AnalysisStorage::saveWorkflow(const Workflow& workflow) {
    return m_impl->saveWorkflow(workflow);
}

std::vector<Workflow> AnalysisStorage::listWorkflows() {
    return m_impl->listWorkflows();
}

std::optional<Workflow> AnalysisStorage::loadWorkflow(int64_t id) {
    return m_impl->loadWorkflow(id);
}

bool AnalysisStorage::updateWorkflow(int64_t id, const Workflow& workflow) {
    return m_impl->updateWorkflow(id, workflow);
}

bool AnalysisStorage::deleteWorkflow(int64_t id) {
    return m_impl->deleteWorkflow(id);
}

std::pair<bool, std::string> AnalysisStorage::checkHealth() {
    return m_impl->checkHealth();
}

const std::string& AnalysisStorage::path() const {
    return m_impl->path();
}

} // namespace storage
