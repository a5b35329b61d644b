#include <catch2/catch_test_macros.hpp>
#include "storage/AnalysisStorage.hpp"
#include <filesystem>
#include <cstdio>

using namespace storage;
using json = nlohmann::json;

// Helper to create a temporary database file
class TempDatabase {
public:
    TempDatabase() : m_path("/tmp/test_analysis_storage_" +
                            std::to_string(std::rand()) + ".db") {}

    ~TempDatabase() {
        std::filesystem::remove(m_path);
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

static json sampleOperations() {
    return json::array({
        {{"id", "op_1"}, {"kind", "filter"},
         {"params", {{"conditions", {{{"column", "Age"}, {"operator", ">"}, {"value", "30"}}}}}}},
        {{"id", "op_2"}, {"kind", "sort"},
         {"params", {{"keys", {{{"column", "Fare"}, {"descending", true}}}}}}}
    });
}

// =============================================================================
// Saved analyses
// =============================================================================

TEST_CASE("Save and load analysis", "[AnalysisStorage][CRUD]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    SavedAnalysis analysis{
        .name = "Adult passengers",
        .description = "Over 30, by fare",
        .executedCount = 1,
        .datasetPath = "/data/titanic.csv",
        .mode = "eager",
        .operations = sampleOperations()
    };

    auto saved = db.saveAnalysis(analysis);
    REQUIRE(saved.id > 0);
    REQUIRE_FALSE(saved.versionedName.has_value());

    auto loaded = db.loadAnalysis(saved.id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->name == "Adult passengers");
    REQUIRE(loaded->description == "Over 30, by fare");
    REQUIRE(loaded->operationCount == 2);
    REQUIRE(loaded->executedCount == 1);
    REQUIRE(loaded->datasetPath == "/data/titanic.csv");
    REQUIRE(loaded->mode == "eager");
    REQUIRE(loaded->operations == sampleOperations());
    REQUIRE_FALSE(loaded->createdAt.empty());
}

TEST_CASE("Load missing analysis", "[AnalysisStorage][CRUD]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    REQUIRE_FALSE(db.loadAnalysis(42).has_value());
    REQUIRE_FALSE(db.deleteAnalysis(42));
}

TEST_CASE("Analysis mode defaults to lazy", "[AnalysisStorage][CRUD]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    auto saved = db.saveAnalysis({.name = "No mode", .operations = json::array()});

    REQUIRE(db.loadAnalysis(saved.id)->mode == "lazy");
}

TEST_CASE("Duplicate analysis names are versioned", "[AnalysisStorage][Naming]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    db.saveAnalysis({.name = "Survivors", .operations = sampleOperations()});
    auto second = db.saveAnalysis({.name = "Survivors", .operations = sampleOperations()});
    auto third = db.saveAnalysis({.name = "Survivors", .operations = sampleOperations()});

    REQUIRE(second.versionedName.has_value());
    REQUIRE(second.versionedName->rfind("Survivors_", 0) == 0);
    // Survivors_YYYYMMDD_HHMMSS
    REQUIRE(second.versionedName->size() == std::string("Survivors_").size() + 15);
    REQUIRE(third.versionedName.has_value());
    REQUIRE(*third.versionedName != *second.versionedName);

    REQUIRE(db.listAnalyses().size() == 3);
}

TEST_CASE("Empty analysis name is rejected", "[AnalysisStorage][Naming]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    REQUIRE_THROWS_AS(db.saveAnalysis({.name = ""}), std::invalid_argument);
}

TEST_CASE("List analyses without operations, newest first", "[AnalysisStorage][CRUD]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    auto first = db.saveAnalysis({.name = "first", .operations = sampleOperations()});
    auto second = db.saveAnalysis({.name = "second", .operations = sampleOperations()});

    auto list = db.listAnalyses();

    REQUIRE(list.size() == 2);
    REQUIRE(list[0].id == second.id);
    REQUIRE(list[1].id == first.id);
    REQUIRE(list[0].operationCount == 2);
    REQUIRE(list[0].operations.empty());
}

TEST_CASE("Update and delete analysis", "[AnalysisStorage][CRUD]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    auto saved = db.saveAnalysis({.name = "draft", .operations = sampleOperations()});
    db.saveAnalysis({.name = "taken", .operations = json::array()});

    SECTION("update replaces content") {
        REQUIRE(db.updateAnalysis(saved.id, {.name = "final", .operations = json::array()}));
        auto loaded = db.loadAnalysis(saved.id);
        REQUIRE(loaded->name == "final");
        REQUIRE(loaded->operationCount == 0);
        REQUIRE_FALSE(db.updateAnalysis(999, {.name = "ghost"}));
    }

    SECTION("update to a name in use") {
        REQUIRE_THROWS_AS(db.updateAnalysis(saved.id, {.name = "taken"}), std::invalid_argument);
    }

    SECTION("delete") {
        REQUIRE(db.deleteAnalysis(saved.id));
        REQUIRE_FALSE(db.loadAnalysis(saved.id).has_value());
    }
}

// =============================================================================
// Workflows
// =============================================================================

TEST_CASE("Save and load workflow with required schema", "[AnalysisStorage][Workflow]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    json schema = {{"Age", "numeric"}, {"Fare", "numeric"}};
    auto saved = db.saveWorkflow({
        .name = "Fare ranking",
        .operations = sampleOperations(),
        .requiredSchema = schema
    });

    auto loaded = db.loadWorkflow(saved.id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->operationCount == 2);
    REQUIRE(loaded->requiredSchema == schema);
    REQUIRE(loaded->operations == sampleOperations());
}

TEST_CASE("Workflow without schema loads null", "[AnalysisStorage][Workflow]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    auto saved = db.saveWorkflow({.name = "Unchecked", .operations = sampleOperations()});

    REQUIRE(db.loadWorkflow(saved.id)->requiredSchema.is_null());
}

TEST_CASE("Workflow names are versioned independently of analyses", "[AnalysisStorage][Workflow]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    db.saveAnalysis({.name = "shared", .operations = json::array()});
    auto workflow = db.saveWorkflow({.name = "shared", .operations = json::array()});
    auto duplicate = db.saveWorkflow({.name = "shared", .operations = json::array()});

    REQUIRE_FALSE(workflow.versionedName.has_value());
    REQUIRE(duplicate.versionedName.has_value());
    REQUIRE(db.listWorkflows().size() == 2);
}

TEST_CASE("Update and delete workflow", "[AnalysisStorage][Workflow]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    auto saved = db.saveWorkflow({.name = "wf", .operations = sampleOperations()});

    REQUIRE(db.updateWorkflow(saved.id, {.name = "wf2", .operations = json::array(),
                                         .requiredSchema = {{"Age", "numeric"}}}));
    auto loaded = db.loadWorkflow(saved.id);
    REQUIRE(loaded->name == "wf2");
    REQUIRE(loaded->requiredSchema["Age"] == "numeric");

    REQUIRE(db.deleteWorkflow(saved.id));
    REQUIRE_FALSE(db.deleteWorkflow(saved.id));
}

// =============================================================================
// Persistence and maintenance
// =============================================================================

TEST_CASE("Data persists across reopen", "[AnalysisStorage][Persistence]") {
    TempDatabase tempDb;
    int64_t id = 0;
    {
        AnalysisStorage db(tempDb.path());
        id = db.saveAnalysis({.name = "kept", .operations = sampleOperations()}).id;
    }

    AnalysisStorage reopened(tempDb.path());
    auto loaded = reopened.loadAnalysis(id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->name == "kept");
}

TEST_CASE("Health check and path", "[AnalysisStorage]") {
    TempDatabase tempDb;
    AnalysisStorage db(tempDb.path());

    auto [ok, message] = db.checkHealth();

    REQUIRE(ok);
    REQUIRE(message == "ok");
    REQUIRE(db.path() == tempDb.path());
}

TEST_CASE("Storage move keeps the connection", "[AnalysisStorage]") {
    TempDatabase tempDb;
    AnalysisStorage original(tempDb.path());
    auto saved = original.saveAnalysis({.name = "moved", .operations = json::array()});

    AnalysisStorage moved(std::move(original));

    REQUIRE(moved.loadAnalysis(saved.id).has_value());
}

TEST_CASE("Unopenable database path", "[AnalysisStorage]") {
    REQUIRE_THROWS_AS(AnalysisStorage("/nonexistent_dir/tablescope/analyses.db"), std::runtime_error);
}
