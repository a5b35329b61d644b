#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "exporter/ScriptExporter.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace exporter;
using Catch::Matchers::ContainsSubstring;
using dataframe::FilterOperator;

namespace {

ops::OperationPtr make(ops::OperationParams params) {
    return ops::Operation::create(std::move(params));
}

ExportInput sampleInput() {
    ExportInput input;
    input.name = "Adults";
    input.description = "Passengers over 30";
    input.datasetPath = "/data/titanic.csv";
    input.operations.push_back(make(ops::FilterParams{{{"Age", FilterOperator::Greater, "30"}}}));
    input.operations.push_back(make(ops::SortParams{{{"Fare", true}}}));
    return input;
}

} // namespace

TEST_CASE("Export format names", "[ScriptExporter]") {
    REQUIRE(exportFormatFromString("ipynb") == ExportFormat::Jupyter);
    REQUIRE(exportFormatToString(ExportFormat::Csv) == "csv");
    REQUIRE_THROWS_AS(exportFormatFromString("xlsx"), std::invalid_argument);
}

TEST_CASE("Filter code keeps numbers unquoted", "[ScriptExporter]") {
    auto code = ScriptExporter::operationCode(ops::FilterParams{{
        {"Age", FilterOperator::Greater, "30"},
        {"Sex", FilterOperator::Equal, "male"}
    }});

    REQUIRE(code == "df = df.filter((pl.col(\"Age\") > 30) & (pl.col(\"Sex\") == \"male\"))");
}

TEST_CASE("Text filters are case-insensitive", "[ScriptExporter]") {
    auto code = ScriptExporter::operationCode(ops::FilterParams{{
        {"Name", FilterOperator::Contains, "MRS"}
    }});

    REQUIRE_THAT(code, ContainsSubstring("str.to_lowercase()"));
    REQUIRE_THAT(code, ContainsSubstring("contains(\"mrs\", literal=True)"));
}

TEST_CASE("Null filters", "[ScriptExporter]") {
    auto code = ScriptExporter::operationCode(ops::FilterParams{{{"Cabin", FilterOperator::IsNull, ""}}});

    REQUIRE(code == "df = df.filter(pl.col(\"Cabin\").is_null())");
}

TEST_CASE("Aggregate code", "[ScriptExporter]") {
    ops::AggregateParams grouped;
    grouped.spec = {{"Sex"}, "Age", {dataframe::AggFunction::Mean}};
    ops::AggregateParams global;
    global.spec = {{}, "Fare", {dataframe::AggFunction::Sum}};

    REQUIRE(ScriptExporter::operationCode(grouped)
            == "df = df.group_by([\"Sex\"], maintain_order=True).agg(pl.col(\"Age\").mean().alias(\"Age_mean\"))");
    REQUIRE(ScriptExporter::operationCode(global)
            == "df = df.select(pl.col(\"Fare\").sum().alias(\"Fare_sum\"))");
}

TEST_CASE("Pivot code prefixes value columns", "[ScriptExporter]") {
    ops::PivotParams pivot;
    pivot.spec.index = {"Pclass"};
    pivot.spec.columns = {"Sex"};
    pivot.spec.values = {{"Fare", {dataframe::AggFunction::Sum, dataframe::AggFunction::Max}}};

    auto code = ScriptExporter::operationCode(pivot);

    REQUIRE_THAT(code, ContainsSubstring("aggregate_function=pl.element().sum()"));
    REQUIRE_THAT(code, ContainsSubstring("\"Fare_max_\" + c"));
    REQUIRE_THAT(code, ContainsSubstring("how=\"left\""));
}

TEST_CASE("Join, sort and column edit code", "[ScriptExporter]") {
    ops::JoinParams join;
    join.rightDatasetId = "ds_tickets";
    join.spec = {"Name", "Passenger", dataframe::JoinHow::Outer, "_right"};

    ops::ColumnEditParams rename;
    rename.action = ops::ColumnEditAction::Rename;
    rename.renames = {{"Fare", "Price"}};

    REQUIRE(ScriptExporter::operationCode(join)
            == "df = df.join(ds_tickets, left_on=\"Name\", right_on=\"Passenger\", how=\"full\", suffix=\"_right\")");
    REQUIRE(ScriptExporter::operationCode(ops::SortParams{{{"Fare", true}, {"Age", false}}})
            == "df = df.sort([\"Fare\", \"Age\"], descending=[True, False], nulls_last=True)");
    REQUIRE(ScriptExporter::operationCode(rename) == "df = df.rename({\"Fare\":\"Price\"})");
}

TEST_CASE("Python script lists operations in order", "[ScriptExporter]") {
    auto script = ScriptExporter::toPythonScript(sampleInput());

    REQUIRE_THAT(script, ContainsSubstring("# Adults\n# Passengers over 30\n"));
    REQUIRE_THAT(script, ContainsSubstring("import polars as pl"));
    REQUIRE_THAT(script, ContainsSubstring("df = pl.read_csv(\"/data/titanic.csv\")"));
    REQUIRE_THAT(script, ContainsSubstring("# 1. Filter: Age > 30\n"));
    REQUIRE_THAT(script, ContainsSubstring("# 2. Sort: Fare desc\n"));
    REQUIRE(script.find("# 1.") < script.find("# 2."));
}

TEST_CASE("Script loads join sources once", "[ScriptExporter]") {
    auto input = sampleInput();
    ops::JoinParams join;
    join.rightDatasetId = "ds_tickets";
    join.spec = {"Name", "Name", dataframe::JoinHow::Left, "_right"};
    input.operations.push_back(make(join));
    input.operations.push_back(make(join));

    SECTION("known source") {
        input.joinSources["ds_tickets"] = "/data/tickets.csv";
        auto script = ScriptExporter::toPythonScript(input);
        const std::string load = "ds_tickets = pl.read_csv(\"/data/tickets.csv\")";
        REQUIRE(script.find(load) != std::string::npos);
        REQUIRE(script.find(load) == script.rfind(load));
    }

    SECTION("unknown source") {
        auto script = ScriptExporter::toPythonScript(input);
        REQUIRE_THAT(script, ContainsSubstring("# source file of ds_tickets is unknown"));
    }
}

TEST_CASE("Notebook structure", "[ScriptExporter]") {
    auto notebook = ScriptExporter::toNotebook(sampleInput());

    REQUIRE(notebook["nbformat"] == 4);
    auto& cells = notebook["cells"];
    // titre, setup, 2 x (markdown + code), affichage final
    REQUIRE(cells.size() == 7);
    REQUIRE(cells[0]["cell_type"] == "markdown");
    REQUIRE(cells[0]["source"][0] == "# Adults\n");
    REQUIRE(cells[1]["cell_type"] == "code");
    REQUIRE(cells[2]["source"][0] == "### 1. Filter: Age > 30");
    REQUIRE(cells[3]["source"].back() == "df.head()");
    REQUIRE(cells[6]["source"][0] == "df");
}

TEST_CASE("Write exported file", "[ScriptExporter]") {
    std::string path = "/tmp/tablescope_export_" + std::to_string(std::rand()) + ".py";

    ScriptExporter::writeFile(path, "print(1)\n");

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    REQUIRE(content.str() == "print(1)\n");
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(ScriptExporter::writeFile("/nonexistent_dir/out.py", "x"), std::runtime_error);
}
