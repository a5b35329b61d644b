#include <catch2/catch_test_macros.hpp>
#include "dataframe/DataFrame.hpp"
#include "dataframe/DataFrameSerializer.hpp"

using namespace dataframe;

TEST_CASE("Serializer writes nulls as JSON null", "[DataFrameSerializer]") {
    DataFrame df;
    df.addIntColumn("id");
    df.addDoubleColumn("fare");
    df.addStringColumn("cabin");
    df.addRow({"1", "", ""});
    df.addRow({"2", "8.05", "C85"});

    auto j = df.toJson();

    REQUIRE(j["columns"] == json::array({"id", "fare", "cabin"}));
    REQUIRE(j["data"][0][1].is_null());
    REQUIRE(j["data"][0][2].is_null());
    REQUIRE(j["data"][1][2] == "C85");
    REQUIRE_FALSE(j.contains("schema"));
}

TEST_CASE("Serializer schema lists physical types", "[DataFrameSerializer]") {
    DataFrame df;
    df.addIntColumn("id");
    df.addDoubleColumn("fare");
    df.addStringColumn("name");

    auto j = df.toJsonWithSchema();

    REQUIRE(j["schema"][0]["type"] == "INT");
    REQUIRE(j["schema"][1]["type"] == "DOUBLE");
    REQUIRE(j["schema"][2]["type"] == "STRING");
}

TEST_CASE("Serializer fromJson infers types from values", "[DataFrameSerializer]") {
    json j = {
        {"columns", {"id", "score", "label", "partial"}},
        {"data", {
            {1, 2.5, "a", 4},
            {2, 3, "b", nullptr}
        }}
    };

    auto df = DataFrameSerializer::fromJson(j);

    REQUIRE(df->rowCount() == 2);
    REQUIRE(df->getColumn("id")->getType() == ColumnTypeOpt::INT);
    REQUIRE(df->getColumn("score")->getType() == ColumnTypeOpt::DOUBLE);
    REQUIRE(df->getColumn("label")->getType() == ColumnTypeOpt::STRING);
    // Entiers avec un null : DOUBLE
    REQUIRE(df->getColumn("partial")->getType() == ColumnTypeOpt::DOUBLE);
    REQUIRE(df->getColumn("partial")->isNull(1));
}

TEST_CASE("Serializer fromJson honours an explicit schema", "[DataFrameSerializer]") {
    DataFrame source;
    source.addDoubleColumn("x");
    source.addRow({"1"});

    auto df = DataFrameSerializer::fromJson(source.toJsonWithSchema());

    REQUIRE(df->getColumn("x")->getType() == ColumnTypeOpt::DOUBLE);
    REQUIRE(df->sameContent(source));
}

TEST_CASE("Serializer fromJson errors", "[DataFrameSerializer]") {
    REQUIRE_THROWS_AS(DataFrameSerializer::fromJson(json{{"columns", {"a"}}}), std::invalid_argument);

    json ragged = {{"columns", {"a", "b"}}, {"data", {{1}}}};
    REQUIRE_THROWS(DataFrameSerializer::fromJson(ragged));

    json wrongType = {
        {"columns", {"a"}},
        {"schema", {{{"name", "a"}, {"type", "INT"}}}},
        {"data", {{"x"}}}
    };
    try {
        DataFrameSerializer::fromJson(wrongType);
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.kind() == ErrorKind::TypeMismatch);
    }
}
