#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "dataframe/DataFrame.hpp"
#include <algorithm>
#include <cmath>

using namespace dataframe;
using Catch::Approx;

namespace {

DataFramePtr titanic() {
    auto df = std::make_shared<DataFrame>();
    df->addIntColumn("Pclass");
    df->addStringColumn("Sex");
    df->addDoubleColumn("Fare");
    df->addStringColumn("Embarked");
    df->addRow({"3", "male", "7.25", "S"});
    df->addRow({"1", "female", "71.28", "C"});
    df->addRow({"3", "female", "7.92", "S"});
    df->addRow({"1", "female", "53.10", "S"});
    df->addRow({"3", "male", "", "Q"});
    df->addRow({"2", "male", "13.00", ""});
    return df;
}

double doubleAt(const DataFramePtr& df, const std::string& column, size_t row) {
    return std::static_pointer_cast<DoubleColumn>(df->getColumn(column))->at(row);
}

} // namespace

TEST_CASE("Aggregate function names", "[DataFrameAggregator]") {
    REQUIRE(aggFunctionFromString("median") == AggFunction::Median);
    REQUIRE(aggFunctionToString(AggFunction::Std) == "std");
    REQUIRE_THROWS_AS(aggFunctionFromString("avg"), EngineError);
}

TEST_CASE("Aggregate groups in order of first appearance", "[DataFrameAggregator]") {
    auto result = titanic()->aggregate({{"Pclass"}, "Fare", {AggFunction::Sum, AggFunction::Mean}});

    REQUIRE(result->getColumnNames() == std::vector<std::string>{"Pclass", "Fare_sum", "Fare_mean"});
    REQUIRE(result->rowCount() == 3);

    auto pclass = std::static_pointer_cast<IntColumn>(result->getColumn("Pclass"));
    REQUIRE(pclass->data() == std::vector<int64_t>{3, 1, 2});

    // Les nulls sont ignorés par sum et mean
    REQUIRE(doubleAt(result, "Fare_sum", 0) == Approx(15.17));
    REQUIRE(doubleAt(result, "Fare_mean", 0) == Approx(7.585));
    REQUIRE(doubleAt(result, "Fare_sum", 1) == Approx(124.38));
}

TEST_CASE("Aggregate count skips nulls and is integer", "[DataFrameAggregator]") {
    auto result = titanic()->aggregate({{"Pclass"}, "Fare", {AggFunction::Count}});

    auto count = std::dynamic_pointer_cast<IntColumn>(result->getColumn("Fare_count"));
    REQUIRE(count);
    REQUIRE(count->data() == std::vector<int64_t>{2, 2, 1});
}

TEST_CASE("Aggregate without group is global", "[DataFrameAggregator]") {
    auto result = titanic()->aggregate({{}, "Fare", {AggFunction::Min, AggFunction::Max, AggFunction::Median}});

    REQUIRE(result->rowCount() == 1);
    REQUIRE(doubleAt(result, "Fare_min", 0) == Approx(7.25));
    REQUIRE(doubleAt(result, "Fare_max", 0) == Approx(71.28));
    REQUIRE(doubleAt(result, "Fare_median", 0) == Approx(13.0));
}

TEST_CASE("Aggregate std is sample standard deviation", "[DataFrameAggregator]") {
    auto df = std::make_shared<DataFrame>();
    df->addDoubleColumn("x");
    for (const char* v : {"2", "4", "4", "4", "5", "5", "7", "9"}) {
        df->addRow({v});
    }

    auto result = df->aggregate({{}, "x", {AggFunction::Std}});

    REQUIRE(doubleAt(result, "x_std", 0) == Approx(2.13809).epsilon(1e-4));
}

TEST_CASE("Aggregate over text column with numeric function", "[DataFrameAggregator]") {
    try {
        titanic()->aggregate({{"Pclass"}, "Sex", {AggFunction::Sum}});
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.kind() == ErrorKind::TypeMismatch);
    }

    auto counted = titanic()->aggregate({{}, "Sex", {AggFunction::Count}});
    REQUIRE(std::static_pointer_cast<IntColumn>(counted->getColumn("Sex_count"))->at(0) == 6);
}

TEST_CASE("Aggregate on empty frame yields NaN mean", "[DataFrameAggregator]") {
    auto empty = titanic()->filter({{"Fare", FilterOperator::Greater, "1000"}});
    auto result = empty->aggregate({{}, "Fare", {AggFunction::Mean}});

    REQUIRE(result->rowCount() == 1);
    REQUIRE(std::isnan(doubleAt(result, "Fare_mean", 0)));
}

TEST_CASE("Pivot single column naming", "[DataFrameAggregator]") {
    PivotSpec spec;
    spec.index = {"Pclass"};
    spec.columns = {"Sex"};
    spec.values = {{"Fare", {AggFunction::Sum}}};

    auto result = titanic()->pivot(spec);

    REQUIRE(result->getColumnNames() == std::vector<std::string>{"Pclass", "Fare_male", "Fare_female"});
    REQUIRE(result->rowCount() == 3);
    REQUIRE(doubleAt(result, "Fare_male", 0) == Approx(7.25));
    REQUIRE(doubleAt(result, "Fare_female", 1) == Approx(124.38));
    // Pas de passager masculin en première classe
    REQUIRE(std::isnan(doubleAt(result, "Fare_male", 1)));
}

TEST_CASE("Pivot multiple functions and pivot columns", "[DataFrameAggregator]") {
    PivotSpec spec;
    spec.index = {"Pclass"};
    spec.columns = {"Sex", "Embarked"};
    spec.values = {{"Fare", {AggFunction::Len, AggFunction::Max}}};

    auto result = titanic()->pivot(spec);
    auto names = result->getColumnNames();

    REQUIRE(names.front() == "Pclass");
    REQUIRE(std::find(names.begin(), names.end(), "Fare_len_male_S") != names.end());
    REQUIRE(std::find(names.begin(), names.end(), "Fare_max_female_C") != names.end());
    // Ligne avec Embarked nul ignorée : pas de colonne male_ (vide)
    REQUIRE(std::find(names.begin(), names.end(), "Fare_len_male_") == names.end());
    REQUIRE(doubleAt(result, "Fare_len_male_S", 0) == 1.0);
}

TEST_CASE("Pivot first and last", "[DataFrameAggregator]") {
    PivotSpec spec;
    spec.index = {"Sex"};
    spec.columns = {"Embarked"};
    spec.values = {{"Pclass", {AggFunction::First, AggFunction::Last}}};

    auto result = titanic()->pivot(spec);

    // female / S : lignes Pclass 3 puis 1
    REQUIRE(doubleAt(result, "Pclass_first_S", 1) == 3.0);
    REQUIRE(doubleAt(result, "Pclass_last_S", 1) == 1.0);
}

TEST_CASE("Pivot rejects numeric functions on text values", "[DataFrameAggregator]") {
    PivotSpec spec;
    spec.index = {"Pclass"};
    spec.columns = {"Sex"};
    spec.values = {{"Embarked", {AggFunction::Mean}}};

    REQUIRE_THROWS_AS(titanic()->pivot(spec), EngineError);
}
