#include <catch2/catch_test_macros.hpp>
#include "dataframe/Column.hpp"

using namespace dataframe;

TEST_CASE("IntColumn is never null", "[Column]") {
    IntColumn col("Pclass");
    col.push_back(1);
    col.push_back(3);

    REQUIRE(col.getType() == ColumnTypeOpt::INT);
    REQUIRE(col.size() == 2);
    REQUIRE_FALSE(col.isNull(0));
    REQUIRE(col.toDisplayString(1) == "3");
    REQUIRE(col.filterNull(true).empty());
}

TEST_CASE("IntColumn compare against double target", "[Column]") {
    IntColumn col("Age");
    for (int64_t v : {25, 40, 31}) col.push_back(v);

    auto idx = col.filterCompare(CompareOp::Greater, 30.5);

    REQUIRE(idx == std::vector<size_t>{1, 2});
}

TEST_CASE("IntColumn refuses null gather", "[Column]") {
    IntColumn col("id");
    col.push_back(7);

    REQUIRE_THROWS_AS(col.filterByIndices({0, NULL_INDEX}), EngineError);

    auto promoted = col.toDouble()->filterByIndices({0, NULL_INDEX});
    REQUIRE(promoted->getType() == ColumnTypeOpt::DOUBLE);
    REQUIRE(promoted->isNull(1));
}

TEST_CASE("DoubleColumn NaN is null and never compares", "[Column]") {
    DoubleColumn col("Fare");
    col.push_back(7.25);
    col.push_back(DoubleColumn::null());
    col.push_back(71.28);

    REQUIRE(col.isNull(1));
    REQUIRE(col.toDisplayString(1).empty());
    REQUIRE(col.filterNull(true) == std::vector<size_t>{1});
    REQUIRE(col.filterCompare(CompareOp::NotEqual, 0.0) == std::vector<size_t>{0, 2});
}

TEST_CASE("StringColumn shares its pool", "[Column]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn a("Sex", pool);
    StringColumn b("Sex", pool);
    a.push_back("male");
    b.push_back("male");

    REQUIRE(a.getId(0) == b.getId(0));
    REQUIRE(pool->size() == 1);
}

TEST_CASE("StringColumn equality does not grow the pool", "[Column]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn col("Embarked", pool);
    col.push_back("S");
    col.push_back("C");
    col.push_back("S");

    auto none = col.filterCompare(CompareOp::Equal, "Q");
    auto notQ = col.filterCompare(CompareOp::NotEqual, "Q");

    REQUIRE(none.empty());
    REQUIRE(notQ.size() == 3);
    REQUIRE(pool->size() == 2);
}

TEST_CASE("StringColumn text matching is case-insensitive", "[Column]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn col("Name", pool);
    col.push_back("Braund, Mr. Owen");
    col.push_back("Cumings, Mrs. John");
    col.push_back("Heikkinen, Miss. Laina");

    REQUIRE(col.filterText(TextMatch::Contains, "MRS") == std::vector<size_t>{1});
    REQUIRE(col.filterText(TextMatch::StartsWith, "braund") == std::vector<size_t>{0});
    REQUIRE(col.filterText(TextMatch::EndsWith, "LAINA") == std::vector<size_t>{2});
    REQUIRE(col.filterText(TextMatch::NotContains, "mr") == std::vector<size_t>{2});
}

TEST_CASE("StringColumn lexical compare skips nulls", "[Column]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn col("Cabin", pool);
    col.push_back("C85");
    col.push_back("");
    col.push_back("A6");

    REQUIRE(col.isNull(1));
    REQUIRE(col.filterCompare(CompareOp::Less, "B") == std::vector<size_t>{2});
}

TEST_CASE("Column clone is independent", "[Column]") {
    DoubleColumn col("x");
    col.push_back(1.0);

    auto copy = std::static_pointer_cast<DoubleColumn>(col.clone());
    copy->set(0, 2.0);
    copy->setName("y");

    REQUIRE(col.at(0) == 1.0);
    REQUIRE(col.getName() == "x");
    REQUIRE(copy->getName() == "y");
}
