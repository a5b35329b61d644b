#include <catch2/catch_test_macros.hpp>
#include "dataframe/DataFrame.hpp"

using namespace dataframe;

namespace {

DataFramePtr passengers() {
    auto df = std::make_shared<DataFrame>();
    df->addIntColumn("Age");
    df->addDoubleColumn("Fare");
    df->addStringColumn("Name");
    df->addRow({"25", "7.25", "Braund"});
    df->addRow({"40", "71.28", "Cumings"});
    df->addRow({"31", "", "Heikkinen"});
    return df;
}

} // namespace

TEST_CASE("DataFrame empty", "[DataFrame]") {
    DataFrame df;

    REQUIRE(df.rowCount() == 0);
    REQUIRE(df.columnCount() == 0);
    REQUIRE(df.empty());
}

TEST_CASE("DataFrame addRow parses typed values", "[DataFrame]") {
    auto df = passengers();

    REQUIRE(df->rowCount() == 3);
    REQUIRE(df->getColumnNames() == std::vector<std::string>{"Age", "Fare", "Name"});
    REQUIRE(std::static_pointer_cast<IntColumn>(df->getColumn("Age"))->at(1) == 40);
    REQUIRE(df->getColumn("Fare")->isNull(2));
    REQUIRE_THROWS_AS(df->addRow({"1"}), std::invalid_argument);
}

TEST_CASE("DataFrame duplicate column rejected", "[DataFrame]") {
    DataFrame df;
    df.addIntColumn("a");

    REQUIRE_THROWS_AS(df.addIntColumn("a"), std::invalid_argument);
}

TEST_CASE("DataFrame missing column is ColumnNotFound", "[DataFrame]") {
    auto df = passengers();

    try {
        df->getColumn("Ticket");
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.kind() == ErrorKind::ColumnNotFound);
    }
}

TEST_CASE("DataFrame operations never mutate the source", "[DataFrame]") {
    auto df = passengers();
    auto before = df->toJsonWithSchema();

    df->filter({{"Age", FilterOperator::Greater, "30"}});
    df->orderBy({{"Age", true}});
    df->select({"Name"});
    df->drop({"Fare"});
    df->rename({{"Age", "Years"}});

    REQUIRE(df->toJsonWithSchema() == before);
}

TEST_CASE("DataFrame select keeps requested order", "[DataFrame]") {
    auto df = passengers()->select({"Name", "Age"});

    REQUIRE(df->getColumnNames() == std::vector<std::string>{"Name", "Age"});
    REQUIRE(df->rowCount() == 3);
}

TEST_CASE("DataFrame drop unknown column fails", "[DataFrame]") {
    auto df = passengers();

    REQUIRE(df->drop({"Fare"})->getColumnNames() == std::vector<std::string>{"Age", "Name"});
    REQUIRE_THROWS_AS(df->drop({"Ticket"}), EngineError);
}

TEST_CASE("DataFrame rename", "[DataFrame]") {
    auto df = passengers();

    auto renamed = df->rename({{"Age", "Years"}});
    REQUIRE(renamed->getColumnNames() == std::vector<std::string>{"Years", "Fare", "Name"});

    SECTION("collision with an existing column") {
        try {
            df->rename({{"Age", "Name"}});
            FAIL("expected EngineError");
        } catch (const EngineError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidOperator);
        }
    }

    SECTION("swapping two names is allowed") {
        auto swapped = df->rename({{"Age", "Name"}, {"Name", "Age"}});
        REQUIRE(swapped->getColumnNames() == std::vector<std::string>{"Name", "Fare", "Age"});
    }
}

TEST_CASE("DataFrame slice clamps to row count", "[DataFrame]") {
    auto df = passengers();

    REQUIRE(df->slice(1, 10)->rowCount() == 2);
    REQUIRE(df->slice(5, 10)->rowCount() == 0);
    REQUIRE(df->slice(0, 2)->rowCount() == 2);
    REQUIRE(df->slice(0, 0)->columnCount() == 3);
}

TEST_CASE("DataFrame sameContent compares values and types", "[DataFrame]") {
    auto a = passengers();
    auto b = passengers();

    REQUIRE(a->sameContent(*b));
    REQUIRE_FALSE(a->sameContent(*a->slice(0, 2)));
    REQUIRE_FALSE(a->sameContent(*a->rename({{"Age", "Years"}})));
}

TEST_CASE("DataFrame derived frames share the string pool", "[DataFrame]") {
    auto df = passengers();
    auto filtered = df->filter({{"Age", FilterOperator::Greater, "30"}});

    REQUIRE(filtered->getStringPool() == df->getStringPool());
}
