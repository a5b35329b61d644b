#include <catch2/catch_test_macros.hpp>
#include "dataframe/StringPool.hpp"
#include <thread>
#include <vector>

using namespace dataframe;

TEST_CASE("StringPool interns each distinct string once", "[StringPool]") {
    StringPool pool;

    auto passenger = pool.intern("passenger");
    auto crew = pool.intern("crew");
    auto again = pool.intern("passenger");

    REQUIRE(passenger == 0);
    REQUIRE(crew == 1);
    REQUIRE(again == passenger);
    REQUIRE(pool.size() == 2);
    REQUIRE(pool.getString(crew) == "crew");
}

TEST_CASE("StringPool find does not intern", "[StringPool]") {
    StringPool pool;
    pool.intern("Southampton");

    REQUIRE(pool.find("Southampton").has_value());
    REQUIRE_FALSE(pool.find("Cherbourg").has_value());
    REQUIRE(pool.size() == 1);
}

TEST_CASE("StringPool unknown id yields empty string", "[StringPool]") {
    StringPool pool;
    pool.intern("x");

    REQUIRE(pool.getString(42).empty());
    REQUIRE(pool.folded(42).empty());
}

TEST_CASE("StringPool keeps a lowercase form per entry", "[StringPool]") {
    StringPool pool;

    auto upper = pool.intern("Mrs. ALLISON");
    auto lower = pool.intern("mrs. allison");

    REQUIRE(upper != lower);
    REQUIRE(pool.getString(upper) == "Mrs. ALLISON");
    REQUIRE(pool.folded(upper) == "mrs. allison");
    REQUIRE(pool.folded(upper) == pool.folded(lower));
    REQUIRE(toLowerAscii("Été 1912") == "Été 1912");
}

TEST_CASE("StringPool references stay valid after growth", "[StringPool]") {
    StringPool pool;
    const std::string& first = pool.getString(pool.intern("first"));

    for (int i = 0; i < 5000; ++i) {
        pool.intern("value_" + std::to_string(i));
    }

    REQUIRE(first == "first");
}

TEST_CASE("StringPool concurrent interning agrees on ids", "[StringPool]") {
    StringPool pool;
    std::vector<std::vector<StringPool::StringId>> seen(4);

    std::vector<std::thread> threads;
    for (size_t t = 0; t < seen.size(); ++t) {
        threads.emplace_back([&pool, &seen, t]() {
            for (int i = 0; i < 200; ++i) {
                seen[t].push_back(pool.intern("key_" + std::to_string(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(pool.size() == 200);
    for (size_t t = 1; t < seen.size(); ++t) {
        REQUIRE(seen[t] == seen[0]);
    }
}
