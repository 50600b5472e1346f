#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "utils/Statistics.hpp"
#include "utils/Random.hpp"
#include <algorithm>

using namespace prediction;
using Catch::Approx;

TEST_CASE("Statistics: Mean, min and max", "[statistics]") {
    std::vector<double> data = { 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0 };
    REQUIRE(Statistics::mean(data) == Approx(5.0));
    REQUIRE(Statistics::min(data) == 2.0);
    REQUIRE(Statistics::max(data) == 9.0);
}

TEST_CASE("Statistics: Population standard deviation", "[statistics]") {
    std::vector<double> data = { 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0 };
    REQUIRE(Statistics::stddev(data) == Approx(2.0));
    REQUIRE(Statistics::zscore(9.0, data) == Approx(2.0));
}

TEST_CASE("Statistics: Empty input", "[statistics]") {
    std::vector<double> empty;
    REQUIRE(Statistics::mean(empty) == 0.0);
    REQUIRE(Statistics::stddev(empty) == 0.0);
    REQUIRE(Statistics::min(empty) == 0.0);
    REQUIRE(Statistics::max(empty) == 0.0);
    REQUIRE(Statistics::zscore(1.0, empty) == 0.0);
}

TEST_CASE("Statistics: Rate", "[statistics]") {
    REQUIRE(Statistics::rate(3, 4) == Approx(0.75));
    REQUIRE(Statistics::rate(0, 0) == 0.0);
}

TEST_CASE("Random: Same seed, same sequence", "[random]") {
    Random a(123), b(123);
    for (int i = 0; i < 100; ++i) {
        REQUIRE(a.uniform(0.0, 1.0) == b.uniform(0.0, 1.0));
        REQUIRE(a.uniformInt(0, 9) == b.uniformInt(0, 9));
        REQUIRE(a.next() == b.next());
    }
}

TEST_CASE("Random: Sample is distinct and ascending", "[random]") {
    Random rng(9);
    std::vector<int> pool = { 10, 20, 30, 40, 50, 60 };

    for (int i = 0; i < 50; ++i) {
        auto picked = rng.sample(pool, 3);
        REQUIRE(picked.size() == 3);
        REQUIRE(std::is_sorted(picked.begin(), picked.end()));
        REQUIRE(std::adjacent_find(picked.begin(), picked.end()) == picked.end());
        for (int v : picked) {
            REQUIRE(std::find(pool.begin(), pool.end(), v) != pool.end());
        }
    }

    REQUIRE(rng.sample(pool, 10).size() == pool.size());
    REQUIRE(rng.sample(std::vector<int>{}, 2).empty());
}
