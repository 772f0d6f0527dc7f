#include <catch.hpp>

#include "ivsel/algorithm.hpp"

#include <utility>
#include <vector>

using namespace ivsel;

TEST_CASE("for each adjacent", "[algorithm]") {
    struct test {
        std::vector<int> input;
        std::vector<std::pair<int, int>> expected;
    };

    test tests[]{
        {{}, {}},
        {{1}, {}},
        {{1, 2}, {{1, 2}}},
        {{1, 2, 3, 5}, {{1, 2}, {2, 3}, {3, 5}}},
    };

    for (test& t : tests) {
        std::vector<std::pair<int, int>> got;
        for_each_adjacent(t.input, [&](int a, int b) {
            got.emplace_back(a, b);
        });

        INFO("input size: " << t.input.size());
        CHECK(got == t.expected);
    }
}

TEST_CASE("all adjacent", "[algorithm]") {
    auto less = [](int a, int b) { return a < b; };

    CHECK(all_adjacent(std::vector<int>{}, less));
    CHECK(all_adjacent(std::vector<int>{7}, less));
    CHECK(all_adjacent(std::vector<int>{1, 4, 9}, less));
    CHECK_FALSE(all_adjacent(std::vector<int>{1, 4, 4}, less));
    CHECK_FALSE(all_adjacent(std::vector<int>{3, 1, 2}, less));
}
