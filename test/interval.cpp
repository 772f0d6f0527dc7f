#include <catch.hpp>

#include "ivsel/interval.hpp"

#include <sstream>
#include <vector>

using namespace ivsel;

TEST_CASE("interval properties", "[interval]") {
    CHECK(interval(1, 2, 0).precedes(interval(3, 4, 0)));
    CHECK_FALSE(interval(1, 3, 0).precedes(interval(3, 4, 0)));
    CHECK_FALSE(interval(3, 4, 0).precedes(interval(1, 2, 0)));

    CHECK(interval(1, 3, 0).overlaps(interval(3, 5, 0)));
    CHECK(interval(4, 5, 0).overlaps(interval(2, 4, 0)));
    CHECK(interval(1, 10, 0).overlaps(interval(4, 5, 0)));
    CHECK_FALSE(interval(0, 1, 0).overlaps(interval(2, 3, 0)));
    CHECK_FALSE(interval(2, 3, 0).overlaps(interval(0, 1, 0)));

    CHECK(interval(1, 2, 3) == interval(1, 2, 3));
    CHECK(interval(1, 2, 3) != interval(1, 2, 4));
    CHECK(interval() == interval(0, 0, 0));
}

TEST_CASE("interval output", "[interval]") {
    std::ostringstream out;
    out << interval(1, 3, 5) << " " << interval(-2, 0, 0);
    CHECK(out.str() == "(1, 3, 5) (-2, 0, 0)");
}

TEST_CASE("sort by end is stable", "[interval]") {
    std::vector<interval> intervals{
        {4, 9, 0}, {1, 2, 1}, {0, 9, 2}, {5, 6, 3}, {1, 2, 4}, {2, 9, 5}
    };
    sort_by_end(intervals);

    const std::vector<interval> expected{
        {1, 2, 1}, {1, 2, 4}, {5, 6, 3}, {4, 9, 0}, {0, 9, 2}, {2, 9, 5}
    };
    CHECK(intervals == expected);
}
