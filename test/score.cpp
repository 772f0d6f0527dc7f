#include <catch.hpp>

#include "ivsel/score.hpp"

#include <cmath>
#include <limits>

using namespace ivsel;

TEST_CASE("trade-off scaling truncates", "[score]") {
    CHECK(scale_trade_off(0) == 0);
    CHECK(scale_trade_off(1) == 1000);
    CHECK(scale_trade_off(0.5) == 500);
    CHECK(scale_trade_off(2.0 / 3.0) == 666);
    CHECK(scale_trade_off(0.9999) == 999);
    CHECK(scale_trade_off(0.0005) == 0);
    CHECK(scale_trade_off(0.7 * 0.1) == 69);

    // Out of range values are extrapolated.
    CHECK(scale_trade_off(1.5) == 1500);
    CHECK(scale_trade_off(-0.5) == -500);
}

TEST_CASE("inclusion gain", "[score]") {
    SECTION("count only") {
        CHECK(inclusion_gain(1, 1000, 0) == 1);
        CHECK(inclusion_gain(1, 1000, 7) == 1);
        CHECK(inclusion_gain(1, 1000, -3) == 1);
    }

    SECTION("cost only") {
        CHECK(inclusion_gain(0, 0, 0) == 1);

        // Costly intervals fall through to the blended formula.
        CHECK(inclusion_gain(0, 0, 1) == -1000);
        CHECK(inclusion_gain(0, 0, 5) == -5000);
    }

    SECTION("blended") {
        CHECK(inclusion_gain(0.5, 500, 0) == 500);
        CHECK(inclusion_gain(0.5, 500, 2) == -500);
        CHECK(inclusion_gain(0.25, 250, 1) == -500);
        CHECK(inclusion_gain(0.75, 750, 3) == 0);

        // Negative costs never increase the gain.
        CHECK(inclusion_gain(0.5, 500, -2) == 500);
    }

    SECTION("out of range") {
        CHECK(inclusion_gain(1.5, 1500, 3) == 1500);
        CHECK(inclusion_gain(-0.5, -500, 0) == -500);
        CHECK(inclusion_gain(-0.5, -500, 2) == -3500);
    }
}

TEST_CASE("final score", "[score]") {
    CHECK(final_score(1, 12345, 3) == 3.0);
    CHECK(final_score(1, 0, 0) == 0.0);
    CHECK(final_score(0.5, 1500, 2) == 1.5);
    CHECK(final_score(0.5, -500, 1) == -0.5);
    CHECK(final_score(0, 2, 2) == Approx(0.002));
}

TEST_CASE("valid trade-off values", "[score]") {
    CHECK(is_valid_trade_off(0));
    CHECK(is_valid_trade_off(1));
    CHECK(is_valid_trade_off(-0.5));
    CHECK(is_valid_trade_off(1e15));
    CHECK(is_valid_trade_off(-9e15));

    CHECK_FALSE(is_valid_trade_off(1e16));
    CHECK_FALSE(is_valid_trade_off(-1e30));
    CHECK_FALSE(is_valid_trade_off(std::numeric_limits<double>::infinity()));
    CHECK_FALSE(is_valid_trade_off(-std::numeric_limits<double>::infinity()));
    CHECK_FALSE(is_valid_trade_off(std::nan("")));

    CHECK(scale_trade_off(1e15) == 1000000000000000000);
    CHECK(scale_trade_off(-9e15) == -9000000000000000000);
}

TEST_CASE("inclusion gain at the limits of i64", "[score]") {
    const i64 max = std::numeric_limits<i64>::max();
    const i64 min = std::numeric_limits<i64>::min();

    SECTION("huge costs are maximally penalized") {
        CHECK(inclusion_gain(0.5, 500, 20000000000000000) == 500 - max);
        CHECK(inclusion_gain(0.5, 500, max) == 500 - max);
        CHECK(inclusion_gain(0, 0, max) == -max);
        CHECK(inclusion_gain(0.001, 1, max / 999 + 1) == 1 - max);

        // The largest cost that does not overflow is penalized exactly.
        CHECK(inclusion_gain(0.5, 500, max / 500) == 500 - (max / 500) * 500);
    }

    SECTION("huge negative costs are not rewarded") {
        CHECK(inclusion_gain(0.5, 500, min) == 500);
        CHECK(inclusion_gain(0, 0, -20000000000000000) == 0);
    }

    SECTION("extreme trade-offs") {
        const i64 high = scale_trade_off(1e15);
        CHECK(inclusion_gain(1e15, high, 7) == high);
        CHECK(inclusion_gain(1e15, high, min) == high - max);

        const i64 low = scale_trade_off(-9e15);
        CHECK(inclusion_gain(-9e15, low, 0) == low);
        CHECK(inclusion_gain(-9e15, low, 1) == min);
        CHECK(inclusion_gain(-9e15, low, max) == min);
    }
}

TEST_CASE("add score clamps", "[score]") {
    const i64 max = std::numeric_limits<i64>::max();
    const i64 min = std::numeric_limits<i64>::min();

    CHECK(add_score(5, -7) == -2);
    CHECK(add_score(max - 1, 1) == max);
    CHECK(add_score(max - 1, 5) == max);
    CHECK(add_score(0, min) == min);
    CHECK(add_score(-1, min) == min);
    CHECK(add_score(max, min) == -1);
}
