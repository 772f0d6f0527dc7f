#include "ivsel/score.hpp"

#include <cmath>
#include <limits>

namespace ivsel {

namespace {

constexpr i64 max_i64 = std::numeric_limits<i64>::max();
constexpr i64 min_i64 = std::numeric_limits<i64>::min();

// Returns max(0, factor * cost), clamped to max_i64.
i64 cost_penalty(i64 factor, i64 cost) {
    if (factor == 0 || cost == 0 || (factor < 0) != (cost < 0)) {
        return 0;
    }
    // Both operands have the same sign, the product is positive.
    if (factor > 0 ? cost > max_i64 / factor : cost < max_i64 / factor) {
        return max_i64;
    }
    return factor * cost;
}

} // namespace

bool is_valid_trade_off(double trade_off) {
    // 2^63 is exactly representable, every smaller magnitude converts without overflow.
    constexpr double limit = 9223372036854775808.0;
    return std::isfinite(trade_off) && std::abs(trade_off * scale_factor) < limit;
}

i64 scale_trade_off(double trade_off) {
    Expects(is_valid_trade_off(trade_off));
    return static_cast<i64>(trade_off * scale_factor);
}

i64 inclusion_gain(double trade_off, i64 trade_off_scaled, i64 cost) {
    if (trade_off == 0 && cost == 0) {
        return 1;
    }
    if (trade_off == 1) {
        return 1;
    }

    // scale_factor - trade_off_scaled overflows only for trade_off_scaled < min_i64 + scale_factor.
    const i64 factor = trade_off_scaled < min_i64 + scale_factor
            ? max_i64
            : scale_factor - trade_off_scaled;
    const i64 penalty = cost_penalty(factor, cost);
    if (trade_off_scaled < min_i64 + penalty) {
        return min_i64;
    }
    return trade_off_scaled - penalty;
}

i64 add_score(i64 score, i64 gain) {
    if (gain > 0 && score > max_i64 - gain) {
        return max_i64;
    }
    if (gain < 0 && score < min_i64 - gain) {
        return min_i64;
    }
    return score + gain;
}

double final_score(double trade_off, i64 raw_score, size_t count) {
    if (trade_off == 1) {
        return static_cast<double>(count);
    }
    return static_cast<double>(raw_score) / scale_factor;
}

} // namespace ivsel
