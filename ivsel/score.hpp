#ifndef IVSEL_SCORE_HPP
#define IVSEL_SCORE_HPP

#include "ivsel/common.hpp"

#include <cstddef>

/// \file
/// Integer arithmetic for the count/cost trade-off.
///
/// A trade-off of 1 maximizes the number of selected intervals,
/// a trade-off of 0 minimizes their total cost. Values in between are
/// scaled by `scale_factor` and truncated so that scores can be
/// accumulated as integers.

namespace ivsel {

static constexpr i64 scale_factor = 1000;

/// True iff `trade_off` is finite and `trade_off * scale_factor` fits into an i64.
/// Values outside of [0, 1] are valid.
bool is_valid_trade_off(double trade_off);

/// Returns `trade_off * scale_factor`, truncated towards zero.
///
/// \pre `is_valid_trade_off(trade_off)`.
i64 scale_trade_off(double trade_off);

/// Returns the amount added to the predecessor's score when an interval
/// with the given `cost` becomes part of the selection.
///
///     - `trade_off == 0` and `cost == 0`: 1
///     - `trade_off == 1`: 1
///     - otherwise: `trade_off_scaled - max(0, (scale_factor - trade_off_scaled) * cost)`
///
/// Note that with `trade_off == 0` a non-zero cost falls through to the last
/// case, which then penalizes the interval by `scale_factor * cost`.
///
/// A penalty that does not fit into an i64 is clamped to the largest i64
/// and the result is clamped to the smallest i64, so huge costs stay
/// maximally penalized.
i64 inclusion_gain(double trade_off, i64 trade_off_scaled, i64 cost);

/// Returns `score + gain`, clamped to the range of i64.
i64 add_score(i64 score, i64 gain);

/// Converts the accumulated score of a selection into the reported score.
/// Returns `count` if `trade_off == 1` and `raw_score / scale_factor` otherwise.
double final_score(double trade_off, i64 raw_score, size_t count);

} // namespace ivsel

#endif // IVSEL_SCORE_HPP
