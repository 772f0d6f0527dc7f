#ifndef IVSEL_OPTIMIZER_HPP
#define IVSEL_OPTIMIZER_HPP

#include "ivsel/common.hpp"
#include "ivsel/interval.hpp"

#include <vector>

namespace ivsel {

/// The outcome of a single optimization run.
struct selection_result {
    /// The selected intervals, ordered by their end point.
    /// No two of them overlap.
    std::vector<interval> selected;

    /// The reported score. Either the number of selected intervals
    /// (for a trade-off of 1) or the accumulated score divided by `scale_factor`.
    double score = 0;

    /// The accumulated integer score of the selection, before scaling.
    i64 raw_score = 0;

    /// True iff `score` is the number of selected intervals.
    bool score_is_count = false;
};

/// Selects a set of non-overlapping intervals that maximizes a blend
/// of the number of selected intervals and their (negated) total cost.
///
/// `trade_off` weighs the two goals: 1 only counts intervals, 0 only
/// minimizes cost (see `inclusion_gain` for the exact arithmetic).
/// Values outside of [0, 1] are accepted and extrapolate the blended score.
///
/// The intervals are taken by value and sorted by their end point
/// (stable, see `sort_by_end`); the caller's collection is not modified.
/// If multiple selections reach the best score, the outcome depends on
/// the input order of intervals with equal end points.
///
/// Runs in O(n log n) time and uses O(n) additional space.
///
/// \pre `is_valid_trade_off(trade_off)`.
selection_result optimize(std::vector<interval> intervals, double trade_off = 0.5);

} // namespace ivsel

#endif // IVSEL_OPTIMIZER_HPP
