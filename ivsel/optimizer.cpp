#include "ivsel/optimizer.hpp"

#include "ivsel/algorithm.hpp"
#include "ivsel/predecessor.hpp"
#include "ivsel/score.hpp"
#include "ivsel/utility/stats_guard.hpp"

#include <algorithm>

namespace ivsel {

namespace {

// One row of the dp table. Row i describes the best selection
// among the first i intervals (in sorted order).
struct table_row {
    // Best score for this prefix.
    i64 score = 0;

    // True iff the best selection for this prefix includes interval i - 1.
    bool included = false;

    // The row the selection was extended from if `included` is true,
    // i.e. predecessor(i - 1) + 1.
    size_t parent = 0;
};

} // namespace

selection_result optimize(std::vector<interval> intervals, double trade_off) {
    STATS_GUARD(guard, "optimize {} intervals (trade-off {})", intervals.size(), trade_off);

    {
        STATS_GUARD(sort_guard, "sort");
        sort_by_end(intervals);
        if (!intervals.empty()) {
            STATS_PRINT(sort_guard, "end points range from {} to {}",
                        intervals.front().end(), intervals.back().end());
        }
    }

    const i64 trade_off_scaled = scale_trade_off(trade_off);
    const size_t size = intervals.size();
    const gsl::span<const interval> sorted(intervals);

    // table[0] is the empty selection with score 0.
    std::vector<table_row> table(size + 1);
    {
        STATS_GUARD(dp_guard, "dynamic program");

        for (size_t i = 1; i <= size; ++i) {
            const interval& current = intervals[i - 1];

            const i64 exclude_score = table[i - 1].score;

            const std::ptrdiff_t pred = find_predecessor(sorted, static_cast<std::ptrdiff_t>(i - 1));
            const size_t base = static_cast<size_t>(pred + 1);
            ivsel_assert(base < i, "predecessor must be an earlier row");

            const i64 include_score = add_score(table[base].score,
                    inclusion_gain(trade_off, trade_off_scaled, current.cost()));

            // Ties are resolved in favor of the smaller prefix.
            table_row& row = table[i];
            if (include_score > exclude_score) {
                row.score = include_score;
                row.included = true;
                row.parent = base;
            } else {
                row.score = exclude_score;
            }
        }

        STATS_PRINT(dp_guard, "{} of {} rows include their interval, best score {}",
                    std::count_if(table.begin(), table.end(), [](const table_row& row) {
                        return row.included;
                    }),
                    size, table[size].score);
    }

    selection_result result;
    {
        STATS_GUARD(backtrack_guard, "backtrack");

        // Walk back from the last row: rows that include their interval
        // continue at their parent, all others at the previous row.
        size_t i = size;
        while (i > 0) {
            const table_row& row = table[i];
            if (row.included) {
                result.selected.push_back(intervals[i - 1]);
                i = row.parent;
            } else {
                --i;
            }
        }
        std::reverse(result.selected.begin(), result.selected.end());

        ivsel_assert(all_adjacent(result.selected, [](const interval& a, const interval& b) {
                        return a.precedes(b);
                     }), "selected intervals must not overlap");

        STATS_PRINT(backtrack_guard, "{} intervals selected", result.selected.size());
    }

    result.raw_score = table[size].score;
    result.score = final_score(trade_off, result.raw_score, result.selected.size());
    result.score_is_count = trade_off == 1;
    return result;
}

} // namespace ivsel
