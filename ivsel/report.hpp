#ifndef IVSEL_REPORT_HPP
#define IVSEL_REPORT_HPP

#include "ivsel/common.hpp"
#include "ivsel/optimizer.hpp"

#include <cstddef>
#include <ostream>

namespace ivsel {

struct selection_summary {
    /// Sum of the costs of all selected intervals, clamped to the range of i64.
    i64 total_cost = 0;

    /// Number of selected intervals.
    size_t count = 0;
};

selection_summary summarize(const selection_result& result);

/// Prints the selected intervals (one per line), the score,
/// the total cost and the number of selected intervals.
void print_result(std::ostream& o, const selection_result& result);

} // namespace ivsel

#endif // IVSEL_REPORT_HPP
