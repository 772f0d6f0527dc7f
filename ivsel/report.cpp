#include "ivsel/report.hpp"

#include "ivsel/score.hpp"

#include <fmt/format.h>

#include <string>

namespace ivsel {

namespace {

// Counts are printed as integers. Other scores always show a fractional
// part or an exponent, i.e. 1.0 instead of 1.
std::string format_score(const selection_result& result) {
    if (result.score_is_count) {
        return fmt::format("{}", static_cast<u64>(result.score));
    }

    std::string str = fmt::format("{}", result.score);
    if (str.find_first_of(".eEin") == std::string::npos) {
        str += ".0";
    }
    return str;
}

} // namespace

selection_summary summarize(const selection_result& result) {
    selection_summary summary;
    for (const interval& i : result.selected) {
        summary.total_cost = add_score(summary.total_cost, i.cost());
    }
    summary.count = result.selected.size();
    return summary;
}

void print_result(std::ostream& o, const selection_result& result) {
    const selection_summary summary = summarize(result);

    o << "\nOptimal set of intervals:\n";
    for (const interval& i : result.selected) {
        o << i << "\n";
    }

    o << fmt::format("\nMaximum Score: {}\n", format_score(result))
      << fmt::format("\nTotal Cost Score: {}\n", summary.total_cost)
      << fmt::format("\nCount Intervals: {}\n", summary.count)
      << std::flush;
}

} // namespace ivsel
