#ifndef IVSEL_PREDECESSOR_HPP
#define IVSEL_PREDECESSOR_HPP

#include "ivsel/common.hpp"
#include "ivsel/interval.hpp"

#include <cstddef>

namespace ivsel {

/// Returned by `find_predecessor` if no interval ends before the current one begins.
static constexpr std::ptrdiff_t no_predecessor = -1;

/// Returns the largest index `j < index` for which `sorted[j].end() < sorted[index].begin()`
/// or `no_predecessor` if there is no such index.
///
/// Uses binary search over `[0, index - 1]`, i.e. O(log index) probes.
///
/// \pre `sorted` is sorted by end point.
/// \pre `0 <= index < sorted.size()`.
std::ptrdiff_t find_predecessor(gsl::span<const interval> sorted, std::ptrdiff_t index);

} // namespace ivsel

#endif // IVSEL_PREDECESSOR_HPP
