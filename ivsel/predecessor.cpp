#include "ivsel/predecessor.hpp"

namespace ivsel {

std::ptrdiff_t find_predecessor(gsl::span<const interval> sorted, std::ptrdiff_t index) {
    Expects(index >= 0 && index < static_cast<std::ptrdiff_t>(sorted.size()));

    const interval& current = sorted[index];
    std::ptrdiff_t low = 0;
    std::ptrdiff_t high = index - 1;
    while (low <= high) {
        const std::ptrdiff_t mid = low + (high - low) / 2;
        if (sorted[mid].precedes(current)) {
            // mid + 1 <= index, so the lookahead is always in bounds.
            if (sorted[mid + 1].precedes(current)) {
                low = mid + 1;
            } else {
                return mid;
            }
        } else {
            high = mid - 1;
        }
    }
    return no_predecessor;
}

} // namespace ivsel
