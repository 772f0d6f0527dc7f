#include "ivsel/interval.hpp"

#include <algorithm>

namespace ivsel {

std::ostream& operator<<(std::ostream& o, const interval& i) {
    return o << "(" << i.begin() << ", " << i.end() << ", " << i.cost() << ")";
}

void sort_by_end(std::vector<interval>& intervals) {
    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const interval& a, const interval& b) {
        return a.end() < b.end();
    });
}

} // namespace ivsel
