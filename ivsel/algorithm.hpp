#ifndef IVSEL_ALGORITHM_HPP
#define IVSEL_ALGORITHM_HPP

#include "ivsel/common.hpp"

#include <boost/range/begin.hpp>
#include <boost/range/concepts.hpp>
#include <boost/range/end.hpp>

#include <type_traits>
#include <utility>

/// \file
/// Some generic algorithms.

namespace ivsel {

/// Invokes the function object `f` for every pair of adjacent elements
/// in `r`.
///
/// For example, if `r = [1, 2, 3]`, this algorithm will
/// call `f(1, 2)` and `f(2, 3)`.
template<typename FwdRange, typename Function>
void for_each_adjacent(FwdRange&& r, Function&& f) {
    BOOST_CONCEPT_ASSERT(( boost::ForwardRangeConcept<typename std::remove_reference<FwdRange>::type> ));

    auto current = boost::begin(r);
    auto last = boost::end(r);

    if (current != last) {
        auto previous = current;
        ++current;
        for (; current != last; ++current, ++previous) {
            f(*previous, *current);
        }
    }
}

/// True iff `p(a, b)` holds for every pair of adjacent elements `a`, `b` in `r`.
template<typename FwdRange, typename Predicate>
bool all_adjacent(FwdRange&& r, Predicate&& p) {
    bool result = true;
    for_each_adjacent(std::forward<FwdRange>(r), [&](const auto& a, const auto& b) {
        if (result && !p(a, b)) {
            result = false;
        }
    });
    return result;
}

} // namespace ivsel

#endif // IVSEL_ALGORITHM_HPP
