#ifndef IVSEL_INTERVAL_HPP
#define IVSEL_INTERVAL_HPP

#include "ivsel/common.hpp"

#include <ostream>
#include <vector>

/// \file
/// Contains the interval type processed by the optimizer.

namespace ivsel {

/// A time span `[begin, end]` together with the cost of selecting it.
///
/// Intervals are plain values: two intervals with equal fields are
/// indistinguishable, but duplicates within a collection are treated
/// independently by the optimizer.
/// `begin <= end` is expected but not enforced.
class interval {
public:
    /// Equivalent to `interval(0, 0, 0)`.
    interval(): interval(0, 0, 0) {}

    /// Constructs a new interval with the given `begin`, `end` and `cost`.
    interval(i64 begin, i64 end, i64 cost)
        : m_begin(begin), m_end(end), m_cost(cost) {}

    /// Returns the begin of the interval.
    i64 begin() const { return m_begin; }

    /// Returns the end point of the interval.
    i64 end() const { return m_end; }

    /// Returns the cost of selecting this interval.
    i64 cost() const { return m_cost; }

    /// Returns true iff this interval ends strictly before `other` begins.
    /// Two intervals can only be part of the same selection if one
    /// of them precedes the other.
    bool precedes(const interval& other) const {
        return m_end < other.m_begin;
    }

    /// Returns true if neither interval precedes the other.
    bool overlaps(const interval& other) const {
        return !precedes(other) && !other.precedes(*this);
    }

private:
    i64 m_begin;
    i64 m_end;
    i64 m_cost;
};

inline bool operator==(const interval& a, const interval& b) {
    return a.begin() == b.begin() && a.end() == b.end() && a.cost() == b.cost();
}

inline bool operator!=(const interval& a, const interval& b) {
    return !(a == b);
}

/// Prints `(begin, end, cost)`.
std::ostream& operator<<(std::ostream& o, const interval& i);

/// Sorts the intervals by their end point.
/// Intervals with the same end point keep their relative order.
void sort_by_end(std::vector<interval>& intervals);

} // namespace ivsel

#endif // IVSEL_INTERVAL_HPP
