/*
 * File:   intervals.hpp
 *
 * Mapping closed intervals of coordinate values onto index ranges of an
 * arithmetic progression.
 */

#ifndef RANGESEARCH_INTERVALS_HPP_INCLUDED
#define RANGESEARCH_INTERVALS_HPP_INCLUDED

#include <type_traits>
#include "nsteps.hpp"
#include "range.hpp"
#include "search.hpp"

namespace rangesearch {

//[left, right], both ends included.  left <= right is the caller's business.
template<typename T>
struct closed_interval {
	T left, right;
	bool operator==(const closed_interval&) const = default;
};

template<typename T>
closed_interval(T, T) -> closed_interval<T>;

/**
 * The indices of a whose elements fall within the interval, possibly
 * extending outside [1, length].
 */
template<typename T, typename S, typename X>
index_range unsafe_searchsorted(const step_range<T, S>& a, const closed_interval<X>& interval) {
	return unit_range(unsafe_searchsortedfirst(a, interval.left), unsafe_searchsortedlast(a, interval.right));
}

template<typename T, typename S, typename X>
index_range searchsorted(const step_range<T, S>& a, const closed_interval<X>& interval) {
	return unit_range(searchsortedfirst(a, interval.left), searchsortedlast(a, interval.right));
}

template<typename T, typename S>
struct relative_window {
	index_range indices;
	step_range<T, S> values;
};

/**
 * Treats the interval's ends as displacements from zero and returns the
 * whole-step offsets they cover, along with the values at those offsets
 * (values[k] == indices[k]*step(a)).  a contributes only its step.
 */
template<typename T, typename S, typename X>
relative_window<T, S> relativewindow(const step_range<T, S>& a, const closed_interval<X>& interval) {
	const S& s = a.step();
	index_range idx = unit_range(nsteps(interval.left, s), nsteps(interval.right, s));
	auto start = detail::times_step<T>(idx.first(), s);
	return {idx, step_range<T, S>(static_cast<T>(to_plain(start)), s, idx.length())};
}

}//namespace rangesearch

#endif /* RANGESEARCH_INTERVALS_HPP_INCLUDED */
