/*
 * File:   search.hpp
 *
 * Closed-form searchsortedfirst/searchsortedlast over arithmetic
 * progressions, plus nearest-value search.  Results are 1-based indices:
 * searchsortedfirst is the first index whose element is >= x (length+1 if
 * none), searchsortedlast the last index whose element is <= x (0 if none).
 *
 * The unsafe_ variants skip the clamp to the progression's bounds and
 * extrapolate, which is how callers shift axes beyond the materialized range.
 */

#ifndef RANGESEARCH_SEARCH_HPP_INCLUDED
#define RANGESEARCH_SEARCH_HPP_INCLUDED

#include <algorithm>
#include <cmath>
#include <iterator>
#include <type_traits>
#include "double_double.hpp"
#include "numutils.hpp"
#include "range.hpp"

namespace rangesearch {

/**
 * Which closed form a search uses.  integer needs an integer element and
 * step type and is exact; unsigned_query is integer with an unsigned needle,
 * which gets subtracted in a signed type; everything else (including
 * double-double steps) rounds and corrects.
 */
enum class search_kind {continuous, integer, unsigned_query};

template<typename T, typename S, typename X>
constexpr search_kind search_kind_for() {
	if constexpr (std::is_integral_v<T> && std::is_integral_v<S>) {
		if constexpr (std::is_integral_v<X> && std::is_unsigned_v<X>)
			return search_kind::unsigned_query;
		else
			return search_kind::integer;
	} else
		return search_kind::continuous;
}

template<typename Range, typename X>
inline constexpr search_kind search_kind_v =
		search_kind_for<typename Range::value_type, typename Range::step_type, X>();

//Round the real-valued index to nearest, then nudge by one: the rounding can
//land on the wrong side of x.
template<typename T, typename S, typename X>
index_type continuous_searchsortedfirst(const step_range<T, S>& a, X x) {
	check_step(a.step(), "unsafe_searchsortedfirst");
	using F = real_t<T, plain_type_t<S>, X>;
	index_type n = to_index(std::nearbyint((static_cast<F>(x) - static_cast<F>(a.first())) / static_cast<F>(to_plain(a.step())))) + 1;
	return static_cast<F>(a.element(n)) < static_cast<F>(x) ? n + 1 : n;
}

template<typename T, typename S, typename X>
index_type continuous_searchsortedlast(const step_range<T, S>& a, X x) {
	check_step(a.step(), "unsafe_searchsortedlast");
	using F = real_t<T, plain_type_t<S>, X>;
	index_type n = to_index(std::nearbyint((static_cast<F>(x) - static_cast<F>(a.first())) / static_cast<F>(to_plain(a.step())))) + 1;
	return static_cast<F>(x) < static_cast<F>(a.element(n)) ? n - 1 : n;
}

template<typename T, typename S, typename X>
index_type integer_searchsortedfirst(const step_range<T, S>& a, X x) {
	static_assert(std::is_integral_v<T> && std::is_integral_v<S>, "integer search needs an integer range");
	check_step(a.step(), "unsafe_searchsortedfirst");
	index_type a0 = static_cast<index_type>(a.first()), s = static_cast<index_type>(a.step());
	return -floor_div(integer_floor(-x) + a0, s) + 1;
}

template<typename T, typename S, typename X>
index_type integer_searchsortedlast(const step_range<T, S>& a, X x) {
	static_assert(std::is_integral_v<T> && std::is_integral_v<S>, "integer search needs an integer range");
	check_step(a.step(), "unsafe_searchsortedlast");
	index_type a0 = static_cast<index_type>(a.first()), s = static_cast<index_type>(a.step());
	return floor_div(integer_floor(x) - a0, s) + 1;
}

//a0 - x would wrap in the unsigned type, so subtract in a signed one.
template<typename T, typename S, typename U>
index_type unsigned_searchsortedfirst(const step_range<T, S>& a, U x) {
	static_assert(std::is_integral_v<T> && std::is_integral_v<S>, "integer search needs an integer range");
	static_assert(std::is_unsigned_v<U>);
	check_step(a.step(), "unsafe_searchsortedfirst");
	index_type a0 = static_cast<index_type>(a.first()), s = static_cast<index_type>(a.step());
	index_type sx = static_cast<widened_signed_t<U>>(x);
	return -floor_div(a0 - sx, s) + 1;
}

template<typename T, typename S, typename U>
index_type unsigned_searchsortedlast(const step_range<T, S>& a, U x) {
	static_assert(std::is_integral_v<T> && std::is_integral_v<S>, "integer search needs an integer range");
	static_assert(std::is_unsigned_v<U>);
	check_step(a.step(), "unsafe_searchsortedlast");
	index_type a0 = static_cast<index_type>(a.first()), s = static_cast<index_type>(a.step());
	index_type sx = static_cast<widened_signed_t<U>>(x);
	return floor_div(sx - a0, s) + 1;
}

template<typename T, typename S, typename X>
index_type unsafe_searchsortedfirst(const step_range<T, S>& a, X x) {
	constexpr search_kind kind = search_kind_for<T, S, X>();
	if constexpr (kind == search_kind::unsigned_query)
		return unsigned_searchsortedfirst(a, x);
	else if constexpr (kind == search_kind::integer)
		return integer_searchsortedfirst(a, x);
	else
		return continuous_searchsortedfirst(a, x);
}

template<typename T, typename S, typename X>
index_type unsafe_searchsortedlast(const step_range<T, S>& a, X x) {
	constexpr search_kind kind = search_kind_for<T, S, X>();
	if constexpr (kind == search_kind::unsigned_query)
		return unsigned_searchsortedlast(a, x);
	else if constexpr (kind == search_kind::integer)
		return integer_searchsortedlast(a, x);
	else
		return continuous_searchsortedlast(a, x);
}

template<typename T, typename S, typename X>
index_type searchsortedfirst(const step_range<T, S>& a, X x) {
	index_type n = unsafe_searchsortedfirst(a, x);
	return std::clamp<index_type>(n, 1, a.length() + 1);
}

template<typename T, typename S, typename X>
index_type searchsortedlast(const step_range<T, S>& a, X x) {
	index_type n = unsafe_searchsortedlast(a, x);
	return std::clamp<index_type>(n, 0, a.length());
}

//Binary search over any sorted random-access sequence.
template<typename Sequence, typename X>
index_type searchsortedfirst(const Sequence& seq, X x) {
	using std::begin, std::end;
	return std::distance(begin(seq), std::lower_bound(begin(seq), end(seq), x)) + 1;
}

template<typename Sequence, typename X>
index_type searchsortedlast(const Sequence& seq, X x) {
	using std::begin, std::end;
	return std::distance(begin(seq), std::upper_bound(begin(seq), end(seq), x));
}

/**
 * Returns the index of the element of the sorted sequence closest to x,
 * rounding up: the previous element only wins if it is strictly closer.
 * With several equal elements equally close to x, that's the first of them
 * if x is at most their value and the last otherwise.
 */
template<typename Sequence, typename X>
index_type searchsortednearest(const Sequence& seq, X x) {
	using std::begin, std::size;
	index_type idx = searchsortedfirst(seq, x);
	if (idx > 1) {
		auto it = begin(seq);
		if (idx > static_cast<index_type>(size(seq)) ||
				(*std::next(it, idx-1) - x) > (x - *std::next(it, idx-2)))
			--idx;
	}
	return idx;
}

template<typename T, typename S, typename X>
index_type searchsortednearest(const step_range<T, S>& a, X x) {
	using F = real_t<T, plain_type_t<S>, X>;
	index_type idx = searchsortedfirst(a, x);
	F fx = static_cast<F>(x);
	if (idx > 1 && (idx > a.length() ||
			static_cast<F>(a.element(idx)) - fx > fx - static_cast<F>(a.element(idx - 1))))
		--idx;
	return idx;
}

//As searchsortednearest, but extrapolating past either end of the range.
template<typename T, typename S, typename X>
index_type unsafe_searchsortednearest(const step_range<T, S>& a, X x) {
	using F = real_t<T, plain_type_t<S>, X>;
	index_type idx = unsafe_searchsortedfirst(a, x);
	F fx = static_cast<F>(x);
	if (static_cast<F>(a.element(idx)) - fx > fx - static_cast<F>(a.element(idx - 1)))
		--idx;
	return idx;
}

}//namespace rangesearch

#endif /* RANGESEARCH_SEARCH_HPP_INCLUDED */
