/*
 * File:   nsteps.hpp
 *
 * How many whole steps a displacement from zero covers.
 */

#ifndef RANGESEARCH_NSTEPS_HPP_INCLUDED
#define RANGESEARCH_NSTEPS_HPP_INCLUDED

#include <cmath>
#include <type_traits>
#include "double_double.hpp"
#include "numutils.hpp"
#include "range.hpp"

namespace rangesearch {

/**
 * Returns the signed n such that |n*step| is the largest multiple of step not
 * exceeding |x|, with n taking x's sign (0 for x == 0).
 */
template<typename X, typename S>
index_type nsteps(X x, S step) {
	static_assert(std::is_arithmetic_v<X> && std::is_arithmetic_v<S>);
	check_step(step, "nsteps");
	index_type offset;
	if constexpr (std::is_integral_v<X> && std::is_integral_v<S>)
		offset = int_magnitude(x) / int_magnitude(step);
	else {
		using F = real_t<X, S>;
		offset = to_index(std::floor(std::abs(static_cast<F>(x) / static_cast<F>(step))));
	}
	return is_negative(x) ? -offset : offset;
}

/**
 * The double-double step has no division against a plain value, so divide by
 * the collapsed step and then check the rounded-up candidate against the
 * full-precision product; the quotient can land on either side of a step
 * boundary.
 */
template<typename X, typename T>
index_type nsteps(X x, const double_double<T>& step) {
	check_step(step, "nsteps");
	T ax = std::abs(static_cast<T>(x));
	T nf = std::abs(static_cast<T>(x) / to_plain(step));
	index_type nc = to_index(std::ceil(nf));
	index_type offset = std::abs(to_plain(step * static_cast<T>(nc))) <= ax ? nc : to_index(std::floor(nf));
	return is_negative(x) ? -offset : offset;
}

}//namespace rangesearch

#endif /* RANGESEARCH_NSTEPS_HPP_INCLUDED */
