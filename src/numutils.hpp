/*
 * File:   numutils.hpp
 *
 * Integer and rounding helpers shared by the search and step-offset code.
 */

#ifndef RANGESEARCH_NUMUTILS_HPP_INCLUDED
#define RANGESEARCH_NUMUTILS_HPP_INCLUDED

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <boost/integer.hpp>
#include <boost/numeric/conversion/cast.hpp>
#include <fmt/format.h>

namespace rangesearch {

//Indices are 1-based and may be negative (extrapolation), so signed.
using index_type = std::ptrdiff_t;

//The floating-point type a computation over the given arithmetic types
//happens in: their common type if that's floating, else double.
template<typename... Ts>
using real_t = std::conditional_t<std::is_floating_point_v<std::common_type_t<Ts...>>,
		std::common_type_t<Ts...>, double>;

//A signed type holding every value of the unsigned type U.  Saturates at 64
//bits, where the conversion reinterprets the bits instead of widening.
template<typename U>
using widened_signed_t = typename boost::int_t<std::min(std::numeric_limits<U>::digits + 1, 64)>::least;

template<typename F>
index_type to_index(F f) {
	static_assert(std::is_floating_point_v<F>);
	if (std::isnan(f))
		throw std::domain_error(fmt::format("cannot convert {} to an index", f));
	return boost::numeric_cast<index_type>(f);
}

//floor(x) as an index; the identity on integers.
template<typename X>
index_type integer_floor(X x) {
	if constexpr (std::is_integral_v<X>)
		return static_cast<index_type>(x);
	else
		return to_index(std::floor(x));
}

template<typename X>
constexpr bool is_negative(X x) {
	if constexpr (std::is_unsigned_v<X>)
		return false;
	else
		return x < X(0);
}

//|x| for integers, in index_type.
template<typename X>
constexpr index_type int_magnitude(X x) {
	static_assert(std::is_integral_v<X>);
	index_type i = static_cast<index_type>(x);
	return is_negative(x) ? -i : i;
}

//Division rounding toward negative infinity.
template<typename I>
constexpr I floor_div(I a, I b) {
	static_assert(std::is_integral_v<I> && std::is_signed_v<I>, "floor_div needs signed integers");
	I q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0)))
		--q;
	return q;
}

}//namespace rangesearch

#endif /* RANGESEARCH_NUMUTILS_HPP_INCLUDED */
