/*
 * File:   double_double.hpp
 *
 * Two-limb extended precision, enough to keep n*step accurate across many
 * steps when step isn't exactly representable (0.1 and friends).
 */

#ifndef RANGESEARCH_DOUBLE_DOUBLE_HPP_INCLUDED
#define RANGESEARCH_DOUBLE_DOUBLE_HPP_INCLUDED

#include <bit>
#include <limits>
#include <type_traits>
#include <boost/integer.hpp>

namespace rangesearch {

/**
 * The unevaluated sum hi + lo, with |lo| <= ulp(hi)/2 for values produced by
 * the operations below.  Never modified after construction; multiply() and
 * invert() return new values.
 */
template<typename T>
class double_double {
	static_assert(std::numeric_limits<T>::is_iec559 && (sizeof(T) == 4 || sizeof(T) == 8),
			"double_double limbs must be IEEE single or double");
public:
	using value_type = T;

	constexpr double_double() = default;
	constexpr explicit double_double(T x) : hi_(x), lo_(0) {}
	/**
	 * Takes the limbs as given.  Callers passing a non-normalized pair can
	 * use fast_two_sum() instead.
	 */
	constexpr double_double(T hi, T lo) : hi_(hi), lo_(lo) {}

	constexpr T hi() const {return hi_;}
	constexpr T lo() const {return lo_;}

	bool operator==(const double_double&) const = default;
private:
	T hi_ = 0, lo_ = 0;
};

template<typename T>
struct is_double_double : std::false_type {};
template<typename T>
struct is_double_double<double_double<T>> : std::true_type {};
template<typename T>
inline constexpr bool is_double_double_v = is_double_double<T>::value;

//The ordinary arithmetic type behind a (possibly double-double) step.
template<typename S>
struct plain_type {using type = S;};
template<typename T>
struct plain_type<double_double<T>> {using type = T;};
template<typename S>
using plain_type_t = typename plain_type<S>::type;

template<typename T>
constexpr T to_plain(const double_double<T>& x) {
	return x.hi() + x.lo();
}
template<typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
constexpr T to_plain(T x) {
	return x;
}

/**
 * Splits x into hi + lo == x exactly, with the low half of hi's mantissa
 * zeroed so that products of two hi parts are exact.
 */
template<typename T>
constexpr double_double<T> split(T x) {
	using bits_t = typename boost::uint_t<sizeof(T) * 8>::exact;
	constexpr int dropped = (std::numeric_limits<T>::digits + 1) / 2;
	constexpr bits_t mask = static_cast<bits_t>(~bits_t(0) << dropped);
	T hi = std::bit_cast<T>(static_cast<bits_t>(std::bit_cast<bits_t>(x) & mask));
	return {hi, x - hi};
}

//Requires |a| >= |b| (or a == 0).
template<typename T>
constexpr double_double<T> fast_two_sum(T a, T b) {
	T s = a + b;
	return {s, b - (s - a)};
}

//a*b as the rounded product and its rounding error (Dekker).  split()
//truncates rather than rounding, so for double limbs the low parts carry up
//to 27 bits and lo*lo can round: the error term may be off in its last bit,
//around 2^-104 relative to the product.
template<typename T>
constexpr double_double<T> two_product(T a, T b) {
	T p = a * b;
	auto as = split(a), bs = split(b);
	T err = ((as.hi()*bs.hi() - p) + as.hi()*bs.lo() + as.lo()*bs.hi()) + as.lo()*bs.lo();
	return {p, err};
}

template<typename T>
constexpr double_double<T> multiply(const double_double<T>& a, T b) {
	auto c = two_product(a.hi(), b);
	return fast_two_sum(c.hi(), c.lo() + a.lo()*b);
}

template<typename T>
constexpr double_double<T> multiply(const double_double<T>& a, const double_double<T>& b) {
	auto c = two_product(a.hi(), b.hi());
	return fast_two_sum(c.hi(), (a.hi()*b.lo() + a.lo()*b.hi()) + c.lo());
}

/**
 * 1/y with one Newton correction of the plain reciprocal.  y.hi() must be
 * nonzero.
 */
template<typename T>
constexpr double_double<T> invert(const double_double<T>& y) {
	T c = T(1) / y.hi();
	auto u = two_product(c, y.hi());
	T cc = (((T(1) - u.hi()) - u.lo()) - c*y.lo()) / y.hi();
	return {c, cc};
}

template<typename T>
constexpr double_double<T> operator*(const double_double<T>& a, T b) {
	return multiply(a, b);
}
template<typename T>
constexpr double_double<T> operator*(T a, const double_double<T>& b) {
	return multiply(b, a);
}
template<typename T>
constexpr double_double<T> operator*(const double_double<T>& a, const double_double<T>& b) {
	return multiply(a, b);
}

}//namespace rangesearch

#endif /* RANGESEARCH_DOUBLE_DOUBLE_HPP_INCLUDED */
