/*
 * File:   range.hpp
 *
 * Arithmetic progressions: a start, a step and a length, with elements
 * computed rather than stored.  Indices are 1-based throughout this library;
 * element i is start + (i-1)*step for any integer i, including indices
 * outside [1, length], which is what lets the unsafe searches extrapolate.
 */

#ifndef RANGESEARCH_RANGE_HPP_INCLUDED
#define RANGESEARCH_RANGE_HPP_INCLUDED

#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <boost/iterator/iterator_facade.hpp>
#include <fmt/format.h>
#include "double_double.hpp"
#include "numutils.hpp"

namespace rangesearch {

struct invalid_step : public std::invalid_argument {
	explicit invalid_step(std::string_view operation)
		: std::invalid_argument(fmt::format("{}: ranges with a zero step are unsupported", operation)) {}
};

template<typename S>
bool step_is_zero(const S& step) {
	if constexpr (is_double_double_v<S>)
		return step.hi() == 0;
	else
		return step == S(0);
}

//Every operation dividing by a step calls this first.
template<typename S>
void check_step(const S& step, std::string_view operation) {
	if (step_is_zero(step))
		throw invalid_step(operation);
}

namespace detail {
//n*step in the element type T, or in double-double for such steps.
template<typename T, typename S>
auto times_step(index_type n, const S& step) {
	if constexpr (is_double_double_v<S>)
		return step * static_cast<T>(n);
	else
		return static_cast<T>(static_cast<T>(n) * static_cast<T>(step));
}

//step*n as a new step, keeping the step's own type.
template<typename T, typename S>
S scale_step(const S& step, index_type n) {
	if constexpr (is_double_double_v<S>)
		return step * static_cast<T>(n);
	else
		return static_cast<S>(static_cast<std::common_type_t<S, index_type>>(step) * n);
}
}

template<typename T, typename S = T>
class step_range {
	static_assert(std::is_arithmetic_v<T>, "step_range elements must be arithmetic");
	static_assert(std::is_floating_point_v<T> || std::is_integral_v<S>,
			"integer progressions need an integer step");
public:
	using value_type = T;
	using step_type = S;

	class iterator : public boost::iterator_facade<iterator, T, boost::random_access_traversal_tag, T, index_type> {
	public:
		iterator() = default;
		iterator(const step_range* range, index_type i) : range_(range), i_(i) {}
	private:
		friend class boost::iterator_core_access;
		T dereference() const {return range_->element(i_);}
		bool equal(const iterator& other) const {return i_ == other.i_;}
		void increment() {++i_;}
		void decrement() {--i_;}
		void advance(index_type n) {i_ += n;}
		index_type distance_to(const iterator& other) const {return other.i_ - i_;}
		const step_range* range_ = nullptr;
		index_type i_ = 1;
	};

	step_range(T start, S step, index_type length)
		: start_(start), step_(step), length_(length < 0 ? 0 : length) {}

	T first() const {return start_;}
	const S& step() const {return step_;}
	index_type length() const {return length_;}
	index_type size() const {return length_;}
	bool empty() const {return length_ == 0;}
	T last() const {return element(length_);}

	/**
	 * start + (i-1)*step with no bounds check; i may be anything, including
	 * 0 or negative.
	 */
	T element(index_type i) const {
		auto offset = detail::times_step<T>(i - 1, step_);
		if constexpr (is_double_double_v<S>)
			return static_cast<T>((start_ + offset.hi()) + offset.lo());
		else
			return static_cast<T>(start_ + offset);
	}
	T at(index_type i) const {
		if (i < 1 || i > length_)
			throw std::out_of_range(fmt::format("index {} out of bounds for range of length {}", i, length_));
		return element(i);
	}

	iterator begin() const {return {this, 1};}
	iterator end() const {return {this, length_ + 1};}

	bool operator==(const step_range&) const = default;
private:
	T start_;
	S step_;
	index_type length_;
};

using index_range = step_range<index_type>;

//first, first+1, ..., last; empty if last < first.
inline index_range unit_range(index_type first, index_type last) {
	return index_range(first, 1, last - first + 1);
}

template<typename T, typename S>
T inbounds_getindex(const step_range<T, S>& r, index_type i) {
	return r.element(i);
}

/**
 * The elements of r at the indices in idx, as a progression: starts at
 * r's element first(idx), steps by step(r)*step(idx).  No bounds checks.
 */
template<typename T, typename S, typename I>
step_range<T, S> inbounds_getindex(const step_range<T, S>& r, const step_range<I>& idx) {
	static_assert(std::is_integral_v<I>, "index ranges must be integral");
	return step_range<T, S>(r.element(static_cast<index_type>(idx.first())),
			detail::scale_step<T>(r.step(), static_cast<index_type>(idx.step())),
			idx.length());
}

}//namespace rangesearch

#endif /* RANGESEARCH_RANGE_HPP_INCLUDED */
