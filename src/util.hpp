
#ifndef UTIL_HPP
#define UTIL_HPP

#include <charconv>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <fmt/format.h>

//Parses the whole of view as a T (base 10 for integers), throwing
//std::invalid_argument on anything else.
template<typename T>
T from_string(std::string_view view) {
	T value;
	std::from_chars_result result;
	if constexpr (std::is_integral_v<T>)
		result = std::from_chars(view.data(), view.data() + view.size(), value, 10);
	else
		result = std::from_chars(view.data(), view.data() + view.size(), value);
	if (result.ec != std::errc() || result.ptr != view.data() + view.size())
		throw std::invalid_argument(fmt::format("not a valid number: '{}'", view));
	return value;
}

#endif /* UTIL_HPP */
