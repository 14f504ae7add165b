//The #include part of the precompiled header.
#include <array>
#include <vector>
#include <string>
#include <string_view>
#include <tuple>
#include <optional>
#include <utility>
#include <type_traits>
#include <limits>

#include <algorithm>
#include <iterator>
#include <random>
#include <cmath>
#include <charconv>
#include <boost/integer.hpp>
#include <boost/iterator/iterator_facade.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <cassert>

#include <chrono>
#include <sys/resource.h>
