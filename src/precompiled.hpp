#ifndef RANGESEARCH_PRECOMPILED_HPP_INCLUDED
#define RANGESEARCH_PRECOMPILED_HPP_INCLUDED

#include "precompiled-includes.hpp"
#include "double_double.hpp"
#include "range.hpp"

#define RANGESEARCH_EXTERN_TEMPLATE extern
#include "precompiled-instantiations.hpp"
#undef RANGESEARCH_EXTERN_TEMPLATE

#endif /* RANGESEARCH_PRECOMPILED_HPP_INCLUDED */
