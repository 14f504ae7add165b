//Explicit instantiations matching the extern templates in precompiled.hpp.
#include "precompiled-includes.hpp"
#include "double_double.hpp"
#include "range.hpp"

#define RANGESEARCH_EXTERN_TEMPLATE
#include "precompiled-instantiations.hpp"
#undef RANGESEARCH_EXTERN_TEMPLATE
