//If RANGESEARCH_EXTERN_TEMPLATE is defined as extern, these are extern
//template declarations.  Otherwise, they are explicit instantiations.  This
//way we don't have separate lists to keep in sync.

RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::double_double<double>;
RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::double_double<float>;

RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::step_range<rangesearch::index_type>;
RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::step_range<int>;
RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::step_range<double>;
RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::step_range<double, rangesearch::double_double<double>>;
RANGESEARCH_EXTERN_TEMPLATE template class rangesearch::step_range<float, rangesearch::double_double<float>>;

