/**
 * tree_reduce_impl.hpp
 *
 * Implementation of the bounded-depth tree reduction.
 */
#ifndef TREE_REDUCE_IMPL_HPP
#define TREE_REDUCE_IMPL_HPP

#include "tree_reduce.hpp"

namespace normglm {

template<typename T, typename CombOp>
T TreeReduce(std::vector<T> partials, CombOp combOp, const size_t depth)
{
  if (depth < 1)
  {
    throw std::invalid_argument("TreeReduce(): depth must be at least 1");
  }

  if (partials.empty())
  {
    throw std::invalid_argument("TreeReduce(): nothing to reduce");
  }

  size_t numPartials = partials.size();
  const size_t scale = std::max((size_t) std::ceil(std::pow(
      (double) numPartials, 1.0 / depth)), (size_t) 2);

  while (numPartials > scale + (size_t) std::ceil((double) numPartials / scale))
  {
    const size_t buckets = numPartials / scale;

    // Each bucket is seeded by the partial with the same index, then absorbs
    // every `buckets`-th partial after it.  Buckets are independent.
    std::vector<std::exception_ptr> errors(buckets);
    #pragma omp parallel for
    for (size_t b = 0; b < buckets; ++b)
    {
      try
      {
        for (size_t i = b + buckets; i < numPartials; i += buckets)
          combOp(partials[b], partials[i]);
      }
      catch (...)
      {
        errors[b] = std::current_exception();
      }
    }

    for (size_t b = 0; b < buckets; ++b)
    {
      if (errors[b])
        std::rethrow_exception(errors[b]);
    }

    partials.resize(buckets);
    numPartials = buckets;
  }

  T result = std::move(partials[0]);
  for (size_t i = 1; i < numPartials; ++i)
    combOp(result, partials[i]);

  return result;
}

} // namespace normglm

#endif
