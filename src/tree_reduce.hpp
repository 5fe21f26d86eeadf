/**
 * tree_reduce.hpp
 *
 * Bounded-depth reduction of a set of partial aggregates.
 */
#ifndef TREE_REDUCE_HPP
#define TREE_REDUCE_HPP

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <vector>

namespace normglm {

/**
 * Combine `partials` along a tree of at most `depth` levels.  At each level
 * with `n` partials, partial `i` is merged into bucket `i % (n / scale)` where
 * `scale = max(ceil(n^(1 / depth)), 2)`; levels are added while that still
 * shrinks the work, and the last level is a single fold.  `combOp(into, other)`
 * merges `other` into `into` and must be associative and commutative.
 *
 * A depth of 1 is a single linear fold.
 */
template<typename T, typename CombOp>
T TreeReduce(std::vector<T> partials, CombOp combOp, const size_t depth);

} // namespace normglm

#include "tree_reduce_impl.hpp"

#endif
