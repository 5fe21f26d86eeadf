/**
 * mpi_tree_reduce.hpp
 *
 * Reduction of per-process aggregates across MPI_COMM_WORLD.
 */
#ifndef MPI_TREE_REDUCE_HPP
#define MPI_TREE_REDUCE_HPP

#include <armadillo>
#include "mpi_utils.hpp"
#include "../tree_reduce.hpp"

namespace normglm {

/**
 * Combine the process-local aggregate `local` with those of every other
 * process.  The packed aggregates are gathered on the main node, reduced there
 * with TreeReduce() under the same `depth` bound, and the result is broadcast
 * back so that every process returns the same value.
 *
 * AggregateType must provide `arma::vec Pack() const` and
 * `static AggregateType Unpack(const arma::vec&)`.  If MPI is not running, or
 * there is only one process, `local` is returned unchanged.
 */
template<typename AggregateType, typename CombOp>
AggregateType MPITreeReduce(const AggregateType& local,
                            CombOp combOp,
                            const size_t depth);

} // namespace normglm

#include "mpi_tree_reduce_impl.hpp"

#endif
