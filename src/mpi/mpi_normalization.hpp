/**
 * mpi_normalization.hpp
 *
 * Distribute a NormalizationContext from one process to all others.
 */
#ifndef MPI_NORMALIZATION_HPP
#define MPI_NORMALIZATION_HPP

#include "mpi_utils.hpp"
#include "../normalization_context.hpp"

namespace normglm {

/**
 * Replace `context` on every process with the context held by `root`.  After
 * this call the context is treated as read-only for the rest of the run.
 */
inline void BroadcastNormalizationContext(NormalizationContext& context,
                                          const int root = 0)
{
  if (!MPIIsDistributed())
    return;

  arma::vec packed;
  if (MPIWorldRank() == (size_t) root)
    packed = context.Pack();

  BroadcastVector(packed, root);
  context = NormalizationContext::Unpack(packed);
}

} // namespace normglm

#endif
