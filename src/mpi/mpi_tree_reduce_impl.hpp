/**
 * mpi_tree_reduce_impl.hpp
 *
 * Implementation of the cross-process tree reduction.
 */
#ifndef MPI_TREE_REDUCE_IMPL_HPP
#define MPI_TREE_REDUCE_IMPL_HPP

#include "mpi_tree_reduce.hpp"

namespace normglm {

template<typename AggregateType, typename CombOp>
AggregateType MPITreeReduce(const AggregateType& local,
                            CombOp combOp,
                            const size_t depth)
{
  if (!MPIIsDistributed())
    return local;

  const size_t worldSize = MPIWorldSize();
  const size_t worldRank = MPIWorldRank();

  arma::vec packed = local.Pack();
  int packedLength = (int) packed.n_elem;

  // Packed sizes can differ between processes, so collect them first.
  // `lengths` and `offsets` are only used on the main node.
  arma::Col<int> lengths;
  arma::Col<int> offsets;
  if (worldRank == 0)
    lengths.set_size(worldSize);

  MPI_Gather(&packedLength, 1, MPI_INT, lengths.memptr(), 1, MPI_INT,
      0 /* gather on the main node */, MPI_COMM_WORLD);

  arma::vec allPacked;
  if (worldRank == 0)
  {
    offsets.zeros(worldSize);
    for (size_t i = 1; i < worldSize; ++i)
      offsets[i] = offsets[i - 1] + lengths[i - 1];
    allPacked.set_size(offsets[worldSize - 1] + lengths[worldSize - 1]);
  }

  MPI_Gatherv(packed.memptr(), packedLength, MPI_DOUBLE, allPacked.memptr(),
      lengths.memptr(), offsets.memptr(), MPI_DOUBLE, 0, MPI_COMM_WORLD);

  arma::vec reduced;
  if (worldRank == 0)
  {
    std::vector<AggregateType> partials;
    partials.reserve(worldSize);
    for (size_t i = 0; i < worldSize; ++i)
    {
      if (lengths[i] == 0)
      {
        partials.push_back(AggregateType::Unpack(arma::vec()));
        continue;
      }

      partials.push_back(AggregateType::Unpack(allPacked.subvec(offsets[i],
          offsets[i] + lengths[i] - 1)));
    }

    reduced = TreeReduce(std::move(partials), combOp, depth).Pack();
  }

  // Every process leaves with the main node's result.
  BroadcastVector(reduced, 0);
  return AggregateType::Unpack(reduced);
}

} // namespace normglm

#endif
