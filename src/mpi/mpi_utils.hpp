/**
 * mpi_utils.hpp
 *
 * Small helpers shared by the MPI code paths.
 */
#ifndef MPI_UTILS_HPP
#define MPI_UTILS_HPP

#include <mpi.h>
#include <armadillo>

namespace normglm {

// True if MPI is up and MPI_COMM_WORLD has more than one process.
inline bool MPIIsDistributed()
{
  int initialized = 0;
  int finalized = 0;
  MPI_Initialized(&initialized);
  MPI_Finalized(&finalized);
  if (!initialized || finalized)
    return false;

  int worldSize = 1;
  MPI_Comm_size(MPI_COMM_WORLD, &worldSize);
  return worldSize > 1;
}

inline size_t MPIWorldRank()
{
  int rank = 0;
  if (MPIIsDistributed())
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  return (size_t) rank;
}

inline size_t MPIWorldSize()
{
  int size = 1;
  if (MPIIsDistributed())
    MPI_Comm_size(MPI_COMM_WORLD, &size);
  return (size_t) size;
}

/**
 * Broadcast `n` doubles from `root`.  MVAPICH2 has been seen to segfault on
 * large broadcasts, so the buffer goes out in messages of 128 elements (1 kb).
 */
inline void BroadcastBuffer(double* data, const size_t n, const int root)
{
  for (size_t i = 0; i < n; i += 128)
  {
    const size_t len = (i + 128 <= n) ? 128 : (n - i);
    MPI_Bcast(data + i, (int) len, MPI_DOUBLE, root, MPI_COMM_WORLD);
  }
}

/**
 * Broadcast a vector whose length is only known on `root`; on return every
 * process holds a copy of the root's vector.
 */
inline void BroadcastVector(arma::vec& v, const int root)
{
  uint64_t len = v.n_elem;
  MPI_Bcast(&len, 1, MPI_UINT64_T, root, MPI_COMM_WORLD);
  if (v.n_elem != len)
    v.set_size(len);
  BroadcastBuffer(v.memptr(), v.n_elem, root);
}

} // namespace normglm

#endif
