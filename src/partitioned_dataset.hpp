/**
 * partitioned_dataset.hpp
 *
 * The process-local piece of a distributed labeled dataset, with the map and
 * tree-aggregate primitives that the statistics and objective code run on.
 */
#ifndef PARTITIONED_DATASET_HPP
#define PARTITIONED_DATASET_HPP

#include <armadillo>
#include <vector>
#include "labeled_partition.hpp"

namespace normglm {

template<typename MatType>
class PartitionedDataset
{
 public:
  PartitionedDataset();

  explicit PartitionedDataset(
      std::vector<LabeledPartition<MatType>> partitions);

  /**
   * Split the columns of `data` into `partitions` contiguous partitions of
   * (nearly) equal size.  Empty `weights` and `offsets` mean all ones and all
   * zeros.
   */
  static PartitionedDataset Split(const MatType& data,
                                  const arma::rowvec& labels,
                                  const size_t partitions,
                                  const arma::rowvec& weights = arma::rowvec(),
                                  const arma::rowvec& offsets = arma::rowvec());

  size_t NumPartitions() const { return partitions.size(); }

  const LabeledPartition<MatType>& Partition(const size_t i) const
  {
    return partitions[i];
  }

  // Total number of examples held by this process.
  size_t NumLocalExamples() const;

  /**
   * Throw DimensionMismatch if any partition's feature dimension differs from
   * `dimension`.
   */
  void CheckDimension(const size_t dimension) const;

  /**
   * Apply `f` to every partition in parallel.  `f` must not modify shared
   * state; its results come back in partition order.
   */
  template<typename ResultType, typename MapFunction>
  std::vector<ResultType> Map(MapFunction f) const;

  /**
   * Aggregate over the whole distributed dataset: `seqOp(partition)` produces
   * one partial aggregate per partition, the partials are combined with
   * `combOp(into, other)` in a tree of at most `depth` levels, and the
   * per-process results are then reduced across MPI processes.
   */
  template<typename AggregateType, typename SeqOp, typename CombOp>
  AggregateType TreeAggregate(const AggregateType& zero,
                              SeqOp seqOp,
                              CombOp combOp,
                              const size_t depth) const;

 private:
  std::vector<LabeledPartition<MatType>> partitions;
};

} // namespace normglm

#include "partitioned_dataset_impl.hpp"

#endif
